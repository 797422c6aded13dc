// =============================================================================
// Marionette - Key / Code Translation Tables
// =============================================================================
#include "key_tables.hpp"

#include <cctype>
#include <cstdio>
#include <unordered_map>

namespace marionette {

namespace {

struct KeyEntry {
    const char* name;
    uint32_t vk;        // 0 = Android only
    int android;        // -1 = host only
    bool extended;
};

// Named keys. Letters, digits and F-keys are generated in keyTable().
const KeyEntry NAMED_KEYS[] = {
    // Basic function keys
    {"space",        vk::Space,    62,  false},
    {"enter",        vk::Return,   66,  false},
    {"backspace",    vk::Back,     67,  false},
    {"tab",          vk::Tab,      61,  false},
    {"escape",       vk::Escape,   111, false},
    {"delete",       vk::Delete,   112, true},
    {"insert",       vk::Insert,   124, true},
    {"home",         vk::Home,     3,   true},
    {"end",          vk::End,      123, true},
    {"page_up",      vk::PageUp,   92,  true},
    {"page_down",    vk::PageDown, 93,  true},

    // Arrows
    {"up",           vk::Up,       19,  true},
    {"down",         vk::Down,     20,  true},
    {"left",         vk::Left,     21,  true},
    {"right",        vk::Right,    22,  true},
    {"dpad_center",  0,            23,  false},

    // Modifiers (bare name = left key)
    {"shift",        vk::Shift,    59,  false},
    {"shift_left",   vk::LShift,   59,  false},
    {"shift_right",  vk::RShift,   60,  false},
    {"ctrl",         vk::Control,  113, false},
    {"ctrl_left",    vk::LControl, 113, false},
    {"ctrl_right",   vk::RControl, 114, true},
    {"alt",          vk::Alt,      57,  false},
    {"alt_left",     vk::LAlt,     57,  false},
    {"alt_right",    vk::RAlt,     58,  true},
    {"meta",         vk::LWin,     117, true},
    {"meta_left",    vk::LWin,     117, true},
    {"meta_right",   vk::RWin,     118, true},

    // Locks
    {"caps_lock",    vk::CapsLock,   115, false},
    {"num_lock",     vk::NumLock,    143, true},
    {"scroll_lock",  vk::ScrollLock, 116, false},
    {"pause",        vk::Pause,      121, false},

    // System / navigation
    {"back",         vk::BrowserBack, 4,   true},
    {"menu",         vk::Apps,        82,  true},
    {"app_switch",   0,               187, false},
    {"power",        0,               26,  false},
    {"camera",       0,               27,  false},
    {"search",       0xAA,            84,  true},
    {"volume_up",    vk::VolumeUp,    24,  true},
    {"volume_down",  vk::VolumeDown,  25,  true},
    {"volume_mute",  vk::VolumeMute,  164, true},

    // Media
    {"media_play_pause", 0xB3, 85, true},
    {"media_stop",       0xB2, 86, true},
    {"media_next",       0xB0, 87, true},
    {"media_previous",   0xB1, 88, true},

    // Symbols (US layout VK_OEM_*)
    {"minus",         0xBD, 69, false},
    {"equals",        0xBB, 70, false},
    {"left_bracket",  0xDB, 71, false},
    {"right_bracket", 0xDD, 72, false},
    {"backslash",     0xDC, 73, false},
    {"semicolon",     0xBA, 74, false},
    {"apostrophe",    0xDE, 75, false},
    {"grave",         0xC0, 68, false},
    {"comma",         0xBC, 55, false},
    {"period",        0xBE, 56, false},
    {"slash",         0xBF, 76, false},

    // Numpad
    {"numpad_multiply", 0x6A, 155, false},
    {"numpad_add",      0x6B, 157, false},
    {"numpad_subtract", 0x6D, 156, false},
    {"numpad_dot",      0x6E, 158, false},
    {"numpad_divide",   0x6F, 154, true},
};

const std::unordered_map<std::string, std::string>& aliasTable() {
    static const std::unordered_map<std::string, std::string> aliases = {
        {" ", "space"}, {"spacebar", "space"}, {"spc", "space"},
        {"return", "enter"}, {"ret", "enter"}, {"\n", "enter"}, {"\r", "enter"},
        {"bksp", "backspace"}, {"bs", "backspace"}, {"\b", "backspace"},
        {"del", "delete"},
        {"esc", "escape"},
        {"arrow_up", "up"}, {"arrow_down", "down"},
        {"arrow_left", "left"}, {"arrow_right", "right"},
        {"dpad_up", "up"}, {"dpad_down", "down"},
        {"dpad_left", "left"}, {"dpad_right", "right"},
        {"control", "ctrl"},
        {"ctrl_l", "ctrl_left"}, {"ctrl_r", "ctrl_right"},
        {"alt_l", "alt_left"}, {"alt_r", "alt_right"},
        {"shift_l", "shift_left"}, {"shift_r", "shift_right"},
        {"win", "meta"}, {"windows", "meta"}, {"cmd", "meta"},
        {"command", "meta"}, {"super", "meta"},
        {"pgup", "page_up"}, {"pgdn", "page_down"},
        {"pageup", "page_up"}, {"pagedown", "page_down"},
        {"ins", "insert"},
        {"caps", "caps_lock"}, {"capslock", "caps_lock"},
        {"numlock", "num_lock"}, {"scrolllock", "scroll_lock"},
        {"mute", "volume_mute"},
        {"recent", "app_switch"}, {"task", "app_switch"},
        // Labels used by the workflow editor
        {"\xe8\xbf\x94\xe5\x9b\x9e", "back"},                 // 返回
        {"\xe4\xb8\xbb\xe9\xa1\xb5", "home"},                 // 主页
        {"\xe9\xa6\x96\xe9\xa1\xb5", "home"},                 // 首页
        {"\xe4\xbb\xbb\xe5\x8a\xa1", "app_switch"},           // 任务
        {"\xe9\x9f\xb3\xe9\x87\x8f\xe5\x8a\xa0", "volume_up"},   // 音量加
        {"\xe9\x9f\xb3\xe9\x87\x8f\xe5\x87\x8f", "volume_down"}, // 音量减
        {"\xe9\x9d\x99\xe9\x9f\xb3", "volume_mute"},          // 静音
    };
    return aliases;
}

const std::unordered_map<std::string, KeyEntry>& keyTable() {
    static const std::unordered_map<std::string, KeyEntry> table = [] {
        std::unordered_map<std::string, KeyEntry> t;
        for (const auto& e : NAMED_KEYS) t.emplace(e.name, e);

        // Letters: VK = ASCII uppercase, KEYCODE_A = 29
        static char letter_names[26][2];
        for (int i = 0; i < 26; i++) {
            letter_names[i][0] = static_cast<char>('a' + i);
            letter_names[i][1] = '\0';
            t.emplace(letter_names[i], KeyEntry{letter_names[i],
                      static_cast<uint32_t>('A' + i), 29 + i, false});
        }
        // Digits: VK = ASCII, KEYCODE_0 = 7
        static char digit_names[10][2];
        for (int i = 0; i < 10; i++) {
            digit_names[i][0] = static_cast<char>('0' + i);
            digit_names[i][1] = '\0';
            t.emplace(digit_names[i], KeyEntry{digit_names[i],
                      static_cast<uint32_t>('0' + i), 7 + i, false});
        }
        // F1-F12: KEYCODE_F1 = 131
        static char f_names[12][4];
        for (int i = 0; i < 12; i++) {
            std::snprintf(f_names[i], sizeof(f_names[i]), "f%d", i + 1);
            t.emplace(f_names[i], KeyEntry{f_names[i], vk::F1 + i, 131 + i, false});
        }
        // Numpad digits: KEYCODE_NUMPAD_0 = 144
        static char numpad_names[10][10];
        for (int i = 0; i < 10; i++) {
            std::snprintf(numpad_names[i], sizeof(numpad_names[i]), "numpad_%d", i);
            t.emplace(numpad_names[i], KeyEntry{numpad_names[i], vk::Numpad0 + i, 144 + i, false});
        }
        return t;
    }();
    return table;
}

// Reverse index: first entry wins for VKs shared by several names
const std::unordered_map<uint32_t, const KeyEntry*>& vkIndex() {
    static const std::unordered_map<uint32_t, const KeyEntry*> index = [] {
        std::unordered_map<uint32_t, const KeyEntry*> idx;
        for (const auto& e : NAMED_KEYS) {
            if (e.vk != 0) idx.emplace(e.vk, &e);
        }
        for (const auto& kv : keyTable()) {
            if (kv.second.vk != 0) idx.emplace(kv.second.vk, &kv.second);
        }
        return idx;
    }();
    return index;
}

// Emulator keyevent mapping differs from the name table for these keys
const std::unordered_map<uint32_t, int>& vkAndroidOverrides() {
    static const std::unordered_map<uint32_t, int> overrides = {
        {vk::Escape, 4},    // ESC acts as Android BACK
        {vk::End, 6},       // KEYCODE_ENDCALL
    };
    return overrides;
}

const std::unordered_map<std::string, std::string>& shortcutTable() {
    static const std::unordered_map<std::string, std::string> shortcuts = {
        {"back", "go_back"},
        {"home", "go_home"},
        {"menu", "go_task"},
        {"app_switch", "go_task"},
        {"volume_up", "volume_up"},
        {"volume_down", "volume_down"},
        {"volume_mute", "volume_mute"},
    };
    return shortcuts;
}

const KeyEntry* findEntry(const std::string& name) {
    auto it = keyTable().find(name);
    return it != keyTable().end() ? &it->second : nullptr;
}

} // namespace

std::string canonicalKeyName(const std::string& raw) {
    const auto& aliases = aliasTable();
    auto direct = aliases.find(raw);
    if (direct != aliases.end()) return direct->second;

    std::string lower;
    lower.reserve(raw.size());
    for (char c : raw) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    auto it = aliases.find(lower);
    if (it != aliases.end()) return it->second;
    return lower;
}

std::optional<int> androidKeyCode(const std::string& name) {
    const KeyEntry* e = findEntry(canonicalKeyName(name));
    if (!e || e->android < 0) return std::nullopt;
    return e->android;
}

std::optional<uint32_t> virtualKeyForName(const std::string& name) {
    const KeyEntry* e = findEntry(canonicalKeyName(name));
    if (!e || e->vk == 0) return std::nullopt;
    return e->vk;
}

std::optional<int> androidCodeForVk(uint32_t code) {
    auto ov = vkAndroidOverrides().find(code);
    if (ov != vkAndroidOverrides().end()) return ov->second;
    auto it = vkIndex().find(code);
    if (it == vkIndex().end() || it->second->android < 0) return std::nullopt;
    return it->second->android;
}

std::optional<std::string> keyNameForVk(uint32_t code) {
    auto it = vkIndex().find(code);
    if (it == vkIndex().end()) return std::nullopt;
    return std::string(it->second->name);
}

bool isExtendedKey(uint32_t code) {
    auto it = vkIndex().find(code);
    return it != vkIndex().end() && it->second->extended;
}

std::optional<std::string> remoteShortcutFor(const std::string& name) {
    auto it = shortcutTable().find(canonicalKeyName(name));
    if (it == shortcutTable().end()) return std::nullopt;
    return it->second;
}

std::optional<ResolvedKey> resolveKey(const KeySpec& key) {
    if (const int* code = std::get_if<int>(&key)) {
        if (*code <= 0 || *code > 0xFE) return std::nullopt;
        ResolvedKey r;
        r.vk = static_cast<uint32_t>(*code);
        r.android_code = androidCodeForVk(r.vk);
        r.extended = isExtendedKey(r.vk);
        if (auto name = keyNameForVk(r.vk)) {
            r.name = *name;
        } else {
            char buf[16];
            std::snprintf(buf, sizeof(buf), "vk_0x%02x", *code);
            r.name = buf;
        }
        return r;
    }

    const std::string& raw = std::get<std::string>(key);
    if (raw.empty()) return std::nullopt;
    std::string name = canonicalKeyName(raw);
    const KeyEntry* e = findEntry(name);
    if (!e) return std::nullopt;

    ResolvedKey r;
    r.name = name;
    r.vk = e->vk;
    if (e->android >= 0) r.android_code = e->android;
    r.extended = e->extended;
    return r;
}

std::string describeKey(const KeySpec& key) {
    if (const int* code = std::get_if<int>(&key)) {
        char buf[24];
        std::snprintf(buf, sizeof(buf), "vk=0x%02X", *code);
        return buf;
    }
    return "name=" + std::get<std::string>(key);
}

} // namespace marionette
