// =============================================================================
// Marionette - Key / Code Translation Tables
// =============================================================================
// Static mappings between three key-naming spaces:
//   host virtual-key codes (VK_*), Android KEYCODE_* values, and canonical
//   lowercase names with an alias table ("esc" -> "escape", " " -> "space").
// Pure data + lookup, no state.
// =============================================================================
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace marionette {

// Caller-supplied key: raw virtual-key code or a name / alias
using KeySpec = std::variant<int, std::string>;

// Host virtual-key codes (values of the Win32 VK_* constants)
namespace vk {
constexpr uint32_t Back        = 0x08;
constexpr uint32_t Tab         = 0x09;
constexpr uint32_t Return      = 0x0D;
constexpr uint32_t Shift       = 0x10;
constexpr uint32_t Control     = 0x11;
constexpr uint32_t Alt         = 0x12;
constexpr uint32_t Pause       = 0x13;
constexpr uint32_t CapsLock    = 0x14;
constexpr uint32_t Escape      = 0x1B;
constexpr uint32_t Space       = 0x20;
constexpr uint32_t PageUp      = 0x21;
constexpr uint32_t PageDown    = 0x22;
constexpr uint32_t End         = 0x23;
constexpr uint32_t Home        = 0x24;
constexpr uint32_t Left        = 0x25;
constexpr uint32_t Up          = 0x26;
constexpr uint32_t Right       = 0x27;
constexpr uint32_t Down        = 0x28;
constexpr uint32_t Insert      = 0x2D;
constexpr uint32_t Delete      = 0x2E;
constexpr uint32_t LWin        = 0x5B;
constexpr uint32_t RWin        = 0x5C;
constexpr uint32_t Apps        = 0x5D;
constexpr uint32_t Numpad0     = 0x60;
constexpr uint32_t F1          = 0x70;
constexpr uint32_t NumLock     = 0x90;
constexpr uint32_t ScrollLock  = 0x91;
constexpr uint32_t LShift      = 0xA0;
constexpr uint32_t RShift      = 0xA1;
constexpr uint32_t LControl    = 0xA2;
constexpr uint32_t RControl    = 0xA3;
constexpr uint32_t LAlt        = 0xA4;
constexpr uint32_t RAlt        = 0xA5;
constexpr uint32_t BrowserBack = 0xA6;
constexpr uint32_t VolumeMute  = 0xAD;
constexpr uint32_t VolumeDown  = 0xAE;
constexpr uint32_t VolumeUp    = 0xAF;
} // namespace vk

struct ResolvedKey {
    std::string name;                 // canonical name ("enter", "a", "vk_0x7c")
    uint32_t vk = 0;                  // 0 = no host key (Android-only keys)
    std::optional<int> android_code;  // KEYCODE_* value, if any
    bool extended = false;            // needs the extended-key lParam bit
};

// Lowercases and applies the alias table. "Esc" -> "escape", " " -> "space".
std::string canonicalKeyName(const std::string& raw);

// Lookups by canonical name
std::optional<int> androidKeyCode(const std::string& name);
std::optional<uint32_t> virtualKeyForName(const std::string& name);

// Lookups by virtual key
std::optional<int> androidCodeForVk(uint32_t vk);
std::optional<std::string> keyNameForVk(uint32_t vk);
bool isExtendedKey(uint32_t vk);

// Emulator manager shortcut ("back" -> "go_back"); nullopt when the key has
// no shortcut and must go through `input keyevent`
std::optional<std::string> remoteShortcutFor(const std::string& name);

// Accepts a VK integer, a canonical name or an alias. nullopt = unknown key.
std::optional<ResolvedKey> resolveKey(const KeySpec& key);

// For logs: "vk=0x0D" or "name=enter"
std::string describeKey(const KeySpec& key);

} // namespace marionette
