// =============================================================================
// Marionette - Text encoding helpers
// =============================================================================
#include "text_codec.hpp"

namespace marionette {

namespace {

constexpr uint32_t REPLACEMENT = 0xFFFD;

const char BASE64_TABLE[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

} // namespace

std::vector<uint32_t> utf8ToCodePoints(const std::string& utf8) {
    std::vector<uint32_t> out;
    out.reserve(utf8.size());

    size_t i = 0;
    const size_t n = utf8.size();
    while (i < n) {
        uint8_t c = static_cast<uint8_t>(utf8[i]);
        uint32_t cp = 0;
        size_t extra = 0;
        uint32_t min = 0;

        if (c < 0x80) {
            out.push_back(c);
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            cp = c & 0x1F; extra = 1; min = 0x80;
        } else if ((c & 0xF0) == 0xE0) {
            cp = c & 0x0F; extra = 2; min = 0x800;
        } else if ((c & 0xF8) == 0xF0) {
            cp = c & 0x07; extra = 3; min = 0x10000;
        } else {
            out.push_back(REPLACEMENT);
            ++i;
            continue;
        }

        if (i + extra >= n) {
            // truncated sequence at end of input
            out.push_back(REPLACEMENT);
            break;
        }

        bool ok = true;
        for (size_t k = 1; k <= extra; ++k) {
            uint8_t cc = static_cast<uint8_t>(utf8[i + k]);
            if ((cc & 0xC0) != 0x80) { ok = false; break; }
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (!ok) {
            out.push_back(REPLACEMENT);
            ++i;
            continue;
        }
        if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) cp = REPLACEMENT;
        out.push_back(cp);
        i += extra + 1;
    }
    return out;
}

std::u16string utf8ToUtf16(const std::string& utf8) {
    std::u16string out;
    for (uint32_t cp : utf8ToCodePoints(utf8)) {
        if (cp >= 0x10000) {
            cp -= 0x10000;
            out.push_back(static_cast<char16_t>(0xD800 + (cp >> 10)));
            out.push_back(static_cast<char16_t>(0xDC00 + (cp & 0x3FF)));
        } else {
            out.push_back(static_cast<char16_t>(cp));
        }
    }
    return out;
}

bool isAscii(const std::string& s) {
    for (char c : s) {
        if (static_cast<uint8_t>(c) >= 0x80) return false;
    }
    return true;
}

std::string base64Encode(const uint8_t* data, size_t len) {
    std::string result;
    result.reserve((len + 2) / 3 * 4);

    for (size_t i = 0; i < len; i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < len) n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < len) n |= static_cast<uint32_t>(data[i + 2]);

        result.push_back(BASE64_TABLE[(n >> 18) & 0x3F]);
        result.push_back(BASE64_TABLE[(n >> 12) & 0x3F]);
        result.push_back((i + 1 < len) ? BASE64_TABLE[(n >> 6) & 0x3F] : '=');
        result.push_back((i + 2 < len) ? BASE64_TABLE[n & 0x3F] : '=');
    }
    return result;
}

std::string joinCodePoints(const std::vector<uint32_t>& cps) {
    std::string out;
    for (size_t i = 0; i < cps.size(); ++i) {
        if (i) out += ',';
        out += std::to_string(cps[i]);
    }
    return out;
}

} // namespace marionette
