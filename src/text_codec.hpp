// =============================================================================
// Marionette - Text encoding helpers
// =============================================================================
// UTF-8 is the interchange encoding everywhere in the core. Channels need
// UTF-16 code units (WM_CHAR, KEYEVENTF_UNICODE); the remote keyboard needs
// code points or base64 of the UTF-8 bytes.
// Malformed UTF-8 sequences decode to U+FFFD.
// =============================================================================
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace marionette {

std::vector<uint32_t> utf8ToCodePoints(const std::string& utf8);
std::u16string utf8ToUtf16(const std::string& utf8);

bool isAscii(const std::string& s);

std::string base64Encode(const uint8_t* data, size_t len);
inline std::string base64Encode(const std::string& bytes) {
    return base64Encode(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());
}

// "72,101,108" for ADB_INPUT_CHARS
std::string joinCodePoints(const std::vector<uint32_t>& cps);

} // namespace marionette
