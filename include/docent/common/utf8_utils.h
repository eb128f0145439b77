#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace docent::common {

// True for the 10xxxxxx bytes that continue a multi-byte sequence.
inline bool isUtf8Continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Cut text to at most maxBytes without splitting a UTF-8 sequence.
inline std::string truncateUtf8(std::string_view text, size_t maxBytes) {
    if (text.size() <= maxBytes) {
        return std::string(text);
    }
    size_t cut = maxBytes;
    while (cut > 0 && isUtf8Continuation(text[cut])) {
        --cut;
    }
    return std::string(text.substr(0, cut));
}

} // namespace docent::common
