#include "fdk/text.hpp"

namespace fdk {

namespace {

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Length of the UTF-8 sequence starting at text[i], or 0 if malformed.
size_t sequence_length(std::string_view text, size_t i) {
    auto c = static_cast<unsigned char>(text[i]);
    size_t len = 0;
    if (c < 0x80) return 1;
    else if ((c & 0xE0) == 0xC0) len = 2;
    else if ((c & 0xF0) == 0xE0) len = 3;
    else if ((c & 0xF8) == 0xF0) len = 4;
    else return 0;

    if (i + len > text.size()) return 0;
    for (size_t k = 1; k < len; ++k) {
        if (!is_continuation(static_cast<unsigned char>(text[i + k]))) return 0;
    }
    return len;
}

// Length of the well-formed UTF-8 sequence at raw[i], or of its maximal
// invalid prefix as a negative number (at least one byte).
int well_formed_length(std::string_view raw, size_t i) {
    auto c = static_cast<unsigned char>(raw[i]);
    if (c < 0x80) return 1;

    int len = 0;
    unsigned char lo = 0x80, hi = 0xBF;
    if (c >= 0xC2 && c <= 0xDF) len = 2;
    else if (c >= 0xE0 && c <= 0xEF) {
        len = 3;
        if (c == 0xE0) lo = 0xA0;
        else if (c == 0xED) hi = 0x9F;
    } else if (c >= 0xF0 && c <= 0xF4) {
        len = 4;
        if (c == 0xF0) lo = 0x90;
        else if (c == 0xF4) hi = 0x8F;
    } else {
        return -1;
    }

    for (int k = 1; k < len; ++k) {
        if (i + k >= raw.size()) return -k;
        auto b = static_cast<unsigned char>(raw[i + k]);
        // Only the second byte has a narrowed range
        if (k == 1 ? (b < lo || b > hi) : !is_continuation(b)) return -k;
    }
    return len;
}

} // anonymous namespace

std::string bytes_to_text(const Bytes& bytes) {
    std::string out;
    out.reserve(bytes.size());
    for (uint8_t b : bytes) {
        if (b < 0x80) {
            out.push_back(static_cast<char>(b));
        } else {
            out.push_back(static_cast<char>(0xC0 | (b >> 6)));
            out.push_back(static_cast<char>(0x80 | (b & 0x3F)));
        }
    }
    return out;
}

Bytes text_to_bytes(std::string_view text) {
    Bytes out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        size_t len = sequence_length(text, i);
        if (len == 0) {
            out.push_back(static_cast<uint8_t>(text[i]));
            ++i;
            continue;
        }
        // Only the last byte matters once truncated to 8 bits: the low
        // 6 bits come from it, bits 6-7 from the byte before.
        uint32_t cp = 0;
        if (len == 1) {
            cp = static_cast<unsigned char>(text[i]);
        } else {
            auto prev = static_cast<unsigned char>(text[i + len - 2]);
            auto last = static_cast<unsigned char>(text[i + len - 1]);
            cp = ((prev & 0x03u) << 6) | (last & 0x3Fu);
        }
        out.push_back(static_cast<uint8_t>(cp & 0xFF));
        i += len;
    }
    return out;
}

std::string utf8_lossy(std::string_view raw) {
    static constexpr char REPLACEMENT[] = "\xEF\xBF\xBD";
    std::string out;
    out.reserve(raw.size());
    size_t i = 0;
    while (i < raw.size()) {
        int len = well_formed_length(raw, i);
        if (len > 0) {
            out.append(raw.substr(i, static_cast<size_t>(len)));
            i += static_cast<size_t>(len);
        } else {
            out += REPLACEMENT;
            i += static_cast<size_t>(-len);
        }
    }
    return out;
}

} // namespace fdk
