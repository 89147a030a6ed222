#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace fdk {

using Bytes = std::vector<uint8_t>;

/// Reinterpret every byte as the code point of the same value and return
/// the resulting text as UTF-8.
///
/// This is a narrow mapping: it is exact for ASCII, but multi-byte encoded
/// input (e.g. UTF-8 "é" = C3 A9) comes out as two characters ("Ã©").
/// The plain, XML and form codec paths rely on this exact behavior.
[[nodiscard]] std::string bytes_to_text(const Bytes& bytes);

/// Inverse of bytes_to_text: every UTF-8 encoded character is truncated to
/// the low byte of its code point, so anything above U+00FF is mangled
/// ("€" U+20AC becomes 0xAC). Bytes that are not valid UTF-8 are copied
/// through unchanged.
[[nodiscard]] Bytes text_to_bytes(std::string_view text);

/// Copy of `raw` with every ill-formed UTF-8 sequence replaced by U+FFFD,
/// one replacement per maximal invalid subpart.
[[nodiscard]] std::string utf8_lossy(std::string_view raw);

/// The buffer's bytes as-is, for codecs that read raw input.
[[nodiscard]] inline std::string_view bytes_view(const Bytes& bytes) {
    return std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

/// Byte-for-byte copy of `raw`, for codecs that produce raw output.
[[nodiscard]] inline Bytes to_bytes(std::string_view raw) {
    return Bytes(raw.begin(), raw.end());
}

} // namespace fdk
