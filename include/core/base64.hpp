#pragma once

#include <openssl/evp.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace auditpipe::base64 {

/// Standard alphabet with padding, no line breaks
inline std::string encode(const uint8_t* data, size_t len) {
    std::string out(4 * ((len + 2) / 3), '\0');
    if (len == 0) return out;
    const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data,
                                  static_cast<int>(len));
    out.resize(static_cast<size_t>(n));
    return out;
}

/**
 * @return std::nullopt unless the input is padded standard base64
 */
inline std::optional<std::vector<uint8_t>> decode(std::string_view encoded) {
    if (encoded.size() % 4 != 0) return std::nullopt;
    std::vector<uint8_t> out(3 * encoded.size() / 4);
    if (encoded.empty()) return out;

    const int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(encoded.data()),
                                  static_cast<int>(encoded.size()));
    if (n < 0) return std::nullopt;

    // EVP_DecodeBlock counts padding as zero bytes
    size_t size = static_cast<size_t>(n);
    if (encoded.ends_with("==")) size -= 2;
    else if (encoded.ends_with('=')) size -= 1;
    out.resize(size);
    return out;
}

} // namespace auditpipe::base64
