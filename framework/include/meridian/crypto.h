#ifndef MERIDIAN_CRYPTO_H
#define MERIDIAN_CRYPTO_H

#include <string>
#include <string_view>

namespace meridian::crypto {

    // Raw 32-byte digests
    std::string sha256(std::string_view input);
    std::string hmac_sha256(std::string_view key, std::string_view data);

    std::string sha256_hex(std::string_view input);
    std::string hex_encode(std::string_view input);

    std::string base64_encode(std::string_view input);
    std::string base64_decode(std::string_view input);

} // namespace meridian::crypto

#endif
