#ifndef BTLM_SIGNATURE_HPP
#define BTLM_SIGNATURE_HPP

#include "btlm_frame.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace btlm {

constexpr size_t HMAC_SHA256_LEN = 32;

/*
 * Truncated HMAC-SHA256 over a frame payload. Holds the shared secret that
 * is flashed into the beacons; stateless otherwise.
 */
class SignatureVerifier {
public:
    explicit SignatureVerifier(std::string secret_key)
        : secret_(secret_key.begin(), secret_key.end()) {}

    std::array<uint8_t, HMAC_SHA256_LEN> compute(const uint8_t* payload, size_t len) const {
        std::array<uint8_t, HMAC_SHA256_LEN> digest{};
        if (!compute_into(payload, len, digest)) {
            throw std::runtime_error("HMAC-SHA256 computation failed");
        }
        return digest;
    }

    // First `truncation_len` bytes of the HMAC, as transmitted by a beacon.
    std::vector<uint8_t> sign(const std::vector<uint8_t>& payload,
                              size_t truncation_len = MAC_TRUNC_LEN) const {
        auto digest = compute(payload.data(), payload.size());
        truncation_len = std::min(truncation_len, digest.size());
        return std::vector<uint8_t>(digest.begin(), digest.begin() + truncation_len);
    }

    bool verify(const uint8_t* payload, size_t payload_len,
                const uint8_t* mac, size_t mac_len,
                size_t truncation_len = MAC_TRUNC_LEN) const {
        if (truncation_len == 0 || truncation_len > HMAC_SHA256_LEN) return false;
        if (mac_len != truncation_len) return false;

        std::array<uint8_t, HMAC_SHA256_LEN> digest{};
        if (!compute_into(payload, payload_len, digest)) return false;
        return CRYPTO_memcmp(digest.data(), mac, truncation_len) == 0;
    }

    bool verify(const std::vector<uint8_t>& payload,
                const std::vector<uint8_t>& mac,
                size_t truncation_len = MAC_TRUNC_LEN) const {
        return verify(payload.data(), payload.size(), mac.data(), mac.size(), truncation_len);
    }

private:
    bool compute_into(const uint8_t* payload, size_t len,
                      std::array<uint8_t, HMAC_SHA256_LEN>& digest) const {
        unsigned int digest_len = 0;
        // HMAC() rejects a null key pointer even when the key length is zero
        static const unsigned char empty_key = 0;
        const unsigned char* key = secret_.empty() ? &empty_key : secret_.data();
        return HMAC(EVP_sha256(), key, static_cast<int>(secret_.size()),
                    payload, len, digest.data(), &digest_len) != nullptr &&
               digest_len == HMAC_SHA256_LEN;
    }

    std::vector<unsigned char> secret_;
};

} // namespace btlm

#endif // BTLM_SIGNATURE_HPP
