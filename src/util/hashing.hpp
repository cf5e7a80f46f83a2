#ifndef PIIGUARD_UTIL_HASHING_HPP
#define PIIGUARD_UTIL_HASHING_HPP

#include <string>
#include <stdexcept>
#include <sstream>
#include <iomanip>
#include <openssl/evp.h>

/**
 * @file hashing.hpp
 * @brief SHA-256 digests for audit correlation.
 *
 * REQUIREMENTS:
 *   - Links against OpenSSL libcrypto.
 *
 * USAGE:
 *   @code
 *   std::string digest = piiguard::util::hashing::sha256Hex(documentText);
 *   // 64 lowercase hex characters
 *   @endcode
 */

namespace piiguard {
namespace util {
namespace hashing {

/**
 * @brief Compute the SHA-256 of a byte string, returned as lowercase hex.
 * @throw std::runtime_error if OpenSSL fails.
 */
inline std::string sha256Hex(const std::string &input)
{
    EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
    if (mdctx == nullptr) {
        throw std::runtime_error("hashing::sha256Hex: Failed to create EVP_MD_CTX.");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1
        || EVP_DigestUpdate(mdctx, input.data(), input.size()) != 1
        || EVP_DigestFinal_ex(mdctx, hash, &hashLen) != 1)
    {
        EVP_MD_CTX_free(mdctx);
        throw std::runtime_error("hashing::sha256Hex: digest computation failed.");
    }
    EVP_MD_CTX_free(mdctx);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < hashLen; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(hash[i]);
    }
    return oss.str();
}

} // namespace hashing
} // namespace util
} // namespace piiguard

#endif // PIIGUARD_UTIL_HASHING_HPP
