#ifndef PIIREDACTOR_UTIL_HASHING_HPP
#define PIIREDACTOR_UTIL_HASHING_HPP

#include <string>
#include <stdexcept>
#include <sstream>
#include <memory>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <openssl/evp.h>

/**
 * @file hashing.hpp
 * @brief SHA-256 helpers used to refer to texts without revealing them.
 *
 * REQUIREMENTS:
 *   - Links against OpenSSL (libcrypto).
 *
 * USAGE:
 *   @code
 *   using namespace piiredactor::util::hashing;
 *
 *   std::string digest = sha256("Γιάννης πήγε στην Αθήνα.");   // 64 hex chars
 *   std::string tag    = fingerprint("Γιάννης πήγε στην Αθήνα."); // first 12 hex chars
 *   @endcode
 */

namespace piiredactor {
namespace util {
namespace hashing {

// Hex digest of the input bytes. Throws std::runtime_error if libcrypto fails.
inline std::string sha256(const std::string &input)
{
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("hashing::sha256: out of memory");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digestLen) != 1) {
        throw std::runtime_error("hashing::sha256: digest failed");
    }

    static const char hexDigits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(digestLen * 2);
    for (unsigned int i = 0; i < digestLen; ++i) {
        hex.push_back(hexDigits[digest[i] >> 4]);
        hex.push_back(hexDigits[digest[i] & 0x0f]);
    }
    return hex;
}

/**
 * @brief Short, log-safe identifier for a text (first 12 hex chars of its SHA-256).
 */
inline std::string fingerprint(const std::string &text)
{
    return sha256(text).substr(0, 12);
}

/**
 * @brief Generate a fresh 32-hex-char identifier for a job.
 *        Mixes the payload with a process-wide counter and the wall clock so that
 *        submitting the same text twice yields distinct ids.
 */
inline std::string newJobId(const std::string &payload)
{
    static std::atomic<std::uint64_t> counter{0};
    const auto ticks = std::chrono::system_clock::now().time_since_epoch().count();

    std::ostringstream seed;
    seed << counter.fetch_add(1) << ':' << ticks << ':' << payload;
    return sha256(seed.str()).substr(0, 32);
}

} // namespace hashing
} // namespace util
} // namespace piiredactor

#endif // PIIREDACTOR_UTIL_HASHING_HPP
