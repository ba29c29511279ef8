#ifndef INCLUDE_COFFER_CRYPTO_ARGON2ID_HPP
#define INCLUDE_COFFER_CRYPTO_ARGON2ID_HPP

#include "coffer/crypto/CryptoParams.hpp"
#include "coffer/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>

namespace coffer::crypto
{

constexpr std::uint32_t g_argon2MaxIterations{ 10U };
constexpr std::uint32_t g_argon2MaxMemoryKiB{ 1024U * 1024U };
constexpr std::uint32_t g_argon2MaxParallelism{ 16U };
constexpr std::size_t g_argon2MinOutBytes{ 16U };
constexpr std::size_t g_argon2MaxOutBytes{ 64U };

// Shared by every backend so both reject the same inputs.
inline void requireArgon2idInputs(std::span<const std::byte> password, std::span<const std::uint8_t> salt,
                                  const Argon2idParams& params, std::size_t outBytes)
{
    if (password.empty())
    {
        throw std::invalid_argument("deriveArgon2id: empty password");
    }
    if (salt.size() != g_kdfSaltBytes)
    {
        throw std::invalid_argument("deriveArgon2id: invalid salt size");
    }
    if (outBytes < g_argon2MinOutBytes || outBytes > g_argon2MaxOutBytes)
    {
        throw std::invalid_argument("deriveArgon2id: invalid output size");
    }
    if (params.iterations == 0U || params.parallelism == 0U)
    {
        throw std::invalid_argument("deriveArgon2id: invalid parameters");
    }
    if (params.iterations > g_argon2MaxIterations || params.memoryKiB > g_argon2MaxMemoryKiB ||
        params.parallelism > g_argon2MaxParallelism)
    {
        throw std::invalid_argument("deriveArgon2id: unsafe parameters");
    }
    if (params.memoryKiB < params.parallelism * 8U || (params.memoryKiB % (params.parallelism * 4U)) != 0U)
    {
        throw std::invalid_argument("deriveArgon2id: invalid memory cost");
    }
}

// Monocypher implementation. Single-threaded regardless of lane count.
[[nodiscard]] coffer::security::SecureBuffer deriveArgon2idMonocypher(std::span<const std::byte> password,
                                                                      std::span<const std::uint8_t> salt,
                                                                      const Argon2idParams& params,
                                                                      std::size_t outBytes);

} // namespace coffer::crypto

#endif // INCLUDE_COFFER_CRYPTO_ARGON2ID_HPP
