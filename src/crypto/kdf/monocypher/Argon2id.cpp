#include "coffer/crypto/Argon2id.hpp"

#include "coffer/security/ZeroAllocator.hpp"
#include "monocypher.h"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <new>
#include <vector>

namespace coffer::crypto
{

coffer::security::SecureBuffer deriveArgon2idMonocypher(std::span<const std::byte> password,
                                                        std::span<const std::uint8_t> salt,
                                                        const Argon2idParams& params, std::size_t outBytes)
{
    requireArgon2idInputs(password, salt, params, outBytes);
    if (password.size() > std::numeric_limits<std::uint32_t>::max())
    {
        throw std::invalid_argument("deriveArgon2id: password too large");
    }

    // One Argon2 block is 1 KiB, i.e. 128 64-bit words.
    constexpr std::size_t wordsPerBlock{ 1024U / sizeof(std::uint64_t) };
    if (params.memoryKiB > (std::numeric_limits<std::size_t>::max() / wordsPerBlock))
    {
        throw std::bad_alloc{};
    }
    std::vector<std::uint64_t, coffer::security::ScratchAllocator<std::uint64_t>> workArea(
        static_cast<std::size_t>(params.memoryKiB) * wordsPerBlock);

    coffer::security::SecureBuffer out(outBytes);

    const crypto_argon2_config config{ .algorithm = CRYPTO_ARGON2_ID,
                                       .nb_blocks = params.memoryKiB,
                                       .nb_passes = params.iterations,
                                       .nb_lanes = params.parallelism };
    const crypto_argon2_inputs inputs{ .pass = reinterpret_cast<const std::uint8_t*>(password.data()),
                                       .salt = salt.data(),
                                       .pass_size = static_cast<std::uint32_t>(password.size()),
                                       .salt_size = static_cast<std::uint32_t>(salt.size()) };

    crypto_argon2(out.data(), static_cast<std::uint32_t>(out.size()), workArea.data(), config, inputs,
                  crypto_argon2_no_extras);
    return out;
}

} // namespace coffer::crypto
