#ifndef INCLUDE_COFFER_CRYPTO_CRYPTOPARAMS_HPP
#define INCLUDE_COFFER_CRYPTO_CRYPTOPARAMS_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace coffer::crypto
{

constexpr std::size_t g_kdfSaltBytes{ 16 };
constexpr std::size_t g_vaultKeyBytes{ 32 };

// Argon2 version v1.3 (0x13). Monocypher is hardcoded to this.
constexpr std::uint32_t g_argon2VersionV13{ 0x13 };

// Wire identifiers. Each Argon2id id fixes memory cost and lanes; the iteration count travels separately.
enum class KdfAlgorithm : std::uint8_t
{
    Argon2idInteractive = 0x01,
    Argon2idModerate = 0x02,
    Argon2idSensitive = 0x03,
};

enum class AeadAlgorithm : std::uint8_t
{
    Aes256Gcm = 0x01,
    ChaCha20Poly1305 = 0x02,
};

struct Argon2idParams final
{
    std::uint32_t iterations;
    std::uint32_t memoryKiB;
    std::uint32_t parallelism;
};

struct KdfParams final
{
    KdfAlgorithm algorithm{ KdfAlgorithm::Argon2idInteractive };
    std::uint32_t iterations{ 3U };
    std::uint32_t keyBytes{ static_cast<std::uint32_t>(g_vaultKeyBytes) };

    bool operator==(const KdfParams&) const = default;
};

[[nodiscard]] constexpr std::optional<KdfAlgorithm> kdfAlgorithmFromId(std::uint8_t id) noexcept
{
    switch (static_cast<KdfAlgorithm>(id))
    {
    case KdfAlgorithm::Argon2idInteractive:
    case KdfAlgorithm::Argon2idModerate:
    case KdfAlgorithm::Argon2idSensitive:
        return static_cast<KdfAlgorithm>(id);
    }
    return std::nullopt;
}

[[nodiscard]] constexpr std::optional<AeadAlgorithm> aeadAlgorithmFromId(std::uint8_t id) noexcept
{
    switch (static_cast<AeadAlgorithm>(id))
    {
    case AeadAlgorithm::Aes256Gcm:
    case AeadAlgorithm::ChaCha20Poly1305:
        return static_cast<AeadAlgorithm>(id);
    }
    return std::nullopt;
}

// Memory cost per profile in KiB: 64 MiB, 256 MiB, 1 GiB.
[[nodiscard]] constexpr std::optional<std::uint32_t> profileMemoryKiB(KdfAlgorithm algorithm) noexcept
{
    switch (algorithm)
    {
    case KdfAlgorithm::Argon2idInteractive:
        return 64U * 1024U;
    case KdfAlgorithm::Argon2idModerate:
        return 256U * 1024U;
    case KdfAlgorithm::Argon2idSensitive:
        return 1024U * 1024U;
    }
    return std::nullopt;
}

[[nodiscard]] constexpr std::optional<Argon2idParams> argon2idParamsFor(const KdfParams& kdf) noexcept
{
    const auto memoryKiB{ profileMemoryKiB(kdf.algorithm) };
    if (!memoryKiB)
    {
        return std::nullopt;
    }
    return Argon2idParams{ .iterations = kdf.iterations, .memoryKiB = *memoryKiB, .parallelism = 1U };
}

[[nodiscard]] constexpr std::string_view toString(KdfAlgorithm algorithm) noexcept
{
    switch (algorithm)
    {
    case KdfAlgorithm::Argon2idInteractive:
        return "argon2id-interactive";
    case KdfAlgorithm::Argon2idModerate:
        return "argon2id-moderate";
    case KdfAlgorithm::Argon2idSensitive:
        return "argon2id-sensitive";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view toString(AeadAlgorithm algorithm) noexcept
{
    switch (algorithm)
    {
    case AeadAlgorithm::Aes256Gcm:
        return "aes-256-gcm";
    case AeadAlgorithm::ChaCha20Poly1305:
        return "chacha20-poly1305";
    }
    return "unknown";
}

} // namespace coffer::crypto

#endif // INCLUDE_COFFER_CRYPTO_CRYPTOPARAMS_HPP
