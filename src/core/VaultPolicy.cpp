#include "coffer/core/VaultPolicy.hpp"

#include <cstdint>
#include <initializer_list>

namespace coffer::core
{

VaultPolicy defaultVaultPolicy() noexcept
{
    constexpr std::uint32_t defaultIterations{ 3U };

    return VaultPolicy{
        .kdf = coffer::crypto::KdfParams{ .algorithm = coffer::crypto::KdfAlgorithm::Argon2idInteractive,
                                          .iterations = defaultIterations,
                                          .keyBytes = static_cast<std::uint32_t>(coffer::crypto::g_vaultKeyBytes) },
        .aead = coffer::crypto::AeadAlgorithm::ChaCha20Poly1305,
    };
}

std::optional<coffer::crypto::KdfAlgorithm> parseKdfProfile(std::string_view name) noexcept
{
    using coffer::crypto::KdfAlgorithm;
    for (const KdfAlgorithm a :
         { KdfAlgorithm::Argon2idInteractive, KdfAlgorithm::Argon2idModerate, KdfAlgorithm::Argon2idSensitive })
    {
        const auto full{ coffer::crypto::toString(a) };
        if (name == full || name == full.substr(full.find('-') + 1U))
        {
            return a;
        }
    }
    return std::nullopt;
}

std::optional<coffer::crypto::AeadAlgorithm> parseAeadAlgorithm(std::string_view name) noexcept
{
    using coffer::crypto::AeadAlgorithm;
    if (name == coffer::crypto::toString(AeadAlgorithm::Aes256Gcm) || name == "aes")
    {
        return AeadAlgorithm::Aes256Gcm;
    }
    if (name == coffer::crypto::toString(AeadAlgorithm::ChaCha20Poly1305) || name == "chacha")
    {
        return AeadAlgorithm::ChaCha20Poly1305;
    }
    return std::nullopt;
}

} // namespace coffer::core
