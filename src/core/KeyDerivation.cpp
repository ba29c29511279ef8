#include "coffer/core/KeyDerivation.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

namespace coffer::core
{

std::optional<DerivationError> checkKdfParams(const coffer::crypto::KdfParams& params) noexcept
{
    if (!coffer::crypto::kdfAlgorithmFromId(static_cast<std::uint8_t>(params.algorithm)))
    {
        return DerivationError::InvalidParams;
    }
    if (params.iterations < g_kdfMinIterations)
    {
        return DerivationError::WeakParams;
    }
    if (params.iterations > g_kdfMaxIterations)
    {
        return DerivationError::InvalidParams;
    }
    if (params.keyBytes < g_kdfMinKeyBytes || params.keyBytes > g_kdfMaxKeyBytes)
    {
        return DerivationError::InvalidParams;
    }
    return std::nullopt;
}

Result<coffer::security::SecureBuffer, DerivationError> deriveKey(const coffer::crypto::ICryptoProvider& crypto,
                                                                  std::span<const std::byte> passphrase,
                                                                  std::span<const std::uint8_t> salt,
                                                                  const coffer::crypto::KdfParams& params) noexcept
{
    if (const auto rejected{ checkKdfParams(params) })
    {
        return *rejected;
    }
    if (passphrase.empty() || salt.size() != coffer::crypto::g_kdfSaltBytes)
    {
        return DerivationError::InvalidParams;
    }
    const auto argon2{ coffer::crypto::argon2idParamsFor(params) };
    if (!argon2)
    {
        return DerivationError::InvalidParams;
    }

    try
    {
        return crypto.deriveArgon2id(passphrase, salt, *argon2, params.keyBytes);
    }
    catch (const std::invalid_argument&)
    {
        return DerivationError::InvalidParams;
    }
    catch (const std::exception&)
    {
        // Out of memory for the work area, or a backend without Argon2id.
        return DerivationError::BackendFailure;
    }
}

Result<KeyMaterial, KeySetupError> establishVaultKey(coffer::crypto::ICryptoProvider& crypto,
                                                     std::span<const std::byte> passphrase,
                                                     const VaultPolicy& policy) noexcept
{
    if (const auto rejected{ checkKdfParams(policy.kdf) })
    {
        return KeySetupError{ .kind = KeySetupErrorKind::DerivationFailed, .cause = *rejected };
    }
    if (!crypto.supportsAead(policy.aead))
    {
        return KeySetupError{ .kind = KeySetupErrorKind::AlgorithmUnavailable, .cause = std::nullopt };
    }

    KeyMaterial out{};
    out.header.formatVersion = g_envelopeFormatV1;
    out.header.kdf = policy.kdf;
    out.header.aead = policy.aead;
    if (!crypto.randomBytes(std::span<std::uint8_t>{ out.header.salt }))
    {
        return KeySetupError{ .kind = KeySetupErrorKind::RandomFailed, .cause = std::nullopt };
    }

    auto keyOrErr{ deriveKey(crypto, passphrase, out.header.salt, out.header.kdf) };
    if (std::holds_alternative<DerivationError>(keyOrErr))
    {
        return KeySetupError{ .kind = KeySetupErrorKind::DerivationFailed,
                              .cause = std::get<DerivationError>(keyOrErr) };
    }
    out.key = std::move(std::get<coffer::security::SecureBuffer>(keyOrErr));
    return out;
}

} // namespace coffer::core
