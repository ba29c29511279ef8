#include "coffer/core/VaultService.hpp"

#include "coffer/core/KeyDerivation.hpp"
#include "coffer/core/VaultCipher.hpp"
#include "coffer/core/VaultCodec.hpp"
#include "coffer/core/VaultEnvelope.hpp"
#include "coffer/diagnostics/Log.hpp"
#include <utility>

namespace coffer::core
{
namespace
{

[[nodiscard]] UnlockError unlockFailed(UnlockCause cause)
{
    const UnlockError error{ classifyUnlockFailure(cause) };
    coffer::diagnostics::warning("unlock failed: ", describe(error), " (", causeName(error.cause), ")");
    return error;
}

} // namespace

VaultService::VaultService(coffer::crypto::ICryptoProvider& crypto) noexcept : m_crypto{ &crypto }
{
}

Result<VaultSession, KeySetupError> VaultService::createVault(const coffer::security::SecureString& passphrase,
                                                              const VaultPolicy& policy)
{
    auto material{ establishVaultKey(*m_crypto, coffer::security::asBytes(passphrase), policy) };
    if (std::holds_alternative<KeySetupError>(material))
    {
        const auto error{ std::get<KeySetupError>(material) };
        coffer::diagnostics::warning("create failed: ", describe(error));
        return error;
    }

    auto& fresh{ std::get<KeyMaterial>(material) };
    coffer::diagnostics::info("vault created: ", coffer::crypto::toString(fresh.header.kdf.algorithm), ", ",
                              coffer::crypto::toString(fresh.header.aead));
    return VaultSession{ *m_crypto, fresh.header, std::move(fresh.key), Vault{} };
}

Result<VaultSession, UnlockError> VaultService::unlockVault(const coffer::security::SecureString& passphrase,
                                                            std::span<const std::uint8_t> envelopeBytes)
{
    auto envelopeOrErr{ parseEnvelope(envelopeBytes) };
    if (std::holds_alternative<CipherError>(envelopeOrErr))
    {
        return unlockFailed(std::get<CipherError>(envelopeOrErr));
    }
    const auto& envelope{ std::get<VaultEnvelope>(envelopeOrErr) };

    // Checked before the expensive derivation.
    if (!m_crypto->supportsAead(envelope.header.aead))
    {
        return unlockFailed(CipherError::AlgorithmUnavailable);
    }

    auto keyOrErr{ deriveKey(*m_crypto, coffer::security::asBytes(passphrase), envelope.header.salt,
                             envelope.header.kdf) };
    if (std::holds_alternative<DerivationError>(keyOrErr))
    {
        return unlockFailed(std::get<DerivationError>(keyOrErr));
    }
    auto& key{ std::get<coffer::security::SecureBuffer>(keyOrErr) };

    auto plainOrErr{ openVault(*m_crypto, envelope, key) };
    if (std::holds_alternative<CipherError>(plainOrErr))
    {
        coffer::security::secureRelease(key);
        return unlockFailed(std::get<CipherError>(plainOrErr));
    }
    auto& plainText{ std::get<coffer::security::SecureBuffer>(plainOrErr) };

    auto vaultOrErr{ decodeVault(plainText) };
    coffer::security::secureRelease(plainText);
    if (std::holds_alternative<CodecError>(vaultOrErr))
    {
        coffer::security::secureRelease(key);
        return unlockFailed(std::get<CodecError>(vaultOrErr));
    }

    auto& vault{ std::get<Vault>(vaultOrErr) };
    coffer::diagnostics::info("vault unlocked: ", vault.size(), " entries");
    return VaultSession{ *m_crypto, envelope.header, std::move(key), std::move(vault) };
}

} // namespace coffer::core
