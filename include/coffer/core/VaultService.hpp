#ifndef INCLUDE_COFFER_CORE_VAULTSERVICE_HPP
#define INCLUDE_COFFER_CORE_VAULTSERVICE_HPP

#include "coffer/core/Result.hpp"
#include "coffer/core/VaultErrors.hpp"
#include "coffer/core/VaultPolicy.hpp"
#include "coffer/core/VaultSession.hpp"
#include "coffer/crypto/ICryptoProvider.hpp"
#include "coffer/security/SecureString.hpp"
#include <cstdint>
#include <span>

namespace coffer::core
{

// Entry point that turns a passphrase into an unlocked VaultSession. Holds no secrets of its own.
class VaultService final
{
public:
    explicit VaultService(coffer::crypto::ICryptoProvider& crypto) noexcept;

    // Fresh salt, derived key, empty vault. Nothing is written; persist the session to save it.
    [[nodiscard]] Result<VaultSession, KeySetupError> createVault(const coffer::security::SecureString& passphrase,
                                                                  const VaultPolicy& policy = defaultVaultPolicy());

    // Parses the envelope, derives the key, authenticates and decrypts, then decodes the entries.
    // Every failure path wipes the key and the plaintext before returning.
    [[nodiscard]] Result<VaultSession, UnlockError> unlockVault(const coffer::security::SecureString& passphrase,
                                                                std::span<const std::uint8_t> envelopeBytes);

private:
    coffer::crypto::ICryptoProvider* m_crypto{ nullptr };
};

} // namespace coffer::core

#endif // INCLUDE_COFFER_CORE_VAULTSERVICE_HPP
