#ifndef INCLUDE_COFFER_CORE_VAULTCIPHER_HPP
#define INCLUDE_COFFER_CORE_VAULTCIPHER_HPP

#include "coffer/core/Result.hpp"
#include "coffer/core/VaultEnvelope.hpp"
#include "coffer/core/VaultErrors.hpp"
#include "coffer/crypto/ICryptoProvider.hpp"
#include "coffer/security/SecureBuffer.hpp"
#include <cstdint>
#include <span>

namespace coffer::core
{

// Encrypts under a fresh random nonce, binding the header as associated data.
[[nodiscard]] Result<VaultEnvelope, CipherError> sealVault(coffer::crypto::ICryptoProvider& crypto,
                                                           const EnvelopeHeader& header,
                                                           std::span<const std::uint8_t> key,
                                                           std::span<const std::uint8_t> plainText) noexcept;

// A wrong key and a tampered envelope are indistinguishable: both give AuthenticationFailed.
[[nodiscard]] Result<coffer::security::SecureBuffer, CipherError>
openVault(coffer::crypto::ICryptoProvider& crypto, const VaultEnvelope& envelope,
          std::span<const std::uint8_t> key) noexcept;

} // namespace coffer::core

#endif // INCLUDE_COFFER_CORE_VAULTCIPHER_HPP
