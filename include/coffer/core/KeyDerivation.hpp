#ifndef INCLUDE_COFFER_CORE_KEYDERIVATION_HPP
#define INCLUDE_COFFER_CORE_KEYDERIVATION_HPP

#include "coffer/core/Result.hpp"
#include "coffer/core/VaultEnvelope.hpp"
#include "coffer/core/VaultPolicy.hpp"
#include "coffer/core/VaultErrors.hpp"
#include "coffer/crypto/CryptoParams.hpp"
#include "coffer/crypto/ICryptoProvider.hpp"
#include "coffer/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace coffer::core
{

constexpr std::uint32_t g_kdfMinIterations{ 2U };
constexpr std::uint32_t g_kdfMaxIterations{ 10U };
constexpr std::uint32_t g_kdfMinKeyBytes{ 16U };
constexpr std::uint32_t g_kdfMaxKeyBytes{ 64U };

// Policy check shared by derivation and by vault creation. Empty means acceptable.
[[nodiscard]] std::optional<DerivationError> checkKdfParams(const coffer::crypto::KdfParams& params) noexcept;

// The passphrase stays owned by the caller. Backend exceptions never escape.
[[nodiscard]] Result<coffer::security::SecureBuffer, DerivationError>
deriveKey(const coffer::crypto::ICryptoProvider& crypto, std::span<const std::byte> passphrase,
          std::span<const std::uint8_t> salt, const coffer::crypto::KdfParams& params) noexcept;

struct KeyMaterial final
{
    EnvelopeHeader header{};
    coffer::security::SecureBuffer key;
};

// Fresh salt, policy check, derivation. Used for new vaults and for passphrase changes.
[[nodiscard]] Result<KeyMaterial, KeySetupError> establishVaultKey(coffer::crypto::ICryptoProvider& crypto,
                                                                   std::span<const std::byte> passphrase,
                                                                   const VaultPolicy& policy) noexcept;

} // namespace coffer::core

#endif // INCLUDE_COFFER_CORE_KEYDERIVATION_HPP
