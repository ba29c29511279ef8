#ifndef INCLUDE_COFFER_CORE_VAULTPOLICY_HPP
#define INCLUDE_COFFER_CORE_VAULTPOLICY_HPP

#include "coffer/crypto/CryptoParams.hpp"
#include <optional>
#include <string_view>

namespace coffer::core
{

// Algorithms and cost chosen when a vault is created or its passphrase changes.
struct VaultPolicy final
{
    coffer::crypto::KdfParams kdf{};
    coffer::crypto::AeadAlgorithm aead{ coffer::crypto::AeadAlgorithm::ChaCha20Poly1305 };

    bool operator==(const VaultPolicy&) const = default;
};

[[nodiscard]] VaultPolicy defaultVaultPolicy() noexcept;

// Accept the names printed by coffer::crypto::toString, plus the short forms "interactive", "aes", "chacha".
[[nodiscard]] std::optional<coffer::crypto::KdfAlgorithm> parseKdfProfile(std::string_view name) noexcept;
[[nodiscard]] std::optional<coffer::crypto::AeadAlgorithm> parseAeadAlgorithm(std::string_view name) noexcept;

} // namespace coffer::core

#endif // INCLUDE_COFFER_CORE_VAULTPOLICY_HPP
