#ifndef INCLUDE_COFFER_CORE_VAULTENVELOPE_HPP
#define INCLUDE_COFFER_CORE_VAULTENVELOPE_HPP

#include "coffer/core/Result.hpp"
#include "coffer/core/VaultErrors.hpp"
#include "coffer/crypto/CryptoParams.hpp"
#include "coffer/crypto/ICryptoProvider.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace coffer::core
{

constexpr std::uint8_t g_envelopeFormatV1{ 0x01U };

// [1] version [1] kdf id [4] iterations (BE) [16] salt [1] aead id. These bytes are the AEAD associated data.
constexpr std::size_t g_envelopeHeaderBytes{ 1U + 1U + 4U + coffer::crypto::g_kdfSaltBytes + 1U };

// Header, nonce and tag; the ciphertext may be empty only in principle.
constexpr std::size_t g_envelopeMinBytes{ g_envelopeHeaderBytes + coffer::crypto::g_aeadNonceBytes +
                                          coffer::crypto::g_aeadTagBytes };

struct EnvelopeHeader final
{
    std::uint8_t formatVersion{ g_envelopeFormatV1 };
    coffer::crypto::KdfParams kdf{};
    std::array<std::uint8_t, coffer::crypto::g_kdfSaltBytes> salt{};
    coffer::crypto::AeadAlgorithm aead{ coffer::crypto::AeadAlgorithm::ChaCha20Poly1305 };

    bool operator==(const EnvelopeHeader&) const = default;
};

struct VaultEnvelope final
{
    EnvelopeHeader header{};
    coffer::crypto::AeadBox box{};
};

[[nodiscard]] std::array<std::byte, g_envelopeHeaderBytes> encodeEnvelopeHeader(const EnvelopeHeader& header) noexcept;

[[nodiscard]] std::vector<std::uint8_t> serializeEnvelope(const VaultEnvelope& envelope);

// Structural check only: ids must be known, lengths must fit. KDF cost limits are the key derivation's concern.
[[nodiscard]] Result<VaultEnvelope, CipherError> parseEnvelope(std::span<const std::uint8_t> bytes);

} // namespace coffer::core

#endif // INCLUDE_COFFER_CORE_VAULTENVELOPE_HPP
