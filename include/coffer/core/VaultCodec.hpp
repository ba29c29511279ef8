#ifndef INCLUDE_COFFER_CORE_VAULTCODEC_HPP
#define INCLUDE_COFFER_CORE_VAULTCODEC_HPP

#include "coffer/core/Result.hpp"
#include "coffer/core/Vault.hpp"
#include "coffer/core/VaultErrors.hpp"
#include "coffer/security/SecureBuffer.hpp"
#include <array>
#include <cstdint>
#include <span>

namespace coffer::core
{

// Plaintext payload layout, all integers big-endian:
//   [4] magic "CFRV" [2] schema version [4] entry count
//   per entry: [16] id [8] created ms [8] modified ms [1] flags (bit0 url, bit1 notes)
//              [4+n] title [4+n] username [4+n] password [4+n] url? [4+n] notes?
constexpr std::array<std::uint8_t, 4> g_payloadMagic{ 'C', 'F', 'R', 'V' };
constexpr std::uint16_t g_payloadSchemaV1{ 1U };

constexpr std::uint8_t g_entryFlagUrl{ 0x01U };
constexpr std::uint8_t g_entryFlagNotes{ 0x02U };

[[nodiscard]] coffer::security::SecureBuffer encodeVault(const Vault& vault);

// On any failure nothing decoded so far survives; partially built entries are wiped.
[[nodiscard]] Result<Vault, CodecError> decodeVault(std::span<const std::uint8_t> bytes);

} // namespace coffer::core

#endif // INCLUDE_COFFER_CORE_VAULTCODEC_HPP
