#include "coffer/core/VaultEnvelope.hpp"

#include "BigEndian.hpp"
#include <algorithm>
#include <initializer_list>

namespace coffer::core
{

std::array<std::byte, g_envelopeHeaderBytes> encodeEnvelopeHeader(const EnvelopeHeader& header) noexcept
{
    std::array<std::byte, g_envelopeHeaderBytes> out{};
    std::size_t offset{};
    const auto put{ [&out, &offset](std::uint8_t v) noexcept { out[offset++] = static_cast<std::byte>(v); } };

    put(header.formatVersion);
    put(static_cast<std::uint8_t>(header.kdf.algorithm));
    for (const unsigned shift : { 24U, 16U, 8U, 0U })
    {
        put(static_cast<std::uint8_t>((header.kdf.iterations >> shift) & 0xFFU));
    }
    for (const std::uint8_t b : header.salt)
    {
        put(b);
    }
    put(static_cast<std::uint8_t>(header.aead));
    return out;
}

std::vector<std::uint8_t> serializeEnvelope(const VaultEnvelope& envelope)
{
    const auto header{ encodeEnvelopeHeader(envelope.header) };

    std::vector<std::uint8_t> out{};
    out.reserve(g_envelopeMinBytes + envelope.box.cipherText.size());
    for (const std::byte b : header)
    {
        out.push_back(std::to_integer<std::uint8_t>(b));
    }
    out.insert(out.end(), envelope.box.nonce.begin(), envelope.box.nonce.end());
    out.insert(out.end(), envelope.box.cipherText.begin(), envelope.box.cipherText.end());
    out.insert(out.end(), envelope.box.tag.begin(), envelope.box.tag.end());
    return out;
}

Result<VaultEnvelope, CipherError> parseEnvelope(std::span<const std::uint8_t> bytes)
{
    // Version first, so a future format with a different layout reports as such rather than as malformed.
    if (bytes.empty())
    {
        return CipherError::MalformedEnvelope;
    }
    if (bytes.front() != g_envelopeFormatV1)
    {
        return CipherError::UnsupportedVersion;
    }
    if (bytes.size() < g_envelopeMinBytes)
    {
        return CipherError::MalformedEnvelope;
    }

    detail::BigEndianReader in{ bytes };
    VaultEnvelope envelope{};
    std::uint8_t kdfId{};
    std::uint8_t aeadId{};
    std::span<const std::uint8_t> salt{};
    std::span<const std::uint8_t> nonce{};
    std::span<const std::uint8_t> sealed{};
    if (!in.u8(envelope.header.formatVersion) || !in.u8(kdfId) || !in.u32(envelope.header.kdf.iterations) ||
        !in.take(coffer::crypto::g_kdfSaltBytes, salt) || !in.u8(aeadId) ||
        !in.take(coffer::crypto::g_aeadNonceBytes, nonce) || !in.take(in.remaining(), sealed))
    {
        return CipherError::MalformedEnvelope;
    }

    const auto kdf{ coffer::crypto::kdfAlgorithmFromId(kdfId) };
    const auto aead{ coffer::crypto::aeadAlgorithmFromId(aeadId) };
    if (!kdf || !aead)
    {
        return CipherError::MalformedEnvelope;
    }
    envelope.header.kdf.algorithm = *kdf;
    envelope.header.kdf.keyBytes = static_cast<std::uint32_t>(coffer::crypto::g_vaultKeyBytes);
    envelope.header.aead = *aead;
    std::copy(salt.begin(), salt.end(), envelope.header.salt.begin());
    std::copy(nonce.begin(), nonce.end(), envelope.box.nonce.begin());

    const auto tagStart{ sealed.size() - coffer::crypto::g_aeadTagBytes };
    envelope.box.cipherText.assign(sealed.begin(), sealed.begin() + static_cast<std::ptrdiff_t>(tagStart));
    std::copy(sealed.begin() + static_cast<std::ptrdiff_t>(tagStart), sealed.end(), envelope.box.tag.begin());
    return envelope;
}

} // namespace coffer::core
