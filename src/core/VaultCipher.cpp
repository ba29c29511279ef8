#include "coffer/core/VaultCipher.hpp"

#include "coffer/crypto/CryptoErrors.hpp"
#include <exception>
#include <stdexcept>
#include <utility>

namespace coffer::core
{

Result<VaultEnvelope, CipherError> sealVault(coffer::crypto::ICryptoProvider& crypto, const EnvelopeHeader& header,
                                             std::span<const std::uint8_t> key,
                                             std::span<const std::uint8_t> plainText) noexcept
{
    if (header.formatVersion != g_envelopeFormatV1)
    {
        return CipherError::UnsupportedVersion;
    }
    if (key.size() != coffer::crypto::g_aeadKeyBytes)
    {
        return CipherError::MalformedEnvelope;
    }
    if (!crypto.supportsAead(header.aead))
    {
        return CipherError::AlgorithmUnavailable;
    }

    const auto aad{ encodeEnvelopeHeader(header) };
    try
    {
        return VaultEnvelope{ .header = header,
                              .box = crypto.aeadEncrypt(header.aead, key, std::as_bytes(plainText),
                                                        std::span<const std::byte>{ aad }) };
    }
    catch (const coffer::crypto::AlgorithmUnavailable&)
    {
        return CipherError::AlgorithmUnavailable;
    }
    catch (const std::exception&)
    {
        return CipherError::BackendFailure;
    }
}

Result<coffer::security::SecureBuffer, CipherError> openVault(coffer::crypto::ICryptoProvider& crypto,
                                                              const VaultEnvelope& envelope,
                                                              std::span<const std::uint8_t> key) noexcept
{
    if (envelope.header.formatVersion != g_envelopeFormatV1)
    {
        return CipherError::UnsupportedVersion;
    }
    if (key.size() != coffer::crypto::g_aeadKeyBytes)
    {
        return CipherError::MalformedEnvelope;
    }
    if (!crypto.supportsAead(envelope.header.aead))
    {
        return CipherError::AlgorithmUnavailable;
    }

    const auto aad{ encodeEnvelopeHeader(envelope.header) };
    try
    {
        auto plainOpt{ crypto.aeadDecrypt(envelope.header.aead, key, envelope.box, std::span<const std::byte>{ aad }) };
        if (!plainOpt)
        {
            return CipherError::AuthenticationFailed;
        }
        return std::move(*plainOpt);
    }
    catch (const coffer::crypto::AlgorithmUnavailable&)
    {
        return CipherError::AlgorithmUnavailable;
    }
    catch (const std::exception&)
    {
        return CipherError::BackendFailure;
    }
}

} // namespace coffer::core
