#include "coffer/crypto/Argon2id.hpp"
#include "coffer/crypto/CryptoErrors.hpp"
#include "coffer/crypto/providers/NativeProviderFactory.hpp"
#include "coffer/security/ScopeWipe.hpp"
#include "coffer/security/SecureBuffer.hpp"
#include "coffer/security/SecureRandom.hpp"
#include "monocypher.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>

namespace coffer::crypto::providers
{
namespace
{

const std::uint8_t* asU8Ptr(std::span<const std::byte> s) noexcept
{
    return reinterpret_cast<const std::uint8_t*>(s.data());
}

void requireKey(std::span<const std::uint8_t> key, const char* what)
{
    if (key.size() != g_aeadKeyBytes)
    {
        throw std::invalid_argument(what);
    }
}

void requireChaCha(AeadAlgorithm algorithm)
{
    if (algorithm != AeadAlgorithm::ChaCha20Poly1305)
    {
        throw AlgorithmUnavailable{ std::string{ "native provider: " } + std::string{ toString(algorithm) } +
                                    " not supported" };
    }
}

class NativeCryptoProvider final : public ICryptoProvider
{
public:
    [[nodiscard]] coffer::security::SecureBuffer deriveArgon2id(std::span<const std::byte> password,
                                                                std::span<const std::uint8_t> salt,
                                                                const Argon2idParams& params,
                                                                std::size_t outBytes) const override
    {
        return deriveArgon2idMonocypher(password, salt, params, outBytes);
    }

    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        return coffer::security::secureRandomFill(out);
    }

    [[nodiscard]] bool supportsAead(AeadAlgorithm algorithm) const noexcept override
    {
        return algorithm == AeadAlgorithm::ChaCha20Poly1305;
    }

    [[nodiscard]] AeadBox aeadEncrypt(AeadAlgorithm algorithm, std::span<const std::uint8_t> key,
                                      std::span<const std::byte> plainText,
                                      std::span<const std::byte> associatedData) override
    {
        requireChaCha(algorithm);
        requireKey(key, "aeadEncrypt: key");

        AeadBox box{};
        if (!randomBytes(std::span<std::uint8_t>{ box.nonce }))
        {
            throw std::runtime_error("aeadEncrypt: CSPRNG failure");
        }
        box.cipherText.resize(plainText.size());

        crypto_aead_ctx ctx{};
        auto wipeCtx{ coffer::security::scopeWipe(ctx) };
        crypto_aead_init_ietf(&ctx, key.data(), box.nonce.data());
        crypto_aead_write(&ctx, box.cipherText.data(), box.tag.data(), asU8Ptr(associatedData), associatedData.size(),
                          asU8Ptr(plainText), plainText.size());
        return box;
    }

    [[nodiscard]] std::optional<coffer::security::SecureBuffer>
    aeadDecrypt(AeadAlgorithm algorithm, std::span<const std::uint8_t> key, const AeadBox& box,
                std::span<const std::byte> associatedData) override
    {
        requireChaCha(algorithm);
        requireKey(key, "aeadDecrypt: key");

        coffer::security::SecureBuffer plainText(box.cipherText.size());

        crypto_aead_ctx ctx{};
        auto wipeCtx{ coffer::security::scopeWipe(ctx) };
        crypto_aead_init_ietf(&ctx, key.data(), box.nonce.data());
        if (crypto_aead_read(&ctx, plainText.data(), box.tag.data(), asU8Ptr(associatedData), associatedData.size(),
                             box.cipherText.data(), box.cipherText.size()) != 0)
        {
            coffer::security::secureRelease(plainText);
            return std::nullopt;
        }
        return plainText;
    }
};

} // namespace

std::unique_ptr<ICryptoProvider> makeNativeCryptoProvider()
{
    return std::make_unique<NativeCryptoProvider>();
}

} // namespace coffer::crypto::providers
