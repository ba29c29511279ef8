#include "coffer/crypto/Argon2id.hpp"
#include "coffer/crypto/CryptoErrors.hpp"
#include "coffer/crypto/providers/OpenSslProviderFactory.hpp"
#include "coffer/security/SecureBuffer.hpp"
#include "coffer/security/SecureRandom.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>

namespace coffer::crypto::providers
{
namespace
{

constexpr const char* g_kdfParamArgon2Memcost{ "memcost" };
constexpr const char* g_kdfParamArgon2Lanes{ "lanes" };
constexpr const char* g_kdfParamThreads{ "threads" };
constexpr const char* g_kdfParamArgon2Version{ "version" };

using EvpKdfPtr = std::unique_ptr<EVP_KDF, decltype(&EVP_KDF_free)>;
using EvpKdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, decltype(&EVP_KDF_CTX_free)>;
using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

EvpKdfPtr fetchArgon2idKdf()
{
    return EvpKdfPtr{ EVP_KDF_fetch(nullptr, "ARGON2ID", nullptr), &EVP_KDF_free };
}

const EVP_CIPHER* cipherFor(AeadAlgorithm algorithm)
{
    switch (algorithm)
    {
    case AeadAlgorithm::Aes256Gcm:
        return EVP_aes_256_gcm();
    case AeadAlgorithm::ChaCha20Poly1305:
        return EVP_chacha20_poly1305();
    }
    throw AlgorithmUnavailable{ "openssl provider: unknown AEAD algorithm" };
}

void requireKey(std::span<const std::uint8_t> key, const char* what)
{
    if (key.size() != g_aeadKeyBytes)
    {
        throw std::invalid_argument(what);
    }
}

void requireIntSized(std::size_t size, const char* what)
{
    if (size > static_cast<std::size_t>(std::numeric_limits<int>::max()))
    {
        throw std::invalid_argument(what);
    }
}

void check(int rc, const char* what)
{
    if (rc != 1)
    {
        throw std::runtime_error(what);
    }
}

// Sets cipher, nonce length, key and nonce, then feeds the associated data.
EvpCipherCtxPtr initAead(AeadAlgorithm algorithm, bool encrypt, std::span<const std::uint8_t> key,
                         std::span<const std::uint8_t> nonce, std::span<const std::byte> associatedData)
{
    EvpCipherCtxPtr ctx{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free };
    if (!ctx)
    {
        throw std::runtime_error("aead: EVP_CIPHER_CTX_new failed");
    }

    const int enc{ encrypt ? 1 : 0 };
    check(EVP_CipherInit_ex(ctx.get(), cipherFor(algorithm), nullptr, nullptr, nullptr, enc), "aead: init failed");
    check(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(nonce.size()), nullptr),
          "aead: set ivlen failed");
    check(EVP_CipherInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data(), enc),
          "aead: set key/nonce failed");

    int len{ 0 };
    check(EVP_CipherUpdate(ctx.get(), nullptr, &len, reinterpret_cast<const unsigned char*>(associatedData.data()),
                           static_cast<int>(associatedData.size())),
          "aead: add aad failed");
    return ctx;
}

class OpenSslCryptoProvider final : public ICryptoProvider
{
public:
    OpenSslCryptoProvider() : m_argon2idKdf{ fetchArgon2idKdf() }
    {
    }

    [[nodiscard]] coffer::security::SecureBuffer deriveArgon2id(std::span<const std::byte> password,
                                                                std::span<const std::uint8_t> salt,
                                                                const Argon2idParams& params,
                                                                std::size_t outBytes) const override
    {
        requireArgon2idInputs(password, salt, params, outBytes);
        if (!m_argon2idKdf)
        {
            throw std::runtime_error("deriveArgon2id: OpenSSL Argon2id KDF not available");
        }

        EvpKdfCtxPtr ctx{ EVP_KDF_CTX_new(m_argon2idKdf.get()), &EVP_KDF_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("deriveArgon2id: EVP_KDF_CTX_new failed");
        }

        std::uint32_t iter{ params.iterations };
        std::uint32_t memcostKiB{ params.memoryKiB };
        std::uint32_t lanes{ params.parallelism };
        std::uint32_t threads{ params.parallelism };
        std::uint32_t version{ g_argon2VersionV13 };

        // OSSL_PARAM takes non-const pointers; hand it owned copies rather than casting away const.
        coffer::security::SecureBuffer passwordCopy(password.size());
        std::memcpy(passwordCopy.data(), password.data(), password.size());
        std::array<std::uint8_t, g_kdfSaltBytes> saltCopy{};
        std::memcpy(saltCopy.data(), salt.data(), saltCopy.size());

        OSSL_PARAM osslParams[]{
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_PASSWORD, passwordCopy.data(), passwordCopy.size()),
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT, saltCopy.data(), saltCopy.size()),
            OSSL_PARAM_construct_uint32(OSSL_KDF_PARAM_ITER, &iter),
            OSSL_PARAM_construct_uint32(g_kdfParamArgon2Memcost, &memcostKiB),
            OSSL_PARAM_construct_uint32(g_kdfParamArgon2Lanes, &lanes),
            OSSL_PARAM_construct_uint32(g_kdfParamThreads, &threads),
            OSSL_PARAM_construct_uint32(g_kdfParamArgon2Version, &version),
            OSSL_PARAM_construct_end(),
        };

        coffer::security::SecureBuffer out(outBytes);
        if (EVP_KDF_derive(ctx.get(), out.data(), out.size(), osslParams) <= 0)
        {
            throw std::runtime_error("deriveArgon2id: EVP_KDF_derive failed");
        }
        return out;
    }

    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        return coffer::security::secureRandomFill(out);
    }

    [[nodiscard]] bool supportsAead(AeadAlgorithm algorithm) const noexcept override
    {
        return algorithm == AeadAlgorithm::Aes256Gcm || algorithm == AeadAlgorithm::ChaCha20Poly1305;
    }

    [[nodiscard]] AeadBox aeadEncrypt(AeadAlgorithm algorithm, std::span<const std::uint8_t> key,
                                      std::span<const std::byte> plainText,
                                      std::span<const std::byte> associatedData) override
    {
        requireKey(key, "aeadEncrypt: key");
        requireIntSized(plainText.size(), "aeadEncrypt: plainText too large");
        requireIntSized(associatedData.size(), "aeadEncrypt: associatedData too large");

        AeadBox box{};
        if (!randomBytes(std::span<std::uint8_t>{ box.nonce }))
        {
            throw std::runtime_error("aeadEncrypt: CSPRNG failure");
        }

        auto ctx{ initAead(algorithm, true, key, box.nonce, associatedData) };

        box.cipherText.resize(plainText.size());
        int outLen{ 0 };
        check(EVP_EncryptUpdate(ctx.get(), box.cipherText.data(), &outLen,
                                reinterpret_cast<const unsigned char*>(plainText.data()),
                                static_cast<int>(plainText.size())),
              "aeadEncrypt: encrypt update failed");
        int finalLen{ 0 };
        check(EVP_EncryptFinal_ex(ctx.get(), box.cipherText.data() + outLen, &finalLen),
              "aeadEncrypt: encrypt final failed");
        if (static_cast<std::size_t>(outLen) + static_cast<std::size_t>(finalLen) != plainText.size())
        {
            throw std::runtime_error("aeadEncrypt: unexpected output length");
        }

        check(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(box.tag.size()),
                                  box.tag.data()),
              "aeadEncrypt: get tag failed");
        return box;
    }

    [[nodiscard]] std::optional<coffer::security::SecureBuffer>
    aeadDecrypt(AeadAlgorithm algorithm, std::span<const std::uint8_t> key, const AeadBox& box,
                std::span<const std::byte> associatedData) override
    {
        requireKey(key, "aeadDecrypt: key");
        requireIntSized(box.cipherText.size(), "aeadDecrypt: cipherText too large");
        requireIntSized(associatedData.size(), "aeadDecrypt: associatedData too large");

        auto ctx{ initAead(algorithm, false, key, box.nonce, associatedData) };

        coffer::security::SecureBuffer plainText(box.cipherText.size());
        int outLen{ 0 };
        if (EVP_DecryptUpdate(ctx.get(), plainText.data(), &outLen, box.cipherText.data(),
                              static_cast<int>(box.cipherText.size())) != 1)
        {
            coffer::security::secureRelease(plainText);
            return std::nullopt;
        }

        std::array<std::uint8_t, g_aeadTagBytes> tagCopy{ box.tag };
        check(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(tagCopy.size()),
                                  tagCopy.data()),
              "aeadDecrypt: set tag failed");

        int finalLen{ 0 };
        if (EVP_DecryptFinal_ex(ctx.get(), plainText.data() + outLen, &finalLen) != 1 ||
            static_cast<std::size_t>(outLen) + static_cast<std::size_t>(finalLen) != plainText.size())
        {
            coffer::security::secureRelease(plainText);
            return std::nullopt;
        }
        return plainText;
    }

private:
    EvpKdfPtr m_argon2idKdf{ nullptr, &EVP_KDF_free };
};

} // namespace

std::unique_ptr<ICryptoProvider> makeOpenSslCryptoProvider()
{
    return std::make_unique<OpenSslCryptoProvider>();
}

} // namespace coffer::crypto::providers
