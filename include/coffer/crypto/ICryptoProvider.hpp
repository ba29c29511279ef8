#ifndef INCLUDE_COFFER_CRYPTO_ICRYPTOPROVIDER_HPP
#define INCLUDE_COFFER_CRYPTO_ICRYPTOPROVIDER_HPP

#include "coffer/crypto/CryptoParams.hpp"
#include "coffer/security/SecureBuffer.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace coffer::crypto
{

constexpr std::size_t g_aeadKeyBytes{ 32 };
constexpr std::size_t g_aeadNonceBytes{ 12 };
constexpr std::size_t g_aeadTagBytes{ 16 };

struct AeadBox final
{
    std::array<std::uint8_t, g_aeadNonceBytes> nonce{};
    std::array<std::uint8_t, g_aeadTagBytes> tag{};
    std::vector<std::uint8_t> cipherText;
};

class ICryptoProvider
{
public:
    ICryptoProvider() = default;
    ICryptoProvider(const ICryptoProvider&) = delete;
    ICryptoProvider& operator=(const ICryptoProvider&) = delete;
    ICryptoProvider(ICryptoProvider&&) = delete;
    ICryptoProvider& operator=(ICryptoProvider&&) = delete;
    virtual ~ICryptoProvider() = default;

    // Raw Argon2id v1.3. Parameter sanity (non-empty password, salt size, resource caps) is enforced here and
    // violations throw std::invalid_argument; backend failures throw std::runtime_error.
    [[nodiscard]] virtual coffer::security::SecureBuffer deriveArgon2id(std::span<const std::byte> password,
                                                                        std::span<const std::uint8_t> salt,
                                                                        const Argon2idParams& params,
                                                                        std::size_t outBytes) const = 0;

    [[nodiscard]] virtual bool randomBytes(std::span<std::uint8_t> out) noexcept = 0;

    [[nodiscard]] virtual bool supportsAead(AeadAlgorithm algorithm) const noexcept = 0;

    // Generates a fresh random nonce per call.
    // Throws AlgorithmUnavailable for an algorithm the backend lacks.
    [[nodiscard]] virtual AeadBox aeadEncrypt(AeadAlgorithm algorithm, std::span<const std::uint8_t> key,
                                              std::span<const std::byte> plainText,
                                              std::span<const std::byte> associatedData) = 0;

    // Returns std::nullopt on authentication failure.
    [[nodiscard]] virtual std::optional<coffer::security::SecureBuffer>
    aeadDecrypt(AeadAlgorithm algorithm, std::span<const std::uint8_t> key, const AeadBox& box,
                std::span<const std::byte> associatedData) = 0;
};

} // namespace coffer::crypto

#endif // INCLUDE_COFFER_CRYPTO_ICRYPTOPROVIDER_HPP
