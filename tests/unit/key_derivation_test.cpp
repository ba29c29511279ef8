#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <memory>

#include "coffer/core/KeyDerivation.hpp"
#include "coffer/security/SecureEquals.hpp"
#include "test_utils/CryptoTestSupport.hpp"

namespace
{

using coffer::core::DerivationError;
using coffer::core::KeyMaterial;
using coffer::core::KeySetupError;
using coffer::core::KeySetupErrorKind;
using coffer::crypto::KdfParams;
using coffer::security::SecureBuffer;
using coffer::test_utils::asBytes;

constexpr std::array<std::uint8_t, coffer::crypto::g_kdfSaltBytes> kSalt{ 1, 2, 3, 4, 5, 6, 7, 8,
                                                                          9, 10, 11, 12, 13, 14, 15, 16 };

KdfParams fastParams()
{
    return coffer::test_utils::fastVaultPolicy().kdf;
}

} // namespace

TEST(CheckKdfParams, AcceptsDefaultsAndBounds)
{
    EXPECT_FALSE(coffer::core::checkKdfParams(coffer::core::defaultVaultPolicy().kdf).has_value());

    auto params{ fastParams() };
    params.iterations = coffer::core::g_kdfMaxIterations;
    params.keyBytes = coffer::core::g_kdfMinKeyBytes;
    EXPECT_FALSE(coffer::core::checkKdfParams(params).has_value());
}

TEST(CheckKdfParams, TooFewIterationsIsWeak)
{
    auto params{ fastParams() };
    params.iterations = 1U;
    EXPECT_EQ(coffer::core::checkKdfParams(params), DerivationError::WeakParams);
}

TEST(CheckKdfParams, OutOfRangeValuesAreInvalid)
{
    auto tooMany{ fastParams() };
    tooMany.iterations = coffer::core::g_kdfMaxIterations + 1U;
    EXPECT_EQ(coffer::core::checkKdfParams(tooMany), DerivationError::InvalidParams);

    auto shortKey{ fastParams() };
    shortKey.keyBytes = 8U;
    EXPECT_EQ(coffer::core::checkKdfParams(shortKey), DerivationError::InvalidParams);

    auto longKey{ fastParams() };
    longKey.keyBytes = 65U;
    EXPECT_EQ(coffer::core::checkKdfParams(longKey), DerivationError::InvalidParams);

    auto unknown{ fastParams() };
    unknown.algorithm = static_cast<coffer::crypto::KdfAlgorithm>(0x7FU);
    EXPECT_EQ(coffer::core::checkKdfParams(unknown), DerivationError::InvalidParams);
}

TEST(DeriveKey, SameInputsGiveSameKey)
{
    auto crypto{ coffer::test_utils::makeFastNativeCryptoProvider() };

    auto a{ coffer::core::deriveKey(*crypto, asBytes("correct horse"), kSalt, fastParams()) };
    auto b{ coffer::core::deriveKey(*crypto, asBytes("correct horse"), kSalt, fastParams()) };
    ASSERT_TRUE(std::holds_alternative<SecureBuffer>(a));
    ASSERT_TRUE(std::holds_alternative<SecureBuffer>(b));
    EXPECT_EQ(std::get<SecureBuffer>(a).size(), coffer::crypto::g_vaultKeyBytes);
    EXPECT_TRUE(coffer::security::secureEquals(std::get<SecureBuffer>(a), std::get<SecureBuffer>(b)));

    auto other{ coffer::core::deriveKey(*crypto, asBytes("correct horsE"), kSalt, fastParams()) };
    ASSERT_TRUE(std::holds_alternative<SecureBuffer>(other));
    EXPECT_FALSE(coffer::security::secureEquals(std::get<SecureBuffer>(a), std::get<SecureBuffer>(other)));
}

TEST(DeriveKey, RejectsBadInputsWithoutThrowing)
{
    auto crypto{ coffer::test_utils::makeFastNativeCryptoProvider() };

    const auto empty{ coffer::core::deriveKey(*crypto, asBytes(""), kSalt, fastParams()) };
    ASSERT_TRUE(std::holds_alternative<DerivationError>(empty));
    EXPECT_EQ(std::get<DerivationError>(empty), DerivationError::InvalidParams);

    const std::array<std::uint8_t, 8> shortSalt{};
    const auto salted{ coffer::core::deriveKey(*crypto, asBytes("pw"), shortSalt, fastParams()) };
    ASSERT_TRUE(std::holds_alternative<DerivationError>(salted));
    EXPECT_EQ(std::get<DerivationError>(salted), DerivationError::InvalidParams);

    auto weak{ fastParams() };
    weak.iterations = 1U;
    const auto weakResult{ coffer::core::deriveKey(*crypto, asBytes("pw"), kSalt, weak) };
    ASSERT_TRUE(std::holds_alternative<DerivationError>(weakResult));
    EXPECT_EQ(std::get<DerivationError>(weakResult), DerivationError::WeakParams);
}

TEST(DeriveKey, BackendExceptionBecomesBackendFailure)
{
    coffer::test_utils::FaultInjectingCryptoProvider crypto{ coffer::test_utils::makeFastNativeCryptoProvider() };
    crypto.setDeriveThrows(true);

    const auto result{ coffer::core::deriveKey(crypto, asBytes("pw"), kSalt, fastParams()) };
    ASSERT_TRUE(std::holds_alternative<DerivationError>(result));
    EXPECT_EQ(std::get<DerivationError>(result), DerivationError::BackendFailure);
    EXPECT_EQ(crypto.deriveCalls(), 1);
}

TEST(EstablishVaultKey, DrawsFreshSaltPerCall)
{
    auto crypto{ coffer::test_utils::makeFastNativeCryptoProvider() };
    const auto policy{ coffer::test_utils::fastVaultPolicy() };

    auto a{ coffer::core::establishVaultKey(*crypto, asBytes("pw"), policy) };
    auto b{ coffer::core::establishVaultKey(*crypto, asBytes("pw"), policy) };
    ASSERT_TRUE(std::holds_alternative<KeyMaterial>(a));
    ASSERT_TRUE(std::holds_alternative<KeyMaterial>(b));

    const auto& first{ std::get<KeyMaterial>(a) };
    const auto& second{ std::get<KeyMaterial>(b) };
    EXPECT_EQ(first.header.formatVersion, coffer::core::g_envelopeFormatV1);
    EXPECT_EQ(first.header.kdf, policy.kdf);
    EXPECT_EQ(first.header.aead, policy.aead);
    EXPECT_NE(first.header.salt, second.header.salt);
    EXPECT_FALSE(coffer::security::secureEquals(first.key, second.key));
}

TEST(EstablishVaultKey, ReportsEachFailureKind)
{
    coffer::test_utils::FaultInjectingCryptoProvider crypto{ coffer::test_utils::makeFastNativeCryptoProvider() };

    auto weakPolicy{ coffer::test_utils::fastVaultPolicy() };
    weakPolicy.kdf.iterations = 1U;
    const auto weak{ coffer::core::establishVaultKey(crypto, asBytes("pw"), weakPolicy) };
    ASSERT_TRUE(std::holds_alternative<KeySetupError>(weak));
    EXPECT_EQ(std::get<KeySetupError>(weak).kind, KeySetupErrorKind::DerivationFailed);
    EXPECT_EQ(std::get<KeySetupError>(weak).cause, DerivationError::WeakParams);

    const auto aes{ coffer::core::establishVaultKey(
        crypto, asBytes("pw"), coffer::test_utils::fastVaultPolicy(coffer::crypto::AeadAlgorithm::Aes256Gcm)) };
    ASSERT_TRUE(std::holds_alternative<KeySetupError>(aes));
    EXPECT_EQ(std::get<KeySetupError>(aes).kind, KeySetupErrorKind::AlgorithmUnavailable);

    crypto.setRandomFails(true);
    const auto noRandom{ coffer::core::establishVaultKey(crypto, asBytes("pw"), coffer::test_utils::fastVaultPolicy()) };
    ASSERT_TRUE(std::holds_alternative<KeySetupError>(noRandom));
    EXPECT_EQ(std::get<KeySetupError>(noRandom).kind, KeySetupErrorKind::RandomFailed);
    EXPECT_EQ(crypto.deriveCalls(), 0);
}
