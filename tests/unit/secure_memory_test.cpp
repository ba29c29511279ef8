#include <gtest/gtest.h>

#include "coffer/security/SecureBuffer.hpp"
#include "coffer/security/SecureEquals.hpp"
#include "coffer/security/SecureString.hpp"
#include "test_utils/CryptoTestSupport.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace
{

using coffer::security::SecureBuffer;
using coffer::security::SecureString;
using coffer::security::secureStringFrom;

TEST(SecureEquals, MatchingPassphrasesCompareEqual)
{
    const auto typed{ secureStringFrom("correct horse battery staple") };
    const auto confirmed{ secureStringFrom("correct horse battery staple") };
    EXPECT_TRUE(coffer::security::secureEquals(typed, confirmed));
}

TEST(SecureEquals, LastByteDifferenceIsDetected)
{
    SecureBuffer a(32U, std::uint8_t{ 0x5AU });
    SecureBuffer b(32U, std::uint8_t{ 0x5AU });
    b.back() = 0x5BU;
    EXPECT_FALSE(coffer::security::secureEquals(a, b));
}

TEST(SecureEquals, PrefixIsNotEqual)
{
    EXPECT_FALSE(coffer::security::secureEquals(secureStringFrom("hunter2"), secureStringFrom("hunter")));
}

TEST(SecureEquals, MixesContainerTypes)
{
    constexpr std::array<std::uint8_t, 3> raw{ 'a', 'b', 'c' };
    EXPECT_TRUE(coffer::security::secureEquals(secureStringFrom("abc"), raw));
    EXPECT_TRUE(coffer::security::secureEquals(SecureString{}, std::string_view{}));
}

TEST(SecureString, EmptyViewIsSafe)
{
    const SecureString s{};
    EXPECT_TRUE(coffer::security::asStringView(s).empty());
    EXPECT_TRUE(coffer::security::asBytes(s).empty());
}

TEST(SecureString, KeepsArbitraryBytes)
{
    constexpr char bytes[]{ '\x00', '\x7F', static_cast<char>(0x80), static_cast<char>(0xFF) };
    const std::string_view input{ bytes, sizeof(bytes) };

    const auto s{ secureStringFrom(input) };
    EXPECT_EQ(coffer::security::asStringView(s), input);
    ASSERT_EQ(coffer::security::asBytes(s).size(), input.size());
    EXPECT_EQ(coffer::security::asBytes(s)[3], std::byte{ 0xFF });
}

TEST(SecureString, ReleaseWipesAndDropsStorage)
{
    const coffer::test_utils::WipeRecorder recorder{};
    auto s{ secureStringFrom("entry password") };
    const char* data{ s.data() };
    const auto size{ s.size() };

    coffer::security::secureRelease(s);

    EXPECT_TRUE(s.empty());
    EXPECT_EQ(s.capacity(), 0U);
    EXPECT_TRUE(recorder.covered(data, size));
}

TEST(SecureBuffer, ReleaseWipesAndDropsStorage)
{
    const coffer::test_utils::WipeRecorder recorder{};
    SecureBuffer key(32U, std::uint8_t{ 0xA5U });
    const std::uint8_t* data{ key.data() };

    coffer::security::secureRelease(key);

    EXPECT_TRUE(key.empty());
    EXPECT_EQ(key.capacity(), 0U);
    EXPECT_TRUE(recorder.covered(data, 32U));
}

TEST(SecureBuffer, WritableBytesAliasTheBuffer)
{
    SecureBuffer key(4U);
    auto bytes{ coffer::security::asWritableBytes(key) };
    ASSERT_EQ(bytes.size(), 4U);
    bytes[2] = std::byte{ 0x42 };
    EXPECT_EQ(key[2], 0x42U);
    EXPECT_EQ(coffer::security::asBytes(key).data(), bytes.data());
}

} // namespace
