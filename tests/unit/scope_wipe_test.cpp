#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <span>

#include "coffer/security/ScopeWipe.hpp"
#include "coffer/security/SecureString.hpp"

namespace
{

constexpr std::size_t g_bufferSize{ 32U };
constexpr std::uint8_t g_nonZeroByte{ 0xA5U };

void expectAllBytesEq(const std::array<std::uint8_t, g_bufferSize>& buffer, std::uint8_t expected)
{
    for (const auto b : buffer)
    {
        EXPECT_EQ(b, expected);
    }
}

struct Pod
{
    std::uint64_t a;
    std::uint32_t b;
};

} // namespace

TEST(ScopeWipe, WipesOnDestruction)
{
    std::array<std::uint8_t, g_bufferSize> buffer{};
    buffer.fill(g_nonZeroByte);

    {
        const auto guard = coffer::security::scopeWipe(std::span{ buffer });
        (void)guard;
        expectAllBytesEq(buffer, g_nonZeroByte);
    }

    expectAllBytesEq(buffer, std::uint8_t{});
}

TEST(ScopeWipe, DismissDisablesWipe)
{
    std::array<std::uint8_t, g_bufferSize> buffer{};
    buffer.fill(g_nonZeroByte);

    {
        auto guard = coffer::security::scopeWipe(std::span{ buffer });
        guard.dismiss();
    }

    expectAllBytesEq(buffer, g_nonZeroByte);
}

TEST(ScopeWipe, MoveTransfersWipeResponsibility)
{
    std::array<std::uint8_t, g_bufferSize> buffer{};
    buffer.fill(g_nonZeroByte);

    {
        auto a = coffer::security::scopeWipe(std::span{ buffer });
        {
            auto b = std::move(a);
            (void)b;
        }
        expectAllBytesEq(buffer, std::uint8_t{});
        buffer.fill(g_nonZeroByte);
    }

    // The moved-from guard no longer owns the region.
    expectAllBytesEq(buffer, g_nonZeroByte);
}

TEST(ScopeWipe, WipesTriviallyCopyableObject)
{
    Pod pod{ .a = 0x0123456789ABCDEFULL, .b = 0xFFFFFFFFU };
    {
        const auto guard = coffer::security::scopeWipe(pod);
        (void)guard;
    }
    EXPECT_EQ(pod.a, 0U);
    EXPECT_EQ(pod.b, 0U);
}

TEST(ScopeWipe, WipesSecureStringContents)
{
    auto secret{ coffer::security::secureStringFrom("hunter2") };
    {
        const auto guard = coffer::security::scopeWipe(secret);
        (void)guard;
    }
    ASSERT_EQ(secret.size(), 7U);
    for (const char c : secret)
    {
        EXPECT_EQ(c, '\0');
    }
}
