#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

#include "coffer/security/MemoryWiper.hpp"
#include "test_utils/CryptoTestSupport.hpp"

namespace
{

struct NonTrivial
{
public:
    NonTrivial() = default;
    ~NonTrivial() = default;

private:
    std::unique_ptr<int> m_p;
};

template <typename T>
concept CanSecureWipe = requires(T buffer) { coffer::security::secureWipe(buffer); };

static_assert(!CanSecureWipe<std::span<const std::uint32_t>>);
static_assert(!CanSecureWipe<std::span<NonTrivial>>);
static_assert(CanSecureWipe<std::span<std::uint64_t, 4>>);

} // namespace

TEST(MemoryWiper, ZerosByteSpan)
{
    constexpr std::size_t byteCount{ 64U };
    constexpr std::byte nonZeroByte{ std::byte{ 0xA5 } };

    std::array<std::byte, byteCount> bytes{};
    bytes.fill(nonZeroByte);

    coffer::security::secureWipe(std::span{ bytes });

    for (const auto b : bytes)
    {
        EXPECT_EQ(b, std::byte{});
    }
}

TEST(MemoryWiper, ZerosTypedSpanViaTemplate)
{
    constexpr std::size_t wordCount{ 16U };
    constexpr std::uint32_t nonZeroWord{ 0xDEADBEEFU };

    std::array<std::uint32_t, wordCount> words{};
    words.fill(nonZeroWord);

    coffer::security::secureWipe(std::span{ words });

    for (const auto w : words)
    {
        EXPECT_EQ(w, 0U);
    }
}

TEST(MemoryWiper, EmptySpanIsNoOp)
{
    coffer::security::secureWipe(std::span<std::byte>{});
}

TEST(MemoryWiper, ObserverSeesZeroedRegion)
{
    constexpr std::size_t byteCount{ 24U };
    std::array<std::uint8_t, byteCount> bytes{};
    bytes.fill(0x5AU);

    const coffer::test_utils::WipeRecorder recorder{};
    coffer::security::secureWipe(std::span{ bytes });

    EXPECT_EQ(recorder.count(), 1U);
    EXPECT_TRUE(recorder.covered(bytes.data(), bytes.size()));
}

TEST(MemoryWiper, ObserverIsNotCalledForEmptySpan)
{
    const coffer::test_utils::WipeRecorder recorder{};
    coffer::security::secureWipe(std::span<std::byte>{});
    EXPECT_EQ(recorder.count(), 0U);
}
