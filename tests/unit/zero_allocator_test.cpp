#include <gtest/gtest.h>

#include "coffer/security/SecureString.hpp"
#include "coffer/security/ZeroAllocator.hpp"
#include "test_utils/CryptoTestSupport.hpp"
#include <cstddef>
#include <cstdint>
#include <limits>
#include <new>
#include <string_view>
#include <vector>

namespace
{

using ByteVector = std::vector<std::uint8_t, coffer::security::ZeroAllocator<std::uint8_t>>;

TEST(ZeroAllocatorTests, ZeroCountAllocatesNothing)
{
    coffer::security::ZeroAllocator<std::uint64_t> alloc;
    EXPECT_EQ(alloc.allocate(0U), nullptr);
    alloc.deallocate(nullptr, 0U);
}

TEST(ZeroAllocatorTests, OverflowingCountThrows)
{
    coffer::security::ZeroAllocator<std::uint64_t> alloc;
    EXPECT_THROW(static_cast<void>(alloc.allocate(std::numeric_limits<std::size_t>::max())),
                 std::bad_array_new_length);
}

TEST(ZeroAllocatorTests, RespectsElementAlignment)
{
    struct alignas(64) Block
    {
        std::uint8_t bytes[64];
    };
    coffer::security::ZeroAllocator<Block> alloc;
    Block* p{ alloc.allocate(2U) };
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(reinterpret_cast<std::uintptr_t>(p) % alignof(Block), 0U);
    alloc.deallocate(p, 2U);
}

TEST(ZeroAllocatorTests, DeallocationWipesWholeBlock)
{
    constexpr std::size_t kCount{ 32U };
    const coffer::test_utils::WipeRecorder recorder{};

    const std::uint8_t* data{ nullptr };
    {
        ByteVector v(kCount, std::uint8_t{ 0xC3U });
        data = v.data();
    }

    EXPECT_TRUE(recorder.covered(data, kCount));
}

TEST(ZeroAllocatorTests, ReallocationWipesOldBlock)
{
    const coffer::test_utils::WipeRecorder recorder{};

    ByteVector v{};
    v.reserve(4U);
    v.assign(4U, std::uint8_t{ 0x11U });
    const std::uint8_t* old{ v.data() };

    v.resize(1024U, std::uint8_t{ 0x22U });

    ASSERT_NE(v.data(), old);
    EXPECT_TRUE(recorder.covered(old, 4U));
    EXPECT_EQ(v[3], 0x11U);
}

TEST(ZeroAllocatorTests, GrowingPassphraseLeavesNoCopyBehind)
{
    const coffer::test_utils::WipeRecorder recorder{};

    auto passphrase{ coffer::security::secureStringFrom("correct") };
    passphrase.shrink_to_fit();
    const char* first{ passphrase.data() };
    const auto firstSize{ passphrase.size() };

    for (const char c : std::string_view{ " horse battery staple" })
    {
        passphrase.push_back(c);
    }

    EXPECT_EQ(coffer::security::asStringView(passphrase), "correct horse battery staple");
    EXPECT_TRUE(recorder.covered(first, firstSize));
}

} // namespace
