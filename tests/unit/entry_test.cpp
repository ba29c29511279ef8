#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "coffer/core/Entry.hpp"
#include "coffer/core/Vault.hpp"

namespace
{

using coffer::core::Entry;
using coffer::core::EntryFields;
using coffer::core::EntryId;
using coffer::core::EntryPatch;
using coffer::core::Timestamp;
using coffer::security::asStringView;
using coffer::security::secureStringFrom;

static_assert(!std::is_copy_constructible_v<coffer::core::Vault>);
static_assert(!std::is_copy_assignable_v<coffer::core::Vault>);
static_assert(std::is_nothrow_move_constructible_v<coffer::core::Vault>);

constexpr std::string_view kCanonicalId{ "0123abcd-4567-489a-bcde-f0123456789a" };

Timestamp at(std::int64_t ms)
{
    return Timestamp{ std::chrono::milliseconds{ ms } };
}

EntryId idWithSeed(std::uint8_t seed)
{
    std::array<std::uint8_t, coffer::core::g_entryIdBytes> random{};
    random.fill(seed);
    return EntryId::fromRandom(random);
}

EntryFields makeFields(std::string_view title)
{
    EntryFields fields{};
    fields.title = secureStringFrom(title);
    fields.username = secureStringFrom("alice");
    fields.password = secureStringFrom("hunter2");
    return fields;
}

} // namespace

TEST(EntryId, ParsesAndFormatsCanonicalText)
{
    const auto id{ EntryId::parse(kCanonicalId) };
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->bytes[0], 0x01U);
    EXPECT_EQ(id->bytes[15], 0x9AU);
    EXPECT_EQ(id->toString(), kCanonicalId);
}

TEST(EntryId, ParseAcceptsUpperCaseAndFormatsLowerCase)
{
    const auto id{ EntryId::parse("0123ABCD-4567-489A-BCDE-F0123456789A") };
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->toString(), kCanonicalId);
}

TEST(EntryId, ParseRejectsMalformedText)
{
    EXPECT_FALSE(EntryId::parse("").has_value());
    EXPECT_FALSE(EntryId::parse("0123abcd-4567-489a-bcde-f0123456789").has_value());
    EXPECT_FALSE(EntryId::parse("0123abcd-4567-489a-bcde-f0123456789ab").has_value());
    EXPECT_FALSE(EntryId::parse("0123abcd04567-489a-bcde-f0123456789a").has_value());
    EXPECT_FALSE(EntryId::parse("0123abcg-4567-489a-bcde-f0123456789a").has_value());
    EXPECT_FALSE(EntryId::parse("0123abcd-4567-489a-bcde-f0123456789-").has_value());
}

TEST(EntryId, FromRandomStampsVersionAndVariant)
{
    std::array<std::uint8_t, coffer::core::g_entryIdBytes> ones{};
    ones.fill(0xFFU);
    const auto high{ EntryId::fromRandom(ones) };
    EXPECT_EQ(high.bytes[6], 0x4FU);
    EXPECT_EQ(high.bytes[8], 0xBFU);

    const std::array<std::uint8_t, coffer::core::g_entryIdBytes> zeros{};
    const auto low{ EntryId::fromRandom(zeros) };
    EXPECT_EQ(low.bytes[6], 0x40U);
    EXPECT_EQ(low.bytes[8], 0x80U);
    EXPECT_EQ(low.toString(), "00000000-0000-4000-8000-000000000000");
}

TEST(Utf8Validation, AcceptsWellFormedText)
{
    EXPECT_TRUE(coffer::core::isValidUtf8(""));
    EXPECT_TRUE(coffer::core::isValidUtf8("plain ascii"));
    EXPECT_TRUE(coffer::core::isValidUtf8("h\xC3\xA9llo"));
    EXPECT_TRUE(coffer::core::isValidUtf8("\xE2\x82\xAC"));
    EXPECT_TRUE(coffer::core::isValidUtf8("\xF0\x9F\x94\x91 key"));
}

TEST(Utf8Validation, RejectsIllFormedText)
{
    EXPECT_FALSE(coffer::core::isValidUtf8("\xC3"));
    EXPECT_FALSE(coffer::core::isValidUtf8("\xC3("));
    EXPECT_FALSE(coffer::core::isValidUtf8("\xC0\xAF"));
    EXPECT_FALSE(coffer::core::isValidUtf8("\xED\xA0\x80"));
    EXPECT_FALSE(coffer::core::isValidUtf8("\xF4\x90\x80\x80"));
    EXPECT_FALSE(coffer::core::isValidUtf8("\xFF"));
    EXPECT_FALSE(coffer::core::isValidUtf8("ok\x80"));
}

TEST(Entry, ModifiedNeverPrecedesCreated)
{
    const Entry entry{ idWithSeed(1U), makeFields("mail"), at(5000), at(1000) };
    EXPECT_EQ(entry.createdAt(), at(5000));
    EXPECT_EQ(entry.modifiedAt(), at(5000));
}

TEST(Entry, ApplyChangesOnlyEngagedFields)
{
    Entry entry{ idWithSeed(1U), makeFields("mail"), at(1000), at(1000) };

    EntryPatch patch{};
    patch.title = secureStringFrom("webmail");
    patch.url = secureStringFrom("https://mail.example");
    entry.apply(std::move(patch), at(2000));

    EXPECT_EQ(asStringView(entry.title()), "webmail");
    EXPECT_EQ(asStringView(entry.username()), "alice");
    EXPECT_EQ(asStringView(entry.password()), "hunter2");
    ASSERT_TRUE(entry.url().has_value());
    EXPECT_EQ(asStringView(*entry.url()), "https://mail.example");
    EXPECT_FALSE(entry.notes().has_value());
    EXPECT_EQ(entry.createdAt(), at(1000));
    EXPECT_EQ(entry.modifiedAt(), at(2000));
}

TEST(Entry, ApplyWithEmptyUrlClearsIt)
{
    auto fields{ makeFields("mail") };
    fields.url = secureStringFrom("https://old.example");
    fields.notes = secureStringFrom("keep me");
    Entry entry{ idWithSeed(1U), std::move(fields), at(1000), at(1000) };

    EntryPatch patch{};
    patch.url = coffer::security::SecureString{};
    entry.apply(std::move(patch), at(3000));

    EXPECT_FALSE(entry.url().has_value());
    ASSERT_TRUE(entry.notes().has_value());
    EXPECT_EQ(asStringView(*entry.notes()), "keep me");
}

TEST(Entry, ApplyWithBackwardsClockKeepsModifiedMonotonic)
{
    Entry entry{ idWithSeed(1U), makeFields("mail"), at(1000), at(4000) };

    EntryPatch patch{};
    patch.password = secureStringFrom("n3w");
    entry.apply(std::move(patch), at(500));

    EXPECT_EQ(asStringView(entry.password()), "n3w");
    EXPECT_EQ(entry.modifiedAt(), at(4000));
}

TEST(Entry, WipeLeavesEmptyFields)
{
    auto fields{ makeFields("mail") };
    fields.notes = secureStringFrom("n");
    Entry entry{ idWithSeed(1U), std::move(fields), at(1000), at(1000) };

    entry.wipe();

    EXPECT_TRUE(entry.title().empty());
    EXPECT_TRUE(entry.username().empty());
    EXPECT_TRUE(entry.password().empty());
    EXPECT_FALSE(entry.notes().has_value());
}

TEST(EntryText, ValidityCoversOptionalFields)
{
    auto fields{ makeFields("mail") };
    EXPECT_TRUE(coffer::core::isValidText(fields));
    fields.notes = secureStringFrom("\xC3");
    EXPECT_FALSE(coffer::core::isValidText(fields));

    EntryPatch patch{};
    EXPECT_TRUE(patch.empty());
    EXPECT_TRUE(coffer::core::isValidText(patch));
    patch.username = secureStringFrom("\xFF");
    EXPECT_FALSE(patch.empty());
    EXPECT_FALSE(coffer::core::isValidText(patch));
}

TEST(Vault, AddRejectsDuplicateIds)
{
    coffer::core::Vault vault{};
    EXPECT_TRUE(vault.add(Entry{ idWithSeed(1U), makeFields("one"), at(1), at(1) }));
    EXPECT_FALSE(vault.add(Entry{ idWithSeed(1U), makeFields("again"), at(2), at(2) }));

    ASSERT_EQ(vault.size(), 1U);
    EXPECT_EQ(asStringView(vault.entries().front().title()), "one");
}

TEST(Vault, KeepsInsertionOrderAndRemoves)
{
    coffer::core::Vault vault{};
    ASSERT_TRUE(vault.add(Entry{ idWithSeed(1U), makeFields("one"), at(1), at(1) }));
    ASSERT_TRUE(vault.add(Entry{ idWithSeed(2U), makeFields("two"), at(2), at(2) }));
    ASSERT_TRUE(vault.add(Entry{ idWithSeed(3U), makeFields("three"), at(3), at(3) }));

    EXPECT_TRUE(vault.remove(idWithSeed(2U)));
    EXPECT_FALSE(vault.remove(idWithSeed(2U)));

    ASSERT_EQ(vault.size(), 2U);
    EXPECT_EQ(asStringView(vault.entries()[0].title()), "one");
    EXPECT_EQ(asStringView(vault.entries()[1].title()), "three");
    EXPECT_EQ(vault.find(idWithSeed(2U)), nullptr);
    EXPECT_NE(vault.find(idWithSeed(3U)), nullptr);
}

TEST(Vault, SearchByTitleIsCaseInsensitiveSubstring)
{
    coffer::core::Vault vault{};
    ASSERT_TRUE(vault.add(Entry{ idWithSeed(1U), makeFields("GitHub"), at(1), at(1) }));
    ASSERT_TRUE(vault.add(Entry{ idWithSeed(2U), makeFields("Bank"), at(2), at(2) }));
    ASSERT_TRUE(vault.add(Entry{ idWithSeed(3U), makeFields("gitlab work"), at(3), at(3) }));

    const auto hits{ vault.searchByTitle("GIT") };
    ASSERT_EQ(hits.size(), 2U);
    EXPECT_EQ(asStringView(hits[0]->title()), "GitHub");
    EXPECT_EQ(asStringView(hits[1]->title()), "gitlab work");

    EXPECT_EQ(vault.searchByTitle("").size(), 3U);
    EXPECT_TRUE(vault.searchByTitle("nothing").empty());
}

TEST(Vault, WipeEmptiesTheCollection)
{
    coffer::core::Vault vault{};
    ASSERT_TRUE(vault.add(Entry{ idWithSeed(1U), makeFields("one"), at(1), at(1) }));
    vault.wipe();
    EXPECT_TRUE(vault.empty());
}

TEST(Vault, MoveTransfersEntriesWithoutCopying)
{
    coffer::core::Vault vault{};
    ASSERT_TRUE(vault.add(Entry{ idWithSeed(1U), makeFields("one"), at(1), at(1) }));
    const void* titleData{ vault.entries().front().title().data() };

    coffer::core::Vault moved{ std::move(vault) };
    ASSERT_EQ(moved.size(), 1U);
    EXPECT_EQ(static_cast<const void*>(moved.entries().front().title().data()), titleData);
    EXPECT_TRUE(vault.empty()); // NOLINT(bugprone-use-after-move)
}
