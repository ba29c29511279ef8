#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <variant>
#include <vector>

#include "coffer/storage/file/FileVaultStoreFactory.hpp"
#include "test_utils/TestUtils.hpp"

#include <sys/stat.h>

namespace
{

using coffer::storage::IoError;

class FileVaultStoreTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_FALSE(m_dir.path().empty()) << "could not create a private temp dir";
        m_store = coffer::storage::file::makeFileVaultStore();
    }

    [[nodiscard]] std::filesystem::path vaultPath() const
    {
        return m_dir.path() / "vault.coffer";
    }

    coffer::test_utils::TempDir m_dir{ "file_store_" };              // NOLINT
    std::unique_ptr<coffer::storage::IVaultFileStore> m_store;     // NOLINT
};

std::vector<std::uint8_t> readRaw(const std::filesystem::path& path)
{
    std::ifstream in{ path, std::ios::binary };
    return { std::istreambuf_iterator<char>{ in }, std::istreambuf_iterator<char>{} };
}

} // namespace

TEST_F(FileVaultStoreTest, WriteThenReadReturnsSameBytes)
{
    const std::vector<std::uint8_t> bytes{ 0x01U, 0x02U, 0x00U, 0xFFU, 0x7FU };
    const auto written{ m_store->writeVaultFileAtomic(vaultPath(), bytes) };
    ASSERT_TRUE(std::holds_alternative<std::monostate>(written));

    EXPECT_TRUE(m_store->exists(vaultPath()));
    const auto read{ m_store->readVaultFile(vaultPath()) };
    ASSERT_TRUE((std::holds_alternative<std::vector<std::uint8_t>>(read)));
    EXPECT_EQ(std::get<std::vector<std::uint8_t>>(read), bytes);
    EXPECT_EQ(readRaw(vaultPath()), bytes);
}

TEST_F(FileVaultStoreTest, WrittenFileIsOwnerOnly)
{
    const std::vector<std::uint8_t> bytes{ 0xAAU };
    ASSERT_TRUE(std::holds_alternative<std::monostate>(m_store->writeVaultFileAtomic(vaultPath(), bytes)));

    struct stat st{};
    ASSERT_EQ(::stat(vaultPath().c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777U, 0600U);
}

TEST_F(FileVaultStoreTest, OverwriteReplacesContentsAndLeavesNoTempFiles)
{
    const std::vector<std::uint8_t> first(1000U, std::uint8_t{ 0x11U });
    const std::vector<std::uint8_t> second{ 0x22U, 0x33U };
    ASSERT_TRUE(std::holds_alternative<std::monostate>(m_store->writeVaultFileAtomic(vaultPath(), first)));
    ASSERT_TRUE(std::holds_alternative<std::monostate>(m_store->writeVaultFileAtomic(vaultPath(), second)));

    EXPECT_EQ(readRaw(vaultPath()), second);

    std::size_t files{};
    for (const auto& item : std::filesystem::directory_iterator{ m_dir.path() })
    {
        static_cast<void>(item);
        ++files;
    }
    EXPECT_EQ(files, 1U);
}

TEST_F(FileVaultStoreTest, MissingFileIsNotFound)
{
    EXPECT_FALSE(m_store->exists(vaultPath()));
    const auto read{ m_store->readVaultFile(vaultPath()) };
    ASSERT_TRUE(std::holds_alternative<IoError>(read));
    EXPECT_EQ(std::get<IoError>(read), IoError::NotFound);
}

TEST_F(FileVaultStoreTest, DirectoryIsNotAVaultFile)
{
    EXPECT_FALSE(m_store->exists(m_dir.path()));
    const auto read{ m_store->readVaultFile(m_dir.path()) };
    ASSERT_TRUE(std::holds_alternative<IoError>(read));
    EXPECT_EQ(std::get<IoError>(read), IoError::ReadFailed);
}

TEST_F(FileVaultStoreTest, WriteIntoMissingDirectoryFails)
{
    const std::vector<std::uint8_t> bytes{ 0x01U };
    const auto written{ m_store->writeVaultFileAtomic(m_dir.path() / "missing" / "vault.coffer", bytes) };
    ASSERT_TRUE(std::holds_alternative<IoError>(written));
    EXPECT_EQ(std::get<IoError>(written), IoError::NotFound);
}

TEST_F(FileVaultStoreTest, EmptyFileReadsAsEmpty)
{
    const std::vector<std::uint8_t> empty{};
    ASSERT_TRUE(std::holds_alternative<std::monostate>(m_store->writeVaultFileAtomic(vaultPath(), empty)));
    const auto read{ m_store->readVaultFile(vaultPath()) };
    ASSERT_TRUE((std::holds_alternative<std::vector<std::uint8_t>>(read)));
    EXPECT_TRUE(std::get<std::vector<std::uint8_t>>(read).empty());
}
