#ifndef COFFER_TESTS_TEST_UTILS_TESTUTILS_HPP
#define COFFER_TESTS_TEST_UTILS_TESTUTILS_HPP

#include "coffer/security/SecureRandom.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

namespace coffer::test_utils
{

// Any non-empty value other than "0" counts as set.
[[nodiscard]] inline bool envFlagSet(std::string_view name)
{
    const char* value{ std::getenv(std::string{ name }.c_str()) };
    return value != nullptr && *value != '\0' && std::string_view{ value } != "0";
}

// Owner-only directory under <tmp>/coffer_tests with a random suffix, removed with its contents on scope
// exit. path() is empty if it could not be created.
class TempDir final
{
public:
    explicit TempDir(std::string_view prefix) : m_path{ create(prefix) }
    {
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    TempDir(TempDir&&) = delete;
    TempDir& operator=(TempDir&&) = delete;
    ~TempDir()
    {
        if (!m_path.empty())
        {
            std::error_code ec{};
            std::filesystem::remove_all(m_path, ec);
        }
    }

    [[nodiscard]] const std::filesystem::path& path() const noexcept
    {
        return m_path;
    }

private:
    static constexpr std::size_t g_suffixBytes{ 8U };
    static constexpr int g_attempts{ 8 };

    static std::filesystem::path create(std::string_view prefix)
    {
        constexpr char kHex[]{ "0123456789abcdef" };
        std::error_code ec{};
        const auto base{ std::filesystem::temp_directory_path(ec) / "coffer_tests" };
        if (ec)
        {
            return {};
        }
        std::filesystem::create_directories(base, ec);

        for (int attempt{}; attempt < g_attempts; ++attempt)
        {
            std::array<std::uint8_t, g_suffixBytes> suffix{};
            if (!coffer::security::secureRandomFill(std::span{ suffix }))
            {
                return {};
            }
            std::string name{ prefix };
            for (const std::uint8_t b : suffix)
            {
                name.push_back(kHex[b >> 4U]);
                name.push_back(kHex[b & 0x0FU]);
            }

            const auto dir{ base / name };
            ec.clear();
            if (std::filesystem::create_directory(dir, ec) && !ec)
            {
                std::filesystem::permissions(dir, std::filesystem::perms::owner_all,
                                             std::filesystem::perm_options::replace, ec);
                return dir;
            }
        }
        return {};
    }

    std::filesystem::path m_path;
};

} // namespace coffer::test_utils

#endif // COFFER_TESTS_TEST_UTILS_TESTUTILS_HPP
