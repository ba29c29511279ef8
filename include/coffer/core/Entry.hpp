#ifndef INCLUDE_COFFER_CORE_ENTRY_HPP
#define INCLUDE_COFFER_CORE_ENTRY_HPP

#include "coffer/security/SecureString.hpp"
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace coffer::core
{

constexpr std::size_t g_entryIdBytes{ 16 };

using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

[[nodiscard]] Timestamp currentTimestamp() noexcept;

// 128-bit identifier with the RFC 4122 version-4 layout.
struct EntryId final
{
    std::array<std::uint8_t, g_entryIdBytes> bytes{};

    // Stamps version and variant bits onto 16 random bytes.
    [[nodiscard]] static EntryId fromRandom(std::span<const std::uint8_t, g_entryIdBytes> random) noexcept;

    // Accepts the canonical 8-4-4-4-12 hex form, either case.
    [[nodiscard]] static std::optional<EntryId> parse(std::string_view text) noexcept;

    [[nodiscard]] std::string toString() const;

    bool operator==(const EntryId&) const = default;
};

[[nodiscard]] bool isValidUtf8(std::string_view text) noexcept;

// Field values for a new entry.
struct EntryFields final
{
    coffer::security::SecureString title;
    coffer::security::SecureString username;
    coffer::security::SecureString password;
    std::optional<coffer::security::SecureString> url;
    std::optional<coffer::security::SecureString> notes;

    bool operator==(const EntryFields&) const = default;
};

// Partial update: only engaged fields change. An empty url or notes value clears that field.
struct EntryPatch final
{
    std::optional<coffer::security::SecureString> title;
    std::optional<coffer::security::SecureString> username;
    std::optional<coffer::security::SecureString> password;
    std::optional<coffer::security::SecureString> url;
    std::optional<coffer::security::SecureString> notes;

    [[nodiscard]] bool empty() const noexcept;
};

[[nodiscard]] bool isValidText(const EntryFields& fields) noexcept;
[[nodiscard]] bool isValidText(const EntryPatch& patch) noexcept;

class Entry final
{
public:
    Entry(EntryId id, EntryFields fields, Timestamp createdAt, Timestamp modifiedAt) noexcept;

    [[nodiscard]] const EntryId& id() const noexcept
    {
        return m_id;
    }
    [[nodiscard]] const coffer::security::SecureString& title() const noexcept
    {
        return m_fields.title;
    }
    [[nodiscard]] const coffer::security::SecureString& username() const noexcept
    {
        return m_fields.username;
    }
    [[nodiscard]] const coffer::security::SecureString& password() const noexcept
    {
        return m_fields.password;
    }
    [[nodiscard]] const std::optional<coffer::security::SecureString>& url() const noexcept
    {
        return m_fields.url;
    }
    [[nodiscard]] const std::optional<coffer::security::SecureString>& notes() const noexcept
    {
        return m_fields.notes;
    }
    [[nodiscard]] Timestamp createdAt() const noexcept
    {
        return m_createdAt;
    }
    [[nodiscard]] Timestamp modifiedAt() const noexcept
    {
        return m_modifiedAt;
    }

    // Applies the engaged fields and moves modified-at forward, never behind created-at.
    void apply(EntryPatch&& patch, Timestamp now);

    // Zeroizes every text field in place and leaves the entry with empty fields.
    void wipe() noexcept;

    bool operator==(const Entry&) const = default;

private:
    EntryId m_id;
    EntryFields m_fields;
    Timestamp m_createdAt;
    Timestamp m_modifiedAt;
};

} // namespace coffer::core

#endif // INCLUDE_COFFER_CORE_ENTRY_HPP
