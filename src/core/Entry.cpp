#include "coffer/core/Entry.hpp"

#include <algorithm>
#include <utility>

namespace coffer::core
{
namespace
{

constexpr std::array<std::size_t, 4> g_uuidDashPositions{ 8U, 13U, 18U, 23U };
constexpr std::size_t g_uuidTextLength{ 36U };
constexpr std::string_view g_hexDigits{ "0123456789abcdef" };

[[nodiscard]] std::optional<std::uint8_t> hexValue(char c) noexcept
{
    if (c >= '0' && c <= '9')
    {
        return static_cast<std::uint8_t>(c - '0');
    }
    if (c >= 'a' && c <= 'f')
    {
        return static_cast<std::uint8_t>(c - 'a' + 10);
    }
    if (c >= 'A' && c <= 'F')
    {
        return static_cast<std::uint8_t>(c - 'A' + 10);
    }
    return std::nullopt;
}

[[nodiscard]] bool isDashPosition(std::size_t i) noexcept
{
    return std::find(g_uuidDashPositions.begin(), g_uuidDashPositions.end(), i) != g_uuidDashPositions.end();
}

void wipeOptional(std::optional<coffer::security::SecureString>& field) noexcept
{
    if (field)
    {
        coffer::security::secureRelease(*field);
        field.reset();
    }
}

void assignText(coffer::security::SecureString& target, coffer::security::SecureString&& value) noexcept
{
    coffer::security::secureRelease(target);
    target = std::move(value);
}

void assignOptionalText(std::optional<coffer::security::SecureString>& target,
                        coffer::security::SecureString&& value) noexcept
{
    wipeOptional(target);
    if (!value.empty())
    {
        target = std::move(value);
    }
}

} // namespace

Timestamp currentTimestamp() noexcept
{
    return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

EntryId EntryId::fromRandom(std::span<const std::uint8_t, g_entryIdBytes> random) noexcept
{
    EntryId id{};
    std::copy(random.begin(), random.end(), id.bytes.begin());
    id.bytes[6] = static_cast<std::uint8_t>((id.bytes[6] & 0x0FU) | 0x40U);
    id.bytes[8] = static_cast<std::uint8_t>((id.bytes[8] & 0x3FU) | 0x80U);
    return id;
}

std::optional<EntryId> EntryId::parse(std::string_view text) noexcept
{
    if (text.size() != g_uuidTextLength)
    {
        return std::nullopt;
    }

    EntryId id{};
    std::size_t nibble{};
    for (std::size_t i{}; i < text.size(); ++i)
    {
        if (isDashPosition(i))
        {
            if (text[i] != '-')
            {
                return std::nullopt;
            }
            continue;
        }
        const auto value{ hexValue(text[i]) };
        if (!value)
        {
            return std::nullopt;
        }
        auto& target{ id.bytes[nibble / 2U] };
        target = static_cast<std::uint8_t>((nibble % 2U == 0U) ? (*value << 4U) : (target | *value));
        ++nibble;
    }
    return id;
}

std::string EntryId::toString() const
{
    std::string out{};
    out.reserve(g_uuidTextLength);
    for (std::size_t i{}; i < bytes.size(); ++i)
    {
        if (i == 4U || i == 6U || i == 8U || i == 10U)
        {
            out.push_back('-');
        }
        out.push_back(g_hexDigits[bytes[i] >> 4U]);
        out.push_back(g_hexDigits[bytes[i] & 0x0FU]);
    }
    return out;
}

bool isValidUtf8(std::string_view text) noexcept
{
    std::size_t i{};
    while (i < text.size())
    {
        const auto lead{ static_cast<unsigned char>(text[i]) };
        std::size_t continuation{};
        std::uint32_t codePoint{};
        if (lead < 0x80U)
        {
            ++i;
            continue;
        }
        if ((lead & 0xE0U) == 0xC0U)
        {
            continuation = 1U;
            codePoint = lead & 0x1FU;
        }
        else if ((lead & 0xF0U) == 0xE0U)
        {
            continuation = 2U;
            codePoint = lead & 0x0FU;
        }
        else if ((lead & 0xF8U) == 0xF0U)
        {
            continuation = 3U;
            codePoint = lead & 0x07U;
        }
        else
        {
            return false;
        }

        if (continuation > text.size() - i - 1U)
        {
            return false;
        }
        for (std::size_t k{ 1U }; k <= continuation; ++k)
        {
            const auto next{ static_cast<unsigned char>(text[i + k]) };
            if ((next & 0xC0U) != 0x80U)
            {
                return false;
            }
            codePoint = (codePoint << 6U) | (next & 0x3FU);
        }

        // Overlong forms, UTF-16 surrogates and values past U+10FFFF.
        constexpr std::array<std::uint32_t, 4> minimumForLength{ 0x0U, 0x80U, 0x800U, 0x10000U };
        if (codePoint < minimumForLength[continuation] || (codePoint >= 0xD800U && codePoint <= 0xDFFFU) ||
            codePoint > 0x10FFFFU)
        {
            return false;
        }
        i += continuation + 1U;
    }
    return true;
}

bool EntryPatch::empty() const noexcept
{
    return !title && !username && !password && !url && !notes;
}

bool isValidText(const EntryFields& fields) noexcept
{
    const auto valid{ [](const coffer::security::SecureString& s) noexcept
                      { return isValidUtf8(coffer::security::asStringView(s)); } };
    return valid(fields.title) && valid(fields.username) && valid(fields.password) &&
           (!fields.url || valid(*fields.url)) && (!fields.notes || valid(*fields.notes));
}

bool isValidText(const EntryPatch& patch) noexcept
{
    const auto valid{ [](const std::optional<coffer::security::SecureString>& s) noexcept
                      { return !s || isValidUtf8(coffer::security::asStringView(*s)); } };
    return valid(patch.title) && valid(patch.username) && valid(patch.password) && valid(patch.url) &&
           valid(patch.notes);
}

Entry::Entry(EntryId id, EntryFields fields, Timestamp createdAt, Timestamp modifiedAt) noexcept
    : m_id{ id }, m_fields{ std::move(fields) }, m_createdAt{ createdAt },
      m_modifiedAt{ std::max(createdAt, modifiedAt) }
{
}

void Entry::apply(EntryPatch&& patch, Timestamp now)
{
    if (patch.title)
    {
        assignText(m_fields.title, std::move(*patch.title));
    }
    if (patch.username)
    {
        assignText(m_fields.username, std::move(*patch.username));
    }
    if (patch.password)
    {
        assignText(m_fields.password, std::move(*patch.password));
    }
    if (patch.url)
    {
        assignOptionalText(m_fields.url, std::move(*patch.url));
    }
    if (patch.notes)
    {
        assignOptionalText(m_fields.notes, std::move(*patch.notes));
    }
    m_modifiedAt = std::max({ now, m_modifiedAt, m_createdAt });
}

void Entry::wipe() noexcept
{
    coffer::security::secureRelease(m_fields.title);
    coffer::security::secureRelease(m_fields.username);
    coffer::security::secureRelease(m_fields.password);
    wipeOptional(m_fields.url);
    wipeOptional(m_fields.notes);
}

} // namespace coffer::core
