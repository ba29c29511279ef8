#include "coffer/core/VaultCodec.hpp"

#include "BigEndian.hpp"
#include <algorithm>
#include <optional>
#include <utility>

namespace coffer::core
{
namespace
{

using coffer::security::SecureString;

// Smallest possible entry: id, two timestamps, flags, three empty length-prefixed fields.
constexpr std::size_t g_minEncodedEntryBytes{ g_entryIdBytes + 8U + 8U + 1U + 3U * 4U };

[[nodiscard]] std::int64_t toMillis(Timestamp t) noexcept
{
    return t.time_since_epoch().count();
}

[[nodiscard]] Timestamp fromMillis(std::int64_t ms) noexcept
{
    return Timestamp{ std::chrono::milliseconds{ ms } };
}

[[nodiscard]] std::optional<SecureString> readText(detail::BigEndianReader& in)
{
    std::uint32_t length{};
    std::span<const std::uint8_t> raw{};
    if (!in.u32(length) || !in.take(length, raw))
    {
        return std::nullopt;
    }
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    SecureString text(raw.begin(), raw.end());
    if (!isValidUtf8(coffer::security::asStringView(text)))
    {
        coffer::security::secureRelease(text);
        return std::nullopt;
    }
    return text;
}

[[nodiscard]] Result<Entry, CodecError> readEntry(detail::BigEndianReader& in)
{
    std::span<const std::uint8_t> idBytes{};
    std::int64_t createdMs{};
    std::int64_t modifiedMs{};
    std::uint8_t flags{};
    if (!in.take(g_entryIdBytes, idBytes) || !in.i64(createdMs) || !in.i64(modifiedMs) || !in.u8(flags))
    {
        return CodecError::Malformed;
    }
    if ((flags & ~(g_entryFlagUrl | g_entryFlagNotes)) != 0U || modifiedMs < createdMs)
    {
        return CodecError::Malformed;
    }

    EntryFields fields{};
    auto title{ readText(in) };
    auto username{ title ? readText(in) : std::nullopt };
    auto password{ username ? readText(in) : std::nullopt };
    if (!password)
    {
        return CodecError::Malformed;
    }
    fields.title = std::move(*title);
    fields.username = std::move(*username);
    fields.password = std::move(*password);

    if ((flags & g_entryFlagUrl) != 0U)
    {
        fields.url = readText(in);
        if (!fields.url)
        {
            return CodecError::Malformed;
        }
    }
    if ((flags & g_entryFlagNotes) != 0U)
    {
        fields.notes = readText(in);
        if (!fields.notes)
        {
            return CodecError::Malformed;
        }
    }

    EntryId id{};
    std::copy(idBytes.begin(), idBytes.end(), id.bytes.begin());
    return Entry{ id, std::move(fields), fromMillis(createdMs), fromMillis(modifiedMs) };
}

} // namespace

coffer::security::SecureBuffer encodeVault(const Vault& vault)
{
    coffer::security::SecureBuffer out{};
    detail::BigEndianWriter<coffer::security::SecureBuffer> w{ out };

    w.bytes(g_payloadMagic);
    w.u16(g_payloadSchemaV1);
    w.u32(static_cast<std::uint32_t>(vault.size()));
    for (const Entry& e : vault.entries())
    {
        w.bytes(e.id().bytes);
        w.i64(toMillis(e.createdAt()));
        w.i64(toMillis(e.modifiedAt()));

        const auto flags{ static_cast<std::uint8_t>((e.url() ? g_entryFlagUrl : 0U) |
                                                     (e.notes() ? g_entryFlagNotes : 0U)) };
        w.u8(flags);

        w.text(coffer::security::asStringView(e.title()));
        w.text(coffer::security::asStringView(e.username()));
        w.text(coffer::security::asStringView(e.password()));
        if (e.url())
        {
            w.text(coffer::security::asStringView(*e.url()));
        }
        if (e.notes())
        {
            w.text(coffer::security::asStringView(*e.notes()));
        }
    }
    return out;
}

Result<Vault, CodecError> decodeVault(std::span<const std::uint8_t> bytes)
{
    detail::BigEndianReader in{ bytes };

    std::span<const std::uint8_t> magic{};
    std::uint16_t schema{};
    if (!in.take(g_payloadMagic.size(), magic) || !std::equal(magic.begin(), magic.end(), g_payloadMagic.begin()))
    {
        return CodecError::Malformed;
    }
    if (!in.u16(schema))
    {
        return CodecError::Malformed;
    }
    if (schema != g_payloadSchemaV1)
    {
        return CodecError::UnknownVersion;
    }

    std::uint32_t count{};
    if (!in.u32(count) || count > in.remaining() / g_minEncodedEntryBytes)
    {
        return CodecError::Malformed;
    }

    Vault vault{};
    const auto fail{ [&vault](CodecError e) noexcept -> Result<Vault, CodecError>
                     {
                         vault.wipe();
                         return e;
                     } };

    for (std::uint32_t i{}; i < count; ++i)
    {
        auto entryOrErr{ readEntry(in) };
        if (std::holds_alternative<CodecError>(entryOrErr))
        {
            return fail(std::get<CodecError>(entryOrErr));
        }
        if (!vault.add(std::move(std::get<Entry>(entryOrErr))))
        {
            return fail(CodecError::DuplicateId);
        }
    }
    if (in.remaining() != 0U)
    {
        return fail(CodecError::Malformed);
    }
    return vault;
}

} // namespace coffer::core
