#ifndef COFFER_SRC_CORE_BIGENDIAN_HPP
#define COFFER_SRC_CORE_BIGENDIAN_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace coffer::core::detail
{

constexpr unsigned g_bitsPerByte{ 8U };

// Appends fixed-width big-endian integers and length-prefixed strings.
template <class Container> class BigEndianWriter final
{
public:
    explicit BigEndianWriter(Container& out) noexcept : m_out{ &out }
    {
    }

    void u8(std::uint8_t v)
    {
        m_out->push_back(static_cast<typename Container::value_type>(v));
    }

    void u16(std::uint16_t v)
    {
        putUnsigned(v, sizeof(v));
    }

    void u32(std::uint32_t v)
    {
        putUnsigned(v, sizeof(v));
    }

    void i64(std::int64_t v)
    {
        putUnsigned(static_cast<std::uint64_t>(v), sizeof(v));
    }

    void bytes(std::span<const std::uint8_t> b)
    {
        for (const std::uint8_t v : b)
        {
            u8(v);
        }
    }

    void text(std::string_view s)
    {
        u32(static_cast<std::uint32_t>(s.size()));
        for (const char c : s)
        {
            u8(static_cast<std::uint8_t>(c));
        }
    }

private:
    void putUnsigned(std::uint64_t v, std::size_t width)
    {
        for (std::size_t i{ width }; i > 0U; --i)
        {
            u8(static_cast<std::uint8_t>((v >> ((i - 1U) * g_bitsPerByte)) & 0xFFU));
        }
    }

    Container* m_out;
};

// Bounds-checked cursor. Every read reports false instead of running past the end.
class BigEndianReader final
{
public:
    explicit BigEndianReader(std::span<const std::uint8_t> in) noexcept : m_in{ in }
    {
    }

    [[nodiscard]] std::size_t remaining() const noexcept
    {
        return m_in.size() - m_pos;
    }

    [[nodiscard]] bool u8(std::uint8_t& out) noexcept
    {
        std::uint64_t v{};
        if (!getUnsigned(v, 1U))
        {
            return false;
        }
        out = static_cast<std::uint8_t>(v);
        return true;
    }

    [[nodiscard]] bool u16(std::uint16_t& out) noexcept
    {
        std::uint64_t v{};
        if (!getUnsigned(v, sizeof(out)))
        {
            return false;
        }
        out = static_cast<std::uint16_t>(v);
        return true;
    }

    [[nodiscard]] bool u32(std::uint32_t& out) noexcept
    {
        std::uint64_t v{};
        if (!getUnsigned(v, sizeof(out)))
        {
            return false;
        }
        out = static_cast<std::uint32_t>(v);
        return true;
    }

    [[nodiscard]] bool i64(std::int64_t& out) noexcept
    {
        std::uint64_t v{};
        if (!getUnsigned(v, sizeof(out)))
        {
            return false;
        }
        out = static_cast<std::int64_t>(v);
        return true;
    }

    // Returns a view into the input; the caller copies it where it needs to own the bytes.
    [[nodiscard]] bool take(std::size_t n, std::span<const std::uint8_t>& out) noexcept
    {
        if (n > remaining())
        {
            return false;
        }
        out = m_in.subspan(m_pos, n);
        m_pos += n;
        return true;
    }

private:
    [[nodiscard]] bool getUnsigned(std::uint64_t& out, std::size_t width) noexcept
    {
        if (width > remaining())
        {
            return false;
        }
        std::uint64_t v{};
        for (std::size_t i{}; i < width; ++i)
        {
            v = (v << g_bitsPerByte) | m_in[m_pos + i];
        }
        m_pos += width;
        out = v;
        return true;
    }

    std::span<const std::uint8_t> m_in;
    std::size_t m_pos{};
};

} // namespace coffer::core::detail

#endif // COFFER_SRC_CORE_BIGENDIAN_HPP
