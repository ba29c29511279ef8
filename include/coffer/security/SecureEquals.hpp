#ifndef INCLUDE_COFFER_SECURITY_SECUREEQUALS_HPP
#define INCLUDE_COFFER_SECURITY_SECUREEQUALS_HPP

#include <cstddef>
#include <cstdint>
#include <span>

namespace coffer::security
{

// Compares two contiguous byte-sized sequences (keys, passphrases) in time that depends only on
// their lengths.
template <typename A, typename B>
    requires(sizeof(typename A::value_type) == 1U && sizeof(typename B::value_type) == 1U)
[[nodiscard]] bool secureEquals(const A& a, const B& b) noexcept
{
    const auto lhs{ std::as_bytes(std::span{ a }) };
    const auto rhs{ std::as_bytes(std::span{ b }) };
    if (lhs.size() != rhs.size())
    {
        return false;
    }

    volatile std::uint8_t diff{};
    for (std::size_t i{}; i < lhs.size(); ++i)
    {
        diff = static_cast<std::uint8_t>(diff | std::to_integer<std::uint8_t>(lhs[i] ^ rhs[i]));
    }
    return diff == 0U;
}

} // namespace coffer::security

#endif // INCLUDE_COFFER_SECURITY_SECUREEQUALS_HPP
