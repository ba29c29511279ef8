#ifndef INCLUDE_COFFER_SECURITY_SECURERANDOM_HPP
#define INCLUDE_COFFER_SECURITY_SECURERANDOM_HPP

#include <cstddef>
#include <cstdint>
#include <span>

namespace coffer::security
{

// Fills from the kernel CSPRNG. Returns false if the kernel could not deliver.
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;

// Uniform value in [0, upperExclusive) without modulo bias. Fails for upperExclusive == 0.
[[nodiscard]] bool secureRandomBounded(std::uint64_t upperExclusive, std::uint64_t& out) noexcept;

[[nodiscard]] inline bool secureRandomIndex(std::size_t upperExclusive, std::size_t& out) noexcept
{
    std::uint64_t value{};
    if (!secureRandomBounded(static_cast<std::uint64_t>(upperExclusive), value))
    {
        return false;
    }
    out = static_cast<std::size_t>(value);
    return true;
}

} // namespace coffer::security

#endif // INCLUDE_COFFER_SECURITY_SECURERANDOM_HPP
