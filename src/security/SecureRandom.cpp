#include "coffer/security/SecureRandom.hpp"
#include "coffer/security/ScopeWipe.hpp"
#include <array>
#include <cerrno>
#include <cstring>
#include <limits>

#if defined(__linux__)
#include <sys/random.h>
#else
#error Unsupported platform
#endif

namespace coffer::security
{
namespace
{

constexpr std::size_t g_maxRejectionRounds{ 64U };

} // namespace

bool secureRandomFill(std::span<std::uint8_t> out) noexcept
{
    std::size_t filled{};
    while (filled < out.size())
    {
        const ssize_t got{ ::getrandom(out.data() + filled, out.size() - filled, 0) };
        if (got < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return false;
        }
        if (got == 0)
        {
            return false;
        }
        filled += static_cast<std::size_t>(got);
    }
    return true;
}

bool secureRandomBounded(std::uint64_t upperExclusive, std::uint64_t& out) noexcept
{
    if (upperExclusive == 0U)
    {
        return false;
    }
    if (upperExclusive == 1U)
    {
        out = 0U;
        return true;
    }

    // Largest multiple of upperExclusive that fits; draws above it are rejected.
    const std::uint64_t acceptBelow{ std::numeric_limits<std::uint64_t>::max() -
                                     (std::numeric_limits<std::uint64_t>::max() % upperExclusive) };

    std::array<std::uint8_t, sizeof(std::uint64_t)> raw{};
    auto wipeRaw{ scopeWipe(std::span{ raw }) };
    for (std::size_t round{}; round < g_maxRejectionRounds; ++round)
    {
        if (!secureRandomFill(std::span{ raw }))
        {
            return false;
        }
        std::uint64_t candidate{};
        std::memcpy(&candidate, raw.data(), sizeof(candidate));
        if (candidate < acceptBelow)
        {
            out = candidate % upperExclusive;
            return true;
        }
    }
    return false;
}

} // namespace coffer::security
