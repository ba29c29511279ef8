#ifndef INCLUDE_COFFER_SECURITY_SECURESTRING_HPP
#define INCLUDE_COFFER_SECURITY_SECURESTRING_HPP

#include "coffer/security/ZeroAllocator.hpp"
#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace coffer::security
{

// Passphrases and entry fields. Not NUL-terminated.
using SecureString = std::vector<char, ZeroAllocator<char>>;

[[nodiscard]] inline SecureString secureStringFrom(std::string_view s)
{
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureString(s.begin(), s.end());
}

[[nodiscard]] inline std::string_view asStringView(const SecureString& s) noexcept
{
    return s.empty() ? std::string_view{} : std::string_view{ s.data(), s.size() };
}

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureString& s) noexcept
{
    return std::as_bytes(std::span{ s });
}

[[nodiscard]] inline std::span<std::byte> asWritableBytes(SecureString& s) noexcept
{
    return std::as_writable_bytes(std::span{ s });
}

inline void secureRelease(SecureString& s) noexcept
{
    secureWipe(asWritableBytes(s));
    SecureString{}.swap(s);
}

} // namespace coffer::security

#endif // INCLUDE_COFFER_SECURITY_SECURESTRING_HPP
