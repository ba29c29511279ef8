#ifndef INCLUDE_COFFER_SECURITY_SECUREBUFFER_HPP
#define INCLUDE_COFFER_SECURITY_SECUREBUFFER_HPP

#include "coffer/security/ZeroAllocator.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace coffer::security
{

// Vault keys, Argon2id output and decrypted payloads.
using SecureBuffer = std::vector<std::uint8_t, ZeroAllocator<std::uint8_t>>;

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureBuffer& b) noexcept
{
    return std::as_bytes(std::span{ b });
}

[[nodiscard]] inline std::span<std::byte> asWritableBytes(SecureBuffer& b) noexcept
{
    return std::as_writable_bytes(std::span{ b });
}

// Zeroes the contents and returns the allocation; the buffer is left empty with no capacity.
inline void secureRelease(SecureBuffer& b) noexcept
{
    secureWipe(asWritableBytes(b));
    SecureBuffer{}.swap(b);
}

} // namespace coffer::security

#endif // INCLUDE_COFFER_SECURITY_SECUREBUFFER_HPP
