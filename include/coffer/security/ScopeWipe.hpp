#ifndef INCLUDE_COFFER_SECURITY_SCOPEWIPE_HPP
#define INCLUDE_COFFER_SECURITY_SCOPEWIPE_HPP

#include "coffer/security/MemoryWiper.hpp"
#include "coffer/security/SecureBuffer.hpp"
#include "coffer/security/SecureString.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <type_traits>

namespace coffer::security
{

// Wipes a caller-owned region when the guard goes out of scope, on every exit path.
class [[nodiscard]] ScopeWipe final
{
public:
    explicit ScopeWipe(std::span<std::byte> region) noexcept : m_region{ region }
    {
    }

    ScopeWipe(const ScopeWipe&) = delete;
    ScopeWipe& operator=(const ScopeWipe&) = delete;
    ScopeWipe(ScopeWipe&& other) noexcept : m_region{ other.m_region }
    {
        other.m_region = {};
    }
    ScopeWipe& operator=(ScopeWipe&&) = delete;

    ~ScopeWipe()
    {
        secureWipe(m_region);
    }

    // Hands responsibility for the region back to the caller.
    void dismiss() noexcept
    {
        m_region = {};
    }

private:
    std::span<std::byte> m_region;
};

template <typename T, std::size_t Extent>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
[[nodiscard]] ScopeWipe scopeWipe(std::span<T, Extent> region) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(region) };
}

template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
[[nodiscard]] ScopeWipe scopeWipe(T& object) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(std::span<T, 1>{ &object, 1U }) };
}

// The guard covers the current storage only; do not grow the container while it is armed.
[[nodiscard]] inline ScopeWipe scopeWipe(SecureBuffer& b) noexcept
{
    return ScopeWipe{ asWritableBytes(b) };
}

[[nodiscard]] inline ScopeWipe scopeWipe(SecureString& s) noexcept
{
    return ScopeWipe{ asWritableBytes(s) };
}

} // namespace coffer::security

#endif // INCLUDE_COFFER_SECURITY_SCOPEWIPE_HPP
