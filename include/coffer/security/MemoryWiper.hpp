#ifndef INCLUDE_COFFER_SECURITY_MEMORYWIPER_HPP
#define INCLUDE_COFFER_SECURITY_MEMORYWIPER_HPP

#include <cstddef>
#include <span>
#include <type_traits>

namespace coffer::security
{

// Invoked after every wipe with the region that was just cleared, while it is still owned by the caller.
// Used by tests to observe zeroization; production code leaves it unset.
using WipeObserver = void (*)(std::span<const std::byte> wiped) noexcept;

void setWipeObserver(WipeObserver observer) noexcept;

void secureWipe(std::span<std::byte> bytes) noexcept;

template <typename T, std::size_t Extent>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
void secureWipe(std::span<T, Extent> buffer) noexcept
{
    secureWipe(std::span<std::byte>{ std::as_writable_bytes(buffer) });
}

} // namespace coffer::security

#endif // INCLUDE_COFFER_SECURITY_MEMORYWIPER_HPP
