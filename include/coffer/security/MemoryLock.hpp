#ifndef INCLUDE_COFFER_SECURITY_MEMORYLOCK_HPP
#define INCLUDE_COFFER_SECURITY_MEMORYLOCK_HPP

#include <cstddef>
#include <span>

namespace coffer::security
{

// Pins the pages backing `region` in RAM so they are never written to swap.
// Pages are reference counted: a page shared by several regions stays pinned until the last of them is
// unlocked. Returns 0 on success or the errno of the failed mlock.
[[nodiscard]] int lockMemory(std::span<const std::byte> region) noexcept;

// Releases one reference on every page of `region`. Regions that were never locked are ignored.
void unlockMemory(std::span<const std::byte> region) noexcept;

// Logs the first failed pin of the process as a warning; later failures are counted at debug level.
void reportLockFailure(std::size_t bytes, int error);

} // namespace coffer::security

#endif // INCLUDE_COFFER_SECURITY_MEMORYLOCK_HPP
