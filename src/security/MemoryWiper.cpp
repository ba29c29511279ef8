#include "coffer/security/MemoryWiper.hpp"

#include <atomic>

#if defined(__linux__)
#include <string.h>
#else
#error Unsupported platform
#endif

namespace coffer::security
{
namespace
{

std::atomic<WipeObserver> g_wipeObserver{ nullptr };

} // namespace

void setWipeObserver(WipeObserver observer) noexcept
{
    g_wipeObserver.store(observer, std::memory_order_release);
}

void secureWipe(std::span<std::byte> bytes) noexcept
{
    if (bytes.empty())
    {
        return;
    }

    ::explicit_bzero(bytes.data(), bytes.size());

    if (const WipeObserver observer{ g_wipeObserver.load(std::memory_order_acquire) }; observer != nullptr)
    {
        observer(std::span<const std::byte>{ bytes.data(), bytes.size() });
    }
}

} // namespace coffer::security
