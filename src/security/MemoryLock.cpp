#include "coffer/security/MemoryLock.hpp"

#include "coffer/diagnostics/Log.hpp"
#include <atomic>
#include <cerrno>
#include <cstdint>
#include <map>
#include <mutex>
#include <new>
#include <system_error>

#if defined(__linux__)
#include <sys/mman.h>
#include <unistd.h>
#else
#error Unsupported platform
#endif

namespace coffer::security
{
namespace
{

struct LockTable
{
    std::mutex mutex;
    std::map<std::uintptr_t, std::size_t> regions; // region start -> size, for regions pinned successfully
    std::map<std::uintptr_t, std::size_t> pins;    // page address -> pinned regions touching it
};

// Never destroyed: secure containers with static storage may still be released after main returns.
LockTable& lockTable() noexcept
{
    static LockTable* const table{ new LockTable{} };
    return *table;
}

std::atomic<bool> g_failureReported{ false };

struct PageRange
{
    std::uintptr_t first;
    std::uintptr_t end;
    std::uintptr_t pageSize;
};

[[nodiscard]] PageRange pagesOf(std::span<const std::byte> region) noexcept
{
    const auto pageSize{ static_cast<std::uintptr_t>(::sysconf(_SC_PAGESIZE)) };
    const auto begin{ reinterpret_cast<std::uintptr_t>(region.data()) };
    const std::uintptr_t first{ begin - (begin % pageSize) };
    const std::uintptr_t last{ begin + region.size() - 1U };
    return PageRange{ first, last - (last % pageSize) + pageSize, pageSize };
}

// Caller holds the table mutex.
void unpinPage(LockTable& table, std::uintptr_t page, std::uintptr_t pageSize) noexcept
{
    const auto it{ table.pins.find(page) };
    if (it != table.pins.end() && --it->second != 0U)
    {
        return;
    }
    if (it != table.pins.end())
    {
        table.pins.erase(it);
    }
    static_cast<void>(::munlock(reinterpret_cast<const void*>(page), pageSize));
}

} // namespace

int lockMemory(std::span<const std::byte> region) noexcept
{
    if (region.empty())
    {
        return 0;
    }
    const auto begin{ reinterpret_cast<std::uintptr_t>(region.data()) };
    const PageRange range{ pagesOf(region) };
    LockTable& table{ lockTable() };
    const std::lock_guard<std::mutex> guard{ table.mutex };

    if (::mlock(reinterpret_cast<const void*>(range.first), range.end - range.first) != 0)
    {
        return errno;
    }

    bool recorded{ false };
    std::uintptr_t page{ range.first };
    try
    {
        recorded = table.regions.emplace(begin, region.size()).second;
        for (; page < range.end; page += range.pageSize)
        {
            ++table.pins[page];
        }
    }
    catch (const std::bad_alloc&)
    {
        if (recorded)
        {
            table.regions.erase(begin);
        }
        // Undo the counted pages, then unpin the rest unless another region still holds them.
        for (std::uintptr_t p{ range.first }; p < page; p += range.pageSize)
        {
            unpinPage(table, p, range.pageSize);
        }
        for (; page < range.end; page += range.pageSize)
        {
            if (!table.pins.contains(page))
            {
                static_cast<void>(::munlock(reinterpret_cast<const void*>(page), range.pageSize));
            }
        }
        return ENOMEM;
    }
    return 0;
}

void unlockMemory(std::span<const std::byte> region) noexcept
{
    if (region.empty())
    {
        return;
    }
    const auto begin{ reinterpret_cast<std::uintptr_t>(region.data()) };
    LockTable& table{ lockTable() };
    const std::lock_guard<std::mutex> guard{ table.mutex };

    const auto it{ table.regions.find(begin) };
    if (it == table.regions.end() || it->second != region.size())
    {
        return;
    }
    table.regions.erase(it);

    const PageRange range{ pagesOf(region) };
    for (std::uintptr_t page{ range.first }; page < range.end; page += range.pageSize)
    {
        unpinPage(table, page, range.pageSize);
    }
}

void reportLockFailure(std::size_t bytes, int error)
{
    if (g_failureReported.exchange(true))
    {
        coffer::diagnostics::debug("mlock of ", bytes, " bytes failed: ", std::generic_category().message(error));
        return;
    }
    coffer::diagnostics::warning("cannot lock secret memory (", std::generic_category().message(error),
                                 "); secrets may be swapped to disk. Raise RLIMIT_MEMLOCK to fix this");
}

} // namespace coffer::security
