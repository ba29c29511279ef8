#ifndef INCLUDE_COFFER_SECURITY_ZEROALLOCATOR_HPP
#define INCLUDE_COFFER_SECURITY_ZEROALLOCATOR_HPP

#include "coffer/security/MemoryLock.hpp"
#include "coffer/security/MemoryWiper.hpp"
#include <cstddef>
#include <limits>
#include <new>
#include <span>
#include <type_traits>

namespace coffer::security
{

// Page policies for BasicZeroAllocator.
struct PinnedPages
{
    static constexpr bool g_lock{ true };
};

struct SwappablePages
{
    static constexpr bool g_lock{ false };
};

// Allocator that zeroizes every block before handing it back to the heap.
// Containers using it never leave their previous contents behind on reallocation or destruction.
// With PinnedPages every block is also mlock'ed for its lifetime; a failed pin is reported, not fatal.
template <class T, class Pages> struct BasicZeroAllocator
{
    using value_type = T;
    using is_always_equal = std::true_type;
    using propagate_on_container_move_assignment = std::true_type;
    using propagate_on_container_swap = std::true_type;

    BasicZeroAllocator() noexcept = default;

    template <class U>
    constexpr explicit BasicZeroAllocator([[maybe_unused]] const BasicZeroAllocator<U, Pages>& other) noexcept
    {
    }

    [[nodiscard]] T* allocate(std::size_t n)
    {
        if (n == 0U)
        {
            return nullptr;
        }
        if (n > (std::numeric_limits<std::size_t>::max() / sizeof(T)))
        {
            throw std::bad_array_new_length{};
        }
        T* p{ static_cast<T*>(::operator new(n * sizeof(T), std::align_val_t{ alignof(T) })) };
        if constexpr (Pages::g_lock)
        {
            if (const int error{ lockMemory(block(p, n)) }; error != 0)
            {
                try
                {
                    reportLockFailure(n * sizeof(T), error);
                }
                catch (...)
                {
                    ::operator delete(p, std::align_val_t{ alignof(T) });
                    throw;
                }
            }
        }
        return p;
    }

    void deallocate(T* p, std::size_t n) noexcept
    {
        if (p == nullptr)
        {
            return;
        }
        if (n != 0U)
        {
            secureWipe(std::span<std::byte>{ reinterpret_cast<std::byte*>(p), n * sizeof(T) });
            if constexpr (Pages::g_lock)
            {
                unlockMemory(block(p, n));
            }
        }
        ::operator delete(p, std::align_val_t{ alignof(T) });
    }

private:
    [[nodiscard]] static std::span<const std::byte> block(const T* p, std::size_t n) noexcept
    {
        return std::span<const std::byte>{ reinterpret_cast<const std::byte*>(p), n * sizeof(T) };
    }
};

template <class T, class U, class Pages>
constexpr bool operator==([[maybe_unused]] const BasicZeroAllocator<T, Pages>& lhs,
                          [[maybe_unused]] const BasicZeroAllocator<U, Pages>& rhs) noexcept
{
    return true;
}

// Keys, passphrases, decrypted payloads and entry fields.
template <class T> using ZeroAllocator = BasicZeroAllocator<T, PinnedPages>;

// Large scratch areas (the Argon2id work area) that would exceed RLIMIT_MEMLOCK if pinned.
template <class T> using ScratchAllocator = BasicZeroAllocator<T, SwappablePages>;

} // namespace coffer::security

#endif // INCLUDE_COFFER_SECURITY_ZEROALLOCATOR_HPP
