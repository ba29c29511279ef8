#include "ConsoleUtils.hpp"

#include <cstddef>
#include <iostream>
#include <string>

#if defined(__linux__)
#include <sys/mman.h>
#include <sys/resource.h>
#include <termios.h>
#include <unistd.h>
#else
#error "Unsupported platform"
#endif

namespace coffer::ui::cli
{

namespace
{

constexpr std::size_t g_passwordReserve{ 256U };

// Turns echo off for its lifetime when stdin is a terminal.
class EchoGuard final
{
public:
    EchoGuard() noexcept
    {
        if (::isatty(STDIN_FILENO) == 0 || ::tcgetattr(STDIN_FILENO, &m_saved) != 0)
        {
            return;
        }
        struct termios silent = m_saved;
        silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        m_active = ::tcsetattr(STDIN_FILENO, TCSANOW, &silent) == 0;
    }

    EchoGuard(const EchoGuard&) = delete;
    EchoGuard& operator=(const EchoGuard&) = delete;
    EchoGuard(EchoGuard&&) = delete;
    EchoGuard& operator=(EchoGuard&&) = delete;

    ~EchoGuard()
    {
        if (m_active)
        {
            static_cast<void>(::tcsetattr(STDIN_FILENO, TCSANOW, &m_saved));
        }
    }

private:
    struct termios m_saved
    {
    };
    bool m_active{ false };
};

} // namespace

bool lockProcessMemory() noexcept
{
    // No MCL_FUTURE: Argon2id work areas would fail against RLIMIT_MEMLOCK. Secret allocations pin
    // themselves through ZeroAllocator.
    const bool locked{ ::mlockall(MCL_CURRENT) == 0 };
    struct rlimit lim
    {
        0, 0
    };
    const bool noCore{ ::setrlimit(RLIMIT_CORE, &lim) == 0 };
    return locked && noCore;
}

coffer::security::SecureString readPassword(const std::string& prompt)
{
    std::cout << prompt << std::flush;

    coffer::security::SecureString password{};
    password.reserve(g_passwordReserve);
    {
        EchoGuard noEcho{};
        char c{};
        // Character by character so no std::string copy of the secret is ever made.
        while (std::cin.get(c) && c != '\n')
        {
            if (c != '\r')
            {
                password.push_back(c);
            }
        }
    }
    std::cout << "\n";
    return password;
}

} // namespace coffer::ui::cli
