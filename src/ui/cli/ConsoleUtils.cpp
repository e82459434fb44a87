#include "ConsoleUtils.hpp"

#include "nopassplz/security/ScopeWipe.hpp"
#include <iostream>
#include <string>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#elif defined(__linux__)
#include <sys/mman.h>
#include <sys/resource.h>
#include <termios.h>
#include <unistd.h>
#else
#error "Unsupported platform"
#endif

namespace nopassplz::ui::cli
{

namespace
{

// Turns echo off for its lifetime. Does nothing when stdin is not a terminal.
class EchoGuard final
{
public:
    EchoGuard() noexcept
    {
#if defined(_WIN32)
        m_handle = GetStdHandle(STD_INPUT_HANDLE);
        if (GetConsoleMode(m_handle, &m_saved) != 0)
        {
            m_active = SetConsoleMode(m_handle, m_saved & ~static_cast<DWORD>(ENABLE_ECHO_INPUT)) != 0;
        }
#elif defined(__linux__)
        if (isatty(STDIN_FILENO) != 0 && tcgetattr(STDIN_FILENO, &m_saved) == 0)
        {
            struct termios silent = m_saved;
            silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
            m_active = tcsetattr(STDIN_FILENO, TCSANOW, &silent) == 0;
        }
#endif
    }

    EchoGuard(const EchoGuard&) = delete;
    EchoGuard& operator=(const EchoGuard&) = delete;
    EchoGuard(EchoGuard&&) = delete;
    EchoGuard& operator=(EchoGuard&&) = delete;

    ~EchoGuard() noexcept
    {
        if (!m_active)
        {
            return;
        }
#if defined(_WIN32)
        (void)SetConsoleMode(m_handle, m_saved);
#elif defined(__linux__)
        (void)tcsetattr(STDIN_FILENO, TCSANOW, &m_saved);
#endif
    }

private:
#if defined(_WIN32)
    HANDLE m_handle{};
    DWORD m_saved{};
#elif defined(__linux__)
    struct termios m_saved
    {
    };
#endif
    bool m_active{ false };
};

} // namespace

bool lockProcessMemory() noexcept
{
#if defined(_WIN32)
    // Secrets live in ZeroAllocator storage; per-page VirtualLock is not wired up.
    return false;
#elif defined(__linux__)
    const bool locked{ mlockall(MCL_CURRENT | MCL_FUTURE) == 0 };
    struct rlimit lim
    {
        0, 0
    };
    const bool noCore{ setrlimit(RLIMIT_CORE, &lim) == 0 };
    return locked && noCore;
#endif
}

nopassplz::security::SecureString readPassword(const std::string& prompt)
{
    std::cout << prompt << std::flush;

    std::string line;
    {
        EchoGuard noEcho{};
        std::getline(std::cin, line);
    }
    std::cout << "\n";

    auto wipeLine = nopassplz::security::scopeWipe(line);
    return nopassplz::security::secureStringFrom(line);
}

} // namespace nopassplz::ui::cli
