#ifndef INCLUDE_NOPASSPLZ_CORE_SESSION_HPP
#define INCLUDE_NOPASSPLZ_CORE_SESSION_HPP

#include "nopassplz/core/PasswordDeriver.hpp"
#include "nopassplz/security/SecureString.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

namespace nopassplz::core
{

// A logged-in user: one Ready deriver plus an idle timeout.
class Session final
{
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::seconds;
    using NowProvider = std::function<TimePoint()>;

    Session(DeriverHandle deriver, Duration timeout, NowProvider nowProvider = Clock::now);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    Session(Session&&) = delete;
    Session& operator=(Session&&) = delete;
    ~Session() = default;

    void touch();
    // A timeout of zero never expires.
    [[nodiscard]] bool isExpired() const;

    // Erases the seed. The session stays usable only for reporting; deriveAt returns std::nullopt.
    void lock();
    [[nodiscard]] bool isLocked() const noexcept;

    // Resets the idle timer on success.
    [[nodiscard]] std::optional<nopassplz::security::SecureString> deriveAt(std::uint32_t index);

    void setTimeout(Duration timeout) noexcept;
    [[nodiscard]] Duration timeout() const noexcept;
    [[nodiscard]] const PasswordDeriver& deriver() const noexcept;

private:
    NowProvider m_now;
    Duration m_timeout{};
    TimePoint m_lastActivity{};
    DeriverHandle m_deriver;
};

} // namespace nopassplz::core

#endif // INCLUDE_NOPASSPLZ_CORE_SESSION_HPP
