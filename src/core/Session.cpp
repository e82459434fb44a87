#include "nopassplz/core/Session.hpp"

#include <stdexcept>
#include <utility>

namespace nopassplz::core
{

Session::Session(DeriverHandle deriver, Duration timeout, NowProvider nowProvider)
    : m_now(std::move(nowProvider)), m_timeout(timeout), m_lastActivity{}, m_deriver(std::move(deriver))
{
    if (!m_deriver)
    {
        throw std::invalid_argument("Session: deriver must not be null");
    }
    m_lastActivity = m_now();
}

void Session::touch()
{
    m_lastActivity = m_now();
}

bool Session::isExpired() const
{
    if (m_timeout.count() <= 0)
    {
        return false;
    }

    return (m_now() - m_lastActivity) > m_timeout;
}

void Session::lock()
{
    m_deriver->erase();
}

bool Session::isLocked() const noexcept
{
    return m_deriver->state() == DeriverState::Erased;
}

std::optional<nopassplz::security::SecureString> Session::deriveAt(std::uint32_t index)
{
    auto out{ m_deriver->deriveAt(index) };
    if (out.has_value())
    {
        touch();
    }
    return out;
}

void Session::setTimeout(Duration timeout) noexcept
{
    m_timeout = timeout;
}

Session::Duration Session::timeout() const noexcept
{
    return m_timeout;
}

const PasswordDeriver& Session::deriver() const noexcept
{
    return *m_deriver;
}

} // namespace nopassplz::core
