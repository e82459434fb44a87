#include "nopassplz/core/DerivationTask.hpp"

#include <exception>
#include <utility>

namespace nopassplz::core
{

DerivationTask::~DerivationTask() noexcept
{
    if (m_worker.joinable())
    {
        m_worker.join();
    }
}

bool DerivationTask::start(const nopassplz::crypto::ICryptoProvider& crypto, nopassplz::security::SecureString username,
                           nopassplz::security::SecureString password,
                           nopassplz::security::SecureString confirmPassword,
                           const nopassplz::crypto::KdfParameters& params)
{
    {
        std::lock_guard lock{ m_mutex };
        if (m_running)
        {
            nopassplz::security::secureRelease(username);
            nopassplz::security::secureRelease(password);
            nopassplz::security::secureRelease(confirmPassword);
            return false;
        }
    }

    // Only this thread starts workers, so a finished one can be joined outside the lock.
    if (m_worker.joinable())
    {
        m_worker.join();
    }

    {
        std::lock_guard lock{ m_mutex };
        m_running = true;
        m_result.reset();
        m_progress.store(DeriverState::Uninitialized);
    }

    m_worker = std::thread(
        [this, &crypto, params, username = std::move(username), password = std::move(password),
         confirmPassword = std::move(confirmPassword)]() mutable
        { run(crypto, username, password, confirmPassword, params); });
    return true;
}

void DerivationTask::run(const nopassplz::crypto::ICryptoProvider& crypto, nopassplz::security::SecureString& username,
                         nopassplz::security::SecureString& password,
                         nopassplz::security::SecureString& confirmPassword,
                         const nopassplz::crypto::KdfParameters& params)
{
    std::optional<CreateResult> result{};
    try
    {
        result.emplace(PasswordDeriver::create(crypto, username, password, confirmPassword, params,
                                               [this](DeriverState state) { m_progress.store(state); }));
    }
    catch (const std::exception&)
    {
        // Only allocation failures get here; create() reports crypto failures itself.
        result.emplace(DerivationError::KdfFailure);
    }

    nopassplz::security::secureRelease(username);
    nopassplz::security::secureRelease(password);
    nopassplz::security::secureRelease(confirmPassword);

    {
        std::lock_guard lock{ m_mutex };
        m_result = std::move(result);
        m_running = false;
    }
    m_done.notify_all();
}

bool DerivationTask::isRunning() const
{
    std::lock_guard lock{ m_mutex };
    return m_running;
}

DeriverState DerivationTask::progress() const noexcept
{
    return m_progress.load();
}

bool DerivationTask::waitFor(std::chrono::milliseconds timeout)
{
    std::unique_lock lock{ m_mutex };
    return m_done.wait_for(lock, timeout, [this]() { return !m_running; });
}

std::optional<CreateResult> DerivationTask::takeResult()
{
    std::unique_lock lock{ m_mutex };
    m_done.wait(lock, [this]() { return !m_running; });

    std::optional<CreateResult> out{ std::move(m_result) };
    m_result.reset();
    return out;
}

} // namespace nopassplz::core
