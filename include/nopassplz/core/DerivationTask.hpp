#ifndef INCLUDE_NOPASSPLZ_CORE_DERIVATIONTASK_HPP
#define INCLUDE_NOPASSPLZ_CORE_DERIVATIONTASK_HPP

#include "nopassplz/core/PasswordDeriver.hpp"
#include "nopassplz/crypto/ICryptoProvider.hpp"
#include "nopassplz/crypto/KdfParameters.hpp"
#include "nopassplz/security/SecureString.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>

namespace nopassplz::core
{

// Runs PasswordDeriver::create on a dedicated worker thread so the driving loop stays responsive.
// At most one derivation is in flight per task. There is no cancellation: the destructor waits
// for a running derivation to finish.
class DerivationTask final
{
public:
    DerivationTask() = default;
    DerivationTask(const DerivationTask&) = delete;
    DerivationTask& operator=(const DerivationTask&) = delete;
    DerivationTask(DerivationTask&&) = delete;
    DerivationTask& operator=(DerivationTask&&) = delete;
    ~DerivationTask() noexcept;

    // Takes the credentials; the worker wipes them once the attempt ends.
    // Returns false, without touching the running derivation, if one is still in flight.
    [[nodiscard]] bool start(const nopassplz::crypto::ICryptoProvider& crypto,
                             nopassplz::security::SecureString username, nopassplz::security::SecureString password,
                             nopassplz::security::SecureString confirmPassword,
                             const nopassplz::crypto::KdfParameters& params);

    [[nodiscard]] bool isRunning() const;

    // Last state reported by the running (or last finished) construction.
    [[nodiscard]] DeriverState progress() const noexcept;

    // Returns true if the derivation finished within `timeout`.
    [[nodiscard]] bool waitFor(std::chrono::milliseconds timeout);

    // Blocks until the derivation finishes and hands over its result once.
    // Returns std::nullopt if nothing was started or the result was already taken.
    [[nodiscard]] std::optional<CreateResult> takeResult();

private:
    void run(const nopassplz::crypto::ICryptoProvider& crypto, nopassplz::security::SecureString& username,
             nopassplz::security::SecureString& password, nopassplz::security::SecureString& confirmPassword,
             const nopassplz::crypto::KdfParameters& params);

    mutable std::mutex m_mutex;
    std::condition_variable m_done;
    std::thread m_worker;
    bool m_running{ false };
    std::optional<CreateResult> m_result;
    std::atomic<DeriverState> m_progress{ DeriverState::Uninitialized };
};

} // namespace nopassplz::core

#endif // INCLUDE_NOPASSPLZ_CORE_DERIVATIONTASK_HPP
