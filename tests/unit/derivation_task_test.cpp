#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <span>
#include <thread>
#include <variant>

#include "test_utils/CountingCryptoProvider.hpp"
#include "nopassplz/core/DerivationTask.hpp"
#include "nopassplz/crypto/providers/CryptoProviderFactory.hpp"

namespace
{

using nopassplz::core::DerivationTask;
using nopassplz::core::DeriverHandle;
using nopassplz::core::DeriverState;
using nopassplz::core::ValidationError;
using nopassplz::security::secureStringFrom;

// Blocks deriveKey until released, so a test can hold a derivation in flight.
class GatedCryptoProvider final : public nopassplz::crypto::ICryptoProvider
{
public:
    explicit GatedCryptoProvider(const nopassplz::crypto::ICryptoProvider& inner) : m_inner(inner)
    {
    }

    [[nodiscard]] nopassplz::security::SecureBuffer deriveKey(std::span<const std::byte> password,
                                                              std::span<const std::byte> salt,
                                                              const nopassplz::crypto::KdfParameters& params) const override
    {
        std::unique_lock lock{ m_mutex };
        m_cv.wait(lock, [this]() { return m_open; });
        return m_inner.deriveKey(password, salt, params);
    }

    [[nodiscard]] nopassplz::security::SecureBuffer digestSha3_512(std::span<const std::byte> data) const override
    {
        return m_inner.digestSha3_512(data);
    }

    [[nodiscard]] nopassplz::security::SecureBuffer hmacSha3_512(std::span<const std::uint8_t> key,
                                                                 std::span<const std::byte> message) const override
    {
        return m_inner.hmacSha3_512(key, message);
    }

    void open()
    {
        {
            std::lock_guard lock{ m_mutex };
            m_open = true;
        }
        m_cv.notify_all();
    }

private:
    const nopassplz::crypto::ICryptoProvider& m_inner;
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;
    bool m_open{ false };
};

class DerivationTaskTest : public ::testing::Test
{
protected:
    std::unique_ptr<nopassplz::crypto::ICryptoProvider> m_native{
        nopassplz::crypto::providers::makeNativeCryptoProvider()
    };                                                   // NOLINT
    GatedCryptoProvider m_gated{ *m_native };            // NOLINT
};

} // namespace

TEST_F(DerivationTaskTest, TakeResultWithoutStartIsEmpty)
{
    DerivationTask task{};
    EXPECT_FALSE(task.isRunning());
    EXPECT_FALSE(task.takeResult().has_value());
}

TEST_F(DerivationTaskTest, RunsDerivationOnWorker)
{
    DerivationTask task{};
    ASSERT_TRUE(task.start(*m_native, secureStringFrom("username"), secureStringFrom("password"),
                           secureStringFrom("password"), nopassplz::test_utils::g_kReferenceParams));

    auto result = task.takeResult();
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(std::holds_alternative<DeriverHandle>(*result));
    EXPECT_EQ(task.progress(), DeriverState::Ready);
    EXPECT_FALSE(task.isRunning());

    const auto pw = std::get<DeriverHandle>(*result)->deriveAt(0U);
    ASSERT_TRUE(pw.has_value());
    EXPECT_EQ(nopassplz::security::asStringView(*pw), nopassplz::test_utils::g_kReferencePasswords[0]);

    // Handed over exactly once.
    EXPECT_FALSE(task.takeResult().has_value());
}

TEST_F(DerivationTaskTest, RefusesSecondStartWhileRunning)
{
    DerivationTask task{};
    ASSERT_TRUE(task.start(m_gated, secureStringFrom("username"), secureStringFrom("password"),
                           secureStringFrom("password"), nopassplz::test_utils::g_kQuickParams));

    EXPECT_TRUE(task.isRunning());
    EXPECT_FALSE(task.waitFor(std::chrono::milliseconds{ 20 }));
    EXPECT_FALSE(task.start(m_gated, secureStringFrom("other"), secureStringFrom("x"), secureStringFrom("x"),
                            nopassplz::test_utils::g_kQuickParams));

    m_gated.open();
    EXPECT_TRUE(task.waitFor(std::chrono::seconds{ 30 }));

    auto result = task.takeResult();
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(std::holds_alternative<DeriverHandle>(*result));
}

TEST_F(DerivationTaskTest, ReportsDerivingWhileKdfRuns)
{
    DerivationTask task{};
    ASSERT_TRUE(task.start(m_gated, secureStringFrom("username"), secureStringFrom("password"),
                           secureStringFrom("password"), nopassplz::test_utils::g_kQuickParams));

    const auto deadline{ std::chrono::steady_clock::now() + std::chrono::seconds{ 10 } };
    while (task.progress() != DeriverState::Deriving && std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::yield();
    }
    EXPECT_EQ(task.progress(), DeriverState::Deriving);

    m_gated.open();
    EXPECT_TRUE(task.takeResult().has_value());
}

TEST_F(DerivationTaskTest, ValidationErrorIsReturned)
{
    DerivationTask task{};
    ASSERT_TRUE(task.start(*m_native, secureStringFrom("username"), secureStringFrom("password"),
                           secureStringFrom("different"), nopassplz::test_utils::g_kReferenceParams));

    auto result = task.takeResult();
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(std::holds_alternative<ValidationError>(*result));
    EXPECT_EQ(std::get<ValidationError>(*result), ValidationError::PasswordMismatch);
}

TEST_F(DerivationTaskTest, CanRunAgainAfterCompletion)
{
    DerivationTask task{};
    ASSERT_TRUE(task.start(*m_native, secureStringFrom(""), secureStringFrom("p"), secureStringFrom("p"),
                           nopassplz::test_utils::g_kQuickParams));
    ASSERT_TRUE(task.takeResult().has_value());

    ASSERT_TRUE(task.start(*m_native, secureStringFrom("username"), secureStringFrom("p"), secureStringFrom("p"),
                           nopassplz::test_utils::g_kQuickParams));
    auto result = task.takeResult();
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(std::holds_alternative<DeriverHandle>(*result));
}

TEST_F(DerivationTaskTest, DestructorJoinsRunningWorker)
{
    {
        DerivationTask task{};
        ASSERT_TRUE(task.start(m_gated, secureStringFrom("username"), secureStringFrom("password"),
                               secureStringFrom("password"), nopassplz::test_utils::g_kQuickParams));
        m_gated.open();
    }
    SUCCEED();
}
