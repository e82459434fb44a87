#ifndef NOPASSPLZ_UI_CLI_INTERACTIVESHELL_HPP
#define NOPASSPLZ_UI_CLI_INTERACTIVESHELL_HPP

#include "nopassplz/core/DerivationTask.hpp"
#include "nopassplz/core/KdfPolicy.hpp"
#include "nopassplz/core/Session.hpp"
#include "nopassplz/crypto/ICryptoProvider.hpp"
#include "nopassplz/crypto/KdfParameters.hpp"
#include "nopassplz/security/SecureString.hpp"
#include "nopassplz/storage/IIndexLabelRepository.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <optional>
#include <string>

namespace nopassplz::ui::cli
{

// In tests: returns a pre-determined string.
using PasswordReader = std::function<nopassplz::security::SecureString(const std::string&)>;

struct ShellOptions final
{
    nopassplz::crypto::KdfParameters kdf{};
    // Empty for a custom configuration; only used to show the expected wait.
    std::optional<nopassplz::core::KdfPreset> preset{};
    nopassplz::core::Session::Duration idleTimeout{};
    bool verbose{ false };
};

class InteractiveShell final
{
public:
    static constexpr std::uint32_t g_kEntriesPerPage{ 10U };

    InteractiveShell(const nopassplz::crypto::ICryptoProvider& crypto,
                     nopassplz::storage::IIndexLabelRepository& labels, ShellOptions options, std::istream& in,
                     std::ostream& out, std::ostream& diag, PasswordReader pwdReader,
                     nopassplz::core::Session::NowProvider now = nopassplz::core::Session::Clock::now);

    int run();

private:
    const nopassplz::crypto::ICryptoProvider& m_crypto;
    nopassplz::storage::IIndexLabelRepository& m_labels;
    ShellOptions m_options;
    std::istream& m_in;
    std::ostream& m_out;
    std::ostream& m_diag;
    PasswordReader m_pwdReader;
    nopassplz::core::Session::NowProvider m_now;

    nopassplz::core::DerivationTask m_task;
    std::optional<nopassplz::core::Session> m_session;
    bool m_running{ true };

    void processLine(const std::string& line);
    void lockIfIdle();
    void log(const std::string& message);

    void doLogin();
    void doDerive(std::uint32_t index);
    void doList(std::uint64_t page);
    void doLabel(std::uint32_t index, const std::string& title, const std::string& description, bool exposed);
    void doUnlabel(std::uint32_t index);
    void doPresets();
    void doLogout();
};

} // namespace nopassplz::ui::cli

#endif // NOPASSPLZ_UI_CLI_INTERACTIVESHELL_HPP
