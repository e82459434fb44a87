#include "InteractiveShell.hpp"
#include "Tokenizer.hpp"
#include "nopassplz/core/DeriverErrors.hpp"
#include "nopassplz/core/PasswordDeriver.hpp"
#include "nopassplz/security/ScopeWipe.hpp"

#include <CLI/CLI.hpp>
#include <algorithm>
#include <iomanip>
#include <limits>
#include <utility>
#include <variant>
#include <vector>

namespace nopassplz::ui::cli
{

namespace
{

constexpr std::chrono::milliseconds g_kProgressInterval{ 1000 };
constexpr std::uint64_t g_kMaxIndex{ std::numeric_limits<std::uint32_t>::max() };

void printParameters(std::ostream& out, const nopassplz::crypto::KdfParameters& params)
{
    out << std::fixed << std::setprecision(2) << nopassplz::core::memoryGigabytes(params) << " GB, "
        << params.iterations << (params.iterations == 1U ? " pass" : " passes") << ", " << params.parallelism
        << (params.parallelism == 1U ? " lane" : " lanes");
}

} // namespace

InteractiveShell::InteractiveShell(const nopassplz::crypto::ICryptoProvider& crypto,
                                   nopassplz::storage::IIndexLabelRepository& labels, ShellOptions options,
                                   std::istream& in, std::ostream& out, std::ostream& diag, PasswordReader pwdReader,
                                   nopassplz::core::Session::NowProvider now)
    : m_crypto(crypto), m_labels(labels), m_options(options), m_in(in), m_out(out), m_diag(diag),
      m_pwdReader(std::move(pwdReader)), m_now(std::move(now))
{
}

int InteractiveShell::run()
{
    m_out << "NoPassPlz Shell\n";
    m_out << "Type 'help' for available commands.\n";

    std::string line;
    while (m_running && m_in.good())
    {
        m_out << (m_session.has_value() ? "npp*> " : "npp> ");

        if (!std::getline(m_in, line))
        {
            break; // EOF
        }

        if (line.empty())
        {
            continue;
        }

        processLine(line);
    }

    if (m_session.has_value())
    {
        m_session->lock();
        m_session.reset();
    }
    return 0;
}

void InteractiveShell::lockIfIdle()
{
    if (m_session.has_value() && m_session->isExpired())
    {
        m_session->lock();
        m_session.reset();
        log("idle timeout reached, seed erased");
        m_out << "Session expired after inactivity. Log in again.\n";
    }
}

void InteractiveShell::log(const std::string& message)
{
    if (m_options.verbose)
    {
        m_diag << "[nopassplz] " << message << '\n';
    }
}

void InteractiveShell::processLine(const std::string& line)
{
    std::vector<std::string> userArgs = Tokenizer::tokenize(line);

    if (userArgs.empty())
    {
        return;
    }

    lockIfIdle();
    if (m_session.has_value())
    {
        m_session->touch();
    }

    // 'help' prints the root help rather than help for the 'help' subcommand.
    if (userArgs[0] == "help")
    {
        userArgs[0] = "--help";
    }

    std::vector<std::string> args;
    args.reserve(userArgs.size() + 1);
    args.emplace_back("npp");
    args.insert(args.end(), userArgs.begin(), userArgs.end());

    CLI::App app{ "NoPassPlz Shell" };
    app.require_subcommand(1);

    app.add_subcommand("help", "Print this help message")->callback([]() { throw CLI::CallForHelp(); });

    app.add_subcommand("exit", "Erase the seed and leave")->alias("quit")->callback([this]() { m_running = false; });

    app.add_subcommand("login", "Enter master credentials and derive the seed")->callback([this]() { doLogin(); });

    app.add_subcommand("logout", "Erase the seed")->callback([this]() { doLogout(); });

    std::uint32_t indexArg{};
    auto* subDerive = app.add_subcommand("derive", "Print the password for an index");
    subDerive->add_option("index", indexArg, "Index in [0, 4294967295]")->required();
    subDerive->callback([&]() { doDerive(indexArg); });

    std::uint64_t pageArg{ 1U };
    auto* subList = app.add_subcommand("list", "Show labels, 10 indices per page");
    subList->add_option("page", pageArg, "Page number, starting at 1")->check(CLI::PositiveNumber);
    subList->callback([&]() { doList(pageArg); });

    std::string titleArg;
    std::string descriptionArg;
    bool exposedArg{ false };
    auto* subLabel = app.add_subcommand("label", "Attach a title to an index");
    subLabel->add_option("index", indexArg, "Index to label")->required();
    subLabel->add_option("title", titleArg, "Short title")->required();
    subLabel->add_option("-d,--description", descriptionArg, "Free-form description");
    subLabel->add_flag("-e,--exposed", exposedArg, "Mark the password as exposed");
    subLabel->callback([&]() { doLabel(indexArg, titleArg, descriptionArg, exposedArg); });

    auto* subUnlabel = app.add_subcommand("unlabel", "Remove the label of an index");
    subUnlabel->add_option("index", indexArg, "Index to unlabel")->required();
    subUnlabel->callback([&]() { doUnlabel(indexArg); });

    app.add_subcommand("presets", "Show the key derivation presets")->callback([this]() { doPresets(); });

    try
    {
        std::vector<char*> argv;
        argv.reserve(args.size());
        for (const auto& arg : args)
        {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }

        app.parse(static_cast<int>(argv.size()), argv.data());
    }
    catch ([[maybe_unused]] const CLI::CallForHelp&)
    {
        m_out << app.help();
    }
    catch (const CLI::ParseError& e)
    {
        m_out << "Syntax Error: " << e.what() << "\n";
    }
    catch (const std::exception& e)
    {
        log(std::string{ "command failed: " } + e.what());
        m_out << "Error: " << e.what() << "\n";
    }
}

// --- Handlers ---

void InteractiveShell::doLogin()
{
    if (m_session.has_value())
    {
        m_out << "Error: Already logged in. Use 'logout' first.\n";
        return;
    }

    m_out << "Username: " << std::flush;
    std::string user;
    if (!std::getline(m_in, user))
    {
        m_out << "\nError: No username given.\n";
        return;
    }
    auto username = nopassplz::security::secureStringFrom(user);
    auto wipeUser = nopassplz::security::scopeWipe(user);

    auto password = m_pwdReader("Password: ");
    auto confirm = m_pwdReader("Confirm Password: ");

    if (!m_task.start(m_crypto, std::move(username), std::move(password), std::move(confirm), m_options.kdf))
    {
        m_out << "Error: A derivation is already running.\n";
        return;
    }

    m_out << "Deriving seed (";
    printParameters(m_out, m_options.kdf);
    m_out << ").";
    if (m_options.preset.has_value())
    {
        m_out << " This takes about " << nopassplz::core::estimatedLatency(*m_options.preset).count()
              << " seconds with the " << nopassplz::core::kdfPresetName(*m_options.preset) << " preset.";
    }
    m_out << " Please wait" << std::flush;

    while (!m_task.waitFor(g_kProgressInterval))
    {
        m_out << '.' << std::flush;
    }
    m_out << "\n";

    auto result = m_task.takeResult();
    if (!result.has_value())
    {
        m_out << "Error: " << nopassplz::core::toString(nopassplz::core::DerivationError::KdfFailure) << "\n";
        return;
    }

    if (const auto* invalid = std::get_if<nopassplz::core::ValidationError>(&*result))
    {
        m_out << "Error: " << nopassplz::core::toString(*invalid) << "\n";
        return;
    }
    if (const auto* failed = std::get_if<nopassplz::core::DerivationError>(&*result))
    {
        log("seed derivation failed");
        m_out << "Error: " << nopassplz::core::toString(*failed) << "\n";
        return;
    }

    m_session.emplace(std::move(std::get<nopassplz::core::DeriverHandle>(*result)), m_options.idleTimeout, m_now);
    log("seed ready");
    m_out << "Logged in.\n";
}

void InteractiveShell::doDerive(std::uint32_t index)
{
    if (!m_session.has_value())
    {
        m_out << "Error: Not logged in.\n";
        return;
    }

    auto password = m_session->deriveAt(index);
    if (!password.has_value())
    {
        m_out << "Error: Session is locked.\n";
        return;
    }
    auto wipePassword = nopassplz::security::scopeWipe(*password);

    if (const auto label = m_labels.load(index); label.has_value())
    {
        m_out << "[" << index << "] " << label->title << "\n";
    }
    m_out << nopassplz::security::asStringView(*password) << "\n";
}

void InteractiveShell::doList(std::uint64_t page)
{
    constexpr std::uint64_t kLastPage{ g_kMaxIndex / g_kEntriesPerPage + 1U };
    if (page == 0U || page > kLastPage)
    {
        m_out << "Error: Page out of range.\n";
        return;
    }

    const std::uint64_t first{ (page - 1U) * g_kEntriesPerPage };

    const std::uint64_t count{ std::min<std::uint64_t>(g_kEntriesPerPage, g_kMaxIndex - first + 1U) };
    const auto labels = m_labels.list(static_cast<std::uint32_t>(first), static_cast<std::size_t>(count));

    m_out << "Page " << page << "\n";
    auto it = labels.begin();
    for (std::uint64_t index{ first }; index < first + count; ++index)
    {
        m_out << "  " << std::setw(10) << index << "  ";
        if (it != labels.end() && it->index == index)
        {
            m_out << it->label.title;
            if (it->label.exposed)
            {
                m_out << " (exposed)";
            }
            if (!it->label.description.empty())
            {
                m_out << " - " << it->label.description;
            }
            ++it;
        }
        else
        {
            m_out << "No entry found";
        }
        m_out << "\n";
    }
}

void InteractiveShell::doLabel(std::uint32_t index, const std::string& title, const std::string& description,
                               bool exposed)
{
    if (title.empty())
    {
        m_out << "Error: Title must not be empty.\n";
        return;
    }

    m_labels.store(index, nopassplz::storage::IndexLabel{ title, description, exposed });
    m_out << "Label saved.\n";
}

void InteractiveShell::doUnlabel(std::uint32_t index)
{
    if (m_labels.remove(index))
    {
        m_out << "Label removed.\n";
    }
    else
    {
        m_out << "Error: No label for index " << index << ".\n";
    }
}

void InteractiveShell::doPresets()
{
    for (const auto preset : nopassplz::core::g_kAllKdfPresets)
    {
        const bool active{ m_options.preset.has_value() && *m_options.preset == preset };
        m_out << (active ? "* " : "  ") << std::left << std::setw(10) << nopassplz::core::kdfPresetName(preset)
              << std::right << "  ";
        printParameters(m_out, nopassplz::core::kdfParametersFor(preset));
        m_out << ", ~" << nopassplz::core::estimatedLatency(preset).count() << " s\n";
    }
    if (!m_options.preset.has_value())
    {
        m_out << "* custom      ";
        printParameters(m_out, m_options.kdf);
        m_out << "\n";
    }
}

void InteractiveShell::doLogout()
{
    if (!m_session.has_value())
    {
        m_out << "Error: Not logged in.\n";
        return;
    }
    m_session->lock();
    m_session.reset();
    log("seed erased on logout");
    m_out << "Logged out.\n";
}

} // namespace nopassplz::ui::cli
