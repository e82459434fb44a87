#include "ConsoleUtils.hpp"
#include "InteractiveShell.hpp"

#include "nopassplz/core/KdfPolicy.hpp"
#include "nopassplz/crypto/providers/CryptoProviderFactory.hpp"
#include "nopassplz/storage/sqlite/SqliteIndexLabelRepositoryFactory.hpp"

#include <CLI/CLI.hpp>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>

int main(int argc, char** argv)
{
    CLI::App app{ "NoPassPlz: derive any number of passwords from one master credential" };

    std::map<std::string, nopassplz::core::KdfPreset> presetNames{};
    for (const auto p : nopassplz::core::g_kAllKdfPresets)
    {
        presetNames.emplace(nopassplz::core::kdfPresetName(p), p);
    }
    using nopassplz::crypto::providers::CryptoBackend;
    std::map<std::string, CryptoBackend> backendNames{};
    for (const CryptoBackend backend : { CryptoBackend::Native, CryptoBackend::OpenSsl })
    {
        backendNames.emplace(nopassplz::crypto::providers::cryptoBackendName(backend), backend);
    }

    nopassplz::core::KdfPreset preset{ nopassplz::core::g_kDefaultKdfPreset };
    std::filesystem::path labelsFile{ "nopassplz.db" };
    CryptoBackend backend{ CryptoBackend::Native };
    std::int64_t timeoutSeconds{ 300 };
    std::optional<std::uint32_t> memoryKiB{};
    std::optional<std::uint32_t> iterations{};
    std::optional<std::uint32_t> parallelism{};
    bool verbose{ false };

    app.add_option("-p,--preset", preset, "Key derivation preset")
        ->transform(CLI::CheckedTransformer(presetNames, CLI::ignore_case))
        ->capture_default_str();
    app.add_option("-l,--labels", labelsFile, "SQLite file holding index labels")->capture_default_str();
    app.add_option("--provider", backend, "Crypto backend")
        ->transform(CLI::CheckedTransformer(backendNames, CLI::ignore_case));
    app.add_option("-t,--timeout", timeoutSeconds, "Idle seconds before the seed is erased (0 disables)")
        ->check(CLI::NonNegativeNumber)
        ->capture_default_str();
    auto* memOpt = app.add_option("--memory-kib", memoryKiB, "Custom Argon2id memory cost in KiB");
    auto* iterOpt = app.add_option("--iterations", iterations, "Custom Argon2id passes");
    auto* parOpt = app.add_option("--parallelism", parallelism, "Custom Argon2id lanes");
    memOpt->excludes("--preset");
    iterOpt->excludes("--preset");
    parOpt->excludes("--preset");
    app.add_flag("-v,--verbose", verbose, "Print diagnostics to stderr");

    CLI11_PARSE(app, argc, argv);

    try
    {
        if (!nopassplz::ui::cli::lockProcessMemory() && verbose)
        {
            std::cerr << "[nopassplz] warning: could not lock memory or disable core dumps\n";
        }

        nopassplz::ui::cli::ShellOptions options{};
        options.kdf = nopassplz::core::kdfParametersFor(preset);
        options.preset = preset;
        if (memoryKiB.has_value() || iterations.has_value() || parallelism.has_value())
        {
            options.kdf.memoryKiB = memoryKiB.value_or(options.kdf.memoryKiB);
            options.kdf.iterations = iterations.value_or(options.kdf.iterations);
            options.kdf.parallelism = parallelism.value_or(options.kdf.parallelism);
            options.preset.reset();
        }
        options.idleTimeout = nopassplz::core::Session::Duration{ timeoutSeconds };
        options.verbose = verbose;

        auto crypto{ nopassplz::crypto::providers::makeCryptoProvider(backend) };
        auto labels{ nopassplz::storage::sqlite::makeSqliteIndexLabelRepository(labelsFile) };
        if (verbose)
        {
            std::cerr << "[nopassplz] backend: " << nopassplz::crypto::providers::cryptoBackendName(backend)
                      << ", labels: " << labelsFile.string() << "\n";
        }

        nopassplz::ui::cli::InteractiveShell shell{ *crypto,   *labels,   options,
                                                    std::cin,  std::cout, std::cerr,
                                                    [](const std::string& prompt)
                                                    { return nopassplz::ui::cli::readPassword(prompt); } };
        return shell.run();
    }
    catch (const std::exception& e)
    {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
