#include "ConsoleUtils.hpp"
#include "InteractiveShell.hpp"
#include "coffer/core/VaultPolicy.hpp"
#include "coffer/core/VaultService.hpp"
#include "coffer/core/VaultSession.hpp"
#include "coffer/crypto/providers/NativeProviderFactory.hpp"
#include "coffer/diagnostics/Log.hpp"
#include "coffer/storage/file/FileVaultStoreFactory.hpp"

#include <CLI/CLI.hpp>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>

#if defined(COFFER_ENABLE_OPENSSL)
#include "coffer/crypto/providers/OpenSslProviderFactory.hpp"
#endif

namespace
{

constexpr const char* g_defaultVaultFile{ "vault.coffer" };

std::filesystem::path defaultVaultPath()
{
    if (const char* home{ std::getenv("HOME") }; home != nullptr && *home != '\0')
    {
        return std::filesystem::path{ home } / ".coffer" / g_defaultVaultFile;
    }
    return std::filesystem::path{ g_defaultVaultFile };
}

std::unique_ptr<coffer::crypto::ICryptoProvider> makeProvider(const std::string& name)
{
    if (name == "native")
    {
        return coffer::crypto::providers::makeNativeCryptoProvider();
    }
#if defined(COFFER_ENABLE_OPENSSL)
    if (name == "openssl")
    {
        return coffer::crypto::providers::makeOpenSslCryptoProvider();
    }
#endif
    return nullptr;
}

// Creates the directory that will hold the vault file, owner-only, if it is missing.
bool prepareVaultDirectory(const std::filesystem::path& vaultPath)
{
    const auto dir{ vaultPath.parent_path() };
    if (dir.empty())
    {
        return true;
    }
    std::error_code ec{};
    if (std::filesystem::is_directory(dir, ec))
    {
        return true;
    }
    ec.clear();
    if (!std::filesystem::create_directories(dir, ec) || ec)
    {
        return false;
    }
    std::filesystem::permissions(dir, std::filesystem::perms::owner_all, std::filesystem::perm_options::replace, ec);
    return !ec;
}

} // namespace

int main(int argc, char** argv)
{
    CLI::App app{ "Coffer: local encrypted secrets vault" };

    std::string vaultPath{ defaultVaultPath().string() };
    std::string kdfProfile{ "interactive" };
    std::uint32_t kdfIterations{ coffer::core::defaultVaultPolicy().kdf.iterations };
    std::string aead{ "chacha20-poly1305" };
    std::int64_t idleSeconds{ coffer::ui::cli::g_defaultIdleTimeout.count() };
    std::string logLevel{ "warning" };
    std::string provider{ "native" };

    app.add_option("--vault", vaultPath, "Path of the vault file")->capture_default_str();
    app.add_option("--kdf-profile", kdfProfile, "interactive, moderate or sensitive (new vaults and passwd)")
        ->capture_default_str();
    app.add_option("--kdf-iterations", kdfIterations, "Argon2id passes (2-10)")
        ->check(CLI::Range(std::uint32_t{ 2 }, std::uint32_t{ 10 }))
        ->capture_default_str();
    app.add_option("--aead", aead, "chacha20-poly1305 or aes-256-gcm")->capture_default_str();
    app.add_option("--idle-timeout", idleSeconds, "Seconds of inactivity before auto-lock, 0 disables")
        ->check(CLI::Range(std::int64_t{ 0 },
                           static_cast<std::int64_t>(coffer::core::VaultSession::g_maxIdleTimeout.count())))
        ->capture_default_str();
    app.add_option("--log-level", logLevel, "debug, info, warning, error or off")->capture_default_str();
    app.add_option("--provider", provider, "Crypto backend: native or openssl")->capture_default_str();

    CLI11_PARSE(app, argc, argv);

    const auto level{ coffer::diagnostics::parseLogLevel(logLevel) };
    if (!level.has_value())
    {
        std::cerr << "unknown log level: " << logLevel << '\n';
        return 2;
    }
    coffer::diagnostics::setLogLevel(*level);

    const auto kdf{ coffer::core::parseKdfProfile(kdfProfile) };
    if (!kdf.has_value())
    {
        std::cerr << "unknown KDF profile: " << kdfProfile << '\n';
        return 2;
    }
    const auto cipher{ coffer::core::parseAeadAlgorithm(aead) };
    if (!cipher.has_value())
    {
        std::cerr << "unknown AEAD algorithm: " << aead << '\n';
        return 2;
    }

    try
    {
        auto crypto{ makeProvider(provider) };
        if (!crypto)
        {
            std::cerr << "unknown or disabled crypto provider: " << provider << '\n';
            return 2;
        }
        if (!crypto->supportsAead(*cipher))
        {
            std::cerr << "provider " << provider << " does not support " << coffer::crypto::toString(*cipher) << '\n';
            return 2;
        }

        if (!coffer::ui::cli::lockProcessMemory())
        {
            coffer::diagnostics::warning("could not lock process memory or disable core dumps");
        }

        if (!prepareVaultDirectory(vaultPath))
        {
            std::cerr << "cannot create directory for " << vaultPath << '\n';
            return 1;
        }

        coffer::ui::cli::ShellOptions options{};
        options.vaultPath = vaultPath;
        options.policy.kdf.algorithm = *kdf;
        options.policy.kdf.iterations = kdfIterations;
        options.policy.aead = *cipher;
        options.idleTimeout = std::chrono::seconds{ idleSeconds };

        auto store{ coffer::storage::file::makeFileVaultStore() };
        coffer::core::VaultService service{ *crypto };
        coffer::ui::cli::InteractiveShell shell{ service,    *store,    options,
                                                 std::cin,   std::cout, coffer::ui::cli::readPassword };
        return shell.run();
    }
    catch (const std::exception& e)
    {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
