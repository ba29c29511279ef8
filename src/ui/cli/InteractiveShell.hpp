#ifndef COFFER_UI_CLI_INTERACTIVESHELL_HPP
#define COFFER_UI_CLI_INTERACTIVESHELL_HPP

#include "coffer/core/Entry.hpp"
#include "coffer/core/VaultPolicy.hpp"
#include "coffer/core/VaultService.hpp"
#include "coffer/core/VaultSession.hpp"
#include "coffer/security/SecureString.hpp"
#include "coffer/storage/IVaultFileStore.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace coffer::ui::cli
{

// In tests: returns a pre-determined string.
using PasswordReader = std::function<coffer::security::SecureString(const std::string&)>;

constexpr std::chrono::seconds g_defaultIdleTimeout{ 300 };

struct ShellOptions final
{
    std::filesystem::path vaultPath;
    coffer::core::VaultPolicy policy{ coffer::core::defaultVaultPolicy() };
    std::chrono::seconds idleTimeout{ g_defaultIdleTimeout };
};

class InteractiveShell final
{
public:
    InteractiveShell(coffer::core::VaultService& service, coffer::storage::IVaultFileStore& store,
                     ShellOptions options, std::istream& in, std::ostream& out, PasswordReader pwdReader);

    int run();

    // Clock used for idle auto-lock; applies to sessions opened afterwards.
    void setClock(coffer::core::VaultSession::NowProvider now);

    void processLine(const std::string& line);

    [[nodiscard]] bool isUnlocked() const noexcept
    {
        return m_session.isUnlocked();
    }

private:
    // Disengaged fields were not given on the command line.
    struct EntryOptions
    {
        std::optional<std::string> title;
        std::optional<std::string> username;
        std::optional<std::string> url;
        std::optional<std::string> notes;
        bool promptPassword{ false };
        bool generate{ false };
        std::size_t length{ 20U };
    };

    struct GenOptions
    {
        std::size_t length{ 16U };
        bool noUpper{ false };
        bool noLower{ false };
        bool noDigits{ false };
        bool noSymbols{ false };
        bool excludeSimilar{ false };
        bool excludeAmbiguous{ false };
    };

    coffer::core::VaultService& m_service;
    coffer::storage::IVaultFileStore& m_store;
    ShellOptions m_options;
    std::istream& m_in;
    std::ostream& m_out;
    PasswordReader m_pwdReader;
    coffer::core::VaultSession::NowProvider m_now{ coffer::core::VaultSession::Clock::now };

    coffer::core::VaultSession m_session;
    bool m_running{ true };

    [[nodiscard]] bool requireUnlocked();
    [[nodiscard]] std::optional<coffer::core::EntryId> resolveEntry(const std::string& token);
    [[nodiscard]] std::optional<coffer::security::SecureString> readNewPassphrase();
    [[nodiscard]] std::optional<coffer::security::SecureString> generatePassword(std::size_t length);
    [[nodiscard]] bool writeSession();
    void adoptSession(coffer::core::VaultSession session);
    void warnUnsaved();

    void doInit();
    void doUnlock();
    void doAdd(const EntryOptions& opts);
    void doEdit(const std::string& idToken, const EntryOptions& opts);
    void doGet(const std::string& idToken, bool show);
    void doList();
    void doFind(const std::string& needle);
    void doRemove(const std::string& idToken);
    void doSave();
    void doPasswd(bool applyPolicy);
    void doGen(const GenOptions& opts);
    void doLock();
    void doExit();
};

} // namespace coffer::ui::cli

#endif // COFFER_UI_CLI_INTERACTIVESHELL_HPP
