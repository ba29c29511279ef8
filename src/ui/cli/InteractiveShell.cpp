#include "InteractiveShell.hpp"
#include "CommandLine.hpp"
#include "coffer/core/PasswordGenerator.hpp"
#include "coffer/core/PasswordStrength.hpp"
#include "coffer/core/VaultEnvelope.hpp"
#include "coffer/diagnostics/Log.hpp"
#include "coffer/security/ScopeWipe.hpp"
#include "coffer/security/SecureEquals.hpp"

#include <CLI/CLI.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <ctime>
#include <utility>
#include <variant>
#include <vector>

namespace coffer::ui::cli
{

namespace
{

constexpr std::size_t g_minIdPrefix{ 4U };
constexpr std::size_t g_maxGeneratedLength{ 256U };

std::string formatTimestamp(coffer::core::Timestamp ts)
{
    const std::time_t seconds{ std::chrono::system_clock::to_time_t(
        std::chrono::time_point_cast<std::chrono::system_clock::duration>(ts)) };
    std::tm utc{};
    if (::gmtime_r(&seconds, &utc) == nullptr)
    {
        return "?";
    }
    std::array<char, 32> buf{};
    const std::size_t n{ std::strftime(buf.data(), buf.size(), "%Y-%m-%d %H:%M:%S UTC", &utc) };
    return std::string{ buf.data(), n };
}

coffer::security::SecureString toSecure(const std::string& s)
{
    return coffer::security::secureStringFrom(s);
}

} // namespace

InteractiveShell::InteractiveShell(coffer::core::VaultService& service, coffer::storage::IVaultFileStore& store,
                                   ShellOptions options, std::istream& in, std::ostream& out,
                                   PasswordReader pwdReader)
    : m_service(service), m_store(store), m_options(std::move(options)), m_in(in), m_out(out),
      m_pwdReader(std::move(pwdReader))
{
}

void InteractiveShell::setClock(coffer::core::VaultSession::NowProvider now)
{
    m_now = std::move(now);
}

int InteractiveShell::run()
{
    m_out << "Coffer vault shell\n";
    m_out << "Vault file: " << m_options.vaultPath.string() << "\n";
    m_out << "Type 'help' for available commands.\n";

    std::string line;
    while (m_running && m_in.good())
    {
        if (m_session.isUnlocked())
        {
            m_out << "coffer(" << m_options.vaultPath.filename().string() << ")> ";
        }
        else
        {
            m_out << "coffer> ";
        }

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

    if (m_running)
    {
        doExit();
    }
    return 0;
}

void InteractiveShell::processLine(const std::string& line)
{
    auto words{ splitCommandLine(line) };
    if (!words.has_value())
    {
        m_out << "Syntax Error: unterminated quote\n";
        return;
    }
    std::vector<std::string> userArgs{ std::move(*words) };
    if (userArgs.empty())
    {
        return;
    }

    if (m_session.isExpired())
    {
        const bool discarded{ m_session.hasUnsavedChanges() };
        if (m_session.lockIfExpired())
        {
            coffer::diagnostics::info("session locked after idle timeout");
            m_out << "Vault locked after inactivity.\n";
            if (discarded)
            {
                m_out << "Warning: unsaved changes were discarded.\n";
            }
        }
    }

    // 'help' prints the root help, not the help of the 'help' subcommand.
    if (userArgs[0] == "help")
    {
        userArgs[0] = "--help";
    }

    std::vector<std::string> args;
    args.reserve(userArgs.size() + 1);
    args.emplace_back("coffer");
    args.insert(args.end(), userArgs.begin(), userArgs.end());

    CLI::App app{ "Coffer Shell" };
    app.require_subcommand(1);

    app.add_subcommand("help", "Print this help message")->callback([]() { throw CLI::CallForHelp(); });
    app.add_subcommand("exit", "Lock and leave the shell")->alias("quit")->callback([this]() { doExit(); });

    app.add_subcommand("init", "Create a new vault at the configured path")->callback([this]() { doInit(); });
    app.add_subcommand("unlock", "Unlock the vault")->callback([this]() { doUnlock(); });
    app.add_subcommand("lock", "Lock the vault and wipe it from memory")->callback([this]() { doLock(); });
    app.add_subcommand("save", "Encrypt and write the vault")->callback([this]() { doSave(); });
    app.add_subcommand("list", "List entries")->callback([this]() { doList(); });

    EntryOptions entryOpts{};
    std::string titleArg;
    std::string usernameArg;
    std::string urlArg;
    std::string notesArg;
    std::string idArg;

    // ADD
    auto* subAdd = app.add_subcommand("add", "Add an entry (prompts for its password)");
    subAdd->add_option("title", titleArg, "Entry title")->required();
    auto* addUser = subAdd->add_option("-u,--username", usernameArg, "User name");
    auto* addUrl = subAdd->add_option("--url", urlArg, "URL");
    auto* addNotes = subAdd->add_option("--notes", notesArg, "Notes");
    subAdd->add_flag("-g,--generate", entryOpts.generate, "Generate the password instead of prompting");
    subAdd->add_option("-l,--length", entryOpts.length, "Generated password length")
        ->check(CLI::Range(std::size_t{ 1 }, g_maxGeneratedLength));
    subAdd->callback(
        [&]()
        {
            entryOpts.title = titleArg;
            entryOpts.username = addUser->count() > 0 ? std::optional{ usernameArg } : std::nullopt;
            entryOpts.url = addUrl->count() > 0 ? std::optional{ urlArg } : std::nullopt;
            entryOpts.notes = addNotes->count() > 0 ? std::optional{ notesArg } : std::nullopt;
            doAdd(entryOpts);
        });

    // EDIT
    auto* subEdit = app.add_subcommand("edit", "Change fields of an entry; an empty --url or --notes clears it");
    subEdit->add_option("id", idArg, "Entry id or unique prefix")->required();
    auto* editTitle = subEdit->add_option("-t,--title", titleArg, "New title");
    auto* editUser = subEdit->add_option("-u,--username", usernameArg, "New user name");
    auto* editUrl = subEdit->add_option("--url", urlArg, "New URL");
    auto* editNotes = subEdit->add_option("--notes", notesArg, "New notes");
    subEdit->add_flag("-p,--password", entryOpts.promptPassword, "Prompt for a new password");
    subEdit->add_flag("-g,--generate", entryOpts.generate, "Generate a new password");
    subEdit->add_option("-l,--length", entryOpts.length, "Generated password length")
        ->check(CLI::Range(std::size_t{ 1 }, g_maxGeneratedLength));
    subEdit->callback(
        [&]()
        {
            entryOpts.title = editTitle->count() > 0 ? std::optional{ titleArg } : std::nullopt;
            entryOpts.username = editUser->count() > 0 ? std::optional{ usernameArg } : std::nullopt;
            entryOpts.url = editUrl->count() > 0 ? std::optional{ urlArg } : std::nullopt;
            entryOpts.notes = editNotes->count() > 0 ? std::optional{ notesArg } : std::nullopt;
            doEdit(idArg, entryOpts);
        });

    // GET
    bool show{ false };
    auto* subGet = app.add_subcommand("get", "Show an entry");
    subGet->add_option("id", idArg, "Entry id or unique prefix")->required();
    subGet->add_flag("-s,--show", show, "Reveal the password");
    subGet->callback([&]() { doGet(idArg, show); });

    // FIND
    std::string needle;
    auto* subFind = app.add_subcommand("find", "Search entries by title (case-insensitive)");
    subFind->add_option("text", needle, "Part of the title")->required();
    subFind->callback([&]() { doFind(needle); });

    // REMOVE
    auto* subRemove = app.add_subcommand("remove", "Delete an entry")->alias("rm");
    subRemove->add_option("id", idArg, "Entry id or unique prefix")->required();
    subRemove->callback([&]() { doRemove(idArg); });

    // PASSWD
    bool applyPolicy{ false };
    auto* subPasswd = app.add_subcommand("passwd", "Change the master passphrase and save");
    subPasswd->add_flag("--apply-policy", applyPolicy, "Also switch to the KDF/AEAD settings given at startup");
    subPasswd->callback([&]() { doPasswd(applyPolicy); });

    // GEN
    GenOptions genOpts{};
    auto* subGen = app.add_subcommand("gen", "Generate a random password");
    subGen->add_option("-l,--length", genOpts.length, "Password length")
        ->check(CLI::Range(std::size_t{ 1 }, g_maxGeneratedLength));
    subGen->add_flag("--no-upper", genOpts.noUpper, "Leave out upper-case letters");
    subGen->add_flag("--no-lower", genOpts.noLower, "Leave out lower-case letters");
    subGen->add_flag("--no-digits", genOpts.noDigits, "Leave out digits");
    subGen->add_flag("--no-symbols", genOpts.noSymbols, "Leave out symbols");
    subGen->add_flag("--exclude-similar", genOpts.excludeSimilar, "Leave out I, O, l, o, 0 and 1");
    subGen->add_flag("--exclude-ambiguous", genOpts.excludeAmbiguous, "Only use the symbols !@#$%^&*-_=+");
    subGen->callback([&]() { doGen(genOpts); });

    try
    {
        std::vector<char*> argv;
        argv.reserve(args.size());
        for (auto& arg : args)
        {
            argv.push_back(arg.data());
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

    if (m_session.isUnlocked())
    {
        m_session.touch();
    }
}

// --- Helpers ---

bool InteractiveShell::requireUnlocked()
{
    if (m_session.isUnlocked())
    {
        return true;
    }
    m_out << "Error: Vault is locked. Use 'unlock' first.\n";
    return false;
}

std::optional<coffer::core::EntryId> InteractiveShell::resolveEntry(const std::string& token)
{
    if (const auto exact{ coffer::core::EntryId::parse(token) }; exact.has_value())
    {
        if (m_session.findEntry(*exact) == nullptr)
        {
            m_out << "Error: Entry not found.\n";
            return std::nullopt;
        }
        return exact;
    }

    if (token.size() < g_minIdPrefix)
    {
        m_out << "Error: Give the full id or at least " << g_minIdPrefix << " characters of it.\n";
        return std::nullopt;
    }

    std::string prefix{ token };
    std::transform(prefix.begin(), prefix.end(), prefix.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::optional<coffer::core::EntryId> match{};
    for (const auto& entry : m_session.entries())
    {
        if (entry.id().toString().starts_with(prefix))
        {
            if (match.has_value())
            {
                m_out << "Error: Id prefix is ambiguous.\n";
                return std::nullopt;
            }
            match = entry.id();
        }
    }
    if (!match.has_value())
    {
        m_out << "Error: Entry not found.\n";
    }
    return match;
}

std::optional<coffer::security::SecureString> InteractiveShell::readNewPassphrase()
{
    auto first{ m_pwdReader("New passphrase: ") };
    auto wipeFirst{ coffer::security::scopeWipe(first) };
    auto second{ m_pwdReader("Confirm passphrase: ") };
    auto wipeSecond{ coffer::security::scopeWipe(second) };

    if (first.empty())
    {
        m_out << "Error: Passphrase must not be empty.\n";
        return std::nullopt;
    }
    if (!coffer::security::secureEquals(first, second))
    {
        m_out << "Error: Passphrases do not match.\n";
        return std::nullopt;
    }

    const auto strength{ coffer::core::analyzePasswordStrength(coffer::security::asStringView(first)) };
    if (strength.level <= coffer::core::StrengthLevel::Weak)
    {
        m_out << "Warning: " << coffer::core::toString(strength.level) << " passphrase";
        for (const auto issue : strength.issues)
        {
            m_out << "; " << coffer::core::describe(issue);
        }
        m_out << "\n";
        for (const auto suggestion : strength.suggestions)
        {
            m_out << "  Suggestion: " << coffer::core::describe(suggestion) << "\n";
        }
    }

    wipeFirst.dismiss();
    return std::optional<coffer::security::SecureString>{ std::move(first) };
}

std::optional<coffer::security::SecureString> InteractiveShell::generatePassword(std::size_t length)
{
    const coffer::core::PasswordGenerator generator{ coffer::core::PasswordGeneratorOptions{ .length = length } };
    auto generated{ length >= coffer::core::g_generatorComplexMinLength ? generator.generateComplex()
                                                                        : generator.generate() };
    if (const auto* err{ std::get_if<coffer::core::PasswordGenError>(&generated) })
    {
        m_out << "Error: " << coffer::core::describe(*err) << "\n";
        return std::nullopt;
    }
    return std::optional<coffer::security::SecureString>{ std::move(
        std::get<coffer::security::SecureString>(generated)) };
}

bool InteractiveShell::writeSession()
{
    auto persisted{ m_session.persist() };
    if (const auto* err{ std::get_if<coffer::core::PersistError>(&persisted) })
    {
        m_out << "Error: " << coffer::core::describe(*err) << "\n";
        return false;
    }

    const auto bytes{ coffer::core::serializeEnvelope(std::get<coffer::core::VaultEnvelope>(persisted)) };
    const auto written{ m_store.writeVaultFileAtomic(m_options.vaultPath, bytes) };
    if (const auto* io{ std::get_if<coffer::storage::IoError>(&written) })
    {
        m_out << "Error: Cannot write vault file: " << coffer::storage::describe(*io) << "\n";
        return false;
    }
    m_session.markSaved();
    return true;
}

void InteractiveShell::adoptSession(coffer::core::VaultSession session)
{
    m_session = std::move(session);
    m_session.setIdleTimeout(m_options.idleTimeout, m_now);
}

void InteractiveShell::warnUnsaved()
{
    if (m_session.hasUnsavedChanges())
    {
        m_out << "Warning: unsaved changes were discarded.\n";
    }
}

// --- Handlers ---

void InteractiveShell::doInit()
{
    if (m_session.isUnlocked())
    {
        m_out << "Error: A vault is already unlocked.\n";
        return;
    }
    if (m_store.exists(m_options.vaultPath))
    {
        m_out << "Error: Vault already exists at " << m_options.vaultPath.string() << "\n";
        return;
    }

    auto passphrase{ readNewPassphrase() };
    if (!passphrase.has_value())
    {
        return;
    }
    auto wipePassphrase{ coffer::security::scopeWipe(*passphrase) };

    auto created{ m_service.createVault(*passphrase, m_options.policy) };
    if (const auto* err{ std::get_if<coffer::core::KeySetupError>(&created) })
    {
        m_out << "Error: " << coffer::core::describe(*err) << "\n";
        return;
    }

    adoptSession(std::move(std::get<coffer::core::VaultSession>(created)));
    if (!writeSession())
    {
        m_session.lock();
        return;
    }
    m_out << "Vault created at " << m_options.vaultPath.string() << " and unlocked.\n";
}

void InteractiveShell::doUnlock()
{
    if (m_session.isUnlocked())
    {
        m_out << "Error: Vault is already unlocked.\n";
        return;
    }
    if (!m_store.exists(m_options.vaultPath))
    {
        m_out << "Error: No vault at " << m_options.vaultPath.string() << ". Use 'init' to create one.\n";
        return;
    }

    const auto file{ m_store.readVaultFile(m_options.vaultPath) };
    if (const auto* io{ std::get_if<coffer::storage::IoError>(&file) })
    {
        m_out << "Error: Cannot read vault file: " << coffer::storage::describe(*io) << "\n";
        return;
    }

    auto passphrase{ m_pwdReader("Passphrase: ") };
    auto wipePassphrase{ coffer::security::scopeWipe(passphrase) };

    auto unlocked{ m_service.unlockVault(passphrase, std::get<std::vector<std::uint8_t>>(file)) };
    if (const auto* err{ std::get_if<coffer::core::UnlockError>(&unlocked) })
    {
        m_out << "Error: " << coffer::core::describe(*err) << "\n";
        return;
    }

    adoptSession(std::move(std::get<coffer::core::VaultSession>(unlocked)));
    m_out << "Vault unlocked (" << m_session.entries().size() << " entries).\n";
}

void InteractiveShell::doAdd(const EntryOptions& opts)
{
    if (!requireUnlocked())
    {
        return;
    }

    coffer::core::EntryFields fields{};
    fields.title = toSecure(opts.title.value_or(std::string{}));
    fields.username = toSecure(opts.username.value_or(std::string{}));
    if (opts.url.has_value() && !opts.url->empty())
    {
        fields.url = toSecure(*opts.url);
    }
    if (opts.notes.has_value() && !opts.notes->empty())
    {
        fields.notes = toSecure(*opts.notes);
    }

    if (opts.generate)
    {
        auto generated{ generatePassword(opts.length) };
        if (!generated.has_value())
        {
            return;
        }
        fields.password = std::move(*generated);
    }
    else
    {
        fields.password = m_pwdReader("Entry password: ");
    }

    const auto added{ m_session.addEntry(std::move(fields)) };
    if (const auto* err{ std::get_if<coffer::core::MutationError>(&added) })
    {
        m_out << "Error: " << coffer::core::describe(*err) << "\n";
        return;
    }
    m_out << "Entry added: " << std::get<coffer::core::EntryId>(added).toString() << "\n";
}

void InteractiveShell::doEdit(const std::string& idToken, const EntryOptions& opts)
{
    if (!requireUnlocked())
    {
        return;
    }
    const auto id{ resolveEntry(idToken) };
    if (!id.has_value())
    {
        return;
    }

    coffer::core::EntryPatch patch{};
    if (opts.title.has_value())
    {
        patch.title = toSecure(*opts.title);
    }
    if (opts.username.has_value())
    {
        patch.username = toSecure(*opts.username);
    }
    if (opts.url.has_value())
    {
        patch.url = toSecure(*opts.url);
    }
    if (opts.notes.has_value())
    {
        patch.notes = toSecure(*opts.notes);
    }
    if (opts.generate)
    {
        auto generated{ generatePassword(opts.length) };
        if (!generated.has_value())
        {
            return;
        }
        patch.password = std::move(*generated);
    }
    else if (opts.promptPassword)
    {
        patch.password = m_pwdReader("New entry password: ");
    }

    if (patch.empty())
    {
        m_out << "Error: Nothing to change.\n";
        return;
    }

    const auto updated{ m_session.updateEntry(*id, std::move(patch)) };
    if (const auto* err{ std::get_if<coffer::core::MutationError>(&updated) })
    {
        m_out << "Error: " << coffer::core::describe(*err) << "\n";
        return;
    }
    m_out << "Entry updated.\n";
}

void InteractiveShell::doGet(const std::string& idToken, bool show)
{
    if (!requireUnlocked())
    {
        return;
    }
    const auto id{ resolveEntry(idToken) };
    if (!id.has_value())
    {
        return;
    }
    const auto* entry{ m_session.findEntry(*id) };
    if (entry == nullptr)
    {
        m_out << "Error: Entry not found.\n";
        return;
    }

    m_out << "Id:       " << entry->id().toString() << "\n";
    m_out << "Title:    " << coffer::security::asStringView(entry->title()) << "\n";
    m_out << "Username: " << coffer::security::asStringView(entry->username()) << "\n";
    if (show)
    {
        m_out << "Password: " << coffer::security::asStringView(entry->password()) << "\n";
    }
    else
    {
        m_out << "Password: ******** (use --show to reveal)\n";
    }
    if (entry->url().has_value())
    {
        m_out << "URL:      " << coffer::security::asStringView(*entry->url()) << "\n";
    }
    if (entry->notes().has_value())
    {
        m_out << "Notes:    " << coffer::security::asStringView(*entry->notes()) << "\n";
    }
    m_out << "Created:  " << formatTimestamp(entry->createdAt()) << "\n";
    m_out << "Modified: " << formatTimestamp(entry->modifiedAt()) << "\n";
}

void InteractiveShell::doList()
{
    if (!requireUnlocked())
    {
        return;
    }

    const auto& entries{ m_session.entries() };
    if (entries.empty())
    {
        m_out << "(empty)\n";
        return;
    }
    for (const auto& entry : entries)
    {
        m_out << " - " << entry.id().toString() << "  " << coffer::security::asStringView(entry.title());
        if (!entry.username().empty())
        {
            m_out << "  (" << coffer::security::asStringView(entry.username()) << ")";
        }
        m_out << "\n";
    }
}

void InteractiveShell::doFind(const std::string& needle)
{
    if (!requireUnlocked())
    {
        return;
    }

    const auto matches{ m_session.searchByTitle(needle) };
    if (matches.empty())
    {
        m_out << "No matching entries.\n";
        return;
    }
    for (const auto* entry : matches)
    {
        m_out << " - " << entry->id().toString() << "  " << coffer::security::asStringView(entry->title()) << "\n";
    }
}

void InteractiveShell::doRemove(const std::string& idToken)
{
    if (!requireUnlocked())
    {
        return;
    }
    const auto id{ resolveEntry(idToken) };
    if (!id.has_value())
    {
        return;
    }

    const auto removed{ m_session.deleteEntry(*id) };
    if (const auto* err{ std::get_if<coffer::core::MutationError>(&removed) })
    {
        m_out << "Error: " << coffer::core::describe(*err) << "\n";
        return;
    }
    m_out << "Entry removed.\n";
}

void InteractiveShell::doSave()
{
    if (!requireUnlocked())
    {
        return;
    }
    if (writeSession())
    {
        m_out << "Vault saved.\n";
    }
}

void InteractiveShell::doPasswd(bool applyPolicy)
{
    if (!requireUnlocked())
    {
        return;
    }

    auto passphrase{ readNewPassphrase() };
    if (!passphrase.has_value())
    {
        return;
    }
    auto wipePassphrase{ coffer::security::scopeWipe(*passphrase) };

    // Without --apply-policy the vault keeps its current KDF profile and AEAD.
    const coffer::core::VaultPolicy current{ .kdf = m_session.header().kdf, .aead = m_session.header().aead };
    const auto changed{ m_session.changePassphrase(*passphrase, applyPolicy ? m_options.policy : current) };
    if (const auto* err{ std::get_if<coffer::core::KeySetupError>(&changed) })
    {
        m_out << "Error: " << coffer::core::describe(*err) << "\n";
        return;
    }

    if (!writeSession())
    {
        m_out << "The new passphrase is only active in this session; run 'save' to retry.\n";
        return;
    }
    m_out << "Passphrase changed and vault saved.\n";
}

void InteractiveShell::doGen(const GenOptions& opts)
{
    const coffer::core::PasswordGenerator generator{ coffer::core::PasswordGeneratorOptions{
        .length = opts.length,
        .uppercase = !opts.noUpper,
        .lowercase = !opts.noLower,
        .digits = !opts.noDigits,
        .symbols = !opts.noSymbols,
        .excludeSimilar = opts.excludeSimilar,
        .excludeAmbiguous = opts.excludeAmbiguous,
    } };
    auto generated{ opts.length >= coffer::core::g_generatorComplexMinLength ? generator.generateComplex()
                                                                             : generator.generate() };
    if (const auto* err{ std::get_if<coffer::core::PasswordGenError>(&generated) })
    {
        m_out << "Error: " << coffer::core::describe(*err) << "\n";
        return;
    }

    auto& password{ std::get<coffer::security::SecureString>(generated) };
    auto wipePassword{ coffer::security::scopeWipe(password) };
    const auto strength{ coffer::core::analyzePasswordStrength(coffer::security::asStringView(password)) };
    m_out << coffer::security::asStringView(password) << "\n";
    m_out << "Strength: " << coffer::core::toString(strength.level) << " (" << static_cast<int>(strength.score)
          << "/100)\n";
}

void InteractiveShell::doLock()
{
    if (!m_session.isUnlocked())
    {
        m_out << "Vault is already locked.\n";
        return;
    }
    warnUnsaved();
    m_session.lock();
    coffer::diagnostics::info("session locked");
    m_out << "Vault locked.\n";
}

void InteractiveShell::doExit()
{
    if (m_session.isUnlocked())
    {
        warnUnsaved();
        m_session.lock();
        coffer::diagnostics::info("session locked on exit");
    }
    m_running = false;
}

} // namespace coffer::ui::cli
