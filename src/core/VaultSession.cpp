#include "coffer/core/VaultSession.hpp"

#include "coffer/core/KeyDerivation.hpp"
#include "coffer/core/VaultCipher.hpp"
#include "coffer/core/VaultCodec.hpp"
#include "coffer/diagnostics/Log.hpp"
#include <algorithm>
#include <array>
#include <utility>

namespace coffer::core
{
namespace
{

constexpr int g_maxIdAttempts{ 4 };

const std::vector<Entry> g_noEntries{};

} // namespace

VaultSession::VaultSession(coffer::crypto::ICryptoProvider& crypto, EnvelopeHeader header,
                           coffer::security::SecureBuffer key, Vault vault)
    : m_crypto{ &crypto }, m_header{ header }, m_key{ std::move(key) }, m_vault{ std::move(vault) },
      m_state{ SessionState::Unlocked }
{
    m_lastActivity = m_now();
}

VaultSession::VaultSession(VaultSession&& other) noexcept
{
    takeFrom(other);
}

VaultSession& VaultSession::operator=(VaultSession&& other) noexcept
{
    if (this != &other)
    {
        lock();
        takeFrom(other);
    }
    return *this;
}

VaultSession::~VaultSession()
{
    lock();
}

void VaultSession::takeFrom(VaultSession& other) noexcept
{
    m_crypto = other.m_crypto;
    m_header = other.m_header;
    m_key.swap(other.m_key);
    m_vault = std::move(other.m_vault);
    m_state = other.m_state;
    m_unsavedChanges = other.m_unsavedChanges;
    m_now.swap(other.m_now);
    m_wallClock.swap(other.m_wallClock);
    m_idleTimeout = other.m_idleTimeout;
    m_lastActivity = other.m_lastActivity;

    // The source keeps nothing secret and can only be destroyed or assigned to.
    other.m_crypto = nullptr;
    other.m_header = {};
    other.m_state = SessionState::Locked;
    other.m_unsavedChanges = false;
}

Result<EntryId, MutationError> VaultSession::addEntry(EntryFields fields)
{
    if (!isUnlocked())
    {
        return MutationError::Locked;
    }
    if (!isValidText(fields))
    {
        return MutationError::InvalidText;
    }

    EntryId id{};
    bool fresh{ false };
    for (int attempt{}; attempt < g_maxIdAttempts && !fresh; ++attempt)
    {
        std::array<std::uint8_t, g_entryIdBytes> random{};
        if (!m_crypto->randomBytes(random))
        {
            return MutationError::RandomFailed;
        }
        id = EntryId::fromRandom(random);
        fresh = (m_vault.find(id) == nullptr);
    }
    if (!fresh)
    {
        return MutationError::RandomFailed;
    }

    const Timestamp now{ m_wallClock() };
    if (!m_vault.add(Entry{ id, std::move(fields), now, now }))
    {
        return MutationError::RandomFailed;
    }
    m_unsavedChanges = true;
    touch();
    return id;
}

Result<std::monostate, MutationError> VaultSession::updateEntry(const EntryId& id, EntryPatch patch)
{
    if (!isUnlocked())
    {
        return MutationError::Locked;
    }
    Entry* entry{ m_vault.find(id) };
    if (entry == nullptr)
    {
        return MutationError::NotFound;
    }
    if (!isValidText(patch))
    {
        return MutationError::InvalidText;
    }

    entry->apply(std::move(patch), m_wallClock());
    m_unsavedChanges = true;
    touch();
    return std::monostate{};
}

Result<std::monostate, MutationError> VaultSession::deleteEntry(const EntryId& id)
{
    if (!isUnlocked())
    {
        return MutationError::Locked;
    }
    if (!m_vault.remove(id))
    {
        return MutationError::NotFound;
    }
    m_unsavedChanges = true;
    touch();
    return std::monostate{};
}

const std::vector<Entry>& VaultSession::entries() const noexcept
{
    return isUnlocked() ? m_vault.entries() : g_noEntries;
}

const Entry* VaultSession::findEntry(const EntryId& id) const noexcept
{
    return isUnlocked() ? m_vault.find(id) : nullptr;
}

std::vector<const Entry*> VaultSession::searchByTitle(std::string_view needle) const
{
    if (!isUnlocked())
    {
        return {};
    }
    return m_vault.searchByTitle(needle);
}

Result<VaultEnvelope, PersistError> VaultSession::persist()
{
    if (!isUnlocked())
    {
        return PersistError{ .kind = PersistErrorKind::Locked, .cause = std::nullopt };
    }

    auto plainText{ encodeVault(m_vault) };
    auto sealed{ sealVault(*m_crypto, m_header, m_key, plainText) };
    coffer::security::secureRelease(plainText);
    if (std::holds_alternative<CipherError>(sealed))
    {
        const auto cause{ std::get<CipherError>(sealed) };
        coffer::diagnostics::warning("persist failed: ", describe(cause));
        return PersistError{ .kind = PersistErrorKind::SealFailed, .cause = cause };
    }

    coffer::diagnostics::info("vault sealed: ", m_vault.size(), " entries, ", coffer::crypto::toString(m_header.aead));
    touch();
    return std::move(std::get<VaultEnvelope>(sealed));
}

Result<std::monostate, KeySetupError> VaultSession::changePassphrase(const coffer::security::SecureString& newPassphrase,
                                                                     const VaultPolicy& policy)
{
    if (!isUnlocked())
    {
        return KeySetupError{ .kind = KeySetupErrorKind::Locked, .cause = std::nullopt };
    }

    auto material{ establishVaultKey(*m_crypto, coffer::security::asBytes(newPassphrase), policy) };
    if (std::holds_alternative<KeySetupError>(material))
    {
        return std::get<KeySetupError>(material);
    }

    auto& fresh{ std::get<KeyMaterial>(material) };
    coffer::security::secureRelease(m_key);
    m_key.swap(fresh.key);
    m_header = fresh.header;
    m_unsavedChanges = true;
    touch();
    coffer::diagnostics::info("passphrase changed, kdf ", coffer::crypto::toString(m_header.kdf.algorithm));
    return std::monostate{};
}

void VaultSession::lock() noexcept
{
    coffer::security::secureRelease(m_key);
    m_vault.wipe();
    m_header = {};
    m_state = SessionState::Locked;
    m_unsavedChanges = false;
}

void VaultSession::setIdleTimeout(Duration timeout, NowProvider nowProvider)
{
    m_now = std::move(nowProvider);
    m_idleTimeout = std::min(timeout, g_maxIdleTimeout);
    m_lastActivity = m_now();
}

void VaultSession::setWallClock(WallClock wallClock)
{
    m_wallClock = std::move(wallClock);
}

void VaultSession::touch() noexcept
{
    m_lastActivity = m_now();
}

bool VaultSession::isExpired() const noexcept
{
    if (!isUnlocked() || m_idleTimeout.count() <= 0)
    {
        return false;
    }
    return (m_now() - m_lastActivity) > m_idleTimeout;
}

bool VaultSession::lockIfExpired() noexcept
{
    if (!isExpired())
    {
        return false;
    }
    lock();
    return true;
}

} // namespace coffer::core
