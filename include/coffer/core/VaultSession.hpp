#ifndef INCLUDE_COFFER_CORE_VAULTSESSION_HPP
#define INCLUDE_COFFER_CORE_VAULTSESSION_HPP

#include "coffer/core/Entry.hpp"
#include "coffer/core/Result.hpp"
#include "coffer/core/Vault.hpp"
#include "coffer/core/VaultEnvelope.hpp"
#include "coffer/core/VaultErrors.hpp"
#include "coffer/core/VaultPolicy.hpp"
#include "coffer/crypto/ICryptoProvider.hpp"
#include "coffer/security/SecureBuffer.hpp"
#include "coffer/security/SecureString.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string_view>
#include <variant>
#include <vector>

namespace coffer::core
{

enum class SessionState : std::uint8_t
{
    Locked,
    Unlocked,
};

// Sole owner of the derived key and the decrypted entries.
// Obtained unlocked from VaultService; once locked it stays locked and a new unlock yields a new session.
class VaultSession final
{
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::seconds;
    using NowProvider = std::function<TimePoint()>;
    using WallClock = std::function<Timestamp()>;

    VaultSession() = default;
    VaultSession(coffer::crypto::ICryptoProvider& crypto, EnvelopeHeader header, coffer::security::SecureBuffer key,
                 Vault vault);

    VaultSession(const VaultSession&) = delete;
    VaultSession& operator=(const VaultSession&) = delete;
    VaultSession(VaultSession&& other) noexcept;
    VaultSession& operator=(VaultSession&& other) noexcept;
    ~VaultSession();

    [[nodiscard]] SessionState state() const noexcept
    {
        return m_state;
    }
    [[nodiscard]] bool isUnlocked() const noexcept
    {
        return m_state == SessionState::Unlocked;
    }

    [[nodiscard]] Result<EntryId, MutationError> addEntry(EntryFields fields);
    [[nodiscard]] Result<std::monostate, MutationError> updateEntry(const EntryId& id, EntryPatch patch);
    [[nodiscard]] Result<std::monostate, MutationError> deleteEntry(const EntryId& id);

    // Empty while locked.
    [[nodiscard]] const std::vector<Entry>& entries() const noexcept;
    [[nodiscard]] const Entry* findEntry(const EntryId& id) const noexcept;
    [[nodiscard]] std::vector<const Entry*> searchByTitle(std::string_view needle) const;

    // Seals the current entries under the held key with a fresh nonce. Writing the bytes out is the caller's job.
    [[nodiscard]] Result<VaultEnvelope, PersistError> persist();

    // New salt, new key, optionally new algorithms. Entries are kept and must be persisted again.
    [[nodiscard]] Result<std::monostate, KeySetupError>
    changePassphrase(const coffer::security::SecureString& newPassphrase, const VaultPolicy& policy);

    // Zeroizes the key and every entry field. Safe to call repeatedly.
    void lock() noexcept;

    [[nodiscard]] bool hasUnsavedChanges() const noexcept
    {
        return m_unsavedChanges;
    }
    void markSaved() noexcept
    {
        m_unsavedChanges = false;
    }

    // Longer idle timeouts are clamped to this.
    static constexpr Duration g_maxIdleTimeout{ 365 * 24 * 60 * 60 };

    // A timeout of zero or less disables auto-lock.
    void setIdleTimeout(Duration timeout, NowProvider nowProvider = Clock::now);
    void setWallClock(WallClock wallClock);
    void touch() noexcept;
    [[nodiscard]] bool isExpired() const noexcept;
    // Returns true if this call locked the session.
    bool lockIfExpired() noexcept;

    [[nodiscard]] const EnvelopeHeader& header() const noexcept
    {
        return m_header;
    }
    [[nodiscard]] bool hasKey() const noexcept
    {
        return !m_key.empty();
    }
    [[nodiscard]] std::size_t keySize() const noexcept
    {
        return m_key.size();
    }

private:
    void takeFrom(VaultSession& other) noexcept;

    coffer::crypto::ICryptoProvider* m_crypto{ nullptr };
    EnvelopeHeader m_header{};
    coffer::security::SecureBuffer m_key;
    Vault m_vault;
    SessionState m_state{ SessionState::Locked };
    bool m_unsavedChanges{ false };

    NowProvider m_now{ Clock::now };
    WallClock m_wallClock{ currentTimestamp };
    Duration m_idleTimeout{ 0 };
    TimePoint m_lastActivity{};
};

} // namespace coffer::core

#endif // INCLUDE_COFFER_CORE_VAULTSESSION_HPP
