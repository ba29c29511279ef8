#ifndef INCLUDE_COFFER_CORE_VAULT_HPP
#define INCLUDE_COFFER_CORE_VAULT_HPP

#include "coffer/core/Entry.hpp"
#include <cstddef>
#include <string_view>
#include <vector>

namespace coffer::core
{

// Ordered entry collection. Insertion order is display order; ids are unique.
// Move-only so decrypted entries are never duplicated behind the owner's back.
class Vault final
{
public:
    Vault() = default;
    Vault(const Vault&) = delete;
    Vault& operator=(const Vault&) = delete;
    Vault(Vault&&) noexcept = default;
    Vault& operator=(Vault&&) noexcept = default;
    ~Vault() = default;

    [[nodiscard]] const std::vector<Entry>& entries() const noexcept
    {
        return m_entries;
    }
    [[nodiscard]] std::size_t size() const noexcept
    {
        return m_entries.size();
    }
    [[nodiscard]] bool empty() const noexcept
    {
        return m_entries.empty();
    }

    // Returns false and leaves the vault unchanged if the id is already present.
    [[nodiscard]] bool add(Entry entry);

    [[nodiscard]] const Entry* find(const EntryId& id) const noexcept;
    [[nodiscard]] Entry* find(const EntryId& id) noexcept;

    // Wipes the entry before removing it.
    [[nodiscard]] bool remove(const EntryId& id) noexcept;

    // Case-insensitive (ASCII) substring match on title, in display order. An empty needle matches everything.
    [[nodiscard]] std::vector<const Entry*> searchByTitle(std::string_view needle) const;

    void wipe() noexcept;

    bool operator==(const Vault&) const = default;

private:
    std::vector<Entry> m_entries;
};

} // namespace coffer::core

#endif // INCLUDE_COFFER_CORE_VAULT_HPP
