#include "coffer/core/Vault.hpp"

#include <algorithm>
#include <utility>

namespace coffer::core
{
namespace
{

[[nodiscard]] char asciiLower(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

[[nodiscard]] bool containsIgnoreCase(std::string_view haystack, std::string_view needle) noexcept
{
    const auto it{ std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                               [](char a, char b) noexcept { return asciiLower(a) == asciiLower(b); }) };
    return it != haystack.end() || needle.empty();
}

} // namespace

bool Vault::add(Entry entry)
{
    if (find(entry.id()) != nullptr)
    {
        entry.wipe();
        return false;
    }
    m_entries.push_back(std::move(entry));
    return true;
}

const Entry* Vault::find(const EntryId& id) const noexcept
{
    const auto it{ std::find_if(m_entries.begin(), m_entries.end(),
                                [&id](const Entry& e) noexcept { return e.id() == id; }) };
    return (it == m_entries.end()) ? nullptr : &*it;
}

Entry* Vault::find(const EntryId& id) noexcept
{
    return const_cast<Entry*>(std::as_const(*this).find(id));
}

bool Vault::remove(const EntryId& id) noexcept
{
    const auto it{ std::find_if(m_entries.begin(), m_entries.end(),
                                [&id](const Entry& e) noexcept { return e.id() == id; }) };
    if (it == m_entries.end())
    {
        return false;
    }
    it->wipe();
    m_entries.erase(it);
    return true;
}

std::vector<const Entry*> Vault::searchByTitle(std::string_view needle) const
{
    std::vector<const Entry*> hits{};
    for (const Entry& e : m_entries)
    {
        if (containsIgnoreCase(coffer::security::asStringView(e.title()), needle))
        {
            hits.push_back(&e);
        }
    }
    return hits;
}

void Vault::wipe() noexcept
{
    for (Entry& e : m_entries)
    {
        e.wipe();
    }
    std::vector<Entry> released{};
    m_entries.swap(released);
}

} // namespace coffer::core
