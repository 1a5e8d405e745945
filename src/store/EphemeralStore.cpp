#include "strongbox/store/EphemeralStore.hpp"

#include <iterator>
#include <utility>

namespace strongbox::store
{

EphemeralStore::EphemeralStore() : m_now(&Clock::now)
{
}

EphemeralStore::EphemeralStore(NowProvider nowProvider) : m_now(std::move(nowProvider))
{
}

bool EphemeralStore::isLive(const Entry& entry) const
{
    return !entry.expiresAt.has_value() || m_now() < *entry.expiresAt;
}

std::optional<Bytes> EphemeralStore::insert(Bytes key, Bytes value, std::optional<std::chrono::milliseconds> lifetime)
{
    purgeExpired();

    Entry entry{ std::move(value), std::nullopt };
    if (lifetime.has_value())
    {
        entry.expiresAt = m_now() + *lifetime;
    }

    auto it{ m_entries.find(key) };
    if (it == m_entries.end())
    {
        m_entries.emplace(std::move(key), std::move(entry));
        return std::nullopt;
    }

    auto previous{ std::move(it->second.value) };
    it->second = std::move(entry);
    return previous;
}

[[nodiscard]] std::optional<Bytes> EphemeralStore::get(const Bytes& key) const
{
    const auto it{ m_entries.find(key) };
    if (it == m_entries.end() || !isLive(it->second))
    {
        return std::nullopt;
    }
    return it->second.value;
}

bool EphemeralStore::remove(const Bytes& key)
{
    const auto it{ m_entries.find(key) };
    if (it == m_entries.end())
    {
        return false;
    }
    const bool wasLive{ isLive(it->second) };
    m_entries.erase(it);
    purgeExpired();
    return wasLive;
}

[[nodiscard]] bool EphemeralStore::containsKey(const Bytes& key) const
{
    const auto it{ m_entries.find(key) };
    return it != m_entries.end() && isLive(it->second);
}

[[nodiscard]] std::size_t EphemeralStore::size() const
{
    std::size_t live{};
    for (const auto& [key, entry] : m_entries)
    {
        if (isLive(entry))
        {
            ++live;
        }
    }
    return live;
}

void EphemeralStore::purgeExpired()
{
    std::erase_if(m_entries, [this](const auto& item) { return !isLive(item.second); });
}

void EphemeralStore::restore(Bytes key, Entry entry)
{
    m_entries.insert_or_assign(std::move(key), std::move(entry));
}

} // namespace strongbox::store
