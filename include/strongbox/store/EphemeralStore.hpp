#ifndef INCLUDE_STRONGBOX_STORE_EPHEMERALSTORE_HPP
#define INCLUDE_STRONGBOX_STORE_EPHEMERALSTORE_HPP

#include "strongbox/core/Location.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>

namespace strongbox::store
{

using Bytes = strongbox::core::Bytes;

// Unencrypted key/value cache for non-secret metadata. Entries may carry an absolute expiry;
// an expired entry reads as absent and is dropped on the next mutation.
class EphemeralStore final
{
public:
    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;
    using NowProvider = std::function<TimePoint()>;

    struct Entry final
    {
        Bytes value;
        std::optional<TimePoint> expiresAt;

        friend bool operator==(const Entry&, const Entry&) = default;
    };

    EphemeralStore();
    explicit EphemeralStore(NowProvider nowProvider);

    // Returns the previous live value when the key was already present.
    std::optional<Bytes> insert(Bytes key, Bytes value,
                                std::optional<std::chrono::milliseconds> lifetime = std::nullopt);

    [[nodiscard]] std::optional<Bytes> get(const Bytes& key) const;

    bool remove(const Bytes& key);

    [[nodiscard]] bool containsKey(const Bytes& key) const;

    // Live entries only.
    [[nodiscard]] std::size_t size() const;

    void purgeExpired();

    void clear() noexcept
    {
        m_entries.clear();
    }

    [[nodiscard]] const std::map<Bytes, Entry>& entries() const noexcept
    {
        return m_entries;
    }

    // Reinserts an entry with its original absolute expiry (snapshot decode).
    void restore(Bytes key, Entry entry);

    friend bool operator==(const EphemeralStore& a, const EphemeralStore& b)
    {
        return a.m_entries == b.m_entries;
    }

private:
    [[nodiscard]] bool isLive(const Entry& entry) const;

    NowProvider m_now;
    std::map<Bytes, Entry> m_entries;
};

} // namespace strongbox::store

#endif // INCLUDE_STRONGBOX_STORE_EPHEMERALSTORE_HPP
