#ifndef INCLUDE_STRONGBOX_SNAPSHOT_SNAPSHOTCONTAINER_HPP
#define INCLUDE_STRONGBOX_SNAPSHOT_SNAPSHOTCONTAINER_HPP

#include "strongbox/core/ClientSnapshot.hpp"
#include "strongbox/core/Ids.hpp"
#include "strongbox/core/StateError.hpp"
#include "strongbox/crypto/ICryptoProvider.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <variant>
#include <vector>

namespace strongbox::snapshot
{

using strongbox::core::ClientId;
using strongbox::core::ClientSnapshot;
using strongbox::core::SnapshotState;
using strongbox::core::StateError;
using strongbox::core::StateResult;

// Staged state of every client plus the encrypted file protocol. Not thread safe; the coordinator
// serializes access.
class SnapshotContainer final
{
public:
    explicit SnapshotContainer(strongbox::crypto::ICryptoProvider& crypto) noexcept;
    SnapshotContainer(strongbox::crypto::ICryptoProvider& crypto, SnapshotState state) noexcept;

    // Stages a client's state, replacing whatever was staged for it.
    void addData(const ClientId& clientId, ClientSnapshot data);

    [[nodiscard]] StateResult<ClientSnapshot> getState(const ClientId& clientId) const;
    [[nodiscard]] bool hasData(const ClientId& clientId) const noexcept;
    [[nodiscard]] std::vector<ClientId> clientIds() const;

    [[nodiscard]] bool empty() const noexcept
    {
        return m_state.empty();
    }

    void clear() noexcept
    {
        m_state.clear();
    }

    [[nodiscard]] const SnapshotState& state() const noexcept
    {
        return m_state;
    }

    // Encrypts the staged state to `path` (temp file + rename) and clears it on success.
    // The staged state is untouched on failure.
    [[nodiscard]] StateResult<std::monostate> writeToSnapshot(const std::filesystem::path& path,
                                                              std::span<const std::uint8_t> key);

    // IoFailure when the file cannot be read, BadPasswordOrCorrupt for anything that fails to open.
    [[nodiscard]] static StateResult<SnapshotContainer> readFromSnapshot(strongbox::crypto::ICryptoProvider& crypto,
                                                                         const std::filesystem::path& path,
                                                                         std::span<const std::uint8_t> key);

    // Merges `clientId` from the source (the file at otherPath under otherKey, else this container)
    // into the target file, which is re-encrypted under targetKey. Other clients in the target are kept.
    // A missing target file starts out empty.
    [[nodiscard]] StateResult<std::monostate> synchronize(const ClientId& clientId,
                                                          const std::optional<std::filesystem::path>& otherPath,
                                                          std::span<const std::uint8_t> otherKey,
                                                          const std::filesystem::path& targetPath,
                                                          std::span<const std::uint8_t> targetKey);

    // Merges a state the caller holds into the target file; nothing is staged in this container.
    [[nodiscard]] StateResult<std::monostate> synchronize(const ClientId& clientId, ClientSnapshot live,
                                                          const std::filesystem::path& targetPath,
                                                          std::span<const std::uint8_t> targetKey);

private:
    [[nodiscard]] StateResult<std::monostate> mergeIntoTarget(const ClientId& clientId,
                                                              std::optional<ClientSnapshot> subject,
                                                              const std::filesystem::path& targetPath,
                                                              std::span<const std::uint8_t> targetKey);


    strongbox::crypto::ICryptoProvider* m_crypto{ nullptr };
    SnapshotState m_state;
};

// Writes `state` under `key` to `path` without touching the old file until the new one is complete.
[[nodiscard]] StateResult<std::monostate> writeSnapshotFile(strongbox::crypto::ICryptoProvider& crypto,
                                                            const std::filesystem::path& path,
                                                            std::span<const std::uint8_t> key,
                                                            const SnapshotState& state);

} // namespace strongbox::snapshot

#endif // INCLUDE_STRONGBOX_SNAPSHOT_SNAPSHOTCONTAINER_HPP
