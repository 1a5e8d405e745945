#ifndef INCLUDE_STRONGBOX_SNAPSHOT_SNAPSHOTMESSAGES_HPP
#define INCLUDE_STRONGBOX_SNAPSHOT_SNAPSHOTMESSAGES_HPP

#include "strongbox/core/ClientSnapshot.hpp"
#include "strongbox/core/Ids.hpp"
#include "strongbox/core/StateError.hpp"
#include "strongbox/security/SecureBuffer.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace strongbox::snapshot
{

constexpr std::string_view g_kReadRetryHint{ "Unable to read snapshot. Please try another password." };

// OK, or the text of an error.
class StatusMessage final
{
public:
    [[nodiscard]] static StatusMessage ok()
    {
        return StatusMessage{};
    }

    [[nodiscard]] static StatusMessage error(std::string text)
    {
        StatusMessage status{};
        status.m_error = std::move(text);
        return status;
    }

    [[nodiscard]] static StatusMessage error(strongbox::core::StateError stateError)
    {
        return StatusMessage::error(std::string{ strongbox::core::describe(stateError) });
    }

    [[nodiscard]] bool isOk() const noexcept
    {
        return !m_error.has_value();
    }

    // Empty for OK.
    [[nodiscard]] std::string_view text() const noexcept
    {
        return m_error ? std::string_view{ *m_error } : std::string_view{};
    }

    friend bool operator==(const StatusMessage&, const StatusMessage&) = default;

private:
    std::optional<std::string> m_error;
};

struct FillRequest final
{
    strongbox::core::ClientId clientId;
    strongbox::core::ClientSnapshot data;
};

struct WriteRequest final
{
    strongbox::security::SecureBuffer key;
    std::optional<std::string> filename;
    std::optional<std::filesystem::path> path;
};

// `forwardId` loads another client's data into the requester's state.
struct ReadRequest final
{
    strongbox::security::SecureBuffer key;
    std::optional<std::string> filename;
    std::optional<std::filesystem::path> path;
    strongbox::core::ClientId clientId;
    std::optional<strongbox::core::ClientId> forwardId;
};

// Source is the file named by otherFilename/otherPath (opened with `key`), else `liveData`, else the
// loaded container. `liveData` is merged without being staged, so later reads still go to disk.
struct SynchronizeRequest final
{
    strongbox::core::ClientId clientId;
    strongbox::security::SecureBuffer key;
    std::optional<std::string> otherFilename;
    std::optional<std::filesystem::path> otherPath;
    std::filesystem::path targetPath;
    strongbox::security::SecureBuffer targetKey;
    std::optional<strongbox::core::ClientSnapshot> liveData;
};

using SnapshotRequest = std::variant<FillRequest, WriteRequest, ReadRequest, SynchronizeRequest>;

enum class ReplyKind : std::uint8_t
{
    Fill,
    Write,
    Read,
    Synchronize,
};

struct SnapshotReply final
{
    ReplyKind kind{ ReplyKind::Fill };
    StatusMessage status;
    // Set by a Read when no owner is registered for the requesting client.
    std::optional<strongbox::core::ClientSnapshot> data;
};

} // namespace strongbox::snapshot

#endif // INCLUDE_STRONGBOX_SNAPSHOT_SNAPSHOTMESSAGES_HPP
