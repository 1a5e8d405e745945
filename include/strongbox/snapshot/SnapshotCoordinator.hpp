#ifndef INCLUDE_STRONGBOX_SNAPSHOT_SNAPSHOTCOORDINATOR_HPP
#define INCLUDE_STRONGBOX_SNAPSHOT_SNAPSHOTCOORDINATOR_HPP

#include "strongbox/core/IClientStateOwner.hpp"
#include "strongbox/core/Ids.hpp"
#include "strongbox/core/SnapshotPaths.hpp"
#include "strongbox/crypto/ICryptoProvider.hpp"
#include "strongbox/snapshot/Mailbox.hpp"
#include "strongbox/snapshot/SnapshotContainer.hpp"
#include "strongbox/snapshot/SnapshotMessages.hpp"
#include <future>
#include <mutex>
#include <thread>

namespace strongbox::snapshot
{

// Owns one SnapshotContainer and processes requests against it one at a time, in arrival order.
// post() queues to the worker thread; handle() runs on the caller's thread under the same lock.
class SnapshotCoordinator final
{
public:
    SnapshotCoordinator(strongbox::crypto::ICryptoProvider& crypto, strongbox::core::SnapshotPathConfig paths,
                        strongbox::core::ClientRouter router = {});
    ~SnapshotCoordinator();

    SnapshotCoordinator(const SnapshotCoordinator&) = delete;
    SnapshotCoordinator& operator=(const SnapshotCoordinator&) = delete;
    SnapshotCoordinator(SnapshotCoordinator&&) = delete;
    SnapshotCoordinator& operator=(SnapshotCoordinator&&) = delete;

    [[nodiscard]] SnapshotReply handle(SnapshotRequest request);

    // Throws std::runtime_error after shutdown().
    [[nodiscard]] std::future<SnapshotReply> post(SnapshotRequest request);

    // Stops accepting requests, finishes the queued ones and joins the worker. Idempotent.
    void shutdown();

    [[nodiscard]] bool hasData(const strongbox::core::ClientId& clientId) const;
    [[nodiscard]] bool empty() const;

    [[nodiscard]] const strongbox::core::SnapshotPathConfig& paths() const noexcept
    {
        return m_paths;
    }

private:
    struct Envelope final
    {
        SnapshotRequest request;
        std::promise<SnapshotReply> reply;
    };

    void run();
    [[nodiscard]] SnapshotReply process(SnapshotRequest& request);

    [[nodiscard]] SnapshotReply onFill(FillRequest& request);
    [[nodiscard]] SnapshotReply onWrite(WriteRequest& request);
    [[nodiscard]] SnapshotReply onRead(ReadRequest& request);
    [[nodiscard]] SnapshotReply onSynchronize(SynchronizeRequest& request);
    [[nodiscard]] SnapshotReply deliver(const strongbox::core::ClientId& requester,
                                        const strongbox::core::ClientId& effectiveId,
                                        strongbox::core::ClientSnapshot data);

    strongbox::crypto::ICryptoProvider* m_crypto{ nullptr };
    strongbox::core::SnapshotPathConfig m_paths;
    strongbox::core::ClientRouter m_router;

    mutable std::mutex m_containerMutex;
    SnapshotContainer m_container;

    Mailbox<Envelope> m_mailbox;
    std::once_flag m_shutdownOnce;
    std::thread m_worker;
};

} // namespace strongbox::snapshot

#endif // INCLUDE_STRONGBOX_SNAPSHOT_SNAPSHOTCOORDINATOR_HPP
