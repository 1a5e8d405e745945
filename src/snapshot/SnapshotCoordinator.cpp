#include "strongbox/snapshot/SnapshotCoordinator.hpp"

#include "strongbox/log/Registry.hpp"
#include <exception>
#include <fmt/format.h>
#include <stdexcept>

namespace strongbox::snapshot
{
namespace
{

template <class... Ts> struct Overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

[[nodiscard]] SnapshotReply replyFor(ReplyKind kind, const StateResult<std::monostate>& result)
{
    if (std::holds_alternative<StateError>(result))
    {
        return SnapshotReply{ kind, StatusMessage::error(std::get<StateError>(result)), std::nullopt };
    }
    return SnapshotReply{ kind, StatusMessage::ok(), std::nullopt };
}

} // namespace

SnapshotCoordinator::SnapshotCoordinator(strongbox::crypto::ICryptoProvider& crypto,
                                         strongbox::core::SnapshotPathConfig paths, strongbox::core::ClientRouter router)
    : m_crypto(&crypto), m_paths(std::move(paths)), m_router(std::move(router)), m_container(crypto),
      m_worker(&SnapshotCoordinator::run, this)
{
}

SnapshotCoordinator::~SnapshotCoordinator()
{
    shutdown();
}

void SnapshotCoordinator::shutdown()
{
    std::call_once(m_shutdownOnce,
                   [this]()
                   {
                       m_mailbox.close();
                       if (m_worker.joinable())
                       {
                           m_worker.join();
                       }
                   });
}

[[nodiscard]] std::future<SnapshotReply> SnapshotCoordinator::post(SnapshotRequest request)
{
    Envelope envelope{ std::move(request), {} };
    auto future{ envelope.reply.get_future() };
    if (!m_mailbox.push(std::move(envelope)))
    {
        throw std::runtime_error("snapshot coordinator is shut down");
    }
    return future;
}

[[nodiscard]] SnapshotReply SnapshotCoordinator::handle(SnapshotRequest request)
{
    return process(request);
}

void SnapshotCoordinator::run()
{
    while (auto envelope{ m_mailbox.pop() })
    {
        try
        {
            envelope->reply.set_value(process(envelope->request));
        }
        catch (const std::exception& e)
        {
            strongbox::log::Registry::snapshot()->error("snapshot request failed: {}", e.what());
            envelope->reply.set_exception(std::current_exception());
        }
    }
}

[[nodiscard]] bool SnapshotCoordinator::hasData(const strongbox::core::ClientId& clientId) const
{
    const std::lock_guard lock{ m_containerMutex };
    return m_container.hasData(clientId);
}

[[nodiscard]] bool SnapshotCoordinator::empty() const
{
    const std::lock_guard lock{ m_containerMutex };
    return m_container.empty();
}

[[nodiscard]] SnapshotReply SnapshotCoordinator::process(SnapshotRequest& request)
{
    const std::lock_guard lock{ m_containerMutex };
    return std::visit(Overloaded{
                          [this](FillRequest& r) { return onFill(r); },
                          [this](WriteRequest& r) { return onWrite(r); },
                          [this](ReadRequest& r) { return onRead(r); },
                          [this](SynchronizeRequest& r) { return onSynchronize(r); },
                      },
                      request);
}

[[nodiscard]] SnapshotReply SnapshotCoordinator::onFill(FillRequest& request)
{
    m_container.addData(request.clientId, std::move(request.data));
    strongbox::log::Registry::snapshot()->debug("staged client {}", request.clientId.shortString());
    return SnapshotReply{ ReplyKind::Fill, StatusMessage::ok(), std::nullopt };
}

[[nodiscard]] SnapshotReply SnapshotCoordinator::onWrite(WriteRequest& request)
{
    const auto path{ strongbox::core::resolveSnapshotPath(m_paths, request.filename, request.path) };
    const auto result{ m_container.writeToSnapshot(path, request.key) };
    strongbox::security::secureRelease(request.key);
    return replyFor(ReplyKind::Write, result);
}

[[nodiscard]] SnapshotReply SnapshotCoordinator::onRead(ReadRequest& request)
{
    const auto effectiveId{ request.forwardId.value_or(request.clientId) };

    if (m_container.hasData(effectiveId))
    {
        strongbox::security::secureRelease(request.key);
        auto staged{ m_container.getState(effectiveId) };
        return deliver(request.clientId, effectiveId, std::move(std::get<strongbox::core::ClientSnapshot>(staged)));
    }

    const auto path{ strongbox::core::resolveSnapshotPath(m_paths, request.filename, request.path) };
    auto loaded{ SnapshotContainer::readFromSnapshot(*m_crypto, path, request.key) };
    strongbox::security::secureRelease(request.key);
    if (std::holds_alternative<StateError>(loaded))
    {
        return SnapshotReply{
            ReplyKind::Read,
            StatusMessage::error(
                fmt::format("{}, {}", strongbox::core::describe(std::get<StateError>(loaded)), g_kReadRetryHint)),
            std::nullopt
        };
    }

    m_container = std::move(std::get<SnapshotContainer>(loaded));

    auto extracted{ m_container.getState(effectiveId) };
    if (std::holds_alternative<StateError>(extracted))
    {
        strongbox::log::Registry::snapshot()->warn("snapshot {} holds no data for client {}", path.string(),
                                                   effectiveId.shortString());
        return SnapshotReply{ ReplyKind::Read, StatusMessage::error(std::get<StateError>(extracted)), std::nullopt };
    }
    return deliver(request.clientId, effectiveId, std::move(std::get<strongbox::core::ClientSnapshot>(extracted)));
}

// Hands the data to the requester's owner, or back in the reply when none is registered.
[[nodiscard]] SnapshotReply SnapshotCoordinator::deliver(const strongbox::core::ClientId& requester,
                                                         const strongbox::core::ClientId& effectiveId,
                                                         strongbox::core::ClientSnapshot data)
{
    const auto owner{ m_router.find(requester) };
    if (owner == m_router.end())
    {
        return SnapshotReply{ ReplyKind::Read, StatusMessage::ok(), std::move(data) };
    }

    const auto reloaded{ owner->second.get().reloadData(effectiveId, std::move(data)) };
    return replyFor(ReplyKind::Read, reloaded);
}

[[nodiscard]] SnapshotReply SnapshotCoordinator::onSynchronize(SynchronizeRequest& request)
{
    const bool fromFile{ request.otherFilename.has_value() || request.otherPath.has_value() };

    StateResult<std::monostate> result{ std::monostate{} };
    if (!fromFile && request.liveData.has_value())
    {
        result = m_container.synchronize(request.clientId, std::move(*request.liveData), request.targetPath,
                                         request.targetKey);
    }
    else
    {
        if (!fromFile && !m_container.hasData(request.clientId))
        {
            strongbox::log::Registry::snapshot()->warn("No data present for client {}",
                                                       request.clientId.shortString());
        }

        std::optional<std::filesystem::path> source{};
        if (fromFile)
        {
            source = strongbox::core::resolveSnapshotPath(m_paths, request.otherFilename, request.otherPath);
        }
        result = m_container.synchronize(request.clientId, source, request.key, request.targetPath,
                                         request.targetKey);
    }

    strongbox::security::secureRelease(request.key);
    strongbox::security::secureRelease(request.targetKey);
    return replyFor(ReplyKind::Synchronize, result);
}

} // namespace strongbox::snapshot
