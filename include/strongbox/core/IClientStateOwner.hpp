#ifndef INCLUDE_STRONGBOX_CORE_ICLIENTSTATEOWNER_HPP
#define INCLUDE_STRONGBOX_CORE_ICLIENTSTATEOWNER_HPP

#include "strongbox/core/ClientSnapshot.hpp"
#include "strongbox/core/Ids.hpp"
#include "strongbox/core/StateError.hpp"
#include <functional>
#include <map>
#include <variant>

namespace strongbox::core
{

// Receiver of client state loaded from a snapshot.
// reloadData runs on the coordinator's thread with its container lock held: implementations must not
// call back into the SnapshotCoordinator (handle, hasData, empty or a blocking wait on post).
class IClientStateOwner
{
public:
    IClientStateOwner() = default;
    IClientStateOwner(const IClientStateOwner&) = delete;
    IClientStateOwner& operator=(const IClientStateOwner&) = delete;
    IClientStateOwner(IClientStateOwner&&) = delete;
    IClientStateOwner& operator=(IClientStateOwner&&) = delete;
    virtual ~IClientStateOwner() = default;

    [[nodiscard]] virtual StateResult<std::monostate> reloadData(const ClientId& clientId, ClientSnapshot data) = 0;
};

using ClientRouter = std::map<ClientId, std::reference_wrapper<IClientStateOwner>>;

} // namespace strongbox::core

#endif // INCLUDE_STRONGBOX_CORE_ICLIENTSTATEOWNER_HPP
