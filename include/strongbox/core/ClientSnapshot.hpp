#ifndef INCLUDE_STRONGBOX_CORE_CLIENTSNAPSHOT_HPP
#define INCLUDE_STRONGBOX_CORE_CLIENTSNAPSHOT_HPP

#include "strongbox/core/Ids.hpp"
#include "strongbox/core/KeyStore.hpp"
#include "strongbox/store/EphemeralStore.hpp"
#include "strongbox/vault/DbView.hpp"
#include <map>

namespace strongbox::core
{

// Everything needed to rebuild one client: its vault keys, its encrypted records and its cache.
struct ClientSnapshot final
{
    KeyMap keys;
    strongbox::vault::DbView db;
    strongbox::store::EphemeralStore store;

    friend bool operator==(const ClientSnapshot&, const ClientSnapshot&) = default;
};

using SnapshotState = std::map<ClientId, ClientSnapshot>;

} // namespace strongbox::core

#endif // INCLUDE_STRONGBOX_CORE_CLIENTSNAPSHOT_HPP
