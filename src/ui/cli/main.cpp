#include "ConsoleUtils.hpp"
#include "InteractiveShell.hpp"

#include "strongbox/core/AddressDerivation.hpp"
#include "strongbox/core/IClientStateOwner.hpp"
#include "strongbox/core/KdfPolicy.hpp"
#include "strongbox/core/SecureClientState.hpp"
#include "strongbox/core/SnapshotPaths.hpp"
#include "strongbox/crypto/providers/NativeProviderFactory.hpp"
#include "strongbox/crypto/providers/OpenSslProviderFactory.hpp"
#include "strongbox/log/Registry.hpp"
#include "strongbox/snapshot/SnapshotCoordinator.hpp"

#include <CLI/CLI.hpp>
#include <exception>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>

int main(int argc, char** argv)
{
    CLI::App app{ "Strongbox secure client shell" };

    std::string clientPath{ "default" };
    std::string provider{ "native" };
    std::string snapshotDir{};
    std::string logLevel{};
    app.add_option("-c,--client", clientPath, "Client path the client id is derived from")->capture_default_str();
    app.add_option("-p,--provider", provider, "Crypto backend")
        ->check(CLI::IsMember({ "native", "openssl" }))
        ->capture_default_str();
    app.add_option("-d,--snapshot-dir", snapshotDir, "Snapshot directory (overrides SBX_SNAPSHOT_DIR)");
    app.add_option("--log-level", logLevel, "trace, debug, info, warn, error, critical or off");

    CLI11_PARSE(app, argc, argv);

    try
    {
        if (!logLevel.empty())
        {
            strongbox::log::Registry::setLevel(spdlog::level::from_str(logLevel));
        }
        if (!strongbox::ui::cli::lockProcessMemory())
        {
            strongbox::log::Registry::cli()->warn("could not lock process memory or disable core dumps");
        }

        auto crypto{ provider == "openssl" ? strongbox::crypto::providers::makeOpenSslCryptoProvider()
                                           : strongbox::crypto::providers::makeNativeCryptoProvider() };

        auto paths{ strongbox::core::snapshotPathConfigFromEnv() };
        if (!snapshotDir.empty())
        {
            paths.directory = std::filesystem::path{ snapshotDir };
        }

        const auto clientId{ strongbox::core::deriveClientId(strongbox::core::bytesFrom(clientPath)) };
        strongbox::core::SecureClientState state{ *crypto, clientId };

        strongbox::core::ClientRouter router{};
        router.emplace(clientId, std::ref<strongbox::core::IClientStateOwner>(state));
        strongbox::snapshot::SnapshotCoordinator coordinator{ *crypto, paths, std::move(router) };

        strongbox::log::Registry::cli()->info("client {} using {} provider, snapshots in {}", clientId.shortString(),
                                              provider, paths.directory.string());

        strongbox::ui::cli::InteractiveShell shell{ state,
                                                    coordinator,
                                                    std::cin,
                                                    std::cout,
                                                    strongbox::ui::cli::readSecretLine,
                                                    strongbox::core::defaultArgon2idParams() };
        return shell.run();
    }
    catch (const std::exception& e)
    {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
