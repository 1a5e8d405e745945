#include "InteractiveShell.hpp"
#include "Tokenizer.hpp"

#include "strongbox/core/AddressDerivation.hpp"
#include "strongbox/core/KdfPolicy.hpp"
#include "strongbox/log/Registry.hpp"
#include "strongbox/security/ScopeWipe.hpp"
#include "strongbox/security/SecureEquals.hpp"

#include <CLI/CLI.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <exception>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace strongbox::ui::cli
{

namespace
{

// Counters above this are listed by record id only.
constexpr std::uint64_t g_kListScanCap{ 4096U };

[[nodiscard]] bool isCounter(const std::string& s)
{
    return !s.empty() && s.size() <= 19U &&
           std::all_of(s.begin(), s.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}

[[nodiscard]] std::string toText(const strongbox::core::Bytes& bytes)
{
    return std::string(bytes.begin(), bytes.end());
}

} // namespace

InteractiveShell::InteractiveShell(strongbox::core::SecureClientState& state,
                                   strongbox::snapshot::SnapshotCoordinator& coordinator, std::istream& in,
                                   std::ostream& out, PasswordReader pwdReader,
                                   strongbox::crypto::Argon2idParams kdfParams)
    : m_state(state), m_coordinator(coordinator), m_in(in), m_out(out), m_pwdReader(std::move(pwdReader)),
      m_kdfParams(kdfParams)
{
}

int InteractiveShell::run()
{
    m_out << "Strongbox shell\n";
    m_out << "Type 'help' for available commands.\n";

    std::string line;
    while (m_running && m_in.good())
    {
        m_out << "sbx(" << m_state.clientId().shortString() << ")> ";

        if (!std::getline(m_in, line))
        {
            break;
        }
        if (line.empty())
        {
            continue;
        }

        processLine(line);
    }
    return 0;
}

void InteractiveShell::processLine(const std::string& line)
{
    std::vector<std::string> userArgs = Tokenizer::tokenize(line);
    if (userArgs.empty())
    {
        return;
    }

    // 'help' prints the root help, not the help of the 'help' subcommand.
    if (userArgs[0] == "help")
    {
        userArgs[0] = "--help";
    }

    std::vector<std::string> args;
    args.reserve(userArgs.size() + 1);
    args.emplace_back("sbx");
    args.insert(args.end(), userArgs.begin(), userArgs.end());

    CLI::App app{ "Strongbox Shell" };
    app.require_subcommand(1);

    app.add_subcommand("help", "Print this help message")->callback([]() { throw CLI::CallForHelp(); });
    app.add_subcommand("exit", "Exit the shell")->alias("quit")->callback([this]() { m_running = false; });
    app.add_subcommand("whoami", "Show the client id")->callback([this]() { doWhoAmI(); });

    // Records
    std::string vaultArg;
    std::string recordArg;
    auto* subPut = app.add_subcommand("put", "Store a secret (prompts for value)");
    subPut->add_option("vault", vaultArg, "Vault path")->required();
    subPut->add_option("record", recordArg, "Counter or record path")->required();
    subPut->callback([&]() { doPut(vaultArg, recordArg); });

    auto* subGet = app.add_subcommand("get", "Print a secret");
    subGet->add_option("vault", vaultArg, "Vault path")->required();
    subGet->add_option("record", recordArg, "Counter or record path")->required();
    subGet->callback([&]() { doGet(vaultArg, recordArg); });

    auto* subRm = app.add_subcommand("rm", "Revoke a secret");
    subRm->add_option("vault", vaultArg, "Vault path")->required();
    subRm->add_option("record", recordArg, "Counter or record path")->required();
    subRm->callback([&]() { doRm(vaultArg, recordArg); });

    auto* subLs = app.add_subcommand("ls", "List the records of a vault");
    subLs->add_option("vault", vaultArg, "Vault path")->required();
    subLs->callback([&]() { doList(vaultArg); });

    // Store
    std::string keyArg;
    std::string valueArg;
    std::uint64_t ttlArg{};
    auto* subSet = app.add_subcommand("set", "Put a plain value in the cache");
    subSet->add_option("key", keyArg, "Cache key")->required();
    subSet->add_option("value", valueArg, "Cache value")->required();
    auto* ttlOpt = subSet->add_option("--ttl", ttlArg, "Lifetime in milliseconds")->check(CLI::PositiveNumber);
    subSet->callback(
        [&]()
        {
            doSet(keyArg, valueArg,
                  ttlOpt->count() > 0 ? std::optional<std::uint64_t>{ ttlArg } : std::optional<std::uint64_t>{});
        });

    auto* subFetch = app.add_subcommand("fetch", "Read a cached value");
    subFetch->add_option("key", keyArg, "Cache key")->required();
    subFetch->callback([&]() { doFetch(keyArg); });

    auto* subUnset = app.add_subcommand("unset", "Remove a cached value");
    subUnset->add_option("key", keyArg, "Cache key")->required();
    subUnset->callback([&]() { doUnset(keyArg); });

    // Snapshots
    std::string fileArg;
    std::string pathArg;
    std::string fromArg;
    std::string targetArg;
    const auto fileArgs = [&](CLI::Option* fileOpt, CLI::Option* pathOpt)
    {
        FileArgs file{};
        if (fileOpt->count() > 0)
        {
            file.filename = fileArg;
        }
        if (pathOpt->count() > 0)
        {
            file.path = std::filesystem::path{ pathArg };
        }
        return file;
    };

    auto* subSave = app.add_subcommand("save", "Write this client to a snapshot (prompts for password)");
    auto* saveFile = subSave->add_option("--file", fileArg, "Snapshot name in the snapshot directory");
    auto* savePath = subSave->add_option("--path", pathArg, "Snapshot file path");
    subSave->callback([&]() { doSave(fileArgs(saveFile, savePath)); });

    auto* subLoad = app.add_subcommand("load", "Load this client from a snapshot (prompts for password)");
    auto* loadFile = subLoad->add_option("--file", fileArg, "Snapshot name in the snapshot directory");
    auto* loadPath = subLoad->add_option("--path", pathArg, "Snapshot file path");
    auto* loadFrom = subLoad->add_option("--from", fromArg, "Load another client's data, by client path");
    subLoad->callback(
        [&]()
        {
            doLoad(fileArgs(loadFile, loadPath),
                   loadFrom->count() > 0 ? std::optional<std::string>{ fromArg } : std::optional<std::string>{});
        });

    auto* subSync = app.add_subcommand("sync", "Merge this client into another snapshot file");
    auto* syncFile = subSync->add_option("--file", fileArg, "Source snapshot name (default: live state)");
    auto* syncPath = subSync->add_option("--path", pathArg, "Source snapshot path (default: live state)");
    subSync->add_option("target", targetArg, "Target snapshot file")->required();
    subSync->callback([&]() { doSync(fileArgs(syncFile, syncPath), std::filesystem::path{ targetArg }); });

    try
    {
        std::vector<char*> argv;
        argv.reserve(args.size());
        for (const auto& arg : args)
        {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }

        app.parse(static_cast<int>(argv.size()), argv.data());
    }
    catch ([[maybe_unused]] const CLI::CallForHelp&)
    {
        m_out << app.help();
    }
    catch (const CLI::ParseError& e)
    {
        m_out << "Syntax Error: " << e.what() << "\n";
    }
}

strongbox::core::Location InteractiveShell::parseLocation(const std::string& vault, const std::string& record)
{
    if (isCounter(record))
    {
        return strongbox::core::counterLocation(vault, std::stoull(record));
    }
    return strongbox::core::genericLocation(vault, record);
}

std::optional<strongbox::security::SecureBuffer> InteractiveShell::promptKey(const std::string& prompt, bool confirm)
{
    auto pass = m_pwdReader(prompt);
    auto wipePass = strongbox::security::scopeWipe(pass);
    if (pass.empty())
    {
        m_out << "Error: Empty password.\n";
        return std::nullopt;
    }

    if (confirm)
    {
        auto again = m_pwdReader("Confirm Password: ");
        auto wipeAgain = strongbox::security::scopeWipe(again);
        if (!strongbox::security::secureEquals(pass, again))
        {
            m_out << "Error: Passwords do not match.\n";
            return std::nullopt;
        }
    }

    try
    {
        return strongbox::core::deriveSnapshotKey(strongbox::security::asBytes(pass), m_kdfParams);
    }
    catch (const std::invalid_argument& e)
    {
        strongbox::log::Registry::cli()->error("key derivation rejected: {}", e.what());
        m_out << "Error: Key derivation failed.\n";
        return std::nullopt;
    }
}

std::optional<strongbox::snapshot::SnapshotReply> InteractiveShell::await(strongbox::snapshot::SnapshotRequest request)
{
    try
    {
        return m_coordinator.post(std::move(request)).get();
    }
    catch (const std::exception& e)
    {
        strongbox::log::Registry::cli()->error("snapshot request failed: {}", e.what());
        m_out << "Error: Snapshot service unavailable.\n";
        return std::nullopt;
    }
}

// --- Handlers ---

void InteractiveShell::doWhoAmI()
{
    m_out << m_state.clientIdString() << "\n";
}

void InteractiveShell::doPut(const std::string& vault, const std::string& record)
{
    auto val = m_pwdReader("Secret Value: ");
    auto wipeVal = strongbox::security::scopeWipe(val);

    const auto result = m_state.writeSecret(parseLocation(vault, record), strongbox::security::asBytes(val));
    if (std::holds_alternative<strongbox::core::StateError>(result))
    {
        m_out << "Error: Failed to write secret ("
              << strongbox::core::describe(std::get<strongbox::core::StateError>(result)) << ").\n";
        return;
    }
    m_out << "Secret stored.\n";
}

void InteractiveShell::doGet(const std::string& vault, const std::string& record)
{
    auto result = m_state.readSecret(parseLocation(vault, record));
    if (auto* sec = std::get_if<strongbox::security::SecureBuffer>(&result))
    {
        auto wipeSec = strongbox::security::scopeWipe(*sec);
        m_out << strongbox::security::asStringView(*sec) << "\n";
        return;
    }

    if (std::get<strongbox::core::StateError>(result) == strongbox::core::StateError::NotExisting)
    {
        m_out << "Error: Secret not found.\n";
    }
    else
    {
        m_out << "Error: Failed to read secret ("
              << strongbox::core::describe(std::get<strongbox::core::StateError>(result)) << ").\n";
    }
}

void InteractiveShell::doRm(const std::string& vault, const std::string& record)
{
    const auto result = m_state.revokeSecret(parseLocation(vault, record));
    if (std::holds_alternative<strongbox::core::StateError>(result))
    {
        if (std::get<strongbox::core::StateError>(result) == strongbox::core::StateError::NotExisting)
        {
            m_out << "Error: Secret not found.\n";
        }
        else
        {
            m_out << "Error: Failed to revoke secret.\n";
        }
        return;
    }
    m_out << "Secret revoked.\n";
}

void InteractiveShell::doList(const std::string& vault)
{
    const auto vaultPath{ strongbox::core::bytesFrom(vault) };
    const auto ids{ m_state.listRecordIds(strongbox::core::deriveVaultId(vaultPath)) };
    if (ids.empty())
    {
        m_out << "(empty)\n";
        return;
    }

    for (const auto& id : ids)
    {
        const auto counter{ m_state.getIndexFromRecordId(vaultPath, id, g_kListScanCap) };
        m_out << " - " << id.toString();
        if (counter < g_kListScanCap)
        {
            m_out << " (counter " << counter << ")";
        }
        m_out << "\n";
    }
}

void InteractiveShell::doSet(const std::string& key, const std::string& value, std::optional<std::uint64_t> ttlMs)
{
    std::optional<std::chrono::milliseconds> lifetime{};
    if (ttlMs.has_value())
    {
        lifetime = std::chrono::milliseconds{ static_cast<std::chrono::milliseconds::rep>(*ttlMs) };
    }

    const auto previous{ m_state.writeToStore(strongbox::core::bytesFrom(key), strongbox::core::bytesFrom(value),
                                              lifetime) };
    if (previous.has_value())
    {
        m_out << "Replaced: " << toText(*previous) << "\n";
    }
    else
    {
        m_out << "Stored.\n";
    }
}

void InteractiveShell::doFetch(const std::string& key)
{
    const auto value{ m_state.readFromStore(strongbox::core::bytesFrom(key)) };
    if (!value.has_value())
    {
        m_out << "Error: Key not found.\n";
        return;
    }
    m_out << toText(*value) << "\n";
}

void InteractiveShell::doUnset(const std::string& key)
{
    const auto bytes{ strongbox::core::bytesFrom(key) };
    if (!m_state.storeKeyExists(bytes))
    {
        m_out << "Error: Key not found.\n";
        return;
    }
    m_state.deleteFromStore(bytes);
    m_out << "Removed.\n";
}

void InteractiveShell::doSave(const FileArgs& file)
{
    auto key = promptKey("Snapshot Password: ", true);
    if (!key.has_value())
    {
        return;
    }

    const auto filled = await(strongbox::snapshot::FillRequest{ m_state.clientId(), m_state.exportSnapshot() });
    if (!filled.has_value())
    {
        return;
    }

    const auto written = await(strongbox::snapshot::WriteRequest{ std::move(*key), file.filename, file.path });
    if (!written.has_value())
    {
        return;
    }
    if (!written->status.isOk())
    {
        m_out << "Error: " << written->status.text() << "\n";
        return;
    }
    m_out << "Snapshot written.\n";
}

void InteractiveShell::doLoad(const FileArgs& file, const std::optional<std::string>& fromClient)
{
    auto key = promptKey("Snapshot Password: ");
    if (!key.has_value())
    {
        return;
    }

    std::optional<strongbox::core::ClientId> forwardId{};
    if (fromClient.has_value())
    {
        forwardId = strongbox::core::deriveClientId(strongbox::core::bytesFrom(*fromClient));
    }

    auto reply = await(strongbox::snapshot::ReadRequest{ std::move(*key), file.filename, file.path,
                                                         m_state.clientId(), forwardId });
    if (!reply.has_value())
    {
        return;
    }
    if (!reply->status.isOk())
    {
        m_out << "Error: " << reply->status.text() << "\n";
        return;
    }

    // No owner registered for this client: the data came back in the reply.
    if (reply->data.has_value())
    {
        const auto reloaded =
            m_state.reloadData(forwardId.value_or(m_state.clientId()), std::move(*reply->data));
        if (std::holds_alternative<strongbox::core::StateError>(reloaded))
        {
            m_out << "Error: " << strongbox::core::describe(std::get<strongbox::core::StateError>(reloaded))
                  << "\n";
            return;
        }
    }
    m_out << "Snapshot loaded.\n";
}

void InteractiveShell::doSync(const FileArgs& source, const std::filesystem::path& target)
{
    const bool fromFile{ source.filename.has_value() || source.path.has_value() };
    strongbox::security::SecureBuffer sourceKey{};
    if (fromFile)
    {
        auto key = promptKey("Source Password: ");
        if (!key.has_value())
        {
            return;
        }
        sourceKey = std::move(*key);
    }

    auto targetKey = promptKey("Target Password: ");
    if (!targetKey.has_value())
    {
        return;
    }
    std::optional<strongbox::core::ClientSnapshot> live{};
    if (!fromFile)
    {
        live = m_state.exportSnapshot();
    }

    const auto reply = await(strongbox::snapshot::SynchronizeRequest{ m_state.clientId(), std::move(sourceKey),
                                                                      source.filename, source.path, target,
                                                                      std::move(*targetKey), std::move(live) });
    if (!reply.has_value())
    {
        return;
    }
    if (!reply->status.isOk())
    {
        m_out << "Error: " << reply->status.text() << "\n";
        return;
    }
    m_out << "Snapshot synchronized.\n";
}

} // namespace strongbox::ui::cli
