#ifndef STRONGBOX_UI_CLI_INTERACTIVESHELL_HPP
#define STRONGBOX_UI_CLI_INTERACTIVESHELL_HPP

#include "strongbox/core/Location.hpp"
#include "strongbox/core/SecureClientState.hpp"
#include "strongbox/crypto/KeyDerivation.hpp"
#include "strongbox/security/SecureBuffer.hpp"
#include "strongbox/security/SecureString.hpp"
#include "strongbox/snapshot/SnapshotCoordinator.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <iostream>
#include <optional>
#include <string>

namespace strongbox::ui::cli
{

// In tests: returns a pre-determined string.
using PasswordReader = std::function<strongbox::security::SecureString(const std::string&)>;

// Line-oriented front end for one client state and its snapshot coordinator.
class InteractiveShell final
{
public:
    InteractiveShell(strongbox::core::SecureClientState& state, strongbox::snapshot::SnapshotCoordinator& coordinator,
                     std::istream& in, std::ostream& out, PasswordReader pwdReader,
                     strongbox::crypto::Argon2idParams kdfParams);

    int run();

private:
    struct FileArgs
    {
        std::optional<std::string> filename;
        std::optional<std::filesystem::path> path;
    };

    strongbox::core::SecureClientState& m_state;
    strongbox::snapshot::SnapshotCoordinator& m_coordinator;
    std::istream& m_in;
    std::ostream& m_out;
    PasswordReader m_pwdReader;
    strongbox::crypto::Argon2idParams m_kdfParams;
    bool m_running{ true };

    void processLine(const std::string& line);

    // "7" is counter 7 of the vault; anything else is a record path.
    [[nodiscard]] static strongbox::core::Location parseLocation(const std::string& vault, const std::string& record);
    // With `confirm` the password is asked twice and must match.
    [[nodiscard]] std::optional<strongbox::security::SecureBuffer> promptKey(const std::string& prompt,
                                                                            bool confirm = false);
    [[nodiscard]] std::optional<strongbox::snapshot::SnapshotReply> await(strongbox::snapshot::SnapshotRequest request);

    void doWhoAmI();
    void doPut(const std::string& vault, const std::string& record);
    void doGet(const std::string& vault, const std::string& record);
    void doRm(const std::string& vault, const std::string& record);
    void doList(const std::string& vault);
    void doSet(const std::string& key, const std::string& value, std::optional<std::uint64_t> ttlMs);
    void doFetch(const std::string& key);
    void doUnset(const std::string& key);
    void doSave(const FileArgs& file);
    void doLoad(const FileArgs& file, const std::optional<std::string>& fromClient);
    void doSync(const FileArgs& source, const std::filesystem::path& target);
};

} // namespace strongbox::ui::cli

#endif // STRONGBOX_UI_CLI_INTERACTIVESHELL_HPP
