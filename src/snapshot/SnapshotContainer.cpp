#include "strongbox/snapshot/SnapshotContainer.hpp"

#include "strongbox/log/Registry.hpp"
#include "strongbox/snapshot/SnapshotCodec.hpp"
#include <cerrno>
#include <cstring>
#include <exception>
#include <fcntl.h>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>
#include <utility>

namespace strongbox::snapshot
{
namespace
{

constexpr std::string_view g_kTempSuffix{ ".tmp" };

[[nodiscard]] std::filesystem::path tempPathFor(const std::filesystem::path& path)
{
    auto temp{ path };
    temp += std::string{ g_kTempSuffix };
    return temp;
}

void removeQuietly(const std::filesystem::path& path) noexcept
{
    std::error_code ec{};
    std::filesystem::remove(path, ec);
    if (ec)
    {
        strongbox::log::Registry::snapshot()->warn("could not remove {}: {}", path.string(), ec.message());
    }
}

// Closes the descriptor on every path out of writeDurably.
class FileDescriptor final
{
public:
    explicit FileDescriptor(int fd) noexcept : m_fd{ fd }
    {
    }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    ~FileDescriptor()
    {
        if (m_fd >= 0)
        {
            (void)::close(m_fd);
        }
    }

    [[nodiscard]] int get() const noexcept
    {
        return m_fd;
    }

    // False if close fails.
    [[nodiscard]] bool close() noexcept
    {
        const int fd{ std::exchange(m_fd, -1) };
        return ::close(fd) == 0;
    }

private:
    int m_fd{ -1 };
};

// Owner-only from creation, and on stable storage before returning true.
[[nodiscard]] bool writeDurably(const std::filesystem::path& path, std::span<const std::uint8_t> bytes)
{
    FileDescriptor file{ ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR) };
    if (file.get() < 0)
    {
        return false;
    }
    // A leftover temp file keeps its old mode through O_TRUNC.
    if (::fchmod(file.get(), S_IRUSR | S_IWUSR) != 0)
    {
        return false;
    }

    std::size_t done{ 0 };
    while (done < bytes.size())
    {
        const ssize_t n{ ::write(file.get(), bytes.data() + done, bytes.size() - done) };
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return false;
        }
        done += static_cast<std::size_t>(n);
    }
    return ::fsync(file.get()) == 0 && file.close();
}

// Persists the rename. Best effort.
void syncDirectory(const std::filesystem::path& dir)
{
    FileDescriptor handle{ ::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC) };
    if (handle.get() < 0 || ::fsync(handle.get()) != 0)
    {
        strongbox::log::Registry::snapshot()->warn("cannot sync directory {}: {}", dir.string(),
                                                   std::strerror(errno));
    }
}

[[nodiscard]] std::optional<std::vector<std::uint8_t>> readAll(const std::filesystem::path& path)
{
    std::ifstream in{ path, std::ios::binary };
    if (!in)
    {
        return std::nullopt;
    }
    std::vector<std::uint8_t> bytes{ std::istreambuf_iterator<char>{ in }, std::istreambuf_iterator<char>{} };
    if (in.bad())
    {
        return std::nullopt;
    }
    return bytes;
}

} // namespace

SnapshotContainer::SnapshotContainer(strongbox::crypto::ICryptoProvider& crypto) noexcept : m_crypto(&crypto)
{
}

SnapshotContainer::SnapshotContainer(strongbox::crypto::ICryptoProvider& crypto, SnapshotState state) noexcept
    : m_crypto(&crypto), m_state(std::move(state))
{
}

void SnapshotContainer::addData(const ClientId& clientId, ClientSnapshot data)
{
    m_state.insert_or_assign(clientId, std::move(data));
}

[[nodiscard]] StateResult<ClientSnapshot> SnapshotContainer::getState(const ClientId& clientId) const
{
    const auto it{ m_state.find(clientId) };
    if (it == m_state.end())
    {
        return StateError::NotExisting;
    }
    return it->second;
}

[[nodiscard]] bool SnapshotContainer::hasData(const ClientId& clientId) const noexcept
{
    return m_state.contains(clientId);
}

[[nodiscard]] std::vector<ClientId> SnapshotContainer::clientIds() const
{
    std::vector<ClientId> out{};
    out.reserve(m_state.size());
    for (const auto& [id, data] : m_state)
    {
        out.push_back(id);
    }
    return out;
}

[[nodiscard]] StateResult<std::monostate> writeSnapshotFile(strongbox::crypto::ICryptoProvider& crypto,
                                                            const std::filesystem::path& path,
                                                            std::span<const std::uint8_t> key,
                                                            const SnapshotState& state)
{
    std::vector<std::uint8_t> image{};
    try
    {
        image = sealSnapshot(crypto, key, state);
    }
    catch (const std::exception& e)
    {
        strongbox::log::Registry::snapshot()->error("snapshot encryption failed: {}", e.what());
        return StateError::CryptoError;
    }

    std::error_code ec{};
    if (path.has_parent_path())
    {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
        {
            strongbox::log::Registry::snapshot()->error("cannot create {}: {}", path.parent_path().string(),
                                                        ec.message());
            return StateError::IoFailure;
        }
    }

    const auto temp{ tempPathFor(path) };
    if (!writeDurably(temp, image))
    {
        strongbox::log::Registry::snapshot()->error("cannot write {}", temp.string());
        removeQuietly(temp);
        return StateError::IoFailure;
    }

    std::filesystem::rename(temp, path, ec);
    if (ec)
    {
        strongbox::log::Registry::snapshot()->error("cannot replace {}: {}", path.string(), ec.message());
        removeQuietly(temp);
        return StateError::IoFailure;
    }
    syncDirectory(path.parent_path());

    strongbox::log::Registry::snapshot()->info("wrote snapshot {} ({} client(s))", path.string(), state.size());
    return std::monostate{};
}

[[nodiscard]] StateResult<std::monostate> SnapshotContainer::writeToSnapshot(const std::filesystem::path& path,
                                                                             std::span<const std::uint8_t> key)
{
    auto result{ writeSnapshotFile(*m_crypto, path, key, m_state) };
    if (!std::holds_alternative<StateError>(result))
    {
        clear();
    }
    return result;
}

[[nodiscard]] StateResult<SnapshotContainer>
SnapshotContainer::readFromSnapshot(strongbox::crypto::ICryptoProvider& crypto, const std::filesystem::path& path,
                                    std::span<const std::uint8_t> key)
{
    const auto image{ readAll(path) };
    if (!image)
    {
        strongbox::log::Registry::snapshot()->error("cannot read {}", path.string());
        return StateError::IoFailure;
    }

    try
    {
        auto state{ openSnapshot(crypto, key, *image) };
        strongbox::log::Registry::snapshot()->info("read snapshot {} ({} client(s))", path.string(), state.size());
        return SnapshotContainer{ crypto, std::move(state) };
    }
    catch (const std::invalid_argument& e)
    {
        strongbox::log::Registry::snapshot()->error("snapshot key rejected: {}", e.what());
        return StateError::BadPasswordOrCorrupt;
    }
    catch (const std::runtime_error& e)
    {
        strongbox::log::Registry::snapshot()->error("cannot open {}: {}", path.string(), e.what());
        return StateError::BadPasswordOrCorrupt;
    }
}

[[nodiscard]] StateResult<std::monostate>
SnapshotContainer::synchronize(const ClientId& clientId, const std::optional<std::filesystem::path>& otherPath,
                               std::span<const std::uint8_t> otherKey, const std::filesystem::path& targetPath,
                               std::span<const std::uint8_t> targetKey)
{
    std::optional<ClientSnapshot> subject{};
    if (otherPath.has_value())
    {
        auto source{ readFromSnapshot(*m_crypto, *otherPath, otherKey) };
        if (std::holds_alternative<StateError>(source))
        {
            return std::get<StateError>(source);
        }
        auto fromFile{ std::get<SnapshotContainer>(source).getState(clientId) };
        if (!std::holds_alternative<StateError>(fromFile))
        {
            subject = std::move(std::get<ClientSnapshot>(fromFile));
        }
    }
    else
    {
        auto staged{ getState(clientId) };
        if (!std::holds_alternative<StateError>(staged))
        {
            subject = std::move(std::get<ClientSnapshot>(staged));
        }
    }

    return mergeIntoTarget(clientId, std::move(subject), targetPath, targetKey);
}

[[nodiscard]] StateResult<std::monostate> SnapshotContainer::synchronize(const ClientId& clientId,
                                                                         ClientSnapshot live,
                                                                         const std::filesystem::path& targetPath,
                                                                         std::span<const std::uint8_t> targetKey)
{
    return mergeIntoTarget(clientId, std::move(live), targetPath, targetKey);
}

[[nodiscard]] StateResult<std::monostate>
SnapshotContainer::mergeIntoTarget(const ClientId& clientId, std::optional<ClientSnapshot> subject,
                                   const std::filesystem::path& targetPath, std::span<const std::uint8_t> targetKey)
{
    SnapshotState target{};
    std::error_code ec{};
    if (std::filesystem::exists(targetPath, ec))
    {
        auto loaded{ readFromSnapshot(*m_crypto, targetPath, targetKey) };
        if (std::holds_alternative<StateError>(loaded))
        {
            return std::get<StateError>(loaded);
        }
        target = std::get<SnapshotContainer>(loaded).state();
    }
    else if (ec)
    {
        strongbox::log::Registry::snapshot()->error("cannot inspect {}: {}", targetPath.string(), ec.message());
        return StateError::IoFailure;
    }

    if (subject.has_value())
    {
        target.insert_or_assign(clientId, std::move(*subject));
    }
    else
    {
        strongbox::log::Registry::snapshot()->warn("no data present for client {}; target rewritten unchanged",
                                                   clientId.shortString());
    }

    return writeSnapshotFile(*m_crypto, targetPath, targetKey, target);
}

} // namespace strongbox::snapshot
