#include "strongbox/core/SnapshotPaths.hpp"

#include <cstdlib>

namespace strongbox::core
{

[[nodiscard]] SnapshotPathConfig snapshotPathConfigFromEnv()
{
    SnapshotPathConfig config{};

    const char* dir{ std::getenv(g_kSnapshotDirEnv) };
    if (dir != nullptr && *dir != '\0')
    {
        config.directory = dir;
        return config;
    }

    const char* home{ std::getenv("HOME") };
    if (home != nullptr && *home != '\0')
    {
        config.directory = std::filesystem::path{ home } / ".strongbox" / "snapshots";
        return config;
    }

    config.directory = std::filesystem::path{ "snapshots" };
    return config;
}

[[nodiscard]] std::filesystem::path resolveSnapshotPath(const SnapshotPathConfig& config,
                                                        const std::optional<std::string>& filename,
                                                        const std::optional<std::filesystem::path>& path)
{
    if (path.has_value())
    {
        return *path;
    }
    return config.directory / filename.value_or(config.defaultFilename);
}

} // namespace strongbox::core
