#ifndef INCLUDE_STRONGBOX_CORE_SNAPSHOTPATHS_HPP
#define INCLUDE_STRONGBOX_CORE_SNAPSHOTPATHS_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace strongbox::core
{

constexpr std::string_view g_kDefaultSnapshotFilename{ "backup.snapshot" };
constexpr const char* g_kSnapshotDirEnv{ "SBX_SNAPSHOT_DIR" };

struct SnapshotPathConfig final
{
    std::filesystem::path directory;
    std::string defaultFilename{ g_kDefaultSnapshotFilename };
};

// $SBX_SNAPSHOT_DIR, else $HOME/.strongbox/snapshots, else ./snapshots.
[[nodiscard]] SnapshotPathConfig snapshotPathConfigFromEnv();

// An explicit path wins; otherwise `filename` (or the default name) inside the configured directory.
[[nodiscard]] std::filesystem::path resolveSnapshotPath(const SnapshotPathConfig& config,
                                                        const std::optional<std::string>& filename,
                                                        const std::optional<std::filesystem::path>& path);

} // namespace strongbox::core

#endif // INCLUDE_STRONGBOX_CORE_SNAPSHOTPATHS_HPP
