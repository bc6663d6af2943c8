#pragma once

#include <sys/types.h>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace testbox {

enum class entry_type {
    regular,
    directory,
    symlink,
    special,
    missing
};

const char *to_string(entry_type type);

/**
 * @brief What is known about one path of the observed subtree
 */
struct entry_meta {
    entry_type type = entry_type::missing;
    std::uint64_t size = 0;

    /**
     * @brief Permission bits, including setuid, setgid and sticky
     */
    mode_t mode = 0;

    uid_t uid = 0;
    gid_t gid = 0;
    ino_t inode = 0;
    std::int64_t mtime_ns = 0;
    std::int64_t ctime_ns = 0;

    /**
     * @brief CRC-32 of the content, regular files up to the digest size limit
     */
    std::optional<std::uint32_t> digest;

    std::string link_target;

    /**
     * @brief Why the entry could not be fully observed, empty when it could
     */
    std::string anomaly;
};

/**
 * @brief State of a subtree, keyed by the absolute path inside the isolated root
 */
using fs_snapshot = std::map<std::string, entry_meta>;

struct snapshot_options {
    /**
     * @brief Regular files larger than this are compared by metadata only
     */
    std::uint64_t digest_size_limit;

    snapshot_options();
};

/**
 * @brief Indexes every entry below subtree, without following symlinks.
 *
 * Entries that cannot be observed (permission denied, dangling symlinks,
 * fifos, sockets, devices) are kept with an anomaly, the walk never fails
 * because of them. A missing subtree yields a single entry for the
 * subtree itself carrying the anomaly.
 *
 * @param root the isolated root on the host
 * @param subtree observed directory, inside the root
 * @throw std::invalid_argument when subtree leaves the root
 */
fs_snapshot take_snapshot(const std::filesystem::path &root, const std::filesystem::path &subtree,
                          const snapshot_options &options = snapshot_options());

enum class change_kind {
    created,
    modified,
    deleted,

    /**
     * @brief The entry could not be observed after the run, the detail says why
     */
    unknown
};

const char *to_string(change_kind kind);

struct fs_change {
    std::string path;
    change_kind kind;
    std::string detail;

    bool operator==(const fs_change &other) const;
};

/**
 * @brief Lists the changes from before to after, sorted by path.
 * Directories are only compared by type, permissions and ownership.
 */
std::vector<fs_change> diff_snapshots(const fs_snapshot &before, const fs_snapshot &after);

}  // namespace testbox
