#include "fs_observer.hpp"
#include <errno.h>
#include <dirent.h>
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <sys/stat.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/crc.hpp>
#include <cstring>
#include <deque>
#include <memory>
#include <stdexcept>
#include <system_error>
#include "common/io_utils.hpp"
#include "config.hpp"

namespace testbox {
using namespace std;
namespace fs = std::filesystem;

const char *to_string(entry_type type) {
    switch (type) {
        case entry_type::regular: return "file";
        case entry_type::directory: return "directory";
        case entry_type::symlink: return "symlink";
        case entry_type::special: return "special";
        case entry_type::missing: return "missing";
    }
    return "unknown";
}

const char *to_string(change_kind kind) {
    switch (kind) {
        case change_kind::created: return "created";
        case change_kind::modified: return "modified";
        case change_kind::deleted: return "deleted";
        case change_kind::unknown: return "unknown";
    }
    return "unknown";
}

bool fs_change::operator==(const fs_change &other) const {
    return path == other.path && kind == other.kind && detail == other.detail;
}

static const string MISSING_SUBTREE = "observed directory does not exist";

snapshot_options::snapshot_options() : digest_size_limit(DIGEST_SIZE_LIMIT) {}

static int64_t to_ns(const struct timespec &ts) {
    return (int64_t)ts.tv_sec * 1000000000LL + ts.tv_nsec;
}

static const int MAX_SYMLINK_HOPS = 40;

/**
 * @brief Opens a directory below dir_fd, refusing to traverse a symlink
 */
static unique_fd open_directory_at(int dir_fd, const string &name) {
    return unique_fd(openat(dir_fd, name.c_str(), O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC));
}

/**
 * @brief CRC-32 of a file's content
 * @return the error when the file cannot be read
 */
static optional<uint32_t> file_digest(int dir_fd, const string &name, string &error) {
    unique_fd fd(openat(dir_fd, name.c_str(), O_RDONLY | O_NOFOLLOW | O_NONBLOCK | O_CLOEXEC));
    if (!fd.valid()) {
        error = strerror(errno);
        return {};
    }

    boost::crc_32_type crc;
    char buffer[64 * 1024];
    while (true) {
        ssize_t n = read(fd.get(), buffer, sizeof(buffer));
        if (n < 0 && errno == EINTR) continue;
        if (n < 0) {
            error = strerror(errno);
            return {};
        }
        if (n == 0) break;
        crc.process_bytes(buffer, n);
    }
    return crc.checksum();
}

static optional<string> read_link_at(int dir_fd, const string &name, string &error) {
    vector<char> buffer(256);
    while (true) {
        ssize_t n = readlinkat(dir_fd, name.c_str(), buffer.data(), buffer.size());
        if (n < 0) {
            error = strerror(errno);
            return {};
        }
        if ((size_t)n < buffer.size()) return string(buffer.data(), n);
        buffer.resize(buffer.size() * 2);
    }
}

static deque<string> split_components(const fs::path &path) {
    deque<string> components;
    for (auto &part : path.relative_path())
        if (!part.empty()) components.push_back(part.string());
    return components;
}

/**
 * @brief Resolves a path the way the subject would see it from inside the
 * root: symlinks are followed by hand and ".." stops at the root, so the
 * host outside the root is never consulted.
 */
static bool resolves_in_root(int root_fd, const fs::path &inside) {
    vector<string> resolved;
    deque<string> pending = split_components(inside);
    int hops = 0;

    while (!pending.empty()) {
        string part = pending.front();
        pending.pop_front();
        if (part == ".") continue;
        if (part == "..") {
            if (!resolved.empty()) resolved.pop_back();
            continue;
        }

        // re-open the parent from the root, every resolved component is a real directory
        unique_fd parent(dup(root_fd));
        if (!parent.valid()) return false;
        for (auto &dir : resolved) {
            unique_fd next = open_directory_at(parent.get(), dir);
            if (!next.valid()) return false;
            parent = move(next);
        }

        struct stat st;
        if (fstatat(parent.get(), part.c_str(), &st, AT_SYMLINK_NOFOLLOW) != 0) return false;
        if (S_ISLNK(st.st_mode)) {
            if (++hops > MAX_SYMLINK_HOPS) return false;
            string error;
            optional<string> target = read_link_at(parent.get(), part, error);
            if (!target) return false;
            deque<string> expanded = split_components(*target);
            if (fs::path(*target).is_absolute()) resolved.clear();
            pending.insert(pending.begin(), expanded.begin(), expanded.end());
            continue;
        }
        if (!pending.empty() && !S_ISDIR(st.st_mode)) return false;
        resolved.push_back(part);
    }
    return true;
}

static const char *special_name(mode_t mode) {
    if (S_ISFIFO(mode)) return "fifo";
    if (S_ISSOCK(mode)) return "socket";
    if (S_ISCHR(mode)) return "character device";
    if (S_ISBLK(mode)) return "block device";
    return "unknown file type";
}

/**
 * @brief Everything a walk needs besides the directory being listed
 */
struct walk_context {
    int root_fd;
    const snapshot_options &options;
    fs_snapshot &snapshot;
};

/**
 * @param dir_fd directory containing the entry
 * @param name name of the entry in dir_fd, "." for the directory itself
 */
static entry_meta observe(const walk_context &ctx, int dir_fd, const string &name, const string &inside,
                          const struct stat &st) {
    entry_meta meta;
    meta.size = st.st_size;
    meta.mode = st.st_mode & 07777;
    meta.uid = st.st_uid;
    meta.gid = st.st_gid;
    meta.inode = st.st_ino;
    meta.mtime_ns = to_ns(st.st_mtim);
    meta.ctime_ns = to_ns(st.st_ctim);

    if (S_ISREG(st.st_mode)) {
        meta.type = entry_type::regular;
        if ((uint64_t)st.st_size <= ctx.options.digest_size_limit) {
            string error;
            meta.digest = file_digest(dir_fd, name, error);
            if (!meta.digest) meta.anomaly = "unreadable: " + error;
        }
    } else if (S_ISDIR(st.st_mode)) {
        meta.type = entry_type::directory;
    } else if (S_ISLNK(st.st_mode)) {
        meta.type = entry_type::symlink;
        string error;
        optional<string> target = read_link_at(dir_fd, name, error);
        if (!target) {
            meta.anomaly = "unreadable symlink: " + error;
        } else {
            meta.link_target = *target;
            fs::path resolved = fs::path(*target).is_absolute() ? fs::path(*target)
                                                                 : fs::path(inside).parent_path() / *target;
            if (!resolves_in_root(ctx.root_fd, resolved))
                meta.anomaly = "dangling symlink to " + meta.link_target;
        }
    } else {
        meta.type = entry_type::special;
        meta.anomaly = fmt::format("special file ({})", special_name(st.st_mode));
    }
    return meta;
}

static string child_path(const string &inside_dir, const string &name) {
    return (inside_dir == "/" ? "" : inside_dir) + "/" + name;
}

/**
 * @brief Indexes the children of dir_fd, which is owned by the walk
 */
static void walk(const walk_context &ctx, unique_fd dir_fd, const string &inside_dir) {
    int listing_fd = dup(dir_fd.get());
    DIR *dir = listing_fd < 0 ? nullptr : fdopendir(listing_fd);
    if (!dir) {
        int err = errno;
        if (listing_fd >= 0) close(listing_fd);
        ctx.snapshot[inside_dir].anomaly = string("unreadable directory: ") + strerror(err);
        return;
    }
    unique_ptr<DIR, int (*)(DIR *)> guard(dir, closedir);

    vector<string> names;
    while (true) {
        errno = 0;
        struct dirent *ent = readdir(dir);
        if (!ent) break;
        string name = ent->d_name;
        if (name != "." && name != "..") names.push_back(name);
    }
    if (errno != 0) {
        int err = errno;
        ctx.snapshot[inside_dir].anomaly = string("unreadable directory: ") + strerror(err);
        LOG(WARNING) << "cannot list " << inside_dir << ": " << strerror(err);
    }

    for (auto &name : names) {
        string inside = child_path(inside_dir, name);

        struct stat st;
        if (fstatat(dir_fd.get(), name.c_str(), &st, AT_SYMLINK_NOFOLLOW) != 0) {
            // removed while walking, or not stat-able at all
            entry_meta meta;
            meta.anomaly = string("cannot stat: ") + strerror(errno);
            ctx.snapshot[inside] = meta;
            continue;
        }

        entry_meta meta = observe(ctx, dir_fd.get(), name, inside, st);
        ctx.snapshot[inside] = meta;
        if (meta.type != entry_type::directory) continue;

        unique_fd child = open_directory_at(dir_fd.get(), name);
        if (!child.valid()) {
            int err = errno;
            ctx.snapshot[inside].anomaly = err == EACCES ? "permission denied"
                                                         : string("unreadable directory: ") + strerror(err);
            LOG(WARNING) << "cannot list " << inside << ": " << strerror(err);
            continue;
        }
        walk(ctx, move(child), inside);
    }
}

fs_snapshot take_snapshot(const fs::path &root, const fs::path &subtree, const snapshot_options &options) {
    // rejects subtrees leaving the root
    path_in_root(root, subtree);
    deque<string> components = split_components(subtree.lexically_normal());
    while (!components.empty() && components.back() == ".") components.pop_back();
    string inside = "/";
    for (auto &part : components) inside = child_path(inside, part);

    unique_fd root_fd(open(root.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (!root_fd.valid())
        throw system_error(errno, system_category(), fmt::format("opening isolated root {}", root.string()));

    fs_snapshot snapshot;
    walk_context ctx{root_fd.get(), options, snapshot};

    // descend to the parent of the subtree without traversing symlinks,
    // the subject may have replaced any of these directories
    unique_fd parent(dup(root_fd.get()));
    if (!parent.valid())
        throw system_error(errno, system_category(), "duplicating root descriptor");
    string walked = "/";
    for (size_t i = 0; i + 1 < components.size(); ++i) {
        walked = child_path(walked, components[i]);
        unique_fd next = open_directory_at(parent.get(), components[i]);
        if (!next.valid()) {
            int err = errno;
            entry_meta meta;
            if (err == ENOENT)
                meta.anomaly = MISSING_SUBTREE;
            else if (err == ELOOP || err == ENOTDIR)
                meta.anomaly = fmt::format("{} is no longer a directory", walked);
            else
                meta.anomaly = fmt::format("cannot open {}: {}", walked, strerror(err));
            LOG(WARNING) << "observing " << inside << ": " << meta.anomaly;
            snapshot[inside] = meta;
            return snapshot;
        }
        parent = move(next);
    }

    string name = components.empty() ? "." : components.back();
    struct stat st;
    if (fstatat(parent.get(), name.c_str(), &st, AT_SYMLINK_NOFOLLOW) != 0) {
        entry_meta meta;
        meta.anomaly = errno == ENOENT ? MISSING_SUBTREE
                                       : string("cannot stat observed directory: ") + strerror(errno);
        LOG(WARNING) << "observing " << inside << ": " << meta.anomaly;
        snapshot[inside] = meta;
        return snapshot;
    }

    entry_meta meta = observe(ctx, parent.get(), name, inside, st);
    snapshot[inside] = meta;
    if (meta.type != entry_type::directory) return snapshot;

    unique_fd dir = open_directory_at(parent.get(), name);
    if (!dir.valid()) {
        int err = errno;
        snapshot[inside].anomaly = err == EACCES ? "permission denied"
                                                 : string("unreadable directory: ") + strerror(err);
        return snapshot;
    }
    walk(ctx, move(dir), inside);
    return snapshot;
}

static string describe_mode(mode_t mode) {
    return fmt::format("{:04o}", (unsigned)mode);
}

static bool same_state(const entry_meta &a, const entry_meta &b) {
    if (a.type != b.type || a.mode != b.mode || a.uid != b.uid || a.gid != b.gid || a.anomaly != b.anomaly)
        return false;
    if (a.type == entry_type::directory || a.type == entry_type::missing)
        return true;
    return a.size == b.size && a.inode == b.inode && a.mtime_ns == b.mtime_ns &&
           a.digest == b.digest && a.link_target == b.link_target;
}

/**
 * @brief Lists what differs between two states of the same path
 */
static vector<string> changed_attributes(const entry_meta &before, const entry_meta &after) {
    vector<string> changes;
    if (before.type != after.type) {
        changes.push_back(fmt::format("type {} -> {}", to_string(before.type), to_string(after.type)));
        return changes;
    }
    if (before.mode != after.mode)
        changes.push_back(fmt::format("mode {} -> {}", describe_mode(before.mode), describe_mode(after.mode)));
    if (before.uid != after.uid || before.gid != after.gid)
        changes.push_back(fmt::format("owner {}:{} -> {}:{}", before.uid, before.gid, after.uid, after.gid));
    if (after.type == entry_type::directory)
        return changes;

    if (before.link_target != after.link_target)
        changes.push_back(fmt::format("target {} -> {}", before.link_target, after.link_target));
    if (before.size != after.size)
        changes.push_back(fmt::format("size {} -> {}", before.size, after.size));
    if (before.digest && after.digest) {
        if (*before.digest != *after.digest)
            changes.push_back("content");
    } else if (before.mtime_ns != after.mtime_ns) {
        changes.push_back("mtime");
    }
    if (before.inode != after.inode)
        changes.push_back("replaced");
    if (changes.empty() && !before.anomaly.empty())
        changes.push_back("was " + before.anomaly);
    return changes;
}

vector<fs_change> diff_snapshots(const fs_snapshot &before, const fs_snapshot &after) {
    vector<fs_change> delta;
    auto b = before.begin(), a = after.begin();
    while (b != before.end() || a != after.end()) {
        if (a == after.end() || (b != before.end() && b->first < a->first)) {
            if (b->second.type != entry_type::missing)
                delta.push_back({b->first, change_kind::deleted, to_string(b->second.type)});
            ++b;
        } else if (b == before.end() || a->first < b->first) {
            if (!a->second.anomaly.empty())
                delta.push_back({a->first, change_kind::unknown, a->second.anomaly});
            else if (a->second.type != entry_type::missing)
                delta.push_back({a->first, change_kind::created, to_string(a->second.type)});
            ++a;
        } else {
            const entry_meta &old = b->second, &now = a->second;
            if (!same_state(old, now)) {
                if (now.anomaly == MISSING_SUBTREE && old.type != entry_type::missing) {
                    delta.push_back({a->first, change_kind::deleted, to_string(old.type)});
                } else if (!now.anomaly.empty()) {
                    delta.push_back({a->first, change_kind::unknown, now.anomaly});
                } else if (old.type == entry_type::missing) {
                    delta.push_back({a->first, change_kind::created, to_string(now.type)});
                } else {
                    vector<string> changes = changed_attributes(old, now);
                    if (!changes.empty())
                        delta.push_back({a->first, change_kind::modified, boost::algorithm::join(changes, ", ")});
                }
            }
            ++a;
            ++b;
        }
    }
    return delta;
}

}  // namespace testbox
