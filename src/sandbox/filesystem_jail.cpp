/*
 * HalBox C++17 - Filesystem Jail Implementation (Landlock)
 */
#include <halbox/sandbox/filesystem_jail.hpp>
#include <halbox/core/logger.hpp>

#include <cstring>
#include <cerrno>
#include <sys/prctl.h>
#include <unistd.h>
#include <fcntl.h>

// ============================================================================
// Landlock syscall wrappers (not in glibc until very recently)
// ============================================================================

#ifdef __linux__

#include <linux/landlock.h>
#include <sys/syscall.h>

#ifndef __NR_landlock_create_ruleset
#define __NR_landlock_create_ruleset 444
#endif
#ifndef __NR_landlock_add_rule
#define __NR_landlock_add_rule 445
#endif
#ifndef __NR_landlock_restrict_self
#define __NR_landlock_restrict_self 446
#endif

// Landlock ABI v1 access rights
#define HALBOX_FS_READ ( \
    LANDLOCK_ACCESS_FS_EXECUTE    | \
    LANDLOCK_ACCESS_FS_READ_FILE  | \
    LANDLOCK_ACCESS_FS_READ_DIR   )

#define HALBOX_FS_ALL ( \
    HALBOX_FS_READ                      | \
    LANDLOCK_ACCESS_FS_WRITE_FILE       | \
    LANDLOCK_ACCESS_FS_REMOVE_DIR       | \
    LANDLOCK_ACCESS_FS_REMOVE_FILE      | \
    LANDLOCK_ACCESS_FS_MAKE_CHAR        | \
    LANDLOCK_ACCESS_FS_MAKE_DIR         | \
    LANDLOCK_ACCESS_FS_MAKE_REG         | \
    LANDLOCK_ACCESS_FS_MAKE_SOCK        | \
    LANDLOCK_ACCESS_FS_MAKE_FIFO        | \
    LANDLOCK_ACCESS_FS_MAKE_BLOCK       | \
    LANDLOCK_ACCESS_FS_MAKE_SYM         )

static inline int landlock_create_ruleset(
    const struct landlock_ruleset_attr* attr,
    size_t size, __u32 flags) {
    return static_cast<int>(syscall(__NR_landlock_create_ruleset, attr, size, flags));
}

static inline int landlock_add_rule(
    int ruleset_fd, enum landlock_rule_type type,
    const void* attr, __u32 flags) {
    return static_cast<int>(syscall(__NR_landlock_add_rule, ruleset_fd, type, attr, flags));
}

static inline int landlock_restrict_self(int ruleset_fd, __u32 flags) {
    return static_cast<int>(syscall(__NR_landlock_restrict_self, ruleset_fd, flags));
}

#endif // __linux__

namespace halbox {

namespace {

const char* SYSTEM_READ_DIRS[] = {
    "/usr",
    "/lib",
    "/lib64",
    "/bin",
    "/sbin",
    "/etc",     // locale, timezone, ld.so.cache
    "/opt",
    "/proc",    // /proc/self
    "/sys",
    "/dev",     // /dev/urandom
    NULL
};

} // anonymous namespace

FilesystemJail::FilesystemJail() : ruleset_fd_(-1) {}

FilesystemJail::~FilesystemJail() {
    if (ruleset_fd_ >= 0) {
        close(ruleset_fd_);
    }
}

bool FilesystemJail::is_supported() {
#ifdef __linux__
    struct landlock_ruleset_attr attr;
    memset(&attr, 0, sizeof(attr));
    attr.handled_access_fs = HALBOX_FS_ALL;
    int fd = landlock_create_ruleset(&attr, sizeof(attr), 0);
    if (fd >= 0) {
        close(fd);
        return true;
    }
    return false;
#else
    return false;
#endif
}

void FilesystemJail::allow_read(const std::string& path) {
    if (!path.empty()) read_paths_.push_back(path);
}

void FilesystemJail::allow_write(const std::string& path) {
    if (!path.empty()) write_paths_.push_back(path);
}

bool FilesystemJail::prepare() {
    if (ruleset_fd_ >= 0) return true;

#ifndef __linux__
    last_error_ = "Landlock is only available on Linux";
    LOG_WARN("[FilesystemJail] %s", last_error_.c_str());
    return false;
#else
    struct landlock_ruleset_attr ruleset_attr;
    memset(&ruleset_attr, 0, sizeof(ruleset_attr));
    ruleset_attr.handled_access_fs = HALBOX_FS_ALL;

    int fd = landlock_create_ruleset(&ruleset_attr, sizeof(ruleset_attr), 0);
    if (fd < 0) {
        last_error_ = std::string("Landlock unavailable: ") + strerror(errno);
        LOG_WARN("[FilesystemJail] %s (needs Linux >= 5.13)", last_error_.c_str());
        return false;
    }

    auto add_rule = [fd](const std::string& dir_path, __u64 access) -> bool {
        int dir_fd = open(dir_path.c_str(), O_PATH | O_CLOEXEC);
        if (dir_fd < 0) {
            return false;
        }
        struct landlock_path_beneath_attr path_attr;
        memset(&path_attr, 0, sizeof(path_attr));
        path_attr.allowed_access = access;
        path_attr.parent_fd = dir_fd;

        int ret = landlock_add_rule(fd, LANDLOCK_RULE_PATH_BENEATH, &path_attr, 0);
        close(dir_fd);
        return ret == 0;
    };

    for (int i = 0; SYSTEM_READ_DIRS[i] != NULL; ++i) {
        if (add_rule(SYSTEM_READ_DIRS[i], HALBOX_FS_READ)) {
            LOG_DEBUG("[FilesystemJail] Allowed R/O: %s", SYSTEM_READ_DIRS[i]);
        }
    }
    for (const auto& path : read_paths_) {
        if (add_rule(path, HALBOX_FS_READ)) {
            LOG_DEBUG("[FilesystemJail] Allowed R/O: %s", path.c_str());
        } else {
            LOG_WARN("[FilesystemJail] Cannot add read rule for %s: %s", path.c_str(), strerror(errno));
        }
    }
    for (const auto& path : write_paths_) {
        if (!add_rule(path, HALBOX_FS_ALL)) {
            last_error_ = "cannot add write rule for " + path + ": " + strerror(errno);
            LOG_ERROR("[FilesystemJail] %s", last_error_.c_str());
            close(fd);
            return false;
        }
        LOG_DEBUG("[FilesystemJail] Allowed R/W: %s", path.c_str());
    }

    ruleset_fd_ = fd;
    return true;
#endif // __linux__
}

bool FilesystemJail::enforce() const {
#ifdef __linux__
    if (ruleset_fd_ < 0) return false;
    // Required before restrict_self for unprivileged processes
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) < 0) {
        return false;
    }
    return landlock_restrict_self(ruleset_fd_, 0) == 0;
#else
    return false;
#endif
}

} // namespace halbox
