/*
 * HalBox C++17 - Filesystem Jail (Landlock)
 *
 * Optional per-child filesystem restriction using the Linux Landlock LSM.
 * The parent builds the ruleset before fork; the child enforces it right
 * before exec, so only the untrusted program is confined.
 *
 * Landlock is unprivileged and available since Linux 5.13. When the kernel
 * does not support it, prepare() fails and the runner continues without it.
 */
#ifndef halbox_SANDBOX_FILESYSTEM_JAIL_HPP
#define halbox_SANDBOX_FILESYSTEM_JAIL_HPP

#include <string>
#include <vector>

namespace halbox {

class FilesystemJail {
public:
    FilesystemJail();
    ~FilesystemJail();

    // Whether Landlock is supported on this kernel
    static bool is_supported();

    // Paths must be added before prepare()
    void allow_read(const std::string& path);
    void allow_write(const std::string& path);

    // Build the ruleset. System directories are always readable.
    bool prepare();

    // Child side, between fork and exec. Only async-signal-safe calls.
    bool enforce() const;

    bool is_prepared() const { return ruleset_fd_ >= 0; }
    const std::string& last_error() const { return last_error_; }

private:
    FilesystemJail(const FilesystemJail&);
    FilesystemJail& operator=(const FilesystemJail&);

    int ruleset_fd_;
    std::vector<std::string> read_paths_;
    std::vector<std::string> write_paths_;
    std::string last_error_;
};

} // namespace halbox

#endif // halbox_SANDBOX_FILESYSTEM_JAIL_HPP
