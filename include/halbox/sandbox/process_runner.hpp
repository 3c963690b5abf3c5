/*
 * HalBox C++17 - Process Runner
 *
 * Runs one interpreter child per request with a reduced environment,
 * resource ceilings applied before exec, captured stdout/stderr, and a
 * wall-clock deadline enforced by killing the child's process group.
 */
#ifndef halbox_SANDBOX_PROCESS_RUNNER_HPP
#define halbox_SANDBOX_PROCESS_RUNNER_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace halbox {

class FilesystemJail;

// Exit code reported when the deadline is hit
const int TIMEOUT_EXIT_CODE = 124;
// Exit code reported when the interpreter cannot be executed
const int EXEC_FAILED_EXIT_CODE = 127;

// Raised when a temporary artifact cannot be written
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

// A uniquely named file that is removed when the object goes out of scope
class TempArtifact {
public:
    // Creates <dir>/<prefix>_<uuid><suffix> with mode 0600. Throws StorageError.
    TempArtifact(const std::string& dir, const std::string& prefix,
                 const std::string& content, const std::string& suffix = ".py");
    ~TempArtifact();

    const std::string& path() const { return path_; }

    // Unlink now; safe to call more than once
    void remove();

private:
    TempArtifact(const TempArtifact&);
    TempArtifact& operator=(const TempArtifact&);

    std::string path_;
};

struct ResourceLimits {
    uint64_t memory_bytes;   // RLIMIT_AS, 0 = unlimited
    int cpu_seconds;         // RLIMIT_CPU soft limit, 0 = unlimited

    ResourceLimits() : memory_bytes(0), cpu_seconds(0) {}
};

struct RunSpec {
    std::string program;            // bare name (looked up on PATH) or path
    std::vector<std::string> args;  // argv[1..]
    int timeout_ms;
    ResourceLimits limits;
    size_t max_output_bytes;        // per stream
    std::string working_dir;        // empty = inherit
    const FilesystemJail* jail;     // optional, must outlive execute()

    RunSpec() : timeout_ms(8000), max_output_bytes(1024 * 1024), jail(nullptr) {}
};

struct RawRunResult {
    int return_code;
    std::string stdout_text;
    std::string stderr_text;
    int64_t duration_ms;
    bool timed_out;
    int term_signal;                // 0 unless the child died from a signal
    bool stdout_truncated;
    bool stderr_truncated;

    RawRunResult()
        : return_code(0)
        , duration_ms(0)
        , timed_out(false)
        , term_signal(0)
        , stdout_truncated(false)
        , stderr_truncated(false) {}
};

class ProcessRunner {
public:
    RawRunResult execute(const RunSpec& spec) const;

    // PATH, HOME, LANG and LC_* from the current environment, plus the
    // interpreter settings every child gets
    static std::vector<std::string> minimal_environment();

    // Look a program up on a PATH-style list. Empty string if not found.
    static std::string resolve_program(const std::string& program, const std::string& search_path);

    // "8", "1.5": how timeouts are shown to the caller
    static std::string format_seconds(int timeout_ms);
};

} // namespace halbox

#endif // halbox_SANDBOX_PROCESS_RUNNER_HPP
