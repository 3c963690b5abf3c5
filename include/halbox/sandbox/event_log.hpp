/*
 * HalBox C++17 - Event Log and Failure Journal
 *
 * Both are append-only JSONL files. Each record goes out in a single
 * write(2) on an O_APPEND descriptor, so lines from concurrent runs never
 * interleave. Recording is best-effort: a failed append is logged and
 * never changes the result handed to the caller.
 */
#ifndef halbox_SANDBOX_EVENT_LOG_HPP
#define halbox_SANDBOX_EVENT_LOG_HPP

#include <halbox/core/json.hpp>
#include <halbox/sandbox/result_classifier.hpp>

#include <string>
#include <vector>

namespace halbox {

// Append one compact JSON line to path, creating parent directories
bool append_json_line(const std::string& path, const Json& record);

class EventLog {
public:
    explicit EventLog(const std::string& path = "") : path_(path) {}

    void set_path(const std::string& path) { path_ = path; }
    const std::string& path() const { return path_; }

    static Json make_record(const ExecutionResult& result);

    // One line per run: ts, src, path, profile, returncode, sizes, duration
    bool record(const ExecutionResult& result) const;

private:
    std::string path_;
};

// Failed runs, kept for an external repair agent
class FailureJournal {
public:
    explicit FailureJournal(const std::string& path = "") : path_(path) {}

    void set_path(const std::string& path) { path_ = path; }
    const std::string& path() const { return path_; }

    static constexpr size_t MAX_STDERR = 4000;

    bool record_failure(const ExecutionResult& result, const std::string& source_text) const;

    // Last `limit` records, oldest first. Unparsable lines are skipped.
    std::vector<Json> recent_failures(size_t limit) const;

private:
    std::string path_;
};

} // namespace halbox

#endif // halbox_SANDBOX_EVENT_LOG_HPP
