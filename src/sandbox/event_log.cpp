/*
 * HalBox C++17 - Event Log and Failure Journal Implementation
 */
#include <halbox/sandbox/event_log.hpp>
#include <halbox/core/logger.hpp>
#include <halbox/core/utils.hpp>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace halbox {

bool append_json_line(const std::string& path, const Json& record) {
    if (path.empty()) return false;

    std::string line;
    try {
        line = record.dump(-1, ' ', false, Json::error_handler_t::replace);
    } catch (const Json::exception& e) {
        LOG_DEBUG("[EventLog] Cannot serialize record: %s", e.what());
        return false;
    }
    line += '\n';

    if (!create_parent_directory(path)) {
        LOG_DEBUG("[EventLog] Cannot create directory for %s", path.c_str());
        return false;
    }

    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0600);
    if (fd < 0) {
        LOG_DEBUG("[EventLog] Cannot open %s: %s", path.c_str(), strerror(errno));
        return false;
    }

    ssize_t n;
    do {
        n = write(fd, line.data(), line.size());
    } while (n < 0 && errno == EINTR);

    bool ok = n == static_cast<ssize_t>(line.size());
    if (!ok) {
        LOG_DEBUG("[EventLog] Short write to %s: %s", path.c_str(), n < 0 ? strerror(errno) : "partial");
    }
    if (close(fd) != 0) {
        LOG_DEBUG("[EventLog] close(%s) failed: %s", path.c_str(), strerror(errno));
        ok = false;
    }
    return ok;
}

// ============================================================================
// EventLog
// ============================================================================

Json EventLog::make_record(const ExecutionResult& result) {
    Json rec;
    rec["ts"] = local_timestamp();
    rec["src"] = result.source;
    if (!result.path.empty()) rec["path"] = result.path;
    rec["profile"] = result.profile_used;
    rec["returncode"] = result.return_code;
    rec["outcome"] = outcome_name(result.outcome);
    rec["stdout_len"] = result.stdout_text.size();
    rec["stderr_len"] = result.stderr_text.size();
    rec["duration_ms"] = result.duration_ms;
    return rec;
}

bool EventLog::record(const ExecutionResult& result) const {
    return append_json_line(path_, make_record(result));
}

// ============================================================================
// FailureJournal
// ============================================================================

bool FailureJournal::record_failure(const ExecutionResult& result, const std::string& source_text) const {
    if (result.return_code == 0) return false;

    Json rec;
    rec["ts"] = local_timestamp();
    rec["src"] = result.source;
    rec["path"] = result.path;
    rec["source_sha256"] = sha256_hex(source_text);
    rec["stderr"] = truncate_safe(result.stderr_text, MAX_STDERR);
    rec["returncode"] = result.return_code;
    rec["meta"] = {
        {"profile", result.profile_used},
        {"outcome", outcome_name(result.outcome)},
        {"env", result.environment.to_json()}
    };

    bool ok = append_json_line(path_, rec);
    if (ok) {
        LOG_DEBUG("[FailureJournal] Recorded %s failure rc=%d", result.source.c_str(), result.return_code);
    }
    return ok;
}

std::vector<Json> FailureJournal::recent_failures(size_t limit) const {
    std::vector<Json> records;
    std::string text;
    if (limit == 0 || !read_file(path_, text)) {
        return records;
    }

    std::vector<std::string> lines = split_lines(text);
    size_t start = lines.size() > limit ? lines.size() - limit : 0;
    for (size_t i = start; i < lines.size(); ++i) {
        if (trim(lines[i]).empty()) continue;
        Json rec = Json::parse(lines[i], nullptr, false);
        if (rec.is_discarded()) {
            LOG_DEBUG("[FailureJournal] Skipping unparsable line %zu", i + 1);
            continue;
        }
        records.push_back(rec);
    }
    return records;
}

} // namespace halbox
