/*
 * HalBox C++17 - Code Sandbox Implementation
 */
#include <halbox/sandbox/code_sandbox.hpp>
#include <halbox/sandbox/filesystem_jail.hpp>
#include <halbox/core/logger.hpp>
#include <halbox/core/utils.hpp>

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <sys/stat.h>
#include <unistd.h>

namespace halbox {

// ============================================================================
// ExecutionRequest / SandboxPaths
// ============================================================================

ExecutionRequest ExecutionRequest::snippet(const std::string& code,
                                           const std::string& profile,
                                           const std::string& intent_prompt) {
    ExecutionRequest r;
    r.kind = SourceKind::SNIPPET;
    r.source_text = code;
    r.profile = profile;
    r.intent_prompt = intent_prompt;
    return r;
}

ExecutionRequest ExecutionRequest::file(const std::string& path, const std::string& profile) {
    ExecutionRequest r;
    r.kind = SourceKind::FILE;
    r.path = path;
    r.profile = profile;
    return r;
}

SandboxPaths SandboxPaths::resolve(const std::string& config_file, const std::string& data_dir) {
    std::string home = home_directory();

    SandboxPaths p;
    p.config_file = config_file.empty()
        ? join_path(home, ".config/halbox/sandbox.json")
        : expand_user(config_file);
    p.data_dir = data_dir.empty()
        ? join_path(home, ".local/share/halbox")
        : expand_user(data_dir);
    p.log_dir = join_path(p.data_dir, "logs");
    p.tmp_dir = join_path(p.data_dir, "tmp");
    p.event_log = join_path(p.log_dir, "code_exec.log");
    p.failure_log = join_path(p.log_dir, "failures.jsonl");
    return p;
}

// ============================================================================
// CodeSandbox
// ============================================================================

namespace {

const char* source_name(SourceKind kind) {
    return kind == SourceKind::FILE ? "file" : "snippet";
}

// Absolute form of a possibly relative path, without touching the filesystem
std::string absolute_path(const std::string& path) {
    if (!path.empty() && path[0] == '/') return normalize_path(path);
    char cwd[PATH_MAX];
    if (getcwd(cwd, sizeof(cwd)) == NULL) {
        return path;
    }
    return normalize_path(join_path(cwd, path));
}

} // anonymous namespace

CodeSandbox::CodeSandbox()
    : paths_(SandboxPaths::resolve())
{}

bool CodeSandbox::init(const std::string& config_file, const std::string& data_dir) {
    paths_ = SandboxPaths::resolve(config_file, data_dir);

    if (!ensure_directory(paths_.tmp_dir)) {
        LOG_ERROR("[CodeSandbox] Failed to create scratch directory %s: %s",
                  paths_.tmp_dir.c_str(), strerror(errno));
        return false;
    }
    if (!ensure_directory(paths_.log_dir)) {
        // Recording is best-effort; runs still work without it
        LOG_WARN("[CodeSandbox] Failed to create log directory %s: %s",
                 paths_.log_dir.c_str(), strerror(errno));
    }

    event_log_.set_path(paths_.event_log);
    failure_journal_.set_path(paths_.failure_log);

    registry_.load(paths_.config_file);

    LOG_INFO("[CodeSandbox] Ready (config %s, scratch %s, %zu profiles, timeout %ds)",
             paths_.config_file.c_str(), paths_.tmp_dir.c_str(),
             registry_.profile_names().size(), registry_.exec_timeout_sec());
    return true;
}

EnvironmentDescriptor CodeSandbox::detect_environment() const {
    return detector_.detect();
}

ExecutionResult CodeSandbox::run_snippet(const std::string& code,
                                         const std::string& profile_hint,
                                         const std::string& intent_prompt) const {
    return run(ExecutionRequest::snippet(code, profile_hint, intent_prompt));
}

ExecutionResult CodeSandbox::run_file(const std::string& path, const std::string& profile_hint) const {
    return run(ExecutionRequest::file(path, profile_hint));
}

ExecutionResult CodeSandbox::run(const ExecutionRequest& request) const {
    EnvironmentDescriptor env = detector_.detect();
    const char* src = source_name(request.kind);

    Intent intent;
    if (!request.intent_prompt.empty()) {
        intent = intent_analyzer_.analyze(request.intent_prompt);
        publish("code.intent", intent.to_json());
    }

    ExecutionProfile profile = registry_.resolve_profile(request.profile, env, intent.profile);

    std::string source_text;
    std::string target_path;

    if (request.kind == SourceKind::FILE) {
        std::string requested = absolute_path(expand_user(request.path));
        Json start = {{"src", src}, {"profile", profile.name}, {"path", requested}};
        publish("code.run.start", start);

        char resolved[PATH_MAX];
        struct stat st;
        bool found = realpath(requested.c_str(), resolved) != NULL &&
                     stat(resolved, &st) == 0 && S_ISREG(st.st_mode) &&
                     read_file(resolved, source_text);
        if (!found) {
            LOG_WARN("[CodeSandbox] File not found: %s", requested.c_str());
            ResultClassifier classifier(registry_.config().get_bool("validate_output", true));
            ExecutionResult result = classifier.not_found(requested, profile.name, env);
            finish(result, "");
            return result;
        }
        target_path = resolved;
    } else {
        source_text = request.source_text;
        publish("code.run.start", {{"src", src}, {"profile", profile.name}});
    }

    ExecutionResult result = execute(request, source_text, target_path, profile, env);
    result.source = src;
    if (request.kind == SourceKind::FILE) {
        result.path = target_path;
    }
    result.intent = intent.task_type;

    finish(result, source_text);
    return result;
}

ExecutionResult CodeSandbox::execute(const ExecutionRequest& request,
                                     const std::string& source_text,
                                     const std::string& target_path,
                                     const ExecutionProfile& profile,
                                     const EnvironmentDescriptor& env) const {
    ResultClassifier classifier(registry_.config().get_bool("validate_output", true));

    std::vector<PolicyViolation> violations = preflight_.scan(source_text, profile);
    if (!violations.empty()) {
        return classifier.reject(violations, profile, env);
    }

    try {
        // Both artifacts are unlinked when this scope ends, whatever happens
        std::unique_ptr<TempArtifact> user_code;
        std::string target = target_path;
        if (request.kind == SourceKind::SNIPPET) {
            user_code.reset(new TempArtifact(paths_.tmp_dir, "user", source_text));
            target = user_code->path();
        }
        TempArtifact wrapper(paths_.tmp_dir, "wrap", wrapper_builder_.build(target, profile));

        RunSpec spec = make_run_spec(wrapper.path());
        if (request.kind == SourceKind::SNIPPET) {
            spec.working_dir = paths_.tmp_dir;
        }

        FilesystemJail jail;
        if (registry_.config().get_bool("landlock", false)) {
            std::string interpreter = ProcessRunner::resolve_program(
                spec.program, getenv("PATH") ? getenv("PATH") : "");
            jail.allow_write(paths_.tmp_dir);
            jail.allow_read(dirname_of(target));
            if (!interpreter.empty()) {
                // <prefix>/bin/python3 -> <prefix>
                jail.allow_read(dirname_of(dirname_of(interpreter)));
            }
            for (const auto& extra : registry_.config().get_string_array("landlock_paths")) {
                jail.allow_write(expand_user(extra));
            }
            if (jail.prepare()) {
                spec.jail = &jail;
            } else {
                LOG_WARN("[CodeSandbox] Running without filesystem jail: %s", jail.last_error().c_str());
            }
        }

        LOG_INFO("[CodeSandbox] Running %s under profile '%s'", target.c_str(), profile.name.c_str());
        RawRunResult raw = runner_.execute(spec);
        return classifier.classify(raw, profile, env);
    } catch (const StorageError& e) {
        LOG_ERROR("[CodeSandbox] Storage failure: %s", e.what());
        publish("code.error", {{"profile", profile.name}, {"error", e.what()}});
        throw;
    } catch (const std::exception& e) {
        LOG_ERROR("[CodeSandbox] Internal error: %s", e.what());
        RawRunResult raw;
        raw.return_code = 1;
        raw.stderr_text = std::string("Internal error: ") + e.what();
        return classifier.classify(raw, profile, env);
    }
}

RunSpec CodeSandbox::make_run_spec(const std::string& wrapper_path) const {
    const Config& cfg = registry_.config();
    int timeout_sec = registry_.exec_timeout_sec();

    RunSpec spec;
    spec.program = cfg.get_string("interpreter", "python3");
    spec.args = WrapperBuilder::interpreter_args(wrapper_path);
    spec.timeout_ms = timeout_sec * 1000;

    int64_t memory_mb = cfg.get_int("memory_limit_mb", 512);
    spec.limits.memory_bytes = memory_mb > 0 ? static_cast<uint64_t>(memory_mb) * 1024 * 1024 : 0;

    // CPU ceiling defaults to just past the wall-clock deadline
    int64_t cpu = cfg.get_int("cpu_limit_sec", 0);
    spec.limits.cpu_seconds = cpu > 0 ? static_cast<int>(cpu) : timeout_sec + 1;

    int64_t max_output = cfg.get_int("max_output_bytes", 1048576);
    if (max_output > 0) {
        spec.max_output_bytes = static_cast<size_t>(max_output);
    }
    return spec;
}

void CodeSandbox::finish(const ExecutionResult& result, const std::string& source_text) const {
    if (!event_log_.record(result)) {
        LOG_DEBUG("[CodeSandbox] Event not recorded (%s)", event_log_.path().c_str());
    }
    if (result.return_code != 0 && result.outcome != Outcome::NOT_FOUND) {
        if (!failure_journal_.record_failure(result, source_text)) {
            LOG_DEBUG("[CodeSandbox] Failure not journaled (%s)", failure_journal_.path().c_str());
        }
    }

    Json done = {
        {"src", result.source},
        {"profile", result.profile_used},
        {"rc", result.return_code},
        {"ok", result.ok},
        {"outcome", outcome_name(result.outcome)},
        {"duration_ms", result.duration_ms}
    };
    publish("code.run.done", done);

    if (!result.ok) {
        Json err = {
            {"src", result.source},
            {"profile", result.profile_used},
            {"rc", result.return_code},
            {"stderr", sanitize_utf8(truncate_safe(result.stderr_text, 500))},
            {"suggestion", result.suggestion}
        };
        publish("code.error", err);
    }

    LOG_INFO("[CodeSandbox] %s %s rc=%d in %lld ms", result.source.c_str(),
             outcome_name(result.outcome), result.return_code,
             static_cast<long long>(result.duration_ms));
}

void CodeSandbox::publish(const std::string& topic, const Json& payload) const {
    if (!callback_) return;
    try {
        callback_(topic, payload);
    } catch (const std::exception& e) {
        LOG_WARN("[CodeSandbox] Event callback for %s threw: %s", topic.c_str(), e.what());
    }
}

} // namespace halbox
