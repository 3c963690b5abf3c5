/*
 * HalBox C++17 - Code Sandbox
 *
 * Entry point for running untrusted program text:
 *
 *   environment -> profile -> preflight -> wrapper -> child process -> verdict
 *
 * Every request gets a fresh environment snapshot, its own temporary
 * artifacts and its own child. Nothing mutable is shared between requests,
 * so one instance can serve concurrent callers once init() has returned.
 */
#ifndef halbox_SANDBOX_CODE_SANDBOX_HPP
#define halbox_SANDBOX_CODE_SANDBOX_HPP

#include <halbox/core/json.hpp>
#include <halbox/sandbox/environment.hpp>
#include <halbox/sandbox/event_log.hpp>
#include <halbox/sandbox/intent.hpp>
#include <halbox/sandbox/policy_registry.hpp>
#include <halbox/sandbox/preflight.hpp>
#include <halbox/sandbox/process_runner.hpp>
#include <halbox/sandbox/result_classifier.hpp>
#include <halbox/sandbox/wrapper_builder.hpp>

#include <functional>
#include <string>

namespace halbox {

enum class SourceKind {
    SNIPPET,
    FILE
};

struct ExecutionRequest {
    SourceKind kind;
    std::string source_text;    // SNIPPET
    std::string path;           // FILE
    std::string profile;        // optional override
    std::string intent_prompt;  // optional, biases profile choice only

    ExecutionRequest() : kind(SourceKind::SNIPPET) {}

    static ExecutionRequest snippet(const std::string& code,
                                    const std::string& profile = "",
                                    const std::string& intent_prompt = "");
    static ExecutionRequest file(const std::string& path, const std::string& profile = "");
};

// Receives "code.intent", "code.run.start", "code.run.done" and "code.error"
typedef std::function<void(const std::string& topic, const Json& payload)> EventCallback;

struct SandboxPaths {
    std::string config_file;    // ~/.config/halbox/sandbox.json
    std::string data_dir;       // ~/.local/share/halbox
    std::string log_dir;        // <data_dir>/logs
    std::string tmp_dir;        // <data_dir>/tmp
    std::string event_log;      // <log_dir>/code_exec.log
    std::string failure_log;    // <log_dir>/failures.jsonl

    static SandboxPaths resolve(const std::string& config_file = "", const std::string& data_dir = "");
};

class CodeSandbox {
public:
    CodeSandbox();

    // Create the data directories and load the policy file. Returns false
    // only when the scratch directory cannot be created.
    bool init(const std::string& config_file = "", const std::string& data_dir = "");

    ExecutionResult run_snippet(const std::string& code,
                                const std::string& profile_hint = "",
                                const std::string& intent_prompt = "") const;

    ExecutionResult run_file(const std::string& path, const std::string& profile_hint = "") const;

    // Throws StorageError when an artifact cannot be written
    ExecutionResult run(const ExecutionRequest& request) const;

    EnvironmentDescriptor detect_environment() const;

    void set_event_callback(EventCallback callback) { callback_ = callback; }

    const PolicyRegistry& registry() const { return registry_; }
    PolicyRegistry& registry() { return registry_; }
    const SandboxPaths& paths() const { return paths_; }
    const EventLog& event_log() const { return event_log_; }
    const FailureJournal& failure_journal() const { return failure_journal_; }

private:
    ExecutionResult execute(const ExecutionRequest& request,
                            const std::string& source_text,
                            const std::string& target_path,
                            const ExecutionProfile& profile,
                            const EnvironmentDescriptor& env) const;

    RunSpec make_run_spec(const std::string& wrapper_path) const;
    void finish(const ExecutionResult& result, const std::string& source_text) const;
    void publish(const std::string& topic, const Json& payload) const;

    SandboxPaths paths_;
    PolicyRegistry registry_;
    EnvironmentDetector detector_;
    IntentAnalyzer intent_analyzer_;
    PreflightAnalyzer preflight_;
    WrapperBuilder wrapper_builder_;
    ProcessRunner runner_;
    EventLog event_log_;
    FailureJournal failure_journal_;
    EventCallback callback_;
};

} // namespace halbox

#endif // halbox_SANDBOX_CODE_SANDBOX_HPP
