/*
 * HalBox C++17 - Result Classifier
 *
 * Turns a raw process result (or a preflight rejection) into the verdict
 * returned to the caller, with an output sanity check, a remediation hint
 * and a short human-readable summary.
 */
#ifndef halbox_SANDBOX_RESULT_CLASSIFIER_HPP
#define halbox_SANDBOX_RESULT_CLASSIFIER_HPP

#include <halbox/core/json.hpp>
#include <halbox/sandbox/environment.hpp>
#include <halbox/sandbox/preflight.hpp>
#include <halbox/sandbox/process_runner.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace halbox {

// Exit code reported for policy violations and missing files
const int POLICY_EXIT_CODE = 2;

enum class Outcome {
    SUCCESS,
    POLICY_VIOLATION,
    TIMEOUT,
    RUNTIME_FAILURE,
    NOT_FOUND
};

const char* outcome_name(Outcome outcome);

struct ExecutionResult {
    bool ok;
    std::string stdout_text;
    std::string stderr_text;
    int return_code;
    int64_t duration_ms;
    std::string profile_used;
    EnvironmentDescriptor environment;
    std::vector<PolicyViolation> violations;

    Outcome outcome;
    std::string source;         // "snippet" | "file"
    std::string path;           // file runs only
    bool validated;             // output heuristic was applied
    bool valid;
    std::string suggestion;     // remediation hint for failures
    std::string intent;         // task type when an intent prompt was given
    bool output_truncated;

    ExecutionResult()
        : ok(false)
        , return_code(0)
        , duration_ms(0)
        , outcome(Outcome::RUNTIME_FAILURE)
        , validated(false)
        , valid(false)
        , output_truncated(false) {}

    Json to_json() const;
};

class ResultClassifier {
public:
    explicit ResultClassifier(bool validate_output = true) : validate_output_(validate_output) {}

    // Preflight rejection: the runner was never invoked
    ExecutionResult reject(const std::vector<PolicyViolation>& violations,
                           const ExecutionProfile& profile,
                           const EnvironmentDescriptor& env) const;

    ExecutionResult classify(const RawRunResult& raw,
                             const ExecutionProfile& profile,
                             const EnvironmentDescriptor& env) const;

    ExecutionResult not_found(const std::string& path,
                              const std::string& profile_name,
                              const EnvironmentDescriptor& env) const;

    // First matching marker in stderr picks the hint
    static std::string suggest_fix(const std::string& stderr_text);

    // One paragraph describing what the run produced
    static std::string summarize(const ExecutionResult& result);

private:
    void finish(ExecutionResult& result) const;

    bool validate_output_;
};

} // namespace halbox

#endif // halbox_SANDBOX_RESULT_CLASSIFIER_HPP
