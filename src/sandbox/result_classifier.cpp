/*
 * HalBox C++17 - Result Classifier Implementation
 */
#include <halbox/sandbox/result_classifier.hpp>
#include <halbox/core/utils.hpp>

#include <algorithm>
#include <cctype>

namespace halbox {

const char* outcome_name(Outcome outcome) {
    switch (outcome) {
        case Outcome::SUCCESS: return "success";
        case Outcome::POLICY_VIOLATION: return "policy_violation";
        case Outcome::TIMEOUT: return "timeout";
        case Outcome::RUNTIME_FAILURE: return "runtime_failure";
        case Outcome::NOT_FOUND: return "not_found";
        default: return "unknown";
    }
}

// ============================================================================
// ExecutionResult
// ============================================================================

Json ExecutionResult::to_json() const {
    Json j;
    j["ok"] = ok;
    j["stdout"] = sanitize_utf8(stdout_text);
    j["stderr"] = sanitize_utf8(stderr_text);
    j["returncode"] = return_code;
    j["duration_ms"] = duration_ms;
    j["profile"] = profile_used;
    j["env"] = environment.to_json();
    j["outcome"] = outcome_name(outcome);
    j["src"] = source;
    if (!path.empty()) j["path"] = sanitize_utf8(path);

    j["violations"] = Json::array();
    for (const auto& v : violations) {
        j["violations"].push_back(v.to_json());
    }
    if (validated) j["valid"] = valid;
    if (!suggestion.empty()) j["suggestion"] = suggestion;
    if (!intent.empty()) j["intent"] = intent;
    if (output_truncated) j["truncated"] = true;
    return j;
}

// ============================================================================
// ResultClassifier
// ============================================================================

namespace {

struct HintRule {
    const char* markers[3];
    const char* hint;
};

const HintRule HINTS[] = {
    { { "SyntaxError", "IndentationError", NULL },
      "Check the syntax: a colon, bracket or indentation is likely wrong." },
    { { "ModuleNotFoundError", NULL, NULL },
      "A library is missing: install it or check whether the import is blocked." },
    { { "SandboxViolation", NULL, NULL },
      "The code uses a module or call the active profile blocks; rewrite it without it." },
    { { "Timeout", NULL, NULL },
      "The code ran too long: look for an endless loop or reduce the work." },
    { { "MemoryError", NULL, NULL },
      "The code hit the memory ceiling: process the data in smaller pieces." },
};

const char* DEFAULT_HINT = "Unknown error: check the sandbox logs.";

// Counts tokens of the form [-+]?[0-9]*\.?[0-9]+
size_t count_numbers(const std::string& s, std::vector<std::string>& first, size_t keep) {
    size_t count = 0;
    size_t i = 0;
    auto digit = [&s](size_t k) { return k < s.size() && std::isdigit(static_cast<unsigned char>(s[k])); };
    while (i < s.size()) {
        size_t start = i;
        size_t j = i;
        if (s[j] == '-' || s[j] == '+') ++j;
        size_t int_start = j;
        while (digit(j)) ++j;
        bool has_int = j > int_start;
        if (j < s.size() && s[j] == '.' && digit(j + 1)) {
            ++j;
            while (digit(j)) ++j;
        } else if (!has_int) {
            ++i;
            continue;
        }
        ++count;
        if (first.size() < keep) first.push_back(s.substr(start, j - start));
        i = j;
    }
    return count;
}

bool has_ascii_art(const std::string& s) {
    int run = 0;
    for (char c : s) {
        if (c == '#' || c == '*' || c == '_' || c == '-') {
            if (++run >= 5) return true;
        } else {
            run = 0;
        }
    }
    return false;
}

std::string first_lines(const std::vector<std::string>& lines, size_t n) {
    std::vector<std::string> head(lines.begin(), lines.begin() + std::min(n, lines.size()));
    return join(head, "\n");
}

} // anonymous namespace

std::string ResultClassifier::suggest_fix(const std::string& stderr_text) {
    for (const auto& rule : HINTS) {
        for (int i = 0; i < 3 && rule.markers[i] != NULL; ++i) {
            if (stderr_text.find(rule.markers[i]) != std::string::npos) {
                return rule.hint;
            }
        }
    }
    return DEFAULT_HINT;
}

void ResultClassifier::finish(ExecutionResult& result) const {
    result.ok = result.return_code == 0 && result.violations.empty();

    if (validate_output_) {
        result.validated = true;
        result.valid = result.ok && !trim(result.stdout_text).empty();
    }
    if (!result.ok) {
        result.suggestion = suggest_fix(result.stderr_text);
    }
}

ExecutionResult ResultClassifier::reject(const std::vector<PolicyViolation>& violations,
                                         const ExecutionProfile& profile,
                                         const EnvironmentDescriptor& env) const {
    ExecutionResult result;
    result.violations = violations;
    result.return_code = POLICY_EXIT_CODE;
    result.outcome = Outcome::POLICY_VIOLATION;
    result.profile_used = profile.name;
    result.environment = env;

    std::vector<std::string> messages;
    for (const auto& v : violations) {
        messages.push_back(v.message);
    }
    result.stderr_text = join(messages, "\n");

    finish(result);
    return result;
}

ExecutionResult ResultClassifier::classify(const RawRunResult& raw,
                                           const ExecutionProfile& profile,
                                           const EnvironmentDescriptor& env) const {
    ExecutionResult result;
    result.stdout_text = raw.stdout_text;
    result.stderr_text = raw.stderr_text;
    result.return_code = raw.return_code;
    result.duration_ms = raw.duration_ms;
    result.profile_used = profile.name;
    result.environment = env;
    result.output_truncated = raw.stdout_truncated || raw.stderr_truncated;

    if (raw.return_code == 0) {
        result.outcome = Outcome::SUCCESS;
    } else if (raw.timed_out || raw.return_code == TIMEOUT_EXIT_CODE) {
        result.outcome = Outcome::TIMEOUT;
    } else {
        result.outcome = Outcome::RUNTIME_FAILURE;
    }

    finish(result);
    return result;
}

ExecutionResult ResultClassifier::not_found(const std::string& path,
                                            const std::string& profile_name,
                                            const EnvironmentDescriptor& env) const {
    ExecutionResult result;
    result.return_code = POLICY_EXIT_CODE;
    result.outcome = Outcome::NOT_FOUND;
    result.stderr_text = "File not found: " + path;
    result.path = path;
    result.profile_used = profile_name;
    result.environment = env;
    result.source = "file";
    result.ok = false;
    if (validate_output_) {
        result.validated = true;
        result.valid = false;
    }
    result.suggestion = "Check the path: the file does not exist or cannot be read.";
    return result;
}

std::string ResultClassifier::summarize(const ExecutionResult& result) {
    if (!result.ok) {
        std::string err = trim(result.stderr_text);
        if (err.empty()) {
            return "Execution failed with exit code " + std::to_string(result.return_code) + ".";
        }
        return "Execution failed:\n" + truncate_safe(err, 500);
    }

    std::string out = trim(result.stdout_text);
    if (out.empty()) {
        return "The program finished without writing to stdout.";
    }

    std::vector<std::string> samples;
    size_t numbers = count_numbers(out, samples, 5);
    if (numbers > 3) {
        return "Numeric data (" + std::to_string(numbers) + " values), e.g.: " + join(samples, ", ") + "...";
    }

    std::vector<std::string> lines = split_lines(out);
    if (has_ascii_art(out)) {
        return "ASCII output:\n" + first_lines(lines, 15);
    }
    if (lines.size() <= 5) {
        return "Text result: " + join(lines, " ");
    }
    return "Longer text, first lines:\n" + first_lines(lines, 10);
}

} // namespace halbox
