/*
 * HalBox C++17 - Preflight Analyzer
 *
 * Line-oriented static scan of untrusted source for blocked imports and
 * blocked call sites. It is a fast reject, not a proof: the execution
 * wrapper enforces the same profile at runtime.
 */
#ifndef halbox_SANDBOX_PREFLIGHT_HPP
#define halbox_SANDBOX_PREFLIGHT_HPP

#include <halbox/core/json.hpp>
#include <halbox/sandbox/policy_registry.hpp>

#include <string>
#include <vector>

namespace halbox {

enum class ViolationKind {
    BLOCKED_IMPORT,
    BLOCKED_CALL
};

const char* violation_kind_name(ViolationKind kind);

struct PolicyViolation {
    std::string message;
    int line_number;        // 1-based
    ViolationKind kind;
    std::string name;       // module root or callable

    PolicyViolation() : line_number(0), kind(ViolationKind::BLOCKED_IMPORT) {}
    PolicyViolation(ViolationKind k, const std::string& n, int line);

    Json to_json() const;
};

class PreflightAnalyzer {
public:
    // Deterministic for a given (source, profile). Never throws.
    std::vector<PolicyViolation> scan(const std::string& source,
                                      const ExecutionProfile& profile) const;

    // Longer lines skip the regex engine and use the plain matcher
    static constexpr size_t MAX_REGEX_LINE = 4096;
};

} // namespace halbox

#endif // halbox_SANDBOX_PREFLIGHT_HPP
