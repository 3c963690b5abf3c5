/*
 * HalBox C++17 - Preflight Analyzer Implementation
 */
#include <halbox/sandbox/preflight.hpp>
#include <halbox/core/logger.hpp>
#include <halbox/core/utils.hpp>

#include <cctype>
#include <regex>

namespace halbox {

// ============================================================================
// PolicyViolation
// ============================================================================

const char* violation_kind_name(ViolationKind kind) {
    switch (kind) {
        case ViolationKind::BLOCKED_IMPORT: return "blocked_import";
        case ViolationKind::BLOCKED_CALL: return "blocked_call";
        default: return "unknown";
    }
}

PolicyViolation::PolicyViolation(ViolationKind k, const std::string& n, int line)
    : line_number(line)
    , kind(k)
    , name(n)
{
    message = std::string("SandboxViolation: ")
            + (k == ViolationKind::BLOCKED_IMPORT ? "blocked import '" : "blocked call '")
            + n + "' (line " + std::to_string(line) + ")";
}

Json PolicyViolation::to_json() const {
    Json j;
    j["message"] = message;
    j["line"] = line_number;
    j["kind"] = violation_kind_name(kind);
    j["name"] = name;
    return j;
}

// ============================================================================
// Matchers
// ============================================================================

namespace {

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string regex_escape(const std::string& s) {
    static const std::string special = "\\^$.|?*+()[]{}";
    std::string out;
    for (char c : s) {
        if (special.find(c) != std::string::npos) out += '\\';
        out += c;
    }
    return out;
}

size_t skip_spaces(const std::string& s, size_t i) {
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) ++i;
    return i;
}

// Reads a dotted name starting at i; returns its first component
std::string read_root(const std::string& s, size_t& i) {
    size_t start = i;
    while (i < s.size() && (is_ident_char(s[i]) || s[i] == '.')) ++i;
    std::string dotted = s.substr(start, i - start);
    size_t dot = dotted.find('.');
    return dot == std::string::npos ? dotted : dotted.substr(0, dot);
}

bool keyword_at(const std::string& s, size_t pos, const std::string& kw) {
    if (s.compare(pos, kw.size(), kw) != 0) return false;
    if (pos > 0 && (is_ident_char(s[pos - 1]) || s[pos - 1] == '.')) return false;
    size_t end = pos + kw.size();
    return end < s.size() && (s[end] == ' ' || s[end] == '\t');
}

// Understands "import a, b.c as d" and "from a.b import c"
bool line_imports(const std::string& line, const std::string& root) {
    for (size_t pos = 0; pos < line.size(); ++pos) {
        if (keyword_at(line, pos, "from")) {
            size_t i = skip_spaces(line, pos + 4);
            if (read_root(line, i) == root) return true;
        } else if (keyword_at(line, pos, "import")) {
            size_t i = pos + 6;
            for (;;) {
                i = skip_spaces(line, i);
                if (read_root(line, i) == root) return true;
                i = skip_spaces(line, i);
                if (keyword_at(line, i, "as")) {
                    i = skip_spaces(line, i + 2);
                    while (i < line.size() && is_ident_char(line[i])) ++i;
                    i = skip_spaces(line, i);
                }
                if (i < line.size() && line[i] == ',') {
                    ++i;
                    continue;
                }
                break;
            }
        }
    }
    return false;
}

bool line_calls(const std::string& line, const std::string& callable) {
    size_t pos = line.find(callable);
    while (pos != std::string::npos) {
        bool start_ok = pos == 0 || (!is_ident_char(line[pos - 1]) && line[pos - 1] != '.');
        if (start_ok) {
            size_t i = skip_spaces(line, pos + callable.size());
            if (i < line.size() && line[i] == '(') return true;
        }
        pos = line.find(callable, pos + 1);
    }
    return false;
}

struct Rule {
    ViolationKind kind;
    std::string name;
    std::regex pattern;
    bool has_regex;
};

std::vector<Rule> compile_rules(const ExecutionProfile& profile) {
    std::vector<Rule> rules;
    auto add = [&rules](ViolationKind kind, const std::string& name, const std::string& expr) {
        Rule rule;
        rule.kind = kind;
        rule.name = name;
        rule.has_regex = false;
        try {
            rule.pattern = std::regex(expr, std::regex::ECMAScript | std::regex::optimize);
            rule.has_regex = true;
        } catch (const std::regex_error& e) {
            LOG_WARN("[Preflight] Pattern for '%s' rejected (%s), using plain matcher",
                     name.c_str(), e.what());
        }
        rules.push_back(std::move(rule));
    };

    for (const auto& m : profile.blocked_imports) {
        add(ViolationKind::BLOCKED_IMPORT, m, "\\b(import|from)\\s+" + regex_escape(m) + "\\b");
    }
    for (const auto& c : profile.blocked_calls) {
        add(ViolationKind::BLOCKED_CALL, c, "(^|[^\\w.])" + regex_escape(c) + "\\s*\\(");
    }
    return rules;
}

bool rule_matches(const Rule& rule, const std::string& line) {
    if (line.find(rule.name) == std::string::npos) {
        return false;
    }
    if (rule.kind == ViolationKind::BLOCKED_IMPORT) {
        // Comma lists are not covered by the regex
        if (line_imports(line, rule.name)) return true;
    }
    if (rule.has_regex && line.size() <= PreflightAnalyzer::MAX_REGEX_LINE) {
        try {
            return std::regex_search(line, rule.pattern);
        } catch (const std::regex_error& e) {
            LOG_DEBUG("[Preflight] regex_search failed on '%s': %s", rule.name.c_str(), e.what());
        }
    }
    return rule.kind == ViolationKind::BLOCKED_CALL && line_calls(line, rule.name);
}

} // anonymous namespace

// ============================================================================
// PreflightAnalyzer
// ============================================================================

std::vector<PolicyViolation> PreflightAnalyzer::scan(const std::string& source,
                                                     const ExecutionProfile& profile) const {
    std::vector<PolicyViolation> violations;
    if (profile.blocked_imports.empty() && profile.blocked_calls.empty()) {
        return violations;
    }

    std::vector<Rule> rules = compile_rules(profile);
    std::vector<std::string> lines = split_lines(source);

    for (size_t i = 0; i < lines.size(); ++i) {
        for (const auto& rule : rules) {
            if (rule_matches(rule, lines[i])) {
                violations.push_back(PolicyViolation(rule.kind, rule.name, static_cast<int>(i + 1)));
            }
        }
    }

    if (!violations.empty()) {
        LOG_INFO("[Preflight] %zu violation(s) under profile '%s', first: %s",
                 violations.size(), profile.name.c_str(), violations.front().message.c_str());
    }
    return violations;
}

} // namespace halbox
