/*
 * HalBox C++17 - Intent Analyzer
 *
 * Keyword heuristic over the user's request. The chosen profile only
 * biases profile resolution; it never relaxes preflight or the wrapper.
 */
#ifndef halbox_SANDBOX_INTENT_HPP
#define halbox_SANDBOX_INTENT_HPP

#include <halbox/core/json.hpp>

#include <string>

namespace halbox {

struct Intent {
    std::string task_type;        // data | network | iot | text | viz | system
    std::string profile;
    std::string expected_output;

    Json to_json() const;
};

class IntentAnalyzer {
public:
    Intent analyze(const std::string& prompt) const;

    static std::string profile_for(const std::string& task_type);
    static std::string expected_output_for(const std::string& task_type);
};

} // namespace halbox

#endif // halbox_SANDBOX_INTENT_HPP
