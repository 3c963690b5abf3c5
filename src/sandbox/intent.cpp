/*
 * HalBox C++17 - Intent Analyzer Implementation
 */
#include <halbox/sandbox/intent.hpp>
#include <halbox/core/logger.hpp>
#include <halbox/core/utils.hpp>

namespace halbox {

namespace {

struct TaskRule {
    const char* task_type;
    const char* keywords[10];
};

// First matching rule wins. Keyword lists are NULL-terminated and include
// the Polish vocabulary the agent's users type.
const TaskRule TASK_RULES[] = {
    { "data",    { "csv", "xlsx", "pandas", "dataframe", "analysis", "analiza", "wykres", NULL } },
    { "network", { "http", "url", "api", "network", "download", "pobierz", "sie\xc4\x87", NULL } },
    { "iot",     { "mqtt", "shelly", "sensor", "gpio", "iot", NULL } },
    { "text",    { "ascii", "string", "markdown", "tekst", NULL } },
    { "viz",     { "matplotlib", "plot", "image", "chart", NULL } },
    { "system",  { "system", "bash", "os.system", NULL } },
};

} // anonymous namespace

Json Intent::to_json() const {
    Json j;
    j["type"] = task_type;
    j["profile"] = profile;
    j["expected_output"] = expected_output;
    return j;
}

Intent IntentAnalyzer::analyze(const std::string& prompt) const {
    std::string p = to_lower(prompt);

    Intent intent;
    intent.task_type = "text";
    bool matched = false;
    for (const auto& rule : TASK_RULES) {
        for (int i = 0; rule.keywords[i] != NULL; ++i) {
            if (p.find(rule.keywords[i]) != std::string::npos) {
                intent.task_type = rule.task_type;
                matched = true;
                break;
            }
        }
        if (matched) break;
    }

    intent.profile = profile_for(intent.task_type);
    intent.expected_output = expected_output_for(intent.task_type);

    LOG_DEBUG("[Intent] type=%s profile=%s", intent.task_type.c_str(), intent.profile.c_str());
    return intent;
}

std::string IntentAnalyzer::profile_for(const std::string& task_type) {
    if (task_type == "data") return "analysis";
    if (task_type == "iot") return "iot";
    return "headless";
}

std::string IntentAnalyzer::expected_output_for(const std::string& task_type) {
    if (task_type == "data") return "CSV file or numeric data";
    if (task_type == "network") return "fetched content or response status";
    if (task_type == "iot") return "action confirmation or device status";
    if (task_type == "viz") return "ASCII chart or saved image";
    if (task_type == "text") return "text or processed string";
    if (task_type == "system") return "log or system command result";
    return "text or general data";
}

} // namespace halbox
