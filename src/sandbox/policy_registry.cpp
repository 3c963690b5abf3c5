/*
 * HalBox C++17 - Policy Registry Implementation
 */
#include <halbox/sandbox/policy_registry.hpp>
#include <halbox/core/logger.hpp>

#include <cerrno>
#include <cstring>
#include <sys/stat.h>

namespace halbox {

// ============================================================================
// ExecutionProfile
// ============================================================================

Json ExecutionProfile::to_json() const {
    Json j;
    j["name"] = name;
    j["blocked_imports"] = Json::array();
    for (const auto& m : blocked_imports) j["blocked_imports"].push_back(m);
    j["blocked_calls"] = Json::array();
    for (const auto& c : blocked_calls) j["blocked_calls"].push_back(c);
    return j;
}

// ============================================================================
// PolicyRegistry
// ============================================================================

namespace {

const int DEFAULT_EXEC_TIMEOUT_SEC = 8;
const int DEFAULT_TOKEN_BUDGET = 2000;

// Keeps the string members of a JSON list, dropping the rest
std::set<std::string> string_set(const Json& list, const std::string& where) {
    std::set<std::string> out;
    if (!list.is_array()) {
        LOG_WARN("[PolicyRegistry] %s is not a list, treating as empty", where.c_str());
        return out;
    }
    for (const auto& item : list) {
        if (item.is_string() && !item.get<std::string>().empty()) {
            out.insert(item.get<std::string>());
        } else {
            LOG_WARN("[PolicyRegistry] Ignoring non-string entry %s in %s",
                     item.dump().c_str(), where.c_str());
        }
    }
    return out;
}

} // anonymous namespace

PolicyRegistry::PolicyRegistry() {
    load_json(Json::object());
}

Json PolicyRegistry::default_config() {
    Json network_and_gui = Json::array({"matplotlib", "tkinter", "pygame", "requests", "socket"});

    Json cfg;
    cfg["exec_timeout_sec"] = DEFAULT_EXEC_TIMEOUT_SEC;
    cfg["gen_timeout_sec"] = 20;
    cfg["token_budget"] = DEFAULT_TOKEN_BUDGET;
    cfg["profile"] = "headless";
    cfg["policy_overrides"] = {
        {"headless", {
            {"blocked_imports", network_and_gui},
            {"blocked_calls", Json::array({"os.system"})}
        }},
        {"iot", {
            {"blocked_imports", network_and_gui},
            {"blocked_calls", Json::array({"os.system"})}
        }},
        {"analysis", {
            {"blocked_imports", Json::array({"tkinter", "pygame", "socket"})},
            {"blocked_calls", Json::array({"os.system"})}
        }}
    };
    cfg["interpreter"] = "python3";
    cfg["memory_limit_mb"] = 512;
    cfg["cpu_limit_sec"] = 0;
    cfg["max_output_bytes"] = 1048576;
    cfg["validate_output"] = true;
    cfg["landlock"] = false;
    cfg["landlock_paths"] = Json::array();
    cfg["log_level"] = "warn";
    return cfg;
}

bool PolicyRegistry::load(const std::string& path) {
    path_ = path;
    last_error_.clear();

    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        load_json(Json::object());
        if (config_.save_file(path)) {
            LOG_INFO("[PolicyRegistry] Created default config at %s", path.c_str());
        } else {
            LOG_WARN("[PolicyRegistry] Could not write default config to %s (%s), using defaults in memory",
                     path.c_str(), strerror(errno));
        }
        return true;
    }

    Config file_cfg;
    if (!file_cfg.load_file(path)) {
        last_error_ = "ConfigurationError: " + file_cfg.last_error();
        LOG_ERROR("[PolicyRegistry] %s; using built-in defaults", last_error_.c_str());
        load_json(Json::object());
        return false;
    }

    load_json(file_cfg.data());
    LOG_INFO("[PolicyRegistry] Loaded %zu profiles from %s", profiles_.size(), path.c_str());
    return true;
}

void PolicyRegistry::load_json(const Json& overlay) {
    Json merged = default_config();
    if (overlay.is_object()) {
        deep_merge(merged, overlay);
    }
    config_ = Config(merged);
    build_profiles();
}

void PolicyRegistry::build_profiles() {
    profiles_.clear();

    const Json& data = config_.data();
    auto it = data.find("policy_overrides");
    const Json* overrides = (it != data.end()) ? &(*it) : nullptr;

    Json defaults;
    if (!overrides || !overrides->is_object()) {
        LOG_WARN("[PolicyRegistry] policy_overrides is not an object, using built-in profiles");
        defaults = default_config()["policy_overrides"];
        overrides = &defaults;
    }

    for (auto p = overrides->begin(); p != overrides->end(); ++p) {
        if (!p.value().is_object()) {
            LOG_WARN("[PolicyRegistry] Profile '%s' is not an object, skipped", p.key().c_str());
            continue;
        }
        ExecutionProfile profile;
        profile.name = p.key();
        if (p.value().contains("blocked_imports")) {
            profile.blocked_imports = string_set(p.value()["blocked_imports"],
                                                 p.key() + ".blocked_imports");
        }
        if (p.value().contains("blocked_calls")) {
            profile.blocked_calls = string_set(p.value()["blocked_calls"],
                                               p.key() + ".blocked_calls");
        }
        profiles_[profile.name] = profile;
    }

    LOG_DEBUG("[PolicyRegistry] %zu profiles available", profiles_.size());
}

std::string PolicyRegistry::environment_profile(const EnvironmentDescriptor& env) const {
    std::string preferred = (env.is_remote_session || !env.has_display) ? "headless" : "analysis";
    if (has_profile(preferred)) {
        return preferred;
    }

    // Built-in names were overridden away: take the profile that blocks the most
    std::string strictest;
    size_t most = 0;
    for (const auto& [name, profile] : profiles_) {
        size_t n = profile.blocked_imports.size() + profile.blocked_calls.size();
        if (strictest.empty() || n > most) {
            strictest = name;
            most = n;
        }
    }
    return strictest;
}

ExecutionProfile PolicyRegistry::resolve_profile(const std::string& name,
                                                 const EnvironmentDescriptor& env,
                                                 const std::string& intent_profile) const {
    std::string chosen;

    if (!name.empty()) {
        if (has_profile(name)) {
            chosen = name;
        } else {
            LOG_WARN("[PolicyRegistry] Unknown profile '%s', falling back", name.c_str());
        }
    }

    if (chosen.empty() && !intent_profile.empty() && has_profile(intent_profile)) {
        chosen = intent_profile;
    }

    if (chosen.empty()) {
        std::string configured = default_profile();
        if (configured != "auto" && has_profile(configured)) {
            chosen = configured;
        } else if (configured != "auto") {
            LOG_WARN("[PolicyRegistry] Configured profile '%s' is unknown", configured.c_str());
        }
    }

    if (chosen.empty()) {
        chosen = environment_profile(env);
    }

    const ExecutionProfile* profile = find_profile(chosen);
    if (!profile) {
        // Every profile was removed by the config; nothing is blocked
        LOG_WARN("[PolicyRegistry] No profiles configured, running with an empty profile");
        ExecutionProfile empty;
        empty.name = chosen.empty() ? "none" : chosen;
        return empty;
    }

    LOG_DEBUG("[PolicyRegistry] Resolved profile '%s'", profile->name.c_str());
    return *profile;
}

bool PolicyRegistry::has_profile(const std::string& name) const {
    return profiles_.find(name) != profiles_.end();
}

const ExecutionProfile* PolicyRegistry::find_profile(const std::string& name) const {
    auto it = profiles_.find(name);
    return it == profiles_.end() ? nullptr : &it->second;
}

std::vector<std::string> PolicyRegistry::profile_names() const {
    std::vector<std::string> names;
    for (const auto& entry : profiles_) {
        names.push_back(entry.first);
    }
    return names;
}

int PolicyRegistry::exec_timeout_sec() const {
    int64_t v = config_.get_int("exec_timeout_sec", DEFAULT_EXEC_TIMEOUT_SEC);
    if (v <= 0 || v > 86400) {
        LOG_WARN("[PolicyRegistry] exec_timeout_sec=%lld out of range, using %d",
                 static_cast<long long>(v), DEFAULT_EXEC_TIMEOUT_SEC);
        return DEFAULT_EXEC_TIMEOUT_SEC;
    }
    return static_cast<int>(v);
}

int PolicyRegistry::token_budget() const {
    return static_cast<int>(config_.get_int("token_budget", DEFAULT_TOKEN_BUDGET));
}

std::string PolicyRegistry::default_profile() const {
    return config_.get_string("profile", "headless");
}

} // namespace halbox
