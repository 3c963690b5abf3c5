/*
 * HalBox C++17 - Policy Registry
 *
 * Owns the named execution profiles and the sandbox tunables. Built-in
 * defaults are deep-merged with the persisted JSON file once at load;
 * after that the registry is read-only and safe to share between threads.
 */
#ifndef halbox_SANDBOX_POLICY_REGISTRY_HPP
#define halbox_SANDBOX_POLICY_REGISTRY_HPP

#include <halbox/core/config.hpp>
#include <halbox/core/json.hpp>
#include <halbox/sandbox/environment.hpp>

#include <map>
#include <set>
#include <string>
#include <vector>

namespace halbox {

struct ExecutionProfile {
    std::string name;
    std::set<std::string> blocked_imports;  // module roots
    std::set<std::string> blocked_calls;    // "eval", "os.system", ...

    Json to_json() const;
};

class PolicyRegistry {
public:
    PolicyRegistry();

    // The built-in configuration document
    static Json default_config();

    // Load from path. A missing file is created from the defaults; a
    // malformed one is reported and ignored. Returns false only when the
    // file existed but could not be used. Never throws.
    bool load(const std::string& path);

    // Reset to built-in defaults, optionally overlaid with a document
    void load_json(const Json& overlay);

    // Resolution order: explicit known name, then intent-derived name,
    // then configured default, then a choice derived from the environment.
    ExecutionProfile resolve_profile(const std::string& name,
                                     const EnvironmentDescriptor& env,
                                     const std::string& intent_profile = "") const;

    // Profile the environment alone would pick
    std::string environment_profile(const EnvironmentDescriptor& env) const;

    bool has_profile(const std::string& name) const;
    std::vector<std::string> profile_names() const;
    const ExecutionProfile* find_profile(const std::string& name) const;

    int exec_timeout_sec() const;
    int token_budget() const;
    std::string default_profile() const;

    const Config& config() const { return config_; }
    const std::string& path() const { return path_; }
    const std::string& last_error() const { return last_error_; }

private:
    void build_profiles();

    Config config_;
    std::map<std::string, ExecutionProfile> profiles_;
    std::string path_;
    std::string last_error_;
};

} // namespace halbox

#endif // halbox_SANDBOX_POLICY_REGISTRY_HPP
