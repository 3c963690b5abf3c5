/*
 * HalBox C++17 - Configuration
 *
 * JSON-backed key/value configuration. Keys are dotted paths into nested
 * objects ("policy_overrides.headless.blocked_imports").
 */
#ifndef halbox_CORE_CONFIG_HPP
#define halbox_CORE_CONFIG_HPP

#include <halbox/core/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace halbox {

// Recursively merge overlay into base. Objects merge key by key, every
// other value (arrays included) replaces what base had.
void deep_merge(Json& base, const Json& overlay);

class Config {
public:
    Config();
    explicit Config(const Json& data);

    // Replace the contents with the JSON object stored in path.
    // Returns false (and keeps the previous contents) when the file is
    // missing, unparseable, or not an object.
    bool load_file(const std::string& path);

    // Write the contents as indented JSON, creating parent directories
    bool save_file(const std::string& path) const;

    std::string get_string(const std::string& key, const std::string& def = "") const;
    int64_t get_int(const std::string& key, int64_t def = 0) const;
    bool get_bool(const std::string& key, bool def = false) const;
    std::vector<std::string> get_string_array(const std::string& key) const;

    const Json& data() const { return data_; }
    const std::string& last_error() const { return last_error_; }

private:
    bool load_string(const std::string& text);
    const Json* find(const std::string& key) const;

    Json data_;
    std::string last_error_;
};

} // namespace halbox

#endif // halbox_CORE_CONFIG_HPP
