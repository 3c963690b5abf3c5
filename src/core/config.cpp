/*
 * HalBox C++17 - Configuration Implementation
 */
#include <halbox/core/config.hpp>
#include <halbox/core/logger.hpp>
#include <halbox/core/utils.hpp>

#include <fstream>

namespace halbox {

void deep_merge(Json& base, const Json& overlay) {
    if (!base.is_object() || !overlay.is_object()) {
        base = overlay;
        return;
    }
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        auto existing = base.find(it.key());
        if (existing != base.end() && existing->is_object() && it.value().is_object()) {
            deep_merge(*existing, it.value());
        } else {
            base[it.key()] = it.value();
        }
    }
}

Config::Config() : data_(Json::object()) {}

Config::Config(const Json& data) : data_(data.is_object() ? data : Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::string text;
    if (!read_file(path, text)) {
        last_error_ = "cannot read " + path;
        return false;
    }
    if (!load_string(text)) {
        last_error_ = path + ": " + last_error_;
        return false;
    }
    LOG_DEBUG("[Config] Loaded %s", path.c_str());
    return true;
}

bool Config::load_string(const std::string& text) {
    Json parsed = Json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        last_error_ = "invalid JSON";
        return false;
    }
    if (!parsed.is_object()) {
        last_error_ = "top-level value is not an object";
        return false;
    }
    data_ = std::move(parsed);
    last_error_.clear();
    return true;
}

bool Config::save_file(const std::string& path) const {
    if (!create_parent_directory(path)) {
        LOG_WARN("[Config] Cannot create directory for %s", path.c_str());
        return false;
    }
    std::ofstream out(path.c_str(), std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        LOG_WARN("[Config] Cannot open %s for writing", path.c_str());
        return false;
    }
    out << data_.dump(2) << "\n";
    out.close();
    return !out.fail();
}

const Json* Config::find(const std::string& key) const {
    const Json* node = &data_;
    for (const auto& part : split(key, '.')) {
        if (!node->is_object()) return nullptr;
        auto it = node->find(part);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

std::string Config::get_string(const std::string& key, const std::string& def) const {
    const Json* v = find(key);
    if (!v || !v->is_string()) return def;
    return v->get<std::string>();
}

int64_t Config::get_int(const std::string& key, int64_t def) const {
    const Json* v = find(key);
    if (!v || !v->is_number()) return def;
    if (v->is_number_float()) {
        return static_cast<int64_t>(v->get<double>());
    }
    return v->get<int64_t>();
}

bool Config::get_bool(const std::string& key, bool def) const {
    const Json* v = find(key);
    if (!v || !v->is_boolean()) return def;
    return v->get<bool>();
}

std::vector<std::string> Config::get_string_array(const std::string& key) const {
    std::vector<std::string> result;
    const Json* v = find(key);
    if (!v || !v->is_array()) return result;
    for (const auto& item : *v) {
        if (item.is_string()) {
            result.push_back(item.get<std::string>());
        }
    }
    return result;
}

} // namespace halbox
