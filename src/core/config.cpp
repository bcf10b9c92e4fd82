/*
 * shotguard - Configuration Implementation
 */
#include <shotguard/core/config.hpp>
#include <shotguard/core/logger.hpp>
#include <shotguard/core/utils.hpp>

#include <fstream>
#include <sstream>

namespace shotguard {

Config::Config() : root_(Json::object()) {}

Config::Config(const Json& root) : root_(root.is_object() ? root : Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream in(path.c_str());
    if (!in) {
        LOG_ERROR("[Config] Cannot open %s", path.c_str());
        return false;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    if (!load_string(ss.str())) {
        LOG_ERROR("[Config] %s is not a valid JSON object", path.c_str());
        return false;
    }
    return true;
}

bool Config::load_string(const std::string& text) {
    Json parsed = Json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return false;
    }
    root_ = parsed;
    return true;
}

const Json* Config::find(const std::string& key) const {
    const Json* node = &root_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) return nullptr;
        Json::const_iterator it = node->find(parts[i]);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

bool Config::has(const std::string& key) const {
    return find(key) != nullptr;
}

std::string Config::get_string(const std::string& key, const std::string& def) const {
    const Json* v = find(key);
    if (v && v->is_string()) return v->get<std::string>();
    return def;
}

int64_t Config::get_int(const std::string& key, int64_t def) const {
    const Json* v = find(key);
    if (v && v->is_number_integer()) return v->get<int64_t>();
    return def;
}

bool Config::get_bool(const std::string& key, bool def) const {
    const Json* v = find(key);
    if (v && v->is_boolean()) return v->get<bool>();
    return def;
}

std::vector<std::string> Config::get_string_array(const std::string& key,
                                                  const std::vector<std::string>& def) const {
    const Json* v = find(key);
    if (!v || !v->is_array()) return def;

    std::vector<std::string> result;
    for (Json::const_iterator it = v->begin(); it != v->end(); ++it) {
        if (!it->is_string()) {
            LOG_WARN("[Config] Ignoring non-string entry in %s", key.c_str());
            continue;
        }
        result.push_back(it->get<std::string>());
    }
    return result;
}

void Config::set_string(const std::string& key, const std::string& value) {
    Json* node = &root_;
    std::vector<std::string> parts = split(key, '.');
    if (parts.empty()) return;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        Json& child = (*node)[parts[i]];
        if (!child.is_object()) child = Json::object();
        node = &child;
    }
    (*node)[parts.back()] = value;
}

} // namespace shotguard
