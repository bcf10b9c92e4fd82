/*
 * shotguard - Configuration
 *
 * JSON configuration file read through dotted keys, e.g.
 * get_int("capture.max_concurrent", 3). Missing or mistyped keys yield
 * the supplied default.
 */
#ifndef shotguard_CORE_CONFIG_HPP
#define shotguard_CORE_CONFIG_HPP

#include <shotguard/core/json.hpp>
#include <string>
#include <vector>
#include <cstdint>

namespace shotguard {

class Config {
public:
    Config();
    explicit Config(const Json& root);

    // Returns false (and logs) if the file is unreadable or not a JSON object.
    bool load_file(const std::string& path);
    bool load_string(const std::string& text);

    std::string get_string(const std::string& key, const std::string& def) const;
    int64_t get_int(const std::string& key, int64_t def) const;
    bool get_bool(const std::string& key, bool def) const;
    std::vector<std::string> get_string_array(const std::string& key,
                                              const std::vector<std::string>& def) const;

    void set_string(const std::string& key, const std::string& value);

    bool has(const std::string& key) const;
    const Json& raw() const { return root_; }

private:
    const Json* find(const std::string& key) const;

    Json root_;
};

} // namespace shotguard

#endif // shotguard_CORE_CONFIG_HPP
