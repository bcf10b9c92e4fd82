#ifndef shotguard_CORE_JSON_HPP
#define shotguard_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace shotguard {

typedef nlohmann::json Json;

} // namespace shotguard

#endif // shotguard_CORE_JSON_HPP
