#ifndef novelforge_CORE_JSON_HPP
#define novelforge_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace novelforge {

typedef nlohmann::json Json;

} // namespace novelforge

#endif // novelforge_CORE_JSON_HPP
