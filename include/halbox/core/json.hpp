#ifndef halbox_CORE_JSON_HPP
#define halbox_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace halbox {

using Json = nlohmann::json;

} // namespace halbox

#endif // halbox_CORE_JSON_HPP
