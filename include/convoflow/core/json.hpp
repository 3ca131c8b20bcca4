#ifndef convoflow_CORE_JSON_HPP
#define convoflow_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace convoflow {

using Json = nlohmann::json;

} // namespace convoflow

#endif // convoflow_CORE_JSON_HPP
