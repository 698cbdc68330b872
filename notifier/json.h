#pragma once

#include <nlohmann/json.hpp>

namespace notifier {

using Json = nlohmann::json;

} // namespace notifier
