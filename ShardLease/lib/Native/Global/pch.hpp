#pragma once

#include <boost/describe.hpp>
#include <boost/describe/enum.hpp>
#include <boost/describe/enum_from_string.hpp>
#include <boost/describe/enum_to_string.hpp>
#include <boost/uuid/uuid.hpp>

#include "nlohmann/json.hpp"
using Json = nlohmann::json;

#include <chrono>
#include <cstdint>
#include <format>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;
// Monotonic time source; injectable so tests can move time without sleeping.
using SteadyNowFn = std::function<SteadyTimePoint()>;
