#pragma once

#include <nlohmann/json.hpp>
#include "eventlog/LogEvent.hpp"

namespace eventlog {

// Wire form used by the HTTP API; field names are spelled out, unlike the stored record.
nlohmann::json toJson(const LogEvent& event);

// Throws std::invalid_argument for missing or mistyped fields. Absent timestamps are stamped now.
LogEvent eventFromJson(const nlohmann::json& j);

} // namespace eventlog
