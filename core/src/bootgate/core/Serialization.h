#pragma once

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "bootgate/core/ConnectionSettings.h"
#include "bootgate/core/Enums.h"
#include "bootgate/core/RetryPolicy.h"

namespace bootgate::core {

// JSON serialization helpers for configuration types.
//
// Objects are read as overlays: fields that are absent keep the value already held by the target,
// so a config file only needs to name what it changes. Deserialization throws std::runtime_error
// on unknown keys, wrong types and invalid enum strings.

void to_json(nlohmann::json& j, const DbDriver& driver);
void from_json(const nlohmann::json& j, DbDriver& driver);

void to_json(nlohmann::json& j, const HandoffMode& mode);
void from_json(const nlohmann::json& j, HandoffMode& mode);

void to_json(nlohmann::json& j, const ConnectionSettings& settings);
void from_json(const nlohmann::json& j, ConnectionSettings& settings);

void to_json(nlohmann::json& j, const RetryPolicy& policy);
void from_json(const nlohmann::json& j, RetryPolicy& policy);

}  // namespace bootgate::core
