#pragma once

#include <trustgate/schema/anchor_point.hpp>

#include <nlohmann/json.hpp>

namespace trustgate::schema {

void to_json(nlohmann::json& j, const anchor_point<1>& o);
void from_json(const nlohmann::json& j, anchor_point<1>& o);

void to_json(nlohmann::json& j, const anchor_chain_data<1>& o);
void from_json(const nlohmann::json& j, anchor_chain_data<1>& o);

}  // namespace trustgate::schema
