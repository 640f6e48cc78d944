/**
 * @file reply_json.hpp
 * @brief JSON serialization of replies for transports
 */

#pragma once

#include <core/reply.hpp>
#include <nlohmann/json.hpp>

namespace Stonetrail {

void to_json(nlohmann::json& j, const GeoPoint& p);
void to_json(nlohmann::json& j, const Address& a);
void to_json(nlohmann::json& j, const HistoryRecord& r);
void to_json(nlohmann::json& j, const ItemSummary& s);
void to_json(nlohmann::json& j, const RouteGeometry& g);
void to_json(nlohmann::json& j, const MatchView& m);
void to_json(nlohmann::json& j, const Reply& r);

} // namespace Stonetrail
