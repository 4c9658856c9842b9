#pragma once

#include "indicators/models.h"
#include "series/bars.h"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace sde {

/// Indicator value as written to storage: rounded to 4 decimal places,
/// null when absent or non-finite.
nlohmann::json indicator_value_json(const std::optional<double>& v);

/// Compact serialization that replaces invalid UTF-8 with U+FFFD instead of throwing.
std::string dump_lenient(const nlohmann::json& value);

// ADL hooks for nlohmann::json. Dates are "YYYY-MM-DD" strings.
void to_json(nlohmann::json& j, const Date& d);
void from_json(const nlohmann::json& j, Date& d);

void to_json(nlohmann::json& j, const DailyBar& bar);
void from_json(const nlohmann::json& j, DailyBar& bar);

void to_json(nlohmann::json& j, const WeeklyBar& bar);
void from_json(const nlohmann::json& j, WeeklyBar& bar);

void to_json(nlohmann::json& j, const IndicatorPoint& point);
void from_json(const nlohmann::json& j, IndicatorPoint& point);

void to_json(nlohmann::json& j, const IndicatorSeries& series);
void from_json(const nlohmann::json& j, IndicatorSeries& series);

} // namespace sde
