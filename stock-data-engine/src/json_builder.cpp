#include "json_builder.h"

#include <cmath>

namespace sde {

using json = nlohmann::json;

json indicator_value_json(const std::optional<double>& v) {
    if (!v || !std::isfinite(*v)) return nullptr;
    return std::round(*v * 10000.0) / 10000.0;
}

std::string dump_lenient(const json& value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

void to_json(json& j, const Date& d) {
    j = d.iso();
}

void from_json(const json& j, Date& d) {
    d = Date::parse(j.get<std::string>());
}


void to_json(json& j, const DailyBar& bar) {
    j = json{
        {"date", bar.date},
        {"open", bar.open},
        {"high", bar.high},
        {"low", bar.low},
        {"close", bar.close},
        {"adj_close", bar.adj_close},
        {"volume", bar.volume},
    };
}

void from_json(const json& j, DailyBar& bar) {
    j.at("date").get_to(bar.date);
    j.at("open").get_to(bar.open);
    j.at("high").get_to(bar.high);
    j.at("low").get_to(bar.low);
    j.at("close").get_to(bar.close);
    bar.adj_close = j.value("adj_close", bar.close);
    j.at("volume").get_to(bar.volume);
}


void to_json(json& j, const WeeklyBar& bar) {
    j = json{
        {"week_start", bar.week_start},
        {"week_ending", bar.week_ending},
        {"open", bar.open},
        {"high", bar.high},
        {"low", bar.low},
        {"close", bar.close},
        {"adj_close", bar.adj_close},
        {"volume", bar.volume},
        {"trading_days", bar.trading_days},
    };
}

void from_json(const json& j, WeeklyBar& bar) {
    j.at("week_start").get_to(bar.week_start);
    j.at("week_ending").get_to(bar.week_ending);
    j.at("open").get_to(bar.open);
    j.at("high").get_to(bar.high);
    j.at("low").get_to(bar.low);
    j.at("close").get_to(bar.close);
    bar.adj_close = j.value("adj_close", bar.close);
    j.at("volume").get_to(bar.volume);
    j.at("trading_days").get_to(bar.trading_days);
}


void to_json(json& j, const IndicatorPoint& point) {
    json values = json::object();
    for (const auto& [name, v] : point.values) {
        values[name] = indicator_value_json(v);
    }
    j = json{{"date", point.date}, {"values", std::move(values)}};
}

void from_json(const json& j, IndicatorPoint& point) {
    j.at("date").get_to(point.date);
    point.values.clear();
    for (const auto& [name, v] : j.at("values").items()) {
        if (v.is_number()) {
            point.values[name] = v.get<double>();
        } else {
            point.values[name] = std::nullopt;
        }
    }
}


void to_json(json& j, const IndicatorSeries& series) {
    j = json{
        {"name", series.name},
        {"display_name", series.display_name},
        {"category", series.category},
        {"description", series.description},
        {"parameters", series.parameters},
        {"outputs", series.outputs},
        {"values", series.values},
    };
}

void from_json(const json& j, IndicatorSeries& series) {
    j.at("name").get_to(series.name);
    series.display_name = j.value("display_name", series.name);
    series.category = j.value("category", std::string("unknown"));
    series.description = j.value("description", std::string());
    series.parameters.clear();
    if (j.contains("parameters")) {
        for (const auto& [key, v] : j.at("parameters").items()) {
            if (v.is_number()) series.parameters[key] = v.get<double>();
        }
    }
    series.outputs = j.value("outputs", std::vector<std::string>{});
    j.at("values").get_to(series.values);

    // Files written without an outputs list: recover them from the points.
    if (series.outputs.empty() && !series.values.empty()) {
        for (const auto& [name, v] : series.values.front().values) series.outputs.push_back(name);
    }
}

} // namespace sde
