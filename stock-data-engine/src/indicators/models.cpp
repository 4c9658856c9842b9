#include "indicators/models.h"

namespace sde {

std::optional<OptionalValues> IndicatorSeries::latest_value() const {
    if (values.empty()) return std::nullopt;
    return values.back().values;
}

std::optional<OptionalValues> IndicatorSeries::value_at(const Date& date) const {
    for (const auto& p : values) {
        if (p.date == date) return p.values;
    }
    return std::nullopt;
}

std::map<std::string, std::vector<std::pair<int64_t, double>>> IndicatorSeries::to_chart_format() const {
    std::map<std::string, std::vector<std::pair<int64_t, double>>> out;
    for (const auto& name : outputs) out[name];

    for (const auto& p : values) {
        int64_t ts_ms = static_cast<int64_t>(p.date.to_epoch()) * 1000;
        for (const auto& [name, v] : p.values) {
            auto& column = out[name];
            if (v) column.emplace_back(ts_ms, *v);
        }
    }
    return out;
}


IndicatorOutcome IndicatorOutcome::computed(IndicatorSeries series) {
    IndicatorOutcome o;
    o.status_ = Status::Computed;
    o.series_ = std::move(series);
    return o;
}

IndicatorOutcome IndicatorOutcome::insufficient_history(int have, int need) {
    IndicatorOutcome o;
    o.status_ = Status::InsufficientHistory;
    o.have_ = have;
    o.need_ = need;
    o.reason_ = "insufficient history: have " + std::to_string(have) + ", need " + std::to_string(need);
    return o;
}

IndicatorOutcome IndicatorOutcome::failed(std::string reason) {
    IndicatorOutcome o;
    o.status_ = Status::Failed;
    o.reason_ = std::move(reason);
    return o;
}

const char* IndicatorOutcome::status_name() const {
    switch (status_) {
        case Status::Computed:            return "computed";
        case Status::InsufficientHistory: return "insufficient_history";
        case Status::Failed:              return "failed";
    }
    return "failed";
}

} // namespace sde
