#pragma once

#include "series/date.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sde {

using OptionalValues = std::map<std::string, std::optional<double>>;

struct IndicatorPoint {
    Date date;
    OptionalValues values;   // output name -> value, nullopt before the window fills
};

/// One computed indicator over a price series, one point per bar.
struct IndicatorSeries {
    std::string name;
    std::string display_name;
    std::string category;
    std::string description;
    std::map<std::string, double> parameters;
    std::vector<std::string> outputs;
    std::vector<IndicatorPoint> values;

    /// Values of the last point, nothing for an empty series.
    std::optional<OptionalValues> latest_value() const;

    std::optional<OptionalValues> value_at(const Date& date) const;

    /// output -> [(epoch_ms, value)...], null values skipped.
    std::map<std::string, std::vector<std::pair<int64_t, double>>> to_chart_format() const;
};

/// Result of evaluating one identifier.
class IndicatorOutcome {
public:
    enum class Status { Computed, InsufficientHistory, Failed };

    static IndicatorOutcome computed(IndicatorSeries series);
    static IndicatorOutcome insufficient_history(int have, int need);
    static IndicatorOutcome failed(std::string reason);

    Status status() const { return status_; }
    bool ok() const { return status_ == Status::Computed; }

    const IndicatorSeries& series() const { return series_; }
    IndicatorSeries&& take_series() { return std::move(series_); }

    int have() const { return have_; }
    int need() const { return need_; }
    const std::string& reason() const { return reason_; }

    /// "computed", "insufficient_history" or "failed".
    const char* status_name() const;

private:
    IndicatorOutcome() = default;

    Status status_ = Status::Failed;
    IndicatorSeries series_;
    int have_ = 0;
    int need_ = 0;
    std::string reason_;
};

} // namespace sde
