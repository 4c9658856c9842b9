#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sde {

enum class IndicatorKind {
    SMA,
    EMA,
    RSI,
    MACD,
    BB,
    ADX,
    ATR,
    STOCH,
    OBV,
    CMF,
    VOLUME_SMA,
};

const char* kind_name(IndicatorKind kind);

/// Structured parameters. Only the fields relevant to the kind are set.
struct IndicatorParams {
    int period = 0;
    int fast = 0;
    int slow = 0;
    int signal = 0;
    int smooth = 0;
    double std_dev = 0.0;
};

/// One registered indicator identifier.
struct IndicatorSpec {
    std::string id;            // e.g. "RSI_14"
    IndicatorKind kind;
    IndicatorParams params;
    int min_periods = 0;       // series length needed before computing
    std::string display_name;
    std::string category;      // trend | momentum | volatility | volume
    std::string description;
    std::vector<std::string> outputs;

    /// Parameters as written to storage, e.g. {"period": 14}.
    std::map<std::string, double> parameter_map() const;
};

/// The fixed catalog, in registration order.
const std::vector<IndicatorSpec>& indicator_catalog();

/// True for identifiers in the fixed catalog.
bool is_registered(const std::string& id);

/// Catalog entry for `id`. Identifiers of the form SMA_<n> / EMA_<n> outside
/// the catalog resolve to a generated spec with min_periods = n.
std::optional<IndicatorSpec> lookup_indicator(const std::string& id);

} // namespace sde
