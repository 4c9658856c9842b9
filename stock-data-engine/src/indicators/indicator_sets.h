#pragma once

#include <map>
#include <string>
#include <vector>

namespace sde {

/// Named indicator sets and identifier-list helpers. Stateless.
struct IndicatorSetManager {
    /// Set name, "all", a comma-separated list or a single identifier.
    /// Does not validate.
    static std::vector<std::string> resolve(const std::string& name);

    /// Identifiers present in the catalog, input order kept.
    static std::vector<std::string> validate(const std::vector<std::string>& identifiers);

    /// Largest minimum history among the identifiers; 0 for an empty list.
    /// Identifiers outside the catalog count as 0.
    static int required_periods(const std::vector<std::string>& identifiers);

    static const std::map<std::string, std::vector<std::string>>& sets();
    static std::vector<std::string> set_names();
    static const std::vector<std::string>& default_indicators();
};

} // namespace sde
