#pragma once

#include "series/bars.h"

#include <string>
#include <vector>

namespace sde {

/// Materiality thresholds for same-date conflicts and the advisory gap check.
struct MergePolicy {
    double price_threshold = 0.01;   // relative close difference
    double volume_threshold = 0.10;  // relative volume difference
    int gap_days = 5;
    int max_gap_warnings = 10;
};

struct MergeStats {
    int new_points = 0;
    int duplicates = 0;
    int overwrites = 0;
    std::vector<std::string> warnings;
};

struct MergeResult {
    std::vector<DailyBar> merged;
    MergeStats stats;
};

/// Folds a short recent download window into a stored daily series.
///
/// Same-date incoming bars either overwrite the stored bar (significant
/// close or volume divergence, recorded as a warning) or are discarded as
/// duplicates. The merged output is strictly increasing by date.
class IncrementalMerger {
public:
    IncrementalMerger() = default;
    explicit IncrementalMerger(MergePolicy policy) : policy_(policy) {}

    MergeResult merge(const std::vector<DailyBar>& existing,
                      const std::vector<DailyBar>& incoming) const;

    bool is_significant_change(const DailyBar& old_bar, const DailyBar& new_bar) const;

    /// Advisory gap notices between consecutive bars, capped at
    /// max_gap_warnings plus one summary line.
    std::vector<std::string> find_gaps(const std::vector<DailyBar>& series) const;

    const MergePolicy& policy() const { return policy_; }

private:
    MergePolicy policy_;
};

} // namespace sde
