#pragma once

#include <cstdint>
#include <ctime>
#include <string>

namespace sde {

/// Calendar date, stored as days since 1970-01-01 (UTC).
class Date {
public:
    Date() = default;
    explicit Date(int32_t days_since_epoch) : days_(days_since_epoch) {}

    static Date from_ymd(int year, int month, int day);

    /// Parse "YYYY-MM-DD" (anything after the first 10 characters is ignored,
    /// so ISO timestamps are accepted). Throws std::invalid_argument.
    static Date parse(const std::string& iso);

    /// Date containing the given UTC epoch second.
    static Date from_epoch(time_t ts);

    static Date today();

    int32_t days() const { return days_; }
    time_t to_epoch() const { return static_cast<time_t>(days_) * 86400; }

    /// Monday = 0 ... Sunday = 6.
    int weekday() const;

    std::string iso() const;

    Date operator+(int n) const { return Date(days_ + n); }
    Date operator-(int n) const { return Date(days_ - n); }
    int operator-(const Date& other) const { return days_ - other.days_; }

    bool operator==(const Date& o) const { return days_ == o.days_; }
    bool operator!=(const Date& o) const { return days_ != o.days_; }
    bool operator<(const Date& o) const { return days_ < o.days_; }
    bool operator<=(const Date& o) const { return days_ <= o.days_; }
    bool operator>(const Date& o) const { return days_ > o.days_; }
    bool operator>=(const Date& o) const { return days_ >= o.days_; }

private:
    int32_t days_ = 0;
};

/// ISO-8601 UTC timestamp ("2024-01-08T14:03:00Z") for an epoch second.
std::string format_timestamp(time_t ts);

/// Inverse of format_timestamp. Throws std::invalid_argument.
time_t parse_timestamp(const std::string& iso);

} // namespace sde
