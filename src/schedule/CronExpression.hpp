#pragma once

#include <bitset>
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

namespace rf::schedule
{

// Five-field cron expression (minute hour day-of-month month day-of-week)
// evaluated in local time. Supports "*", lists, ranges, steps, month and
// weekday names, 7 as Sunday and the @yearly/@monthly/@weekly/@daily/
// @hourly family. When both day fields are restricted a day matches if
// either does.
class CronExpression
{
  public:
    // Throws rf::Error{Validation} with the offending field in the message.
    static CronExpression parse(std::string_view text);

    // First matching minute strictly after unix_seconds, or std::nullopt
    // when none falls within the next five years.
    std::optional<std::int64_t> next_after(std::int64_t unix_seconds) const;

    bool matches(std::tm const &local) const noexcept;

    std::string const &text() const noexcept
    {
        return text_;
    }

  private:
    CronExpression() = default;

    bool day_matches(std::tm const &local) const noexcept;

    std::bitset<60> minutes_;
    std::bitset<24> hours_;
    std::bitset<32> days_;
    std::bitset<13> months_;
    std::bitset<7> weekdays_;
    bool days_restricted_ = false;
    bool weekdays_restricted_ = false;
    std::string text_;
};

} // namespace rf::schedule
