#include "schedule/CronExpression.hpp"

#include "engine/Error.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <vector>

namespace rf::schedule
{

namespace
{

constexpr std::int64_t kSearchWindowSeconds = 5LL * 366 * 24 * 60 * 60;

constexpr std::array<std::string_view, 12> kMonthNames = {
    "jan", "feb", "mar", "apr", "may", "jun",
    "jul", "aug", "sep", "oct", "nov", "dec"};
constexpr std::array<std::string_view, 7> kWeekdayNames = {
    "sun", "mon", "tue", "wed", "thu", "fri", "sat"};

struct FieldSpec
{
    char const *name;
    int min;
    int max;
    std::string_view const *names = nullptr;
    std::size_t name_count = 0;
    int name_base = 0;
};

[[noreturn]] void invalid(FieldSpec const &spec, std::string_view token)
{
    throw rf::Error(rf::ErrorKind::Validation,
                    "Invalid cron " + std::string(spec.name) + " field: '" +
                        std::string(token) + "'");
}

std::string lowered(std::string_view value)
{
    std::string result(value);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char ch)
                   { return static_cast<char>(std::tolower(ch)); });
    return result;
}

std::vector<std::string_view> split(std::string_view text, char delim)
{
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true)
    {
        auto pos = text.find(delim, start);
        if (pos == std::string_view::npos)
        {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::vector<std::string_view> split_whitespace(std::string_view text)
{
    std::vector<std::string_view> parts;
    std::size_t pos = 0;
    while (pos < text.size())
    {
        while (pos < text.size() &&
               std::isspace(static_cast<unsigned char>(text[pos])))
        {
            ++pos;
        }
        auto start = pos;
        while (pos < text.size() &&
               !std::isspace(static_cast<unsigned char>(text[pos])))
        {
            ++pos;
        }
        if (pos > start)
        {
            parts.push_back(text.substr(start, pos - start));
        }
    }
    return parts;
}

int parse_value(FieldSpec const &spec, std::string_view value,
                std::string_view token)
{
    if (value.empty())
    {
        invalid(spec, token);
    }
    int result = 0;
    auto const *first = value.data();
    auto const *last = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(first, last, result);
    if (ec == std::errc() && ptr == last)
    {
        return result;
    }
    if (spec.names != nullptr)
    {
        auto const name = lowered(value);
        for (std::size_t i = 0; i < spec.name_count; ++i)
        {
            if (spec.names[i] == name)
            {
                return static_cast<int>(i) + spec.name_base;
            }
        }
    }
    invalid(spec, token);
}

// Parses one field into the allowed values; returns false when the field
// begins with '*', i.e. does not restrict its unit.
template <std::size_t N>
bool parse_field(std::string_view field, FieldSpec const &spec,
                 std::bitset<N> &out, bool seven_is_sunday = false)
{
    if (field.empty())
    {
        invalid(spec, field);
    }
    for (auto token : split(field, ','))
    {
        if (token.empty())
        {
            invalid(spec, field);
        }
        auto range = token;
        int step = 1;
        if (auto slash = token.find('/'); slash != std::string_view::npos)
        {
            range = token.substr(0, slash);
            auto step_text = token.substr(slash + 1);
            auto [ptr, ec] = std::from_chars(
                step_text.data(), step_text.data() + step_text.size(), step);
            if (step_text.empty() || ec != std::errc() ||
                ptr != step_text.data() + step_text.size() || step <= 0)
            {
                invalid(spec, token);
            }
        }

        // Sunday may be written as 7; it folds onto 0 below.
        int const upper = seven_is_sunday ? 7 : spec.max;
        int low = spec.min;
        int high = upper;
        if (range == "*")
        {
            high = spec.max;
        }
        else if (auto dash = range.find('-'); dash != std::string_view::npos)
        {
            low = parse_value(spec, range.substr(0, dash), token);
            high = parse_value(spec, range.substr(dash + 1), token);
        }
        else
        {
            low = parse_value(spec, range, token);
            // "5/15" means every 15 starting at 5
            high = token.size() != range.size() ? spec.max : low;
        }
        if (low < spec.min || high > upper || low > high)
        {
            invalid(spec, token);
        }
        for (int value = low; value <= high; value += step)
        {
            auto const slot = (seven_is_sunday && value == 7) ? 0 : value;
            out.set(static_cast<std::size_t>(slot));
        }
    }
    return field.front() != '*';
}

std::string_view expand_macro(std::string_view text)
{
    auto const name = lowered(text);
    if (name == "@yearly" || name == "@annually")
    {
        return "0 0 1 1 *";
    }
    if (name == "@monthly")
    {
        return "0 0 1 * *";
    }
    if (name == "@weekly")
    {
        return "0 0 * * 0";
    }
    if (name == "@daily" || name == "@midnight")
    {
        return "0 0 * * *";
    }
    if (name == "@hourly")
    {
        return "0 * * * *";
    }
    throw rf::Error(rf::ErrorKind::Validation,
                    "Unknown cron macro: " + std::string(text));
}

bool to_local(std::time_t when, std::tm &out) noexcept
{
    return localtime_r(&when, &out) != nullptr;
}

} // namespace

CronExpression CronExpression::parse(std::string_view text)
{
    auto trimmed = text;
    while (!trimmed.empty() &&
           std::isspace(static_cast<unsigned char>(trimmed.front())))
    {
        trimmed.remove_prefix(1);
    }
    while (!trimmed.empty() &&
           std::isspace(static_cast<unsigned char>(trimmed.back())))
    {
        trimmed.remove_suffix(1);
    }
    if (trimmed.empty())
    {
        throw rf::Error(rf::ErrorKind::Validation,
                        "Cron expression must not be empty");
    }

    auto source = trimmed;
    if (source.front() == '@')
    {
        source = expand_macro(source);
    }
    auto fields = split_whitespace(source);
    if (fields.size() != 5)
    {
        throw rf::Error(rf::ErrorKind::Validation,
                        "Cron expression must have 5 fields: '" +
                            std::string(trimmed) + "'");
    }

    static constexpr FieldSpec kMinute{"minute", 0, 59};
    static constexpr FieldSpec kHour{"hour", 0, 23};
    static constexpr FieldSpec kDay{"day-of-month", 1, 31};
    static constexpr FieldSpec kMonth{"month", 1, 12, kMonthNames.data(),
                                      kMonthNames.size(), 1};
    static constexpr FieldSpec kWeekday{"day-of-week", 0, 6,
                                        kWeekdayNames.data(),
                                        kWeekdayNames.size(), 0};

    CronExpression expr;
    expr.text_ = std::string(trimmed);
    parse_field(fields[0], kMinute, expr.minutes_);
    parse_field(fields[1], kHour, expr.hours_);
    expr.days_restricted_ = parse_field(fields[2], kDay, expr.days_);
    parse_field(fields[3], kMonth, expr.months_);
    expr.weekdays_restricted_ =
        parse_field(fields[4], kWeekday, expr.weekdays_, true);
    return expr;
}

bool CronExpression::day_matches(std::tm const &local) const noexcept
{
    bool const dom = days_.test(static_cast<std::size_t>(local.tm_mday));
    bool const dow = weekdays_.test(static_cast<std::size_t>(local.tm_wday));
    if (days_restricted_ && weekdays_restricted_)
    {
        return dom || dow;
    }
    if (days_restricted_)
    {
        return dom;
    }
    if (weekdays_restricted_)
    {
        return dow;
    }
    return true;
}

bool CronExpression::matches(std::tm const &local) const noexcept
{
    return minutes_.test(static_cast<std::size_t>(local.tm_min)) &&
           hours_.test(static_cast<std::size_t>(local.tm_hour)) &&
           months_.test(static_cast<std::size_t>(local.tm_mon + 1)) &&
           day_matches(local);
}

std::optional<std::int64_t>
CronExpression::next_after(std::int64_t unix_seconds) const
{
    // Whole minutes only; the first candidate is the next minute boundary.
    std::int64_t candidate = (unix_seconds / 60 + 1) * 60;
    if (unix_seconds < 0 && unix_seconds % 60 != 0)
    {
        candidate -= 60;
    }
    auto const limit = unix_seconds + kSearchWindowSeconds;

    std::tm local{};
    while (candidate <= limit)
    {
        if (!to_local(static_cast<std::time_t>(candidate), local))
        {
            return std::nullopt;
        }

        // Skip whole months and days through mktime so month lengths and
        // DST shifts are handled by the C library.
        bool const month_ok =
            months_.test(static_cast<std::size_t>(local.tm_mon + 1));
        if (!month_ok || !day_matches(local))
        {
            if (!month_ok)
            {
                local.tm_mon += 1;
                local.tm_mday = 1;
            }
            else
            {
                local.tm_mday += 1;
            }
            local.tm_hour = 0;
            local.tm_min = 0;
            local.tm_sec = 0;
            local.tm_isdst = -1;
            auto next = static_cast<std::int64_t>(std::mktime(&local));
            candidate = next > candidate ? next : candidate + 60;
            continue;
        }
        if (!hours_.test(static_cast<std::size_t>(local.tm_hour)))
        {
            candidate += 3600 - local.tm_min * 60 - local.tm_sec;
            continue;
        }
        if (!minutes_.test(static_cast<std::size_t>(local.tm_min)))
        {
            candidate += 60 - local.tm_sec;
            continue;
        }
        return candidate;
    }
    return std::nullopt;
}

} // namespace rf::schedule
