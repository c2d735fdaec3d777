/// @file time_zone.cpp
/// @brief Fixed-offset zones, ISO-8601 formatting and date parsing.

#include "time/time_zone.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <utility>

namespace heliochron::time
{

namespace
{
    std::string_view trim(std::string_view sv)
    {
        while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        {
            sv.remove_prefix(1);
        }
        while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        {
            sv.remove_suffix(1);
        }
        return sv;
    }

    bool iequals(std::string_view a, std::string_view b)
    {
        return a.size() == b.size()
            && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                   return std::toupper(static_cast<unsigned char>(x))
                       == std::toupper(static_cast<unsigned char>(y));
               });
    }

    std::optional<i32> parse_digits(std::string_view sv)
    {
        if (sv.empty() || !std::all_of(sv.begin(), sv.end(), [](char c) {
                return std::isdigit(static_cast<unsigned char>(c)) != 0;
            }))
        {
            return std::nullopt;
        }

        i32 value = 0;
        const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
        if (ec != std::errc{} || ptr != sv.data() + sv.size())
        {
            return std::nullopt;
        }
        return value;
    }

    std::string canonical_name(std::chrono::minutes offset)
    {
        if (offset == std::chrono::minutes::zero())
        {
            return "UTC";
        }
        const auto total = std::abs(offset.count());
        return fmt::format("UTC{}{:02}:{:02}", offset.count() < 0 ? '-' : '+', total / 60, total % 60);
    }
} // namespace

// -----------------------------------------------------------------
// TimeZone
// -----------------------------------------------------------------

TimeZone::TimeZone(std::chrono::minutes offset, std::string name)
    : m_offset(offset)
    , m_name(std::move(name))
{
}

TimeZone TimeZone::utc()
{
    return TimeZone(std::chrono::minutes::zero(), "UTC");
}

std::optional<TimeZone> TimeZone::fixed(std::chrono::minutes offset, std::string name)
{
    if (offset > kMaxOffset || offset < -kMaxOffset)
    {
        return std::nullopt;
    }
    if (name.empty())
    {
        name = canonical_name(offset);
    }
    return TimeZone(offset, std::move(name));
}

// Accepted: UTC | GMT | Z | [UTC|GMT](+|-)H[H][[:]MM]
std::optional<TimeZone> TimeZone::parse(std::string_view text)
{
    text = trim(text);

    if (iequals(text, "UTC") || iequals(text, "GMT") || iequals(text, "Z"))
    {
        return utc();
    }

    if (text.size() > 3 && (iequals(text.substr(0, 3), "UTC") || iequals(text.substr(0, 3), "GMT")))
    {
        text.remove_prefix(3);
    }

    if (text.empty() || (text.front() != '+' && text.front() != '-'))
    {
        return std::nullopt;
    }

    const i32 sign = text.front() == '-' ? -1 : 1;
    text.remove_prefix(1);

    std::optional<i32> hours;
    std::optional<i32> minutes = 0;

    if (const auto colon = text.find(':'); colon != std::string_view::npos)
    {
        hours   = parse_digits(text.substr(0, colon));
        minutes = parse_digits(text.substr(colon + 1));
        if (text.size() - colon - 1 != 2)
        {
            return std::nullopt;
        }
    }
    else if (text.size() <= 2)
    {
        hours = parse_digits(text);
    }
    else if (text.size() == 4)
    {
        hours   = parse_digits(text.substr(0, 2));
        minutes = parse_digits(text.substr(2));
    }

    if (!hours || !minutes || *minutes >= 60)
    {
        return std::nullopt;
    }

    return fixed(std::chrono::minutes{sign * (*hours * 60 + *minutes)});
}

LocalTime TimeZone::to_local(Instant instant) const
{
    return LocalTime{instant.time_since_epoch() + m_offset};
}

std::string TimeZone::offset_suffix() const
{
    if (m_offset == std::chrono::minutes::zero())
    {
        return "Z";
    }
    const auto total = std::abs(m_offset.count());
    return fmt::format("{}{:02}:{:02}", m_offset.count() < 0 ? '-' : '+', total / 60, total % 60);
}

// -----------------------------------------------------------------
// ZonedInstant
// -----------------------------------------------------------------

std::string ZonedInstant::to_string() const
{
    const auto local = std::chrono::floor<std::chrono::seconds>(local_time());
    const auto day   = std::chrono::floor<std::chrono::days>(local);

    const std::chrono::year_month_day ymd{day};
    const std::chrono::hh_mm_ss hms{local - day};

    return fmt::format("{}T{:02}:{:02}:{:02}{}",
                       format_calendar_date(ymd),
                       hms.hours().count(),
                       hms.minutes().count(),
                       hms.seconds().count(),
                       zone.offset_suffix());
}

// -----------------------------------------------------------------
// Calendar helpers
// -----------------------------------------------------------------

CalendarDate calendar_date(Instant instant, const TimeZone& zone)
{
    return CalendarDate{std::chrono::floor<std::chrono::days>(zone.to_local(instant))};
}

std::optional<CalendarDate> parse_calendar_date(std::string_view text)
{
    text = trim(text);

    bool negative_year = false;
    if (!text.empty() && text.front() == '-')
    {
        negative_year = true;
        text.remove_prefix(1);
    }

    const auto first = text.find('-');
    if (first == std::string_view::npos)
    {
        return std::nullopt;
    }
    const auto second = text.find('-', first + 1);
    if (second == std::string_view::npos || second - first != 3 || text.size() - second != 3)
    {
        return std::nullopt;
    }

    const auto year  = parse_digits(text.substr(0, first));
    const auto month = parse_digits(text.substr(first + 1, 2));
    const auto day   = parse_digits(text.substr(second + 1));
    if (!year || !month || !day)
    {
        return std::nullopt;
    }

    // std::chrono::year holds [-32767, 32767]; larger values would wrap
    if (*year > static_cast<i32>(std::chrono::year::max()))
    {
        return std::nullopt;
    }

    const CalendarDate date{std::chrono::year{negative_year ? -*year : *year},
                            std::chrono::month{static_cast<unsigned>(*month)},
                            std::chrono::day{static_cast<unsigned>(*day)}};
    if (!date.ok())
    {
        return std::nullopt;
    }
    return date;
}

std::string format_calendar_date(const CalendarDate& date)
{
    return fmt::format("{:04}-{:02}-{:02}",
                       static_cast<i32>(date.year()),
                       static_cast<unsigned>(date.month()),
                       static_cast<unsigned>(date.day()));
}

std::string format_duration(Duration span)
{
    if (span < Duration::zero())
    {
        return "-" + format_duration(-span);
    }

    const auto total = std::chrono::floor<std::chrono::seconds>(span);
    const auto days  = std::chrono::floor<std::chrono::days>(total);
    const std::chrono::hh_mm_ss hms{total - days};

    std::string out;
    if (days.count() > 0)
    {
        out += fmt::format("{}d ", days.count());
    }
    if (hms.hours().count() > 0)
    {
        out += fmt::format("{}h ", hms.hours().count());
    }
    if (hms.minutes().count() > 0)
    {
        out += fmt::format("{}m ", hms.minutes().count());
    }
    out += fmt::format("{}s", hms.seconds().count());
    return out;
}

} // namespace heliochron::time
