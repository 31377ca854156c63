#include "market_hours.hpp"
#include "job_exceptions.hpp"
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/make_shared.hpp>
#include <iomanip>
#include <sstream>

namespace mdjobs {

namespace bg = boost::gregorian;
namespace bpt = boost::posix_time;
namespace blt = boost::local_time;

namespace {
constexpr int kMaxCalendarWalk = 31;
}

std::string MarketTime::toString() const {
  std::ostringstream oss;
  oss << formatDate(date) << " " << std::setfill('0') << std::setw(2) << hour
      << ":" << std::setw(2) << minute << ":" << std::setw(2) << second;
  return oss.str();
}

std::string formatDate(const bg::date &day) {
  return bg::to_iso_extended_string(day);
}

bg::date parseDate(const std::string &text) {
  bg::date day(boost::date_time::not_a_date_time);
  try {
    day = bg::from_simple_string(text);
  } catch (const std::exception &e) {
    throw ValidationException(ErrorCode::INVALID_FORMAT,
                              "Invalid date: " + text + " (" + e.what() + ")",
                              "date", text);
  }
  if (day.is_not_a_date()) {
    throw ValidationException(ErrorCode::INVALID_FORMAT,
                              "Invalid date: " + text, "date", text);
  }
  return day;
}

MarketHours::MarketHours(MarketHoursConfig config)
    : config_(std::move(config)) {
  try {
    zone_ = boost::make_shared<blt::posix_time_zone>(config_.timezone);
  } catch (const std::exception &e) {
    throw ValidationException(ErrorCode::CONFIGURATION_ERROR,
                              std::string("Invalid market time zone: ") +
                                  e.what(),
                              "market.timezone", config_.timezone);
  }
}

MarketTime MarketHours::toMarketTime(TimePoint now) const {
  const bpt::ptime utc =
      bpt::from_time_t(std::chrono::system_clock::to_time_t(now));
  const blt::local_date_time local(utc, zone_);
  const bpt::ptime wall = local.local_time();

  MarketTime result;
  result.date = wall.date();
  result.hour = static_cast<int>(wall.time_of_day().hours());
  result.minute = static_cast<int>(wall.time_of_day().minutes());
  result.second = static_cast<int>(wall.time_of_day().seconds());
  result.dayOfWeek = result.date.day_of_week().as_number();
  return result;
}

MarketHours::TimePoint MarketHours::fromMarketTime(const bg::date &day,
                                                   int hour,
                                                   int minute) const {
  const bpt::time_duration td(hour, minute, 0);
  const bpt::ptime wall(day, td);

  // Ambiguous fall-back labels resolve to the daylight-time occurrence;
  // labels skipped by spring-forward resolve with the standard offset.
  bpt::ptime utc = wall - zone_->base_utc_offset();
  auto dst = blt::local_date_time::check_dst(day, td, zone_);
  if (dst == boost::date_time::is_in_dst ||
      dst == boost::date_time::ambiguous) {
    utc -= zone_->dst_offset();
  }
  return std::chrono::system_clock::from_time_t(bpt::to_time_t(utc));
}

std::optional<std::string>
MarketHours::holidayName(const bg::date &day) const {
  for (const auto &holiday : config_.holidays) {
    if (day.month().as_number() == holiday.month &&
        day.day().as_number() == holiday.day) {
      return holiday.name;
    }
  }
  return std::nullopt;
}

bool MarketHours::isTradingDay(const bg::date &day) const {
  const int dow = day.day_of_week().as_number();
  if (dow == 0 || dow == 6) {
    return false;
  }
  return !holidayName(day).has_value();
}

bool MarketHours::isOpen(TimePoint now) const {
  const MarketTime local = toMarketTime(now);
  if (!isTradingDay(local.date)) {
    return false;
  }
  const int minutes = local.hour * 60 + local.minute;
  return minutes >= openMinutes() && minutes < closeMinutes();
}

MarketHours::TimePoint MarketHours::nextOpen(TimePoint now) const {
  if (isOpen(now)) {
    return now;
  }

  const MarketTime local = toMarketTime(now);
  bg::date day = local.date;
  if (!isTradingDay(day) || local.hour * 60 + local.minute >= openMinutes()) {
    day += bg::days(1);
  }
  for (int i = 0; i < kMaxCalendarWalk && !isTradingDay(day); ++i) {
    day += bg::days(1);
  }
  return fromMarketTime(day, config_.openHour, config_.openMinute);
}

bg::date MarketHours::tradingDateFor(TimePoint now) const {
  const MarketTime local = toMarketTime(now);
  bg::date day = local.date;
  const bool afterClose = local.hour * 60 + local.minute >= closeMinutes();

  if (local.dayOfWeek == 6) {
    day -= bg::days(1);
  } else if (local.dayOfWeek == 0) {
    day -= bg::days(2);
  } else if (afterClose) {
    // today's session is complete
  } else if (local.dayOfWeek == 1) {
    day -= bg::days(3);
  } else {
    day -= bg::days(1);
  }

  for (int i = 0; i < kMaxCalendarWalk && !isTradingDay(day); ++i) {
    day -= bg::days(1);
  }
  return day;
}

MarketHours MarketHours::withWindow(int openHour, int closeHour) const {
  MarketHoursConfig windowed = config_;
  windowed.openHour = openHour;
  windowed.openMinute = 0;
  windowed.closeHour = closeHour;
  windowed.closeMinute = 0;
  return MarketHours(windowed);
}

} // namespace mdjobs
