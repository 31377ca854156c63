#pragma once

#include "config_manager.hpp"
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/local_time/local_time.hpp>
#include <chrono>
#include <optional>
#include <string>

namespace mdjobs {

// Wall-clock reading in the market time zone
struct MarketTime {
  boost::gregorian::date date;
  int hour = 0;
  int minute = 0;
  int second = 0;
  int dayOfWeek = 0; // 0 = Sunday

  bool isWeekend() const { return dayOfWeek == 0 || dayOfWeek == 6; }
  std::string toString() const;
};

/**
 * Trading-calendar calculations in the market time zone.
 *
 * The market is closed on weekends and on the configured fixed-date
 * holidays. The open window is [open, close) in wall-clock minutes.
 */
class MarketHours {
public:
  using TimePoint = std::chrono::system_clock::time_point;

  explicit MarketHours(MarketHoursConfig config = MarketHoursConfig{});

  bool isOpen(TimePoint now) const;
  // now itself when the market is open
  TimePoint nextOpen(TimePoint now) const;

  bool isTradingDay(const boost::gregorian::date &day) const;
  std::optional<std::string> holidayName(const boost::gregorian::date &day) const;

  // Most recent session whose daily bar should be complete at `now`
  boost::gregorian::date tradingDateFor(TimePoint now) const;

  MarketTime toMarketTime(TimePoint now) const;
  TimePoint fromMarketTime(const boost::gregorian::date &day, int hour,
                           int minute) const;

  // Same calendar and zone with a different [openHour, closeHour) window
  MarketHours withWindow(int openHour, int closeHour) const;

  const MarketHoursConfig &config() const { return config_; }

private:
  MarketHoursConfig config_;
  boost::local_time::time_zone_ptr zone_;

  int openMinutes() const { return config_.openHour * 60 + config_.openMinute; }
  int closeMinutes() const {
    return config_.closeHour * 60 + config_.closeMinute;
  }
};

std::string formatDate(const boost::gregorian::date &day);
// Parses YYYY-MM-DD; throws ValidationException(INVALID_FORMAT)
boost::gregorian::date parseDate(const std::string &text);

} // namespace mdjobs
