#include "job_models.hpp"
#include "job_exceptions.hpp"
#include "market_hours.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace mdjobs {

bool JobConfiguration::sameSchedule(const JobConfiguration& other) const {
    return jobName == other.jobName && enabled == other.enabled &&
           scheduleKind == other.scheduleKind &&
           intervalValue == other.intervalValue &&
           intervalUnit == other.intervalUnit &&
           cronDayOfWeek == other.cronDayOfWeek &&
           cronHour == other.cronHour && cronMinute == other.cronMinute &&
           onlyMarketHours == other.onlyMarketHours &&
           marketStartHour == other.marketStartHour &&
           marketEndHour == other.marketEndHour;
}

bool JobConfigurationPatch::empty() const {
    return !description && !enabled && !scheduleKind && !intervalValue &&
           !intervalUnit && !cronDayOfWeek && !cronHour && !cronMinute &&
           !onlyMarketHours && !marketStartHour && !marketEndHour;
}

void JobConfigurationPatch::applyTo(JobConfiguration& config) const {
    if (description) config.description = *description;
    if (enabled) config.enabled = *enabled;
    if (scheduleKind) config.scheduleKind = *scheduleKind;
    if (intervalValue) config.intervalValue = *intervalValue;
    if (intervalUnit) config.intervalUnit = *intervalUnit;
    if (cronDayOfWeek) config.cronDayOfWeek = *cronDayOfWeek;
    if (cronHour) config.cronHour = *cronHour;
    if (cronMinute) config.cronMinute = *cronMinute;
    if (onlyMarketHours) config.onlyMarketHours = *onlyMarketHours;
    if (marketStartHour) config.marketStartHour = *marketStartHour;
    if (marketEndHour) config.marketEndHour = *marketEndHour;
}

bool Bar::operator==(const Bar& other) const {
    return date == other.date && open == other.open && high == other.high &&
           low == other.low && close == other.close && volume == other.volume;
}

std::string DateRange::label() const {
    return start == end ? startString() : startString() + ".." + endString();
}

std::string DateRange::startString() const { return formatDate(start); }

std::string DateRange::endString() const { return formatDate(end); }

DateRange DateRange::singleDay(const boost::gregorian::date& day) {
    return DateRange{day, day};
}

DateRange DateRange::fromLabel(const std::string& label) {
    const auto sep = label.find("..");
    if (sep == std::string::npos) {
        return fromStrings(label, label);
    }
    return fromStrings(label.substr(0, sep), label.substr(sep + 2));
}

DateRange DateRange::fromStrings(const std::string& start, const std::string& end) {
    DateRange range{parseDate(start), parseDate(end)};
    if (range.start > range.end) {
        throw ValidationException(ErrorCode::INVALID_RANGE,
                                  "Start date is after end date: " + start + ".." + end,
                                  "date_range", start + ".." + end);
    }
    return range;
}

std::string scheduleKindToString(ScheduleKind kind) {
    switch (kind) {
    case ScheduleKind::INTERVAL:
        return "interval";
    case ScheduleKind::CRON:
        return "cron";
    }
    return "interval";
}

ScheduleKind stringToScheduleKind(const std::string& text) {
    if (text == "interval") return ScheduleKind::INTERVAL;
    if (text == "cron") return ScheduleKind::CRON;
    throw ValidationException(ErrorCode::CONFIGURATION_ERROR,
                              "Unknown schedule type: " + text, "schedule_type", text);
}

std::string runStatusToString(RunStatus status) {
    switch (status) {
    case RunStatus::RUNNING:
        return "running";
    case RunStatus::COMPLETED:
        return "completed";
    case RunStatus::FAILED:
        return "failed";
    case RunStatus::SKIPPED:
        return "skipped";
    }
    return "failed";
}

RunStatus stringToRunStatus(const std::string& text) {
    if (text == "running") return RunStatus::RUNNING;
    if (text == "completed") return RunStatus::COMPLETED;
    if (text == "skipped") return RunStatus::SKIPPED;
    return RunStatus::FAILED;
}

std::string scanStatusToString(ScanStatus status) {
    switch (status) {
    case ScanStatus::RUNNING:
        return "running";
    case ScanStatus::COMPLETED:
        return "completed";
    case ScanStatus::FAILED:
        return "failed";
    }
    return "failed";
}

ScanStatus stringToScanStatus(const std::string& text) {
    if (text == "running") return ScanStatus::RUNNING;
    if (text == "completed") return ScanStatus::COMPLETED;
    return ScanStatus::FAILED;
}

std::string scanErrorTypeToString(ScanErrorType type) {
    switch (type) {
    case ScanErrorType::EMPTY_RESULT:
        return "no_data";
    case ScanErrorType::PROVIDER_ERROR:
        return "provider_error";
    case ScanErrorType::AUTH:
        return "auth";
    }
    return "provider_error";
}

ScanErrorType stringToScanErrorType(const std::string& text) {
    if (text == "no_data") return ScanErrorType::EMPTY_RESULT;
    if (text == "auth") return ScanErrorType::AUTH;
    return ScanErrorType::PROVIDER_ERROR;
}

std::string timePointToString(const TimePoint& tp) {
    auto time_t = Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&time_t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

TimePoint stringToTimePoint(const std::string& text) {
    std::tm tm{};
    std::istringstream iss(text);
    iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (iss.fail()) {
        throw ValidationException(ErrorCode::INVALID_FORMAT,
                                  "Invalid timestamp: " + text, "timestamp", text);
    }
    return Clock::from_time_t(timegm(&tm));
}

} // namespace mdjobs
