#pragma once

#include <boost/date_time/gregorian/gregorian.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mdjobs {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class ScheduleKind { INTERVAL, CRON };

enum class RunStatus { RUNNING, COMPLETED, FAILED, SKIPPED };

enum class ScanStatus { RUNNING, COMPLETED, FAILED };

enum class ScanErrorType { EMPTY_RESULT, PROVIDER_ERROR, AUTH };

// Schedule definition for one named job. Interval unit and cron day-of-week
// are kept as entered; the trigger layer validates them when arming.
struct JobConfiguration {
    std::string jobName;
    std::string description;
    bool enabled = true;
    ScheduleKind scheduleKind = ScheduleKind::INTERVAL;
    std::optional<int> intervalValue;
    std::optional<std::string> intervalUnit;
    std::optional<std::string> cronDayOfWeek;
    std::optional<int> cronHour;
    std::optional<int> cronMinute;
    bool onlyMarketHours = false;
    std::optional<int> marketStartHour;
    std::optional<int> marketEndHour;
    TimePoint createdAt{};
    TimePoint updatedAt{};

    // True when both describe the same armed timer
    bool sameSchedule(const JobConfiguration& other) const;
};

// Partial administrative update; unset fields are left unchanged
struct JobConfigurationPatch {
    std::optional<std::string> description;
    std::optional<bool> enabled;
    std::optional<ScheduleKind> scheduleKind;
    std::optional<int> intervalValue;
    std::optional<std::string> intervalUnit;
    std::optional<std::string> cronDayOfWeek;
    std::optional<int> cronHour;
    std::optional<int> cronMinute;
    std::optional<bool> onlyMarketHours;
    std::optional<int> marketStartHour;
    std::optional<int> marketEndHour;

    bool empty() const;
    void applyTo(JobConfiguration& config) const;
};

struct ExecutionRun {
    int64_t id = 0;
    std::string jobName;
    RunStatus status = RunStatus::RUNNING;
    TimePoint startedAt{};
    std::optional<TimePoint> completedAt;
    std::optional<double> durationSeconds;
    std::optional<int64_t> recordsProcessed;
    std::optional<std::string> errorMessage;
    std::optional<TimePoint> nextRunAt;
};

struct ScanRun {
    int64_t id = 0;
    ScanStatus status = ScanStatus::RUNNING;
    std::string scanDate;
    int symbolsRequested = 0;
    int symbolsFetched = 0;
    int errorCount = 0;
    TimePoint startedAt{};
    std::optional<TimePoint> completedAt;
};

struct ScanError {
    int64_t id = 0;
    int64_t scanRunId = 0;
    std::string symbol;
    ScanErrorType errorType = ScanErrorType::PROVIDER_ERROR;
    std::string message;
    std::optional<int> httpStatus;
    TimePoint occurredAt{};
};

struct Bar {
    std::string date; // YYYY-MM-DD
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    int64_t volume = 0;

    bool operator==(const Bar& other) const;
    bool operator!=(const Bar& other) const { return !(*this == other); }
};

struct UpsertCounts {
    int inserted = 0;
    int updated = 0;
    int skipped = 0;

    UpsertCounts& operator+=(const UpsertCounts& other) {
        inserted += other.inserted;
        updated += other.updated;
        skipped += other.skipped;
        return *this;
    }
};

struct SymbolRecord {
    std::string symbol;
    std::string testIssue; // "Y" marks a test issue
};

// Inclusive calendar range; the label is "start" or "start..end"
struct DateRange {
    boost::gregorian::date start;
    boost::gregorian::date end;

    std::string label() const;
    std::string startString() const;
    std::string endString() const;

    static DateRange singleDay(const boost::gregorian::date& day);
    // Throws ValidationException for malformed labels or start > end
    static DateRange fromLabel(const std::string& label);
    static DateRange fromStrings(const std::string& start, const std::string& end);
};

// Enum <-> storage string converters
std::string scheduleKindToString(ScheduleKind kind);
ScheduleKind stringToScheduleKind(const std::string& text);
std::string runStatusToString(RunStatus status);
RunStatus stringToRunStatus(const std::string& text);
std::string scanStatusToString(ScanStatus status);
ScanStatus stringToScanStatus(const std::string& text);
std::string scanErrorTypeToString(ScanErrorType type);
ScanErrorType stringToScanErrorType(const std::string& text);

// UTC "YYYY-MM-DD HH:MM:SS"
std::string timePointToString(const TimePoint& tp);
TimePoint stringToTimePoint(const std::string& text);

} // namespace mdjobs
