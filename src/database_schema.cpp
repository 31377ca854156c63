#include "database_schema.hpp"

namespace mdjobs {

std::vector<std::string> DatabaseSchema::getCreateTableStatements() {
  return {// Job schedule definitions
          R"(
        CREATE TABLE IF NOT EXISTS job_configurations (
            id SERIAL PRIMARY KEY,
            job_name VARCHAR(100) UNIQUE NOT NULL,
            description TEXT,
            enabled BOOLEAN NOT NULL DEFAULT TRUE,
            schedule_type VARCHAR(20) NOT NULL CHECK (schedule_type IN ('interval', 'cron')),
            interval_value INTEGER,
            interval_unit VARCHAR(20),
            cron_day_of_week VARCHAR(50),
            cron_hour INTEGER,
            cron_minute INTEGER,
            only_market_hours BOOLEAN NOT NULL DEFAULT FALSE,
            market_start_hour INTEGER,
            market_end_hour INTEGER,
            created_at TIMESTAMP NOT NULL DEFAULT (NOW() AT TIME ZONE 'UTC'),
            updated_at TIMESTAMP NOT NULL DEFAULT (NOW() AT TIME ZONE 'UTC')
        );
        )",

          // Run history, one row per attempt
          R"(
        CREATE TABLE IF NOT EXISTS job_execution_status (
            id BIGSERIAL PRIMARY KEY,
            job_name VARCHAR(100) NOT NULL,
            status VARCHAR(20) NOT NULL CHECK (status IN ('running', 'completed', 'failed', 'skipped')),
            started_at TIMESTAMP NOT NULL,
            completed_at TIMESTAMP,
            duration_seconds DOUBLE PRECISION,
            records_processed BIGINT,
            error_message TEXT,
            next_run_at TIMESTAMP
        );
        )",

          // End-of-day scan runs
          R"(
        CREATE TABLE IF NOT EXISTS scan_runs (
            id BIGSERIAL PRIMARY KEY,
            status VARCHAR(20) NOT NULL CHECK (status IN ('running', 'completed', 'failed')),
            scan_date VARCHAR(32) NOT NULL,
            symbols_requested INTEGER NOT NULL DEFAULT 0,
            symbols_fetched INTEGER NOT NULL DEFAULT 0,
            error_count INTEGER NOT NULL DEFAULT 0,
            started_at TIMESTAMP NOT NULL,
            completed_at TIMESTAMP
        );
        )",

          // Per-symbol scan diagnostics
          R"(
        CREATE TABLE IF NOT EXISTS scan_errors (
            id BIGSERIAL PRIMARY KEY,
            scan_run_id BIGINT NOT NULL REFERENCES scan_runs(id) ON DELETE CASCADE,
            symbol VARCHAR(32) NOT NULL,
            error_type VARCHAR(32) NOT NULL CHECK (error_type IN ('no_data', 'provider_error', 'auth')),
            error_message TEXT,
            http_status INTEGER,
            occurred_at TIMESTAMP NOT NULL
        );
        )",

          // Daily OHLC bars keyed by symbol and date
          R"(
        CREATE TABLE IF NOT EXISTS prices_daily (
            symbol VARCHAR(32) NOT NULL,
            date VARCHAR(10) NOT NULL,
            open DOUBLE PRECISION NOT NULL,
            high DOUBLE PRECISION NOT NULL,
            low DOUBLE PRECISION NOT NULL,
            close DOUBLE PRECISION NOT NULL,
            volume BIGINT NOT NULL DEFAULT 0,
            source VARCHAR(32) NOT NULL DEFAULT 'schwab',
            PRIMARY KEY (symbol, date)
        );
        )",

          // Symbol reference table maintained by the universe refresh
          R"(
        CREATE TABLE IF NOT EXISTS symbols (
            symbol VARCHAR(32) PRIMARY KEY,
            security_name TEXT,
            test_issue VARCHAR(1) DEFAULT 'N'
        );
        )"};
}

std::vector<std::string> DatabaseSchema::getIndexStatements() {
  return {
      "CREATE INDEX IF NOT EXISTS idx_job_execution_job_started ON "
      "job_execution_status(job_name, started_at DESC);",
      "CREATE INDEX IF NOT EXISTS idx_job_execution_status ON "
      "job_execution_status(status);",
      "CREATE INDEX IF NOT EXISTS idx_scan_runs_started ON "
      "scan_runs(started_at DESC);",
      "CREATE INDEX IF NOT EXISTS idx_scan_errors_scan ON "
      "scan_errors(scan_run_id, error_type);",
      "CREATE INDEX IF NOT EXISTS idx_scan_errors_symbol ON "
      "scan_errors(scan_run_id, symbol);"};
}

} // namespace mdjobs
