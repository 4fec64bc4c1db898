#pragma once

#include "caproute/wal.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace caproute {

// One observed execution. Serialized camelCase:
//   {tool, pattern, observedTimeMs, observedCost, success, timestamp, ...extras}
struct TelemetryRecord {
    std::string tool;
    std::string pattern;
    double observed_time_ms{0.0};
    double observed_cost{0.0};
    bool success{false};
    std::string timestamp;   // ISO-8601 UTC; filled on record() when empty

    std::optional<std::string> tool_version;
    std::optional<std::string> capability;
    std::optional<double> estimated_time_ms;
    std::optional<double> estimated_cost;
    std::optional<double> n;
    std::optional<std::string> error;
    std::optional<std::string> step_id;
    std::optional<std::string> plan_id;
};

std::string telemetry_to_json(const TelemetryRecord& r);

// Strict parse of an ingested record. Returns "" on success, else the reason.
std::string telemetry_from_json(const std::string& json, TelemetryRecord* out);

// TelemetryRecorder
// - record() enqueues and returns at once; a writer thread appends to the WAL
// - Bounded queue: records beyond max_queue are dropped and counted
// - stop() drains what is queued, then joins the writer
class TelemetryRecorder {
public:
    explicit TelemetryRecorder(std::filesystem::path path, WalPolicy policy = {}, size_t max_queue = 10000);
    ~TelemetryRecorder();

    TelemetryRecorder(const TelemetryRecorder&) = delete;
    TelemetryRecorder& operator=(const TelemetryRecorder&) = delete;

    void set_fsync(bool enable) { wal_.set_fsync(enable); }

    // Opens the WAL and starts the writer. Returns "" on success.
    std::string start();
    void stop();

    // false when dropped (queue full or recorder stopped).
    bool record(TelemetryRecord r);

    // Blocks until everything queued so far has been written (or failed).
    void flush();

    uint64_t recorded() const { return recorded_.load(); }
    uint64_t dropped() const { return dropped_.load(); }
    uint64_t write_errors() const { return write_errors_.load(); }
    size_t queued() const;

    const Wal& wal() const { return wal_; }

private:
    void writer_loop();

    Wal wal_;
    size_t max_queue_;

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::condition_variable drained_cv_;
    std::deque<std::string> q_;
    bool running_{false};
    bool stopping_{false};
    size_t in_flight_{0};
    std::thread writer_;

    std::atomic<uint64_t> recorded_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> write_errors_{0};
};

// Per (tool, pattern) aggregate over recorded lines.
struct TelemetrySummary {
    std::string tool;
    std::string pattern;
    uint64_t count{0};
    uint64_t successes{0};
    double success_rate{0.0};
    double mean_time_ms{0.0};
    double mean_cost{0.0};
    // Mean of (observed - estimated) / estimated * 100 over records carrying
    // a positive estimate; nullopt when none did.
    std::optional<double> mean_time_variance_pct;
    std::optional<double> mean_cost_variance_pct;
};

// Lines that fail to parse are counted in *skipped (when non-null).
std::vector<TelemetrySummary> summarize_telemetry(const std::vector<std::string>& lines, size_t* skipped);
std::string telemetry_summary_to_json(const std::vector<TelemetrySummary>& rows, size_t skipped);

} // namespace caproute
