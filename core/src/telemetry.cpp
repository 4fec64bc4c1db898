#include "caproute/telemetry.h"
#include "caproute/json_mini.h"
#include "caproute/util.h"

#include <json-c/json.h>

#include <cmath>
#include <iostream>

namespace caproute {

namespace {

void add_opt_str(json_object* o, const char* key, const std::optional<std::string>& v) {
    if (v) json_object_object_add(o, key, json_object_new_string(v->c_str()));
}

void add_opt_num(json_object* o, const char* key, const std::optional<double>& v) {
    if (v) json_object_object_add(o, key, json_object_new_double(*v));
}

// Optional extras must have the right type when present.
std::string read_opt_str(json_object* o, const char* key, std::optional<std::string>* out) {
    json_object* v = json_mini::field(o, key);
    if (!v || json_object_is_type(v, json_type_null)) return "";
    if (!json_object_is_type(v, json_type_string)) return std::string(key) + " must be a string";
    *out = std::string(json_object_get_string(v));
    return "";
}

std::string read_opt_num(json_object* o, const char* key, std::optional<double>* out) {
    json_object* v = json_mini::field(o, key);
    if (!v || json_object_is_type(v, json_type_null)) return "";
    if (!json_mini::is_number(v)) return std::string(key) + " must be a number";
    double d = json_object_get_double(v);
    if (!std::isfinite(d) || d < 0) return std::string(key) + " must be finite and >= 0";
    *out = d;
    return "";
}

} // namespace

std::string telemetry_to_json(const TelemetryRecord& r) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "tool", json_object_new_string(r.tool.c_str()));
    json_object_object_add(o, "pattern", json_object_new_string(r.pattern.c_str()));
    json_object_object_add(o, "observedTimeMs", json_object_new_double(r.observed_time_ms));
    json_object_object_add(o, "observedCost", json_object_new_double(r.observed_cost));
    json_object_object_add(o, "success", json_object_new_boolean(r.success ? 1 : 0));
    json_object_object_add(o, "timestamp", json_object_new_string(r.timestamp.c_str()));
    add_opt_str(o, "toolVersion", r.tool_version);
    add_opt_str(o, "capability", r.capability);
    add_opt_num(o, "estimatedTimeMs", r.estimated_time_ms);
    add_opt_num(o, "estimatedCost", r.estimated_cost);
    add_opt_num(o, "n", r.n);
    add_opt_str(o, "error", r.error);
    add_opt_str(o, "stepId", r.step_id);
    add_opt_str(o, "planId", r.plan_id);
    std::string s = json_mini::canonical(o);
    json_object_put(o);
    return s;
}

std::string telemetry_from_json(const std::string& json, TelemetryRecord* out) {
    json_mini::Doc d = json_mini::parse(json);
    if (!d || !json_object_is_type(d.root, json_type_object)) return "telemetry record must be a JSON object";
    json_object* o = d.root;

    TelemetryRecord r;
    auto tool = json_mini::field_string(o, "tool");
    auto pattern = json_mini::field_string(o, "pattern");
    if (!tool || tool->empty()) return "tool is required";
    if (!pattern || pattern->empty()) return "pattern is required";
    r.tool = *tool;
    r.pattern = *pattern;

    auto t = json_mini::field_double(o, "observedTimeMs");
    auto c = json_mini::field_double(o, "observedCost");
    if (!t || !std::isfinite(*t) || *t < 0) return "observedTimeMs must be a finite number >= 0";
    if (!c || !std::isfinite(*c) || *c < 0) return "observedCost must be a finite number >= 0";
    r.observed_time_ms = *t;
    r.observed_cost = *c;

    auto ok = json_mini::field_bool(o, "success");
    if (!ok) return "success must be a boolean";
    r.success = *ok;

    json_object* ts = json_mini::field(o, "timestamp");
    if (ts && json_object_is_type(ts, json_type_string)) {
        r.timestamp = json_object_get_string(ts);
    } else if (ts && json_object_is_type(ts, json_type_int)) {
        r.timestamp = iso_from_ms(json_object_get_int64(ts));
    } else if (ts && !json_object_is_type(ts, json_type_null)) {
        return "timestamp must be an ISO-8601 string or epoch milliseconds";
    }

    std::string err;
    if (!(err = read_opt_str(o, "toolVersion", &r.tool_version)).empty()) return err;
    if (!(err = read_opt_str(o, "capability", &r.capability)).empty()) return err;
    if (!(err = read_opt_num(o, "estimatedTimeMs", &r.estimated_time_ms)).empty()) return err;
    if (!(err = read_opt_num(o, "estimatedCost", &r.estimated_cost)).empty()) return err;
    if (!(err = read_opt_num(o, "n", &r.n)).empty()) return err;
    if (!(err = read_opt_str(o, "error", &r.error)).empty()) return err;
    if (!(err = read_opt_str(o, "stepId", &r.step_id)).empty()) return err;
    if (!(err = read_opt_str(o, "planId", &r.plan_id)).empty()) return err;

    *out = std::move(r);
    return "";
}

// ---------- recorder ----------

TelemetryRecorder::TelemetryRecorder(std::filesystem::path path, WalPolicy policy, size_t max_queue)
    : wal_(std::move(path), policy), max_queue_(max_queue == 0 ? 1 : max_queue) {}

TelemetryRecorder::~TelemetryRecorder() {
    stop();
}

std::string TelemetryRecorder::start() {
    std::lock_guard<std::mutex> lk(mu_);
    if (running_) return "";
    std::string err = wal_.open();
    if (!err.empty()) return err;
    stopping_ = false;
    running_ = true;
    writer_ = std::thread([this] { writer_loop(); });
    return "";
}

void TelemetryRecorder::stop() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!running_) return;
        stopping_ = true;
    }
    cv_.notify_all();
    if (writer_.joinable()) writer_.join();
    std::lock_guard<std::mutex> lk(mu_);
    running_ = false;
}

bool TelemetryRecorder::record(TelemetryRecord r) {
    if (r.timestamp.empty()) r.timestamp = iso_from_ms(now_ms_wall());
    std::string line = telemetry_to_json(r);
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!running_ || stopping_ || q_.size() >= max_queue_) {
            dropped_++;
            return false;
        }
        q_.push_back(std::move(line));
    }
    cv_.notify_one();
    return true;
}

void TelemetryRecorder::flush() {
    std::unique_lock<std::mutex> lk(mu_);
    drained_cv_.wait(lk, [&] { return !running_ || (q_.empty() && in_flight_ == 0); });
}

size_t TelemetryRecorder::queued() const {
    std::lock_guard<std::mutex> lk(mu_);
    return q_.size();
}

void TelemetryRecorder::writer_loop() {
    while (true) {
        std::deque<std::string> batch;
        {
            std::unique_lock<std::mutex> lk(mu_);
            cv_.wait(lk, [&] { return stopping_ || !q_.empty(); });
            if (q_.empty() && stopping_) {
                drained_cv_.notify_all();
                return;
            }
            batch.swap(q_);
            in_flight_ = batch.size();
        }

        for (const auto& line : batch) {
            std::string err = wal_.append_json_line(line);
            if (err.empty()) {
                recorded_++;
            } else {
                write_errors_++;
                std::cerr << "[telemetry] append failed: " << err << "\n";
            }
        }

        {
            std::lock_guard<std::mutex> lk(mu_);
            in_flight_ = 0;
        }
        drained_cv_.notify_all();
    }
}

// ---------- summary ----------

std::vector<TelemetrySummary> summarize_telemetry(const std::vector<std::string>& lines, size_t* skipped) {
    struct Acc {
        TelemetrySummary row;
        double sum_time{0.0};
        double sum_cost{0.0};
        double sum_tvar{0.0};
        uint64_t n_tvar{0};
        double sum_cvar{0.0};
        uint64_t n_cvar{0};
    };
    std::map<std::pair<std::string, std::string>, Acc> acc;
    size_t bad = 0;

    for (const auto& line : lines) {
        TelemetryRecord r;
        if (!telemetry_from_json(line, &r).empty()) {
            bad++;
            continue;
        }
        Acc& a = acc[{r.tool, r.pattern}];
        a.row.tool = r.tool;
        a.row.pattern = r.pattern;
        a.row.count++;
        if (r.success) a.row.successes++;
        a.sum_time += r.observed_time_ms;
        a.sum_cost += r.observed_cost;
        if (r.estimated_time_ms && *r.estimated_time_ms > 0) {
            a.sum_tvar += (r.observed_time_ms - *r.estimated_time_ms) / *r.estimated_time_ms * 100.0;
            a.n_tvar++;
        }
        if (r.estimated_cost && *r.estimated_cost > 0) {
            a.sum_cvar += (r.observed_cost - *r.estimated_cost) / *r.estimated_cost * 100.0;
            a.n_cvar++;
        }
    }

    std::vector<TelemetrySummary> out;
    out.reserve(acc.size());
    for (auto& [key, a] : acc) {
        (void)key;
        const double n = static_cast<double>(a.row.count);
        a.row.success_rate = static_cast<double>(a.row.successes) / n;
        a.row.mean_time_ms = a.sum_time / n;
        a.row.mean_cost = a.sum_cost / n;
        if (a.n_tvar > 0) a.row.mean_time_variance_pct = a.sum_tvar / static_cast<double>(a.n_tvar);
        if (a.n_cvar > 0) a.row.mean_cost_variance_pct = a.sum_cvar / static_cast<double>(a.n_cvar);
        out.push_back(a.row);
    }
    if (skipped) *skipped = bad;
    return out;
}

std::string telemetry_summary_to_json(const std::vector<TelemetrySummary>& rows, size_t skipped) {
    json_object* o = json_object_new_object();
    json_object* arr = json_object_new_array();
    for (const auto& r : rows) {
        json_object* e = json_object_new_object();
        json_object_object_add(e, "tool", json_object_new_string(r.tool.c_str()));
        json_object_object_add(e, "pattern", json_object_new_string(r.pattern.c_str()));
        json_object_object_add(e, "count", json_object_new_int64(static_cast<int64_t>(r.count)));
        json_object_object_add(e, "successRate", json_object_new_double(r.success_rate));
        json_object_object_add(e, "meanObservedTimeMs", json_object_new_double(r.mean_time_ms));
        json_object_object_add(e, "meanObservedCost", json_object_new_double(r.mean_cost));
        add_opt_num(e, "meanTimeVariancePercent", r.mean_time_variance_pct);
        add_opt_num(e, "meanCostVariancePercent", r.mean_cost_variance_pct);
        json_object_array_add(arr, e);
    }
    json_object_object_add(o, "patterns", arr);
    json_object_object_add(o, "skippedLines", json_object_new_int64(static_cast<int64_t>(skipped)));
    std::string s = json_mini::to_string(o);
    json_object_put(o);
    return s;
}

} // namespace caproute
