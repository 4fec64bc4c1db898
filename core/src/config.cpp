#include "caproute/config.h"
#include "caproute/util.h"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace caproute {

Profile detect_profile() {
    const char* env = std::getenv("CAPROUTE_PROFILE");
    if (!env) return Profile::DEV;

    const std::string val = lower_ascii(env);
    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("CAPROUTE_TELEMETRY_FSYNC",   "0",     NO_OVERWRITE);
            setenv("CAPROUTE_JUDGE_TIMEOUT_MS",  "3000",  NO_OVERWRITE);
            setenv("CAPROUTE_STEP_TIMEOUT_MS",   "60000", NO_OVERWRITE);
            setenv("CAPROUTE_HTTP_DEFAULT_DENY", "0",     NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("CAPROUTE_TELEMETRY_FSYNC",   "1",     NO_OVERWRITE);
            setenv("CAPROUTE_JUDGE_TIMEOUT_MS",  "2000",  NO_OVERWRITE);
            setenv("CAPROUTE_STEP_TIMEOUT_MS",   "30000", NO_OVERWRITE);
            // No allowlist configured: the http adapter refuses every host.
            setenv("CAPROUTE_HTTP_DEFAULT_DENY", "1",     NO_OVERWRITE);
            break;
    }
}

namespace {

int64_t positive_i64(const char* name, int64_t defv) {
    int64_t v = getenv_i64(name, defv);
    return v > 0 ? v : defv;
}

int positive_int(const char* name, int defv) {
    int v = getenv_int(name, defv);
    return v > 0 ? v : defv;
}

} // namespace

ServiceConfig load_service_config() {
    ServiceConfig c;
    c.profile = detect_profile();

    c.host = getenv_str("CAPROUTE_HOST", c.host);
    c.port = positive_int("CAPROUTE_PORT", c.port);
    if (c.port > 65535) c.port = 8090;
    c.max_connections = positive_int("CAPROUTE_MAX_CONNECTIONS", c.max_connections);
    c.max_body_bytes = (size_t)positive_i64("CAPROUTE_MAX_BODY_BYTES", (int64_t)c.max_body_bytes);
    c.api_token = getenv_str("CAPROUTE_API_TOKEN", "");
    c.hmac_secret = getenv_str("CAPROUTE_API_HMAC_SECRET", "");
    c.hmac_ttl_sec = positive_int("CAPROUTE_API_HMAC_TTL_SEC", c.hmac_ttl_sec);
    c.execute_rpm = getenv_int("CAPROUTE_EXECUTE_RPM", c.execute_rpm);

    c.catalog_dir = getenv_str("CAPROUTE_CATALOG_DIR", c.catalog_dir);
    c.data_dir = getenv_str("CAPROUTE_DATA_DIR", c.data_dir);
    c.telemetry_fsync = getenv_bool("CAPROUTE_TELEMETRY_FSYNC", c.telemetry_fsync);
    c.telemetry_segment_bytes = positive_i64("CAPROUTE_TELEMETRY_SEGMENT_BYTES", c.telemetry_segment_bytes);
    c.telemetry_max_segments = positive_int("CAPROUTE_TELEMETRY_MAX_SEGMENTS", c.telemetry_max_segments);

    c.catalog_cache_entries = (size_t)positive_i64("CAPROUTE_CATALOG_CACHE_ENTRIES", (int64_t)c.catalog_cache_entries);
    c.catalog_cache_ttl_ms = positive_i64("CAPROUTE_CATALOG_CACHE_TTL_MS", c.catalog_cache_ttl_ms);
    c.catalog_pool_size = (size_t)positive_i64("CAPROUTE_CATALOG_POOL_SIZE", (int64_t)c.catalog_pool_size);
    c.catalog_slot_timeout_ms = positive_i64("CAPROUTE_CATALOG_SLOT_TIMEOUT_MS", c.catalog_slot_timeout_ms);
    c.catalog_refresh_interval_ms = getenv_i64("CAPROUTE_CATALOG_REFRESH_MS", 0);
    if (c.catalog_refresh_interval_ms < 0) c.catalog_refresh_interval_ms = 0;

    c.selection_cache_entries = (size_t)positive_i64("CAPROUTE_SELECTION_CACHE_ENTRIES", (int64_t)c.selection_cache_entries);
    c.selection_ttl_ms = positive_i64("CAPROUTE_SELECTION_TTL_MS", c.selection_ttl_ms);
    c.selection_grace_ms = positive_i64("CAPROUTE_SELECTION_GRACE_MS", c.selection_grace_ms);
    c.retry_after_base_sec = positive_int("CAPROUTE_RETRY_AFTER_BASE_SEC", c.retry_after_base_sec);
    c.retry_after_max_sec = positive_int("CAPROUTE_RETRY_AFTER_MAX_SEC", c.retry_after_max_sec);
    if (c.retry_after_max_sec < c.retry_after_base_sec) c.retry_after_max_sec = c.retry_after_base_sec;

    if (const char* e = std::getenv("CAPROUTE_TIEBREAK_EPSILON")) {
        try {
            double v = std::stod(e);
            if (v >= 0.0 && v < 1.0) c.tiebreak_epsilon = v;
        } catch (const std::exception&) {
            std::cerr << "[config] CAPROUTE_TIEBREAK_EPSILON='" << e << "' is not a number, using "
                      << c.tiebreak_epsilon << "\n";
        }
    }
    c.tiebreak_timeout_ms = positive_i64("CAPROUTE_JUDGE_TIMEOUT_MS", c.tiebreak_timeout_ms);
    c.tiebreak_max_candidates = (size_t)positive_i64("CAPROUTE_TIEBREAK_MAX_CANDIDATES", (int64_t)c.tiebreak_max_candidates);
    if (c.tiebreak_max_candidates < 2) c.tiebreak_max_candidates = 2;
    c.tiebreak_max_prompt_chars = (size_t)positive_i64("CAPROUTE_TIEBREAK_PROMPT_CHARS", (int64_t)c.tiebreak_max_prompt_chars);
    c.judge_cmd = getenv_str("CAPROUTE_JUDGE_CMD", "");

    c.step_timeout_ms = positive_i64("CAPROUTE_STEP_TIMEOUT_MS", c.step_timeout_ms);
    c.plan_timeout_ms = getenv_i64("CAPROUTE_PLAN_TIMEOUT_MS", 0);
    if (c.plan_timeout_ms < 0) c.plan_timeout_ms = 0;
    c.max_plan_concurrency = positive_int("CAPROUTE_MAX_PLAN_CONCURRENCY", c.max_plan_concurrency);
    if (c.max_plan_concurrency > 50) c.max_plan_concurrency = 50;
    c.default_backend = getenv_str("CAPROUTE_DEFAULT_BACKEND", c.default_backend);

    c.credentials_file = getenv_str("CAPROUTE_CREDENTIALS_FILE", "");
    c.ssh_bin = getenv_str("CAPROUTE_SSH_BIN", c.ssh_bin);
    c.curl_bin = getenv_str("CAPROUTE_CURL_BIN", c.curl_bin);
    c.http_allowed_hosts = split_csv(getenv_str("CAPROUTE_HTTP_ALLOWED_HOSTS", ""));
    for (auto& h : c.http_allowed_hosts) h = lower_ascii(h);
    c.http_default_deny = getenv_bool("CAPROUTE_HTTP_DEFAULT_DENY", c.http_default_deny);
    c.winrm_client = getenv_str("CAPROUTE_WINRM_CLIENT", "");
    c.database_client = getenv_str("CAPROUTE_DATABASE_CLIENT", "");
    return c;
}

} // namespace caproute
