#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace caproute {

enum class Profile { DEV, PROD };

// Profile from CAPROUTE_PROFILE (case-insensitive "prod"/"production"). Default: DEV.
Profile detect_profile();
const char* profile_name(Profile p);

// Sets CAPROUTE_* variables that are not already set.
// DEV: no fsync, generous judge timeout, HTTP adapter open
// PROD: fsync on, tight judge timeout, HTTP adapter default-deny
// Must run before any worker thread starts (setenv is not thread-safe).
void apply_profile_defaults(Profile p);

// Everything the service reads from the environment, read once at startup.
struct ServiceConfig {
    Profile profile{Profile::DEV};

    // HTTP surface
    std::string host{"127.0.0.1"};
    int port{8090};
    int max_connections{32};
    size_t max_body_bytes{2 * 1024 * 1024};
    std::string api_token;
    std::string hmac_secret;
    int hmac_ttl_sec{60};
    int execute_rpm{120};

    // Storage
    std::string catalog_dir{"catalog"};
    std::string data_dir{"caproute_data"};
    bool telemetry_fsync{false};
    int64_t telemetry_segment_bytes{16 * 1024 * 1024};
    int telemetry_max_segments{10};

    // Catalog adapter
    size_t catalog_cache_entries{1000};
    int64_t catalog_cache_ttl_ms{300000};
    size_t catalog_pool_size{10};
    int64_t catalog_slot_timeout_ms{2000};
    int64_t catalog_refresh_interval_ms{0};   // 0: on demand only

    // Selection cache
    size_t selection_cache_entries{10000};
    int64_t selection_ttl_ms{60000};
    int64_t selection_grace_ms{600000};
    int retry_after_base_sec{30};
    int retry_after_max_sec{300};

    // Tie-break
    double tiebreak_epsilon{0.02};
    int64_t tiebreak_timeout_ms{3000};
    size_t tiebreak_max_candidates{3};
    size_t tiebreak_max_prompt_chars{2000};
    std::string judge_cmd;                    // empty: first-choice judge

    // Dispatch
    int64_t step_timeout_ms{60000};
    int64_t plan_timeout_ms{0};               // 0: sum of step timeouts
    int max_plan_concurrency{50};
    std::string default_backend{"local"};     // "" disables fallback routing

    // Adapters
    std::string credentials_file;
    std::string ssh_bin{"ssh"};
    std::string curl_bin{"curl"};
    std::vector<std::string> http_allowed_hosts;
    bool http_default_deny{false};
    std::string winrm_client;
    std::string database_client;
};

// Reads CAPROUTE_* into a ServiceConfig. Out-of-range values fall back to defaults.
ServiceConfig load_service_config();

} // namespace caproute
