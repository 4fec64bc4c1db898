#include "test_common.h"
#include "caproute/config.h"
#include <cstdlib>

static std::string env_or_empty(const char* name) {
    const char* v = std::getenv(name);
    return v ? v : "";
}

int main() {
    // Test 1: Default profile is DEV
    unsetenv("CAPROUTE_PROFILE");
    auto p = caproute::detect_profile();
    expect_true(p == caproute::Profile::DEV, "default should be DEV");

    // Test 2: PROD detection, case insensitive, long form
    setenv("CAPROUTE_PROFILE", "prod", 1);
    expect_true(caproute::detect_profile() == caproute::Profile::PROD, "should detect PROD");
    setenv("CAPROUTE_PROFILE", "Production", 1);
    expect_true(caproute::detect_profile() == caproute::Profile::PROD, "should detect Production");
    setenv("CAPROUTE_PROFILE", "staging", 1);
    expect_true(caproute::detect_profile() == caproute::Profile::DEV, "unknown profile is DEV");

    // Test 3: Apply defaults (won't override existing)
    setenv("CAPROUTE_TELEMETRY_FSYNC", "0", 1);
    unsetenv("CAPROUTE_HTTP_DEFAULT_DENY");
    unsetenv("CAPROUTE_JUDGE_TIMEOUT_MS");
    caproute::apply_profile_defaults(caproute::Profile::PROD);
    expect_true(env_or_empty("CAPROUTE_TELEMETRY_FSYNC") == "0", "should NOT override pre-existing env var");
    expect_true(env_or_empty("CAPROUTE_HTTP_DEFAULT_DENY") == "1", "PROD should default-deny http");
    expect_true(env_or_empty("CAPROUTE_JUDGE_TIMEOUT_MS") == "2000", "PROD judge timeout");

    // Test 4: Profile name
    expect_true(std::string(caproute::profile_name(caproute::Profile::DEV)) == "dev", "dev name");
    expect_true(std::string(caproute::profile_name(caproute::Profile::PROD)) == "prod", "prod name");

    // Test 5: load_service_config reads values and rejects out-of-range ones
    {
        setenv("CAPROUTE_PORT", "99999", 1);
        setenv("CAPROUTE_SELECTION_TTL_MS", "-5", 1);
        setenv("CAPROUTE_RETRY_AFTER_BASE_SEC", "45", 1);
        setenv("CAPROUTE_RETRY_AFTER_MAX_SEC", "10", 1);
        setenv("CAPROUTE_TIEBREAK_EPSILON", "0.05", 1);
        setenv("CAPROUTE_TIEBREAK_MAX_CANDIDATES", "1", 1);
        setenv("CAPROUTE_MAX_PLAN_CONCURRENCY", "500", 1);
        setenv("CAPROUTE_HTTP_ALLOWED_HOSTS", " API.example.com , probe.local", 1);
        setenv("CAPROUTE_CATALOG_REFRESH_MS", "-1", 1);

        caproute::ServiceConfig c = caproute::load_service_config();
        expect_true(c.profile == caproute::Profile::DEV, "profile carried");
        expect_eq_ll(c.port, 8090, "port out of range falls back");
        expect_eq_ll(c.selection_ttl_ms, 60000, "negative ttl falls back");
        expect_eq_ll(c.retry_after_base_sec, 45, "retry base");
        expect_eq_ll(c.retry_after_max_sec, 45, "retry cap never below base");
        expect_true(c.tiebreak_epsilon == 0.05, "epsilon parsed");
        expect_eq_ll((long long)c.tiebreak_max_candidates, 2, "at least two tie candidates");
        expect_eq_ll(c.max_plan_concurrency, 50, "plan concurrency capped");
        expect_eq_ll(c.catalog_refresh_interval_ms, 0, "negative refresh disables it");
        expect_eq_ll((long long)c.http_allowed_hosts.size(), 2, "two hosts");
        expect_true(c.http_allowed_hosts[0] == "api.example.com", "hosts trimmed and lowercased");
        expect_true(c.http_default_deny, "default deny from PROD profile defaults");
        expect_true(!c.telemetry_fsync, "explicit fsync=0 kept");

        setenv("CAPROUTE_TIEBREAK_EPSILON", "banana", 1);
        c = caproute::load_service_config();
        expect_true(c.tiebreak_epsilon == 0.02, "unparsable epsilon falls back");
    }

    // Cleanup
    const char* vars[] = {"CAPROUTE_PROFILE", "CAPROUTE_TELEMETRY_FSYNC", "CAPROUTE_HTTP_DEFAULT_DENY",
                          "CAPROUTE_JUDGE_TIMEOUT_MS", "CAPROUTE_STEP_TIMEOUT_MS", "CAPROUTE_PORT",
                          "CAPROUTE_SELECTION_TTL_MS", "CAPROUTE_RETRY_AFTER_BASE_SEC",
                          "CAPROUTE_RETRY_AFTER_MAX_SEC", "CAPROUTE_TIEBREAK_EPSILON",
                          "CAPROUTE_TIEBREAK_MAX_CANDIDATES", "CAPROUTE_MAX_PLAN_CONCURRENCY",
                          "CAPROUTE_HTTP_ALLOWED_HOSTS", "CAPROUTE_CATALOG_REFRESH_MS"};
    for (const char* v : vars) unsetenv(v);

    std::cerr << "test_config: ALL PASSED" << std::endl;
    return 0;
}
