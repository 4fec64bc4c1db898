#include "test_common.h"

#include "caproute/approval.h"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace caproute;

int main() {
    // Test 1: token shape and TTL clamping
    {
        ApprovalLeaseManager m;
        ApprovalLease l = m.issue("deploy_pipeline", 10);
        expect_true(l.token.rfind("appr_", 0) == 0 && l.token.size() == 5 + 32, "token prefix and length");
        expect_eq_ll(l.expires_ms - l.issued_ms, 1000, "ttl raised to 1s");
        l = m.issue("deploy_pipeline", 3600000);
        expect_eq_ll(l.expires_ms - l.issued_ms, 300000, "ttl capped at 300s");
        expect_true(m.issue("").scope == "*", "empty scope is wildcard");
        expect_eq_ll((long long)m.total_issued(), 3, "issued counted");
        expect_eq_ll((long long)m.active_count(), 3, "all active");
    }

    // Test 2: scope and host matching, single use
    {
        ApprovalLeaseManager m;
        std::string why;
        ApprovalLease tool_scope = m.issue("deploy_pipeline", 60000, "alice");
        expect_true(m.verify_and_consume(tool_scope.token, "deploy_pipeline", "full_redeploy", "app-01", &why),
                    "tool scope covers any pattern");
        expect_true(!m.verify_and_consume(tool_scope.token, "deploy_pipeline", "full_redeploy", "app-01", &why),
                    "second use rejected");
        expect_true(why == "approval lease already consumed", "consumed reason");

        ApprovalLease pat = m.issue("deploy_pipeline/full_redeploy");
        expect_true(!m.verify_and_consume(pat.token, "deploy_pipeline", "canary", "", &why), "pattern scope enforced");
        expect_true(why.find("scope mismatch") != std::string::npos, "scope reason");
        expect_true(m.verify_and_consume(pat.token, "deploy_pipeline", "full_redeploy", "", &why),
                    "mismatch did not consume");

        ApprovalLease pinned = m.issue("*", 60000, "bob", "db-01");
        expect_true(!m.verify_and_consume(pinned.token, "any", "thing", "db-02", &why), "host pinned");
        expect_true(why.find("host mismatch") != std::string::npos, "host reason");
        expect_true(m.verify_and_consume(pinned.token, "any", "thing", "db-01", &why), "right host");

        expect_true(!m.verify_and_consume("appr_bogus", "t", "p", "", &why), "unknown token");
        expect_true(why == "approval lease not found", "not found reason");
        expect_true(!m.verify_and_consume("", "t", "p", "", &why), "empty token");
        expect_eq_ll((long long)m.total_consumed(), 3, "consumed counted");
        expect_eq_ll((long long)m.total_rejected(), 5, "rejections counted");

        m.gc();
        expect_eq_ll((long long)m.active_count(), 0, "consumed leases collected");
    }

    // Test 3: expiry
    {
        ApprovalLeaseManager m;
        ApprovalLease l = m.issue("t", 1000);
        std::this_thread::sleep_for(std::chrono::milliseconds(1100));
        std::string why;
        expect_true(!m.verify_and_consume(l.token, "t", "p", "", &why), "expired lease rejected");
        expect_true(why == "approval lease expired", "expiry reason");
    }

    // Test 4: concurrent consumers, exactly one wins
    {
        ApprovalLeaseManager m;
        ApprovalLease l = m.issue("t");
        std::atomic<int> wins{0};
        std::vector<std::thread> ts;
        for (int i = 0; i < 8; i++) {
            ts.emplace_back([&] {
                if (m.verify_and_consume(l.token, "t", "p", "")) wins++;
            });
        }
        for (auto& t : ts) t.join();
        expect_eq_ll(wins.load(), 1, "single use under contention");
    }

    std::cerr << "test_approval: ALL PASSED" << std::endl;
    return 0;
}
