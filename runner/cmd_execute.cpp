#include "cmd_execute.h"
#include "runner_utils.h"
#include "service_setup.h"

#include "caproute/json_mini.h"
#include "caproute/serialization.h"

#include <csignal>
#include <iostream>

using namespace caproute;

namespace {
CancelToken* g_cancel = nullptr;

extern "C" void on_cancel_signal(int) {
    if (g_cancel) g_cancel->cancel();
}
} // namespace

// Exit codes: 0 every step succeeded, 1 plan partial/failed/cancelled,
// 2 usage or malformed plan.
int cmd_execute(int argc, char** argv) {
    CliArgs args = parse_cli_args(argc, argv, 2, {"--catalog", "--data"});
    if (args.positional.size() != 1) {
        std::cerr << "usage: caproute_cli execute <plan.json|-> [--data DIR]\n";
        return 2;
    }
    std::string body;
    std::string err = read_input(args.positional[0], &body);
    if (!err.empty()) {
        std::cerr << "[execute] " << err << "\n";
        return 2;
    }
    auto doc = json_mini::parse(body);
    ExecutionPlan plan;
    if (!doc || !plan_from_json(doc.root, &plan, &err)) {
        std::cerr << "[execute] malformed plan: " << (doc ? err : std::string("not JSON")) << "\n";
        return 2;
    }
    err = validate_plan(plan);
    if (!err.empty()) {
        std::cerr << "[execute] invalid plan: " << err << "\n";
        return 2;
    }

    Service svc;
    svc.cfg = configure_from_args(resolve_root(argv[0]), args);
    err = build_service(svc);
    if (!err.empty()) {
        std::cerr << "[execute] startup failed: " << err << "\n";
        shutdown_service(svc);
        return 2;
    }

    CancelToken cancel;
    g_cancel = &cancel;
    std::signal(SIGINT, on_cancel_signal);
    std::signal(SIGTERM, on_cancel_signal);

    PlanResult r = svc.dispatcher->dispatch(plan, &cancel);

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_cancel = nullptr;

    json_mini::Doc out(plan_result_to_json(r));
    std::cout << json_object_to_json_string_ext(out.root, JSON_C_TO_STRING_PRETTY) << "\n";
    std::cerr << "[execute] plan " << r.plan_id << " " << plan_status_str(r.status)
              << " in " << r.duration_ms << " ms\n";
    shutdown_service(svc);
    return r.status == PlanStatus::SUCCEEDED ? 0 : 1;
}
