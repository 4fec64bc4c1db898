#include "cmd_select.h"
#include "runner_utils.h"
#include "service_setup.h"

#include "caproute/json_mini.h"
#include "caproute/serialization.h"

#include <iostream>

using namespace caproute;

// Exit codes: 0 selected, 2 usage/invalid request, 3 no eligible candidate,
// 4 service unavailable.
int cmd_select(int argc, char** argv) {
    CliArgs args = parse_cli_args(argc, argv, 2, {"--catalog", "--data"});
    if (args.positional.size() != 1) {
        std::cerr << "usage: caproute_cli select <request.json|-> [--catalog DIR] [--data DIR]\n";
        return 2;
    }
    std::string body;
    std::string err = read_input(args.positional[0], &body);
    if (!err.empty()) {
        std::cerr << "[select] " << err << "\n";
        return 2;
    }
    SelectionRequest req;
    if (!request_from_string(body, &req, &err)) {
        std::cerr << "[select] invalid request: " << err << "\n";
        return 2;
    }

    Service svc;
    svc.cfg = configure_from_args(resolve_root(argv[0]), args);
    err = build_service(svc);
    if (!err.empty()) {
        std::cerr << "[select] startup failed: " << err << "\n";
        shutdown_service(svc);
        return 4;
    }

    SelectionOutcome out = svc.gateway->select(req);
    int rc = 0;
    switch (out.status) {
        case SelectionStatus::OK:
            std::cout << out.result_json << "\n";
            break;
        case SelectionStatus::NO_ELIGIBLE_CANDIDATE: {
            json_mini::Doc v(violations_to_json(out.violations));
            std::cerr << "[select] no eligible candidate: " << out.reason << "\n";
            std::cout << json_mini::to_string(v.root) << "\n";
            rc = 3;
            break;
        }
        case SelectionStatus::SERVICE_UNAVAILABLE:
            std::cerr << "[select] service unavailable: " << out.reason
                      << " (retry after " << out.retry_after_seconds << "s)\n";
            rc = 4;
            break;
        case SelectionStatus::INVALID_REQUEST:
            std::cerr << "[select] invalid request: " << out.reason << "\n";
            rc = 2;
            break;
    }
    shutdown_service(svc);
    return rc;
}

// Exit codes: 0 planned (and, with --execute, every step succeeded),
// 1 executed with failures, 2 usage/malformed, 3 planning failed.
int cmd_plan(int argc, char** argv) {
    CliArgs args = parse_cli_args(argc, argv, 2, {"--catalog", "--data"});
    if (args.positional.size() != 1) {
        std::cerr << "usage: caproute_cli plan <plan_request.json|-> [--execute] [--catalog DIR] [--data DIR]\n";
        return 2;
    }
    std::string body;
    std::string err = read_input(args.positional[0], &body);
    if (!err.empty()) {
        std::cerr << "[plan] " << err << "\n";
        return 2;
    }
    auto doc = json_mini::parse(body);
    if (!doc) {
        std::cerr << "[plan] " << args.positional[0] << " is not JSON\n";
        return 2;
    }

    Service svc;
    svc.cfg = configure_from_args(resolve_root(argv[0]), args);
    err = build_service(svc);
    if (!err.empty()) {
        std::cerr << "[plan] startup failed: " << err << "\n";
        shutdown_service(svc);
        return 4;
    }

    PlanBuild b = plan_from_requests(svc, doc.root);
    json_mini::Doc out(plan_build_to_json(b));
    int rc = 0;
    if (!b.ok) {
        std::cerr << "[plan] " << b.error << "\n";
        rc = b.steps.empty() ? 2 : 3;
    } else if (args.switches.count("--execute")) {
        PlanResult r = svc.dispatcher->dispatch(b.plan);
        json_object_object_add(out.root, "result", plan_result_to_json(r));
        if (r.status != PlanStatus::SUCCEEDED) rc = 1;
    }
    std::cout << json_object_to_json_string_ext(out.root, JSON_C_TO_STRING_PRETTY) << "\n";
    shutdown_service(svc);
    return rc;
}
