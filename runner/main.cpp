#include "cmd_catalog.h"
#include "cmd_execute.h"
#include "cmd_select.h"
#include "cmd_serve.h"
#include "cmd_telemetry.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "caproute_cli <serve|import|select|plan|execute|telemetry_summary|audit_verify> ...\n";
        return 2;
    }
    std::string cmd = argv[1];
    if (cmd == "serve") return cmd_serve(argc, argv);
    if (cmd == "import") return cmd_import(argc, argv);
    if (cmd == "select") return cmd_select(argc, argv);
    if (cmd == "plan") return cmd_plan(argc, argv);
    if (cmd == "execute") return cmd_execute(argc, argv);
    if (cmd == "telemetry_summary") return cmd_telemetry_summary(argc, argv);
    if (cmd == "audit_verify") return cmd_audit_verify(argc, argv);
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
