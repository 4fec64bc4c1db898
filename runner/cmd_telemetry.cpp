#include "cmd_telemetry.h"

#include "caproute/audit.h"
#include "caproute/telemetry.h"
#include "caproute/wal.h"

#include <iostream>

using namespace caproute;

int cmd_telemetry_summary(int argc, char** argv) {
    if (argc != 3) {
        std::cerr << "usage: caproute_cli telemetry_summary <telemetry.jsonl>\n";
        return 2;
    }
    Wal wal(argv[2]);
    auto segments = wal.list_segments();
    if (segments.empty()) {
        std::cerr << "[telemetry] no segments found for " << argv[2] << "\n";
        return 1;
    }
    size_t skipped = 0;
    auto rows = summarize_telemetry(wal.read_lines(), &skipped);
    std::cout << telemetry_summary_to_json(rows, skipped) << "\n";
    if (skipped > 0) std::cerr << "[telemetry] skipped " << skipped << " malformed line(s)\n";
    return 0;
}

int cmd_audit_verify(int argc, char** argv) {
    if (argc != 3) {
        std::cerr << "usage: caproute_cli audit_verify <audit.jsonl>\n";
        return 2;
    }
    std::string err = verify_audit_chain(argv[2]);
    if (!err.empty()) {
        std::cout << "AUDIT: BROKEN " << err << "\n";
        return 1;
    }
    std::cout << "AUDIT: OK\n";
    return 0;
}
