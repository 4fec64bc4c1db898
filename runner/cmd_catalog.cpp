#include "cmd_catalog.h"
#include "runner_utils.h"

#include "caproute/catalog_import.h"
#include "caproute/catalog_store.h"
#include "caproute/errors.h"

#include <iostream>

using namespace caproute;

// Exit codes: 0 every file accepted, 1 at least one rejected, 2 usage,
// 4 store unavailable.
int cmd_import(int argc, char** argv) {
    CliArgs args = parse_cli_args(argc, argv, 2, {"--catalog"});
    if (args.positional.empty()) {
        std::cerr << "usage: caproute_cli import <tool.json>... [--dry-run] [--catalog DIR]\n";
        return 2;
    }
    const bool dry_run = args.switches.count("--dry-run") > 0;
    ServiceConfig cfg = configure_from_args(resolve_root(argv[0]), args);

    std::error_code ec;
    std::filesystem::create_directories(cfg.catalog_dir, ec);
    if (ec) {
        std::cerr << "[import] cannot create " << cfg.catalog_dir << ": " << ec.message() << "\n";
        return 4;
    }
    FileCatalogStore store(cfg.catalog_dir);

    int rc = 0;
    for (const auto& file : args.positional) {
        std::string body;
        std::string err = read_input(file, &body);
        if (!err.empty()) {
            std::cerr << "[import] " << err << "\n";
            rc = 1;
            continue;
        }
        ImportReport r;
        try {
            r = import_tool_definition(store, body, dry_run);
        } catch (const CatalogUnavailable& e) {
            std::cerr << "[import] catalog unavailable: " << e.what() << "\n";
            return 4;
        }
        std::cout << import_report_to_json(r) << "\n";
        if (!r.ok) {
            rc = 1;
            std::cerr << "[import] " << file << ": rejected (" << r.issues.size() << " issue(s))\n";
        } else {
            std::cerr << "[import] " << file << ": " << r.tool << "@" << r.version
                      << (dry_run ? " valid (dry run)" : (r.written ? " written" : " unchanged")) << "\n";
        }
    }
    return rc;
}
