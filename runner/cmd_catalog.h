#pragma once

// caproute_cli import <tool.json>... [--dry-run] [--catalog DIR]
int cmd_import(int argc, char** argv);
