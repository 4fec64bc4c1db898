#pragma once

// caproute_cli execute <plan.json|-> [--data DIR]
// SIGINT/SIGTERM cancel the running plan.
int cmd_execute(int argc, char** argv);
