#pragma once

// caproute_cli select <request.json|-> [--catalog DIR] [--data DIR]
int cmd_select(int argc, char** argv);

// caproute_cli plan <plan_request.json|-> [--execute] [--catalog DIR] [--data DIR]
int cmd_plan(int argc, char** argv);
