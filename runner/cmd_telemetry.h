#pragma once

// caproute_cli telemetry_summary <telemetry.jsonl>
// Reads the active segment and every rotated segment next to it.
int cmd_telemetry_summary(int argc, char** argv);

// caproute_cli audit_verify <audit.jsonl>
int cmd_audit_verify(int argc, char** argv);
