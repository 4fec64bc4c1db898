#pragma once

// caproute_cli serve [--host H] [--port P] [--catalog DIR] [--data DIR]
int cmd_serve(int argc, char** argv);
