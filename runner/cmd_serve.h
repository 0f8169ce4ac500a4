#pragma once

// gauntlet_cli serve [--host H] [--port P] [flags]
int cmd_serve(int argc, char** argv);
