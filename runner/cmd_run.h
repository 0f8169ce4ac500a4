#pragma once

// gauntlet_cli run [flags] [--report FILE]
int cmd_run(int argc, char** argv);

// gauntlet_cli tasks [--dataset D] [--dataset-dir DIR]
int cmd_tasks(int argc, char** argv);
