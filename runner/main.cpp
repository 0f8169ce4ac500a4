#include "cmd_run.h"
#include "cmd_serve.h"
#include "runner_utils.h"

#include <iostream>
#include <string>

static void print_usage(std::ostream& os) {
    os << "gauntlet_cli <run|serve|tasks|help> ...\n"
       << "  run    evaluate every task in the dataset against the participant\n"
       << "  serve  expose the evaluator as an A2A JSON-RPC endpoint\n"
       << "  tasks  list the tasks a dataset resolves to\n\n";
    gauntlet::print_eval_flags_usage(os);
    os << "\nrun:   --report FILE\n"
       << "serve: --host H (default 127.0.0.1) --port P (default 9009)\n";
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(std::cerr);
        return 2;
    }
    std::string cmd = argv[1];
    if (cmd == "run") return cmd_run(argc, argv);
    if (cmd == "serve") return cmd_serve(argc, argv);
    if (cmd == "tasks") return cmd_tasks(argc, argv);
    if (cmd == "help" || cmd == "-h" || cmd == "--help") {
        print_usage(std::cout);
        return 0;
    }
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
