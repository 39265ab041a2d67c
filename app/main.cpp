#include "commands/dump.hpp"
#include "commands/render.hpp"
#include "commands/validate.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  cvgen render [args]\n"
        << "  cvgen validate [args]\n"
        << "  cvgen dump [args]\n"
        << "  cvgen help\n";
    return 1;
}

static int print_render_help() {
    std::cerr
        << "usage:\n"
        << "  cvgen render --resume <path> --out <path.docx> [options]\n"
        << "\n"
        << "inputs/outputs:\n"
        << "  --resume <path>              (required) resume record, JSON\n"
        << "  --out <path>                 (required) .docx to write\n"
        << "  --config <path>              optional render config, JSON\n"
        << "\n"
        << "conversion:\n"
        << "  --pdf                        also convert to PDF next to --out\n"
        << "  --timeout <sec>              converter timeout, default: 120\n";
    return 0;
}

static int print_validate_help() {
    std::cerr
        << "usage:\n"
        << "  cvgen validate --resume <path> [--out <report.json>]\n";
    return 0;
}

static int print_dump_help() {
    std::cerr
        << "usage:\n"
        << "  cvgen dump [--resume <path>] [--config <path>]\n"
        << "\n"
        << "options:\n"
        << "  --resume <path>              default: data/resume.json\n"
        << "  --config <path>              optional render config, JSON\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    const bool wants_help = argc >= 3 && std::string(argv[2]) == "--help";
    if (cmd == "render"   && wants_help) return print_render_help();
    if (cmd == "validate" && wants_help) return print_validate_help();
    if (cmd == "dump"     && wants_help) return print_dump_help();

    if (cmd == "render")   return cmd_render(argc - 1, argv + 1);
    if (cmd == "validate") return cmd_validate(argc - 1, argv + 1);
    if (cmd == "dump")     return cmd_dump(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
