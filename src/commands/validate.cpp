#include "commands/validate.hpp"

#include "ArgUtil.hpp"

#include "cvgen/Errors.hpp"
#include "cvgen/Validator.hpp"

#include <iostream>
#include <string>

static int validate_usage() {
    std::cerr
        << "usage:\n"
        << "  cvgen validate --resume <path> [--out <report.json>]\n";
    return 1;
}

int cmd_validate(int argc, char** argv) {
    const std::string resume_path = get_arg(argc, argv, "--resume", "");
    const std::string out_path    = get_arg(argc, argv, "--out", "");

    if (resume_path.empty()) {
        std::cerr << "error: missing --resume\n";
        return validate_usage();
    }

    const cvgen::ValidationReport rep = cvgen::validate_file(resume_path);

    if (!out_path.empty()) {
        try {
            cvgen::write_validation_report(out_path, rep);
        } catch (const cvgen::IOError& e) {
            std::cerr << "[error] " << e.what() << "\n";
            return 1;
        }
    }

    if (!rep.pass) {
        std::cerr << "validation failed";
        if (!out_path.empty()) std::cerr << ": wrote " << out_path;
        std::cerr << "\n";
        for (const auto& e : rep.errors) {
            std::cerr << "- " << e.code << ": " << e.message;
            if (!e.path.empty()) std::cerr << " (at " << e.path << ")";
            std::cerr << "\n";
        }
        return 1;
    }

    std::cout << "VALIDATION: pass\n";
    if (!out_path.empty()) std::cout << "OUT_VALIDATE: " << out_path << "\n";
    return 0;
}
