#include "commands/render.hpp"

#include "ArgUtil.hpp"

#include "cvgen/Converter.hpp"
#include "cvgen/Errors.hpp"
#include "cvgen/Generator.hpp"
#include "cvgen/RenderConfig.hpp"
#include "cvgen/Validator.hpp"

#include <iostream>
#include <memory>
#include <string>

static int render_usage() {
    std::cerr
        << "usage:\n"
        << "  cvgen render --resume <path> --out <path.docx> [--config <path>] [--pdf] [--timeout <sec>]\n";
    return 1;
}

int cmd_render(int argc, char** argv) {
    const std::string resume_path = get_arg(argc, argv, "--resume", "");
    const std::string out_path    = get_arg(argc, argv, "--out", "");
    const std::string config_path = get_arg(argc, argv, "--config", "");
    const bool want_pdf           = has_flag(argc, argv, "--pdf");

    if (resume_path.empty()) {
        std::cerr << "error: missing --resume\n";
        return render_usage();
    }
    if (out_path.empty()) {
        std::cerr << "error: missing --out\n";
        return render_usage();
    }

    cvgen::RenderConfig cfg;
    if (!config_path.empty()) {
        try {
            cfg = cvgen::load_render_config(config_path);
        } catch (const std::exception& e) {
            std::cerr << "[error] failed to load config: " << e.what() << "\n";
            return 1;
        }
    }
    if (has_flag(argc, argv, "--timeout")) {
        try {
            cfg.converter.timeout_seconds = cvgen::parse_timeout_seconds(get_arg(argc, argv, "--timeout", ""));
        } catch (const cvgen::ConfigError& e) {
            std::cerr << "error: " << e.what() << "\n";
            return render_usage();
        }
    }

    cvgen::ResumeRecord record;
    try {
        record = cvgen::load_resume_record(resume_path);
    } catch (const cvgen::SchemaError& e) {
        std::cerr << "[error] invalid resume: " << e.what() << "\n";
        return 1;
    } catch (const cvgen::IOError& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 1;
    }

    std::unique_ptr<cvgen::DocumentConverter> converter;
    if (want_pdf) converter = std::make_unique<cvgen::CommandConverter>(cfg.converter);

    cvgen::GenerateResult res;
    try {
        res = cvgen::generate_document(record, cfg, out_path, converter.get());
    } catch (const cvgen::IOError& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 1;
    }

    std::cout << "OUT_DOCX: " << res.document_path.string() << "\n";

    if (res.conversion) {
        if (res.conversion->ok) {
            std::cout << "OUT_PDF: " << res.conversion->output_path.string() << "\n";
        } else {
            std::cerr << "[warn] conversion failed: " << res.conversion->error << "\n";
        }
    }

    return 0;
}
