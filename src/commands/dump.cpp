#include "commands/dump.hpp"

#include "ArgUtil.hpp"

#include "cvgen/Assembler.hpp"
#include "cvgen/OutlineRenderer.hpp"
#include "cvgen/RenderConfig.hpp"
#include "cvgen/StyleRegistry.hpp"
#include "cvgen/Validator.hpp"

#include <iostream>
#include <string>

int cmd_dump(int argc, char** argv) {
    const std::string resume_path = get_arg(argc, argv, "--resume", "data/resume.json");
    const std::string config_path = get_arg(argc, argv, "--config", "");

    try {
        cvgen::RenderConfig cfg;
        if (!config_path.empty()) cfg = cvgen::load_render_config(config_path);

        const cvgen::ResumeRecord record = cvgen::load_resume_record(resume_path);
        const cvgen::DocumentTree tree = cvgen::assemble(record, cvgen::StyleRegistry::standard(), cfg);
        std::cout << cvgen::render_outline(tree);
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 1;
    }

    return 0;
}
