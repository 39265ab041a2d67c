#include <gtest/gtest.h>

#include "cvgen/Assembler.hpp"
#include "cvgen/OutlineRenderer.hpp"
#include "cvgen/Validator.hpp"

#include "test_support.hpp"

using nlohmann::json;

TEST(OutlineRendererTest, MinimalRecord) {
    const json j = json::parse(R"({
        "personal_info": {"name": "A B", "email": "a@b.com"},
        "experience": [{"company": "X", "location": "Y", "dates": "Jan 2020 - Present",
                        "title": "Eng", "bullet_points": ["Did thing"]}],
        "skills": {"categories": [{"name": "Languages", "items": ["C++", "Go"]}]}
    })");

    const cvgen::DocumentTree tree = cvgen::assemble(cvgen::validate_record(j),
                                                     cvgen::StyleRegistry::standard(), cvgen::RenderConfig{});

    const std::string expected =
        "# A B\n"
        "Email: a@b.com\n"
        "\n"
        "## Experience\n"
        "### X, Y | Jan 2020 - Present\n"
        "**Eng**\n"
        "- Did thing\n"
        "\n"
        "## Skills\n"
        "**Languages:** C++, Go\n"
        "\n";

    EXPECT_EQ(cvgen::render_outline(tree), expected);
}

TEST(OutlineRendererTest, EmptyTree) {
    cvgen::DocumentTree tree;
    EXPECT_EQ(cvgen::render_outline(tree), "");
}
