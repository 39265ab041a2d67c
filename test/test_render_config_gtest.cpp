#include <gtest/gtest.h>

#include "cvgen/Errors.hpp"
#include "cvgen/RenderConfig.hpp"

#include "test_support.hpp"

using nlohmann::json;

TEST(RenderConfigTest, EmptyObjectKeepsDefaults) {
    const cvgen::RenderConfig cfg = cvgen::parse_render_config(json::object());

    EXPECT_DOUBLE_EQ(cfg.margins.top_in, 0.75);
    EXPECT_DOUBLE_EQ(cfg.margins.left_in, 1.0);
    EXPECT_EQ(cfg.titles.experience, "Experience");
    EXPECT_EQ(cfg.titles.extracurriculars, "Extracurricular Activities");
    EXPECT_TRUE(cfg.extra_skills.empty());
    EXPECT_EQ(cfg.converter.command.front(), "soffice");
    EXPECT_EQ(cfg.converter.timeout_seconds, 120);
    EXPECT_EQ(cfg.converter.format, "pdf");
}

TEST(RenderConfigTest, OverridesAreApplied) {
    const cvgen::RenderConfig cfg = cvgen::parse_render_config(json::parse(R"({
        "margins_in": {"left": 0.5, "top": 1},
        "section_titles": {"experience": "Work Experience"},
        "extra_skills": ["Kubernetes"],
        "converter": {"command": ["libreoffice", "{input}"], "timeout_seconds": 30}
    })"));

    EXPECT_DOUBLE_EQ(cfg.margins.left_in, 0.5);
    EXPECT_DOUBLE_EQ(cfg.margins.top_in, 1.0);
    EXPECT_DOUBLE_EQ(cfg.margins.right_in, 1.0);
    EXPECT_EQ(cfg.titles.experience, "Work Experience");
    EXPECT_EQ(cfg.titles.skills, "Skills");
    ASSERT_EQ(cfg.extra_skills.size(), 1u);
    EXPECT_EQ(cfg.extra_skills[0], "Kubernetes");
    ASSERT_EQ(cfg.converter.command.size(), 2u);
    EXPECT_EQ(cfg.converter.timeout_seconds, 30);
}

TEST(RenderConfigTest, WrongTypesAreConfigErrors) {
    EXPECT_THROW(cvgen::parse_render_config(json::array()), cvgen::ConfigError);
    EXPECT_THROW(cvgen::parse_render_config(json::parse(R"({"margins_in": 1})")), cvgen::ConfigError);
    EXPECT_THROW(cvgen::parse_render_config(json::parse(R"({"margins_in": {"top": "1in"}})")), cvgen::ConfigError);
    EXPECT_THROW(cvgen::parse_render_config(json::parse(R"({"margins_in": {"top": -1}})")), cvgen::ConfigError);
    EXPECT_THROW(cvgen::parse_render_config(json::parse(R"({"extra_skills": "Go"})")), cvgen::ConfigError);
    EXPECT_THROW(cvgen::parse_render_config(json::parse(R"({"extra_skills": [1]})")), cvgen::ConfigError);
    EXPECT_THROW(cvgen::parse_render_config(json::parse(R"({"converter": {"command": []}})")), cvgen::ConfigError);
    EXPECT_THROW(cvgen::parse_render_config(json::parse(R"({"converter": {"timeout_seconds": 0}})")), cvgen::ConfigError);
    EXPECT_THROW(cvgen::parse_render_config(json::parse(R"({"section_titles": {"skills": 5}})")), cvgen::ConfigError);
}

TEST(RenderConfigTest, LoadFromFile) {
    cvgen_test::ScratchDir dir("config");

    EXPECT_THROW(cvgen::load_render_config(dir.path() / "missing.json"), cvgen::IOError);

    cvgen_test::write_file(dir.path() / "bad.json", "{ nope");
    EXPECT_THROW(cvgen::load_render_config(dir.path() / "bad.json"), cvgen::ConfigError);

    cvgen_test::write_file(dir.path() / "ok.json", R"({"extra_skills": ["Rust"]})");
    EXPECT_EQ(cvgen::load_render_config(dir.path() / "ok.json").extra_skills.size(), 1u);
}

TEST(RenderConfigTest, FormatMayNotBeTheDocumentFormat) {
    EXPECT_THROW(cvgen::parse_render_config(json::parse(R"({"converter": {"format": "docx"}})")), cvgen::ConfigError);
    EXPECT_THROW(cvgen::parse_render_config(json::parse(R"({"converter": {"format": "DOCX"}})")), cvgen::ConfigError);
    EXPECT_THROW(cvgen::parse_render_config(json::parse(R"({"converter": {"format": "../x"}})")), cvgen::ConfigError);

    const auto cfg = cvgen::parse_render_config(json::parse(R"({"converter": {"format": "odt"}})"));
    EXPECT_EQ(cfg.converter.format, "odt");
}

TEST(RenderConfigTest, TimeoutMustFitInAnInt) {
    EXPECT_THROW(cvgen::parse_render_config(json::parse(R"({"converter": {"timeout_seconds": -5}})")), cvgen::ConfigError);
    EXPECT_THROW(cvgen::parse_render_config(json::parse(R"({"converter": {"timeout_seconds": 4294967297}})")),
                 cvgen::ConfigError);
    EXPECT_THROW(cvgen::parse_render_config(json::parse(R"({"converter": {"timeout_seconds": 18446744073709551615}})")),
                 cvgen::ConfigError);
    EXPECT_THROW(cvgen::parse_render_config(json::parse(R"({"converter": {"timeout_seconds": 1.5}})")), cvgen::ConfigError);

    const auto cfg = cvgen::parse_render_config(json::parse(R"({"converter": {"timeout_seconds": 2147483647}})"));
    EXPECT_EQ(cfg.converter.timeout_seconds, 2147483647);
}

TEST(RenderConfigTest, CommandLineTimeout) {
    EXPECT_EQ(cvgen::parse_timeout_seconds("45"), 45);

    EXPECT_THROW(cvgen::parse_timeout_seconds("0"), cvgen::ConfigError);
    EXPECT_THROW(cvgen::parse_timeout_seconds("-5"), cvgen::ConfigError);
    EXPECT_THROW(cvgen::parse_timeout_seconds(""), cvgen::ConfigError);
    EXPECT_THROW(cvgen::parse_timeout_seconds("10s"), cvgen::ConfigError);
    EXPECT_THROW(cvgen::parse_timeout_seconds("99999999999"), cvgen::ConfigError);
    EXPECT_THROW(cvgen::parse_timeout_seconds("99999999999999999999999"), cvgen::ConfigError);
}

TEST(RenderConfigTest, MarginsMustLeaveRoomForDateTab) {
    // Letter is 8.5in wide and the date tab sits 6.0in into the text column.
    EXPECT_THROW(cvgen::parse_render_config(json::parse(R"({"margins_in": {"left": 1.5, "right": 1.5}})")),
                 cvgen::ConfigError);
    EXPECT_THROW(cvgen::parse_render_config(json::parse(R"({"margins_in": {"left": 3}})")), cvgen::ConfigError);

    const auto cfg = cvgen::parse_render_config(json::parse(R"({"margins_in": {"left": 1.25, "right": 1.25}})"));
    EXPECT_DOUBLE_EQ(cfg.margins.left_in, 1.25);
}
