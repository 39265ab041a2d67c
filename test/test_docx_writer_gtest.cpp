#include <gtest/gtest.h>

#include "cvgen/Assembler.hpp"
#include "cvgen/DocxWriter.hpp"
#include "cvgen/Errors.hpp"
#include "cvgen/Validator.hpp"

#include "test_support.hpp"

#include <filesystem>

namespace fs = std::filesystem;

using nlohmann::json;

static cvgen::DocumentTree full_tree() {
    return cvgen::assemble(cvgen::validate_record(cvgen_test::full_resume_json()),
                           cvgen::StyleRegistry::standard(), cvgen::RenderConfig{});
}

static bool contains(const std::string& hay, const std::string& needle) {
    return hay.find(needle) != std::string::npos;
}

static size_t count_of(const std::string& hay, const std::string& needle) {
    size_t n = 0;
    for (size_t pos = hay.find(needle); pos != std::string::npos; pos = hay.find(needle, pos + 1)) ++n;
    return n;
}

TEST(DocxWriterTest, HeadingsCarryBottomBorder) {
    const std::string xml = cvgen::render_document_xml(full_tree());

    const std::string border =
        "<w:pBdr><w:bottom w:val=\"single\" w:sz=\"6\" w:space=\"1\" w:color=\"auto\"/></w:pBdr>";
    EXPECT_EQ(count_of(xml, border), 6u);
    EXPECT_TRUE(contains(xml, "<w:pStyle w:val=\"CvHeading\"/>" + border));
}

TEST(DocxWriterTest, DatesUseRightTabStop) {
    const std::string xml = cvgen::render_document_xml(full_tree());

    // 6 inches = 8640 twips
    EXPECT_EQ(count_of(xml, "<w:tabs><w:tab w:val=\"right\" w:pos=\"8640\"/></w:tabs>"), 4u);
    EXPECT_TRUE(contains(xml,
        "<w:t xml:space=\"preserve\">Northwind, Toronto</w:t></w:r><w:r><w:tab/></w:r>"
        "<w:r><w:t xml:space=\"preserve\">Jan 2021 - Present</w:t></w:r>"));
}

TEST(DocxWriterTest, AlignmentAndBoldRuns) {
    const std::string xml = cvgen::render_document_xml(full_tree());

    EXPECT_TRUE(contains(xml, "<w:jc w:val=\"center\"/></w:pPr><w:r><w:t xml:space=\"preserve\">Jordan Lee</w:t>"));
    EXPECT_TRUE(contains(xml,
        "<w:r><w:rPr><w:b/><w:bCs/></w:rPr><w:t xml:space=\"preserve\">Software Engineer</w:t></w:r>"));
    EXPECT_TRUE(contains(xml,
        "<w:pStyle w:val=\"ListBullet\"/><w:jc w:val=\"both\"/></w:pPr>"
        "<w:r><w:t xml:space=\"preserve\">Built storage tiering</w:t>"));
}

TEST(DocxWriterTest, TextIsEscaped) {
    json j = json::object();
    j["certifications"] = json::parse(R"(["R&D <lab> \"x\" it's"])");
    const cvgen::DocumentTree tree = cvgen::assemble(cvgen::validate_record(j),
                                                     cvgen::StyleRegistry::standard(), cvgen::RenderConfig{});

    const std::string xml = cvgen::render_document_xml(tree);
    EXPECT_TRUE(contains(xml, "R&amp;D &lt;lab&gt; &quot;x&quot; it&apos;s"));
    EXPECT_FALSE(contains(xml, "<lab>"));
}

TEST(DocxWriterTest, LineBreaksAndTabsInTextBecomeMarkup) {
    json j = json::object();
    j["certifications"] = json::parse(R"(["line one\nline two", "col\tcol", "a\r\nb"])");
    const cvgen::DocumentTree tree = cvgen::assemble(cvgen::validate_record(j),
                                                     cvgen::StyleRegistry::standard(), cvgen::RenderConfig{});

    const std::string xml = cvgen::render_document_xml(tree);
    EXPECT_TRUE(contains(xml,
        "<w:r><w:t xml:space=\"preserve\">line one</w:t><w:br/>"
        "<w:t xml:space=\"preserve\">line two</w:t></w:r>"));
    EXPECT_TRUE(contains(xml,
        "<w:r><w:t xml:space=\"preserve\">col</w:t><w:tab/>"
        "<w:t xml:space=\"preserve\">col</w:t></w:r>"));
    EXPECT_TRUE(contains(xml,
        "<w:t xml:space=\"preserve\">a</w:t><w:br/><w:t xml:space=\"preserve\">b</w:t>"));
    EXPECT_FALSE(contains(xml, "line one\n"));
    EXPECT_FALSE(contains(xml, "col\tcol"));
}

TEST(DocxWriterTest, BoldRunKeepsFormattingAcrossBreaks) {
    cvgen::DocumentTree tree;
    cvgen::Paragraph& p = cvgen::append_paragraph(tree, cvgen::StyleId::Body);
    cvgen::add_text(p, "first\nsecond", true);

    const std::string xml = cvgen::render_document_xml(tree);
    EXPECT_TRUE(contains(xml,
        "<w:r><w:rPr><w:b/><w:bCs/></w:rPr><w:t xml:space=\"preserve\">first</w:t><w:br/>"
        "<w:t xml:space=\"preserve\">second</w:t></w:r>"));
}

TEST(DocxWriterTest, PageSetupFromTree) {
    const std::string xml = cvgen::render_document_xml(full_tree());
    EXPECT_TRUE(contains(xml, "<w:pgSz w:w=\"12240\" w:h=\"15840\"/>"));
    EXPECT_TRUE(contains(xml, "<w:pgMar w:top=\"1080\" w:right=\"1440\" w:bottom=\"1080\" w:left=\"1440\""));
}

TEST(DocxWriterTest, CompactSpacerOverridesSpacing) {
    const std::string xml = cvgen::render_document_xml(full_tree());
    // 2pt after = 40 twips, half line = 120
    EXPECT_TRUE(contains(xml,
        "<w:pPr><w:pStyle w:val=\"Normal\"/>"
        "<w:spacing w:before=\"0\" w:after=\"40\" w:line=\"120\" w:lineRule=\"auto\"/></w:pPr></w:p>"));
}

TEST(DocxWriterTest, StylesPartFollowsRegistry) {
    const std::string xml = cvgen::render_styles_xml(cvgen::StyleRegistry::standard());

    EXPECT_EQ(count_of(xml, "<w:style w:type=\"paragraph\""), 4u);
    EXPECT_TRUE(contains(xml, "w:default=\"1\" w:styleId=\"Normal\""));
    EXPECT_TRUE(contains(xml, "w:styleId=\"CvHeading\"><w:name w:val=\"CV Heading\"/>"));
    EXPECT_TRUE(contains(xml, "<w:b/><w:bCs/><w:sz w:val=\"24\"/>"));
    EXPECT_TRUE(contains(xml, "<w:sz w:val=\"19\"/>"));
    EXPECT_TRUE(contains(xml, "<w:numPr><w:numId w:val=\"1\"/></w:numPr>"));
    EXPECT_TRUE(contains(xml, "<w:ind w:left=\"432\" w:hanging=\"216\"/>"));
    EXPECT_TRUE(contains(xml, "w:ascii=\"Calibri\""));

    const std::string num = cvgen::render_numbering_xml(cvgen::StyleRegistry::standard());
    EXPECT_TRUE(contains(num, "<w:numFmt w:val=\"bullet\"/>"));
    EXPECT_TRUE(contains(num, "<w:num w:numId=\"1\"><w:abstractNumId w:val=\"0\"/></w:num>"));
}

TEST(DocxWriterTest, PackageContainsAllParts) {
    const auto parts = cvgen_test::unzip(cvgen::build_docx(full_tree()));

    for (const char* name : {"[Content_Types].xml", "_rels/.rels", "word/document.xml", "word/styles.xml",
                             "word/numbering.xml", "word/settings.xml", "word/_rels/document.xml.rels"}) {
        EXPECT_EQ(parts.count(name), 1u) << name;
    }
    EXPECT_EQ(parts.at("word/document.xml"), cvgen::render_document_xml(full_tree()));
    EXPECT_TRUE(contains(parts.at("_rels/.rels"), "Target=\"word/document.xml\""));
}

TEST(DocxWriterTest, SerializationIsByteStable) {
    EXPECT_EQ(cvgen::build_docx(full_tree()), cvgen::build_docx(full_tree()));

    cvgen_test::ScratchDir dir("docx_stable");
    const cvgen::DocumentTree tree = full_tree();
    cvgen::serialize(tree, dir.path() / "a.docx");
    cvgen::serialize(tree, dir.path() / "b.docx");
    EXPECT_EQ(cvgen_test::read_file(dir.path() / "a.docx"), cvgen_test::read_file(dir.path() / "b.docx"));
}

TEST(DocxWriterTest, SerializeWritesAtomically) {
    cvgen_test::ScratchDir dir("docx_write");
    const fs::path out = dir.path() / "nested" / "resume.docx";

    cvgen::serialize(full_tree(), out);

    ASSERT_TRUE(fs::exists(out));
    EXPECT_FALSE(fs::exists(dir.path() / "nested" / "resume.docx.tmp"));
    EXPECT_EQ(cvgen_test::read_file(out).substr(0, 2), "PK");

    // Overwriting an existing document replaces it.
    cvgen_test::write_file(out, "stale");
    cvgen::serialize(full_tree(), out);
    EXPECT_EQ(cvgen_test::read_file(out), cvgen::build_docx(full_tree()));
}

TEST(DocxWriterTest, SerializeFailureIsIOError) {
    cvgen_test::ScratchDir dir("docx_fail");
    const fs::path blocker = dir.path() / "file";
    cvgen_test::write_file(blocker, "x");

    try {
        cvgen::serialize(full_tree(), blocker / "resume.docx");
        FAIL() << "expected IOError";
    } catch (const cvgen::IOError& e) {
        EXPECT_FALSE(e.path().empty());
    }
    EXPECT_FALSE(fs::exists(blocker / "resume.docx"));

    EXPECT_THROW(cvgen::serialize(full_tree(), fs::path()), cvgen::IOError);
}
