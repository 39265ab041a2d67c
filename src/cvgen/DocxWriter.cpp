#include "cvgen/DocxWriter.hpp"

#include "cvgen/Errors.hpp"
#include "cvgen/XmlUtil.hpp"
#include "cvgen/ZipWriter.hpp"

#include <cmath>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace cvgen {

static const char* kXmlDecl = "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n";
static const char* kWordNs = "http://schemas.openxmlformats.org/wordprocessingml/2006/main";
static const char* kRelNs = "http://schemas.openxmlformats.org/officeDocument/2006/relationships";

// numId shared by the bullet style and numbering.xml.
static const int kBulletNumId = 1;

static std::string attr(const char* name, const std::string& value) {
    return std::string(" ") + name + "=\"" + xml_escape(value) + "\"";
}

static std::string attr(const char* name, long value) {
    return std::string(" ") + name + "=\"" + std::to_string(value) + "\"";
}

static long half_points(double pt) {
    return std::lround(pt * 2.0);
}

// Line spacing as a multiple of single spacing, in 240ths.
static long line_240ths(double multiple) {
    return std::lround(multiple * 240.0);
}

static std::string spacing_xml(double before_pt, double after_pt, double line) {
    return "<w:spacing" + attr("w:before", to_twips_from_points(before_pt)) +
           attr("w:after", to_twips_from_points(after_pt)) +
           attr("w:line", line_240ths(line)) + attr("w:lineRule", "auto") + "/>";
}

static std::string indent_xml(const StyleDef& s) {
    return "<w:ind" + attr("w:left", to_twips_from_inches(s.left_indent_in)) +
           attr("w:hanging", to_twips_from_inches(s.hanging_indent_in)) + "/>";
}

static std::string run_props_xml(const StyleDef& s) {
    std::string x = "<w:rPr>";
    x += "<w:rFonts" + attr("w:ascii", s.typeface) + attr("w:hAnsi", s.typeface) +
         attr("w:eastAsia", s.typeface) + attr("w:cs", s.typeface) + "/>";
    if (s.bold) x += "<w:b/><w:bCs/>";
    x += "<w:sz" + attr("w:val", half_points(s.point_size)) + "/>";
    x += "<w:szCs" + attr("w:val", half_points(s.point_size)) + "/>";
    x += "</w:rPr>";
    return x;
}

static const char* jc_value(Alignment a) {
    switch (a) {
        case Alignment::Left:    return "left";
        case Alignment::Center:  return "center";
        case Alignment::Right:   return "right";
        case Alignment::Justify: return "both";
    }
    return "left";
}

static const char* tab_value(TabAlignment a) {
    return a == TabAlignment::Right ? "right" : "left";
}

// Tabs and line breaks inside text become <w:tab/> and <w:br/>; Word would
// otherwise fold them into plain whitespace. CRLF counts as one break.
static std::string run_content_xml(const std::string& text) {
    std::string x;
    std::string chunk;

    auto flush = [&]() {
        if (chunk.empty()) return;
        x += "<w:t xml:space=\"preserve\">" + xml_escape(chunk) + "</w:t>";
        chunk.clear();
    };

    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '\t') {
            flush();
            x += "<w:tab/>";
        } else if (c == '\n' || c == '\r') {
            flush();
            x += "<w:br/>";
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') ++i;
        } else {
            chunk += c;
        }
    }
    flush();

    if (x.empty()) x = "<w:t xml:space=\"preserve\"></w:t>";
    return x;
}

static std::string paragraph_xml(const Paragraph& p, const StyleRegistry& styles) {
    const RuleLine& rule = styles.heading_rule();

    // pPr children in schema order: pStyle, pBdr, tabs, spacing, jc.
    std::string x = "<w:p><w:pPr>";
    x += "<w:pStyle" + attr("w:val", styles.get(p.style).docx_id) + "/>";

    if (p.bottom_border) {
        x += "<w:pBdr><w:bottom" + attr("w:val", rule.kind) + attr("w:sz", rule.width_eighths) +
             attr("w:space", rule.space_pt) + attr("w:color", rule.color) + "/></w:pBdr>";
    }

    if (!p.tab_stops.empty()) {
        x += "<w:tabs>";
        for (const auto& t : p.tab_stops) {
            x += "<w:tab" + attr("w:val", tab_value(t.alignment)) +
                 attr("w:pos", to_twips_from_inches(t.position_in)) + "/>";
        }
        x += "</w:tabs>";
    }

    if (p.spacing) {
        x += spacing_xml(p.spacing->space_before_pt, p.spacing->space_after_pt, p.spacing->line_spacing);
    }

    if (p.alignment != Alignment::Left) {
        x += "<w:jc" + attr("w:val", jc_value(p.alignment)) + "/>";
    }
    x += "</w:pPr>";

    for (const auto& r : p.runs) {
        x += "<w:r>";
        if (r.bold) x += "<w:rPr><w:b/><w:bCs/></w:rPr>";
        if (r.kind == Run::Kind::Tab) {
            x += "<w:tab/>";
        } else {
            x += run_content_xml(r.text);
        }
        x += "</w:r>";
    }

    x += "</w:p>";
    return x;
}

static std::string section_xml(const PageSetup& page) {
    return "<w:sectPr>"
           "<w:pgSz" + attr("w:w", to_twips_from_inches(page.width_in)) +
           attr("w:h", to_twips_from_inches(page.height_in)) + "/>"
           "<w:pgMar" + attr("w:top", to_twips_from_inches(page.margin_top_in)) +
           attr("w:right", to_twips_from_inches(page.margin_right_in)) +
           attr("w:bottom", to_twips_from_inches(page.margin_bottom_in)) +
           attr("w:left", to_twips_from_inches(page.margin_left_in)) +
           attr("w:header", 720L) + attr("w:footer", 720L) + attr("w:gutter", 0L) + "/>"
           "</w:sectPr>";
}

std::string render_document_xml(const DocumentTree& tree) {
    std::string x = kXmlDecl;
    x += "<w:document xmlns:w=\"" + std::string(kWordNs) + "\" xmlns:r=\"" + kRelNs + "\"><w:body>";
    for (const auto& p : tree.paragraphs) {
        x += paragraph_xml(p, tree.styles);
    }
    x += section_xml(tree.page);
    x += "</w:body></w:document>";
    return x;
}

std::string render_styles_xml(const StyleRegistry& styles) {
    const StyleDef& body = styles.get(StyleId::Body);

    std::string x = kXmlDecl;
    x += "<w:styles xmlns:w=\"" + std::string(kWordNs) + "\">";

    x += "<w:docDefaults><w:rPrDefault>" + run_props_xml(body) + "</w:rPrDefault>";
    x += "<w:pPrDefault><w:pPr>" +
         spacing_xml(body.space_before_pt, body.space_after_pt, body.line_spacing) +
         "</w:pPr></w:pPrDefault></w:docDefaults>";

    for (const auto& s : styles.all()) {
        const bool is_default = s.id == StyleId::Body;

        x += "<w:style w:type=\"paragraph\"";
        if (is_default) x += " w:default=\"1\"";
        x += attr("w:styleId", s.docx_id) + ">";
        x += "<w:name" + attr("w:val", s.display_name) + "/>";
        if (!is_default) x += "<w:basedOn" + attr("w:val", body.docx_id) + "/>";
        x += "<w:qFormat/>";

        x += "<w:pPr>";
        if (s.id == StyleId::Bullet) {
            x += "<w:numPr><w:numId" + attr("w:val", static_cast<long>(kBulletNumId)) + "/></w:numPr>";
        }
        x += spacing_xml(s.space_before_pt, s.space_after_pt, s.line_spacing);
        if (s.left_indent_in != 0.0 || s.hanging_indent_in != 0.0) x += indent_xml(s);
        x += "</w:pPr>";

        x += run_props_xml(s);
        x += "</w:style>";
    }

    x += "</w:styles>";
    return x;
}

std::string render_numbering_xml(const StyleRegistry& styles) {
    const StyleDef& bullet = styles.get(StyleId::Bullet);

    std::string x = kXmlDecl;
    x += "<w:numbering xmlns:w=\"" + std::string(kWordNs) + "\">";
    x += "<w:abstractNum w:abstractNumId=\"0\">";
    x += "<w:multiLevelType w:val=\"singleLevel\"/>";
    x += "<w:lvl w:ilvl=\"0\">";
    x += "<w:start w:val=\"1\"/><w:numFmt w:val=\"bullet\"/>";
    // U+F0B7: the bullet glyph in the Symbol font's private-use mapping.
    x += "<w:lvlText w:val=\"\xEF\x82\xB7\"/><w:lvlJc w:val=\"left\"/>";
    x += "<w:pPr>" + indent_xml(bullet) + "</w:pPr>";
    x += "<w:rPr><w:rFonts w:ascii=\"Symbol\" w:hAnsi=\"Symbol\" w:hint=\"default\"/></w:rPr>";
    x += "</w:lvl></w:abstractNum>";
    x += "<w:num" + attr("w:numId", static_cast<long>(kBulletNumId)) +
         "><w:abstractNumId w:val=\"0\"/></w:num>";
    x += "</w:numbering>";
    return x;
}

static std::string content_types_xml() {
    std::string x = kXmlDecl;
    x += "<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">";
    x += "<Default Extension=\"rels\" ContentType=\"application/vnd.openxmlformats-package.relationships+xml\"/>";
    x += "<Default Extension=\"xml\" ContentType=\"application/xml\"/>";
    x += "<Override PartName=\"/word/document.xml\" ContentType=\"application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml\"/>";
    x += "<Override PartName=\"/word/styles.xml\" ContentType=\"application/vnd.openxmlformats-officedocument.wordprocessingml.styles+xml\"/>";
    x += "<Override PartName=\"/word/numbering.xml\" ContentType=\"application/vnd.openxmlformats-officedocument.wordprocessingml.numbering+xml\"/>";
    x += "<Override PartName=\"/word/settings.xml\" ContentType=\"application/vnd.openxmlformats-officedocument.wordprocessingml.settings+xml\"/>";
    x += "</Types>";
    return x;
}

static std::string package_rels_xml() {
    std::string x = kXmlDecl;
    x += "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">";
    x += "<Relationship Id=\"rId1\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument\" Target=\"word/document.xml\"/>";
    x += "</Relationships>";
    return x;
}

static std::string document_rels_xml() {
    std::string x = kXmlDecl;
    x += "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">";
    x += "<Relationship Id=\"rId1\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles\" Target=\"styles.xml\"/>";
    x += "<Relationship Id=\"rId2\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/numbering\" Target=\"numbering.xml\"/>";
    x += "<Relationship Id=\"rId3\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/settings\" Target=\"settings.xml\"/>";
    x += "</Relationships>";
    return x;
}

static std::string settings_xml() {
    std::string x = kXmlDecl;
    x += "<w:settings xmlns:w=\"" + std::string(kWordNs) + "\">";
    x += "<w:defaultTabStop" + attr("w:val", to_twips_from_inches(0.5)) + "/>";
    x += "<w:compat><w:compatSetting w:name=\"compatibilityMode\" "
         "w:uri=\"http://schemas.microsoft.com/office/word\" w:val=\"15\"/></w:compat>";
    x += "</w:settings>";
    return x;
}

std::string build_docx(const DocumentTree& tree) {
    ZipWriter zip;
    zip.add("[Content_Types].xml", content_types_xml());
    zip.add("_rels/.rels", package_rels_xml());
    zip.add("word/document.xml", render_document_xml(tree));
    zip.add("word/styles.xml", render_styles_xml(tree.styles));
    zip.add("word/numbering.xml", render_numbering_xml(tree.styles));
    zip.add("word/settings.xml", settings_xml());
    zip.add("word/_rels/document.xml.rels", document_rels_xml());
    return zip.finish();
}

void serialize(const DocumentTree& tree, const fs::path& path) {
    if (path.empty()) throw IOError("", "empty output path");

    std::string bytes;
    try {
        bytes = build_docx(tree);
    } catch (const std::runtime_error& e) {
        throw IOError(path.string(), std::string("failed to encode document (") + e.what() + ")");
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) throw IOError(path.parent_path().string(), "failed to create directory: " + ec.message());
    }

    fs::path tmp = path;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!out) throw IOError(tmp.string(), "failed to open output file");
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            throw IOError(tmp.string(), "failed to write output file");
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw IOError(path.string(), "failed to move document into place: " + ec.message());
    }
}

}  // namespace cvgen
