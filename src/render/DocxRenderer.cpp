#include "render/Renderers.hpp"

#include <cctype>
#include <exception>
#include <iostream>
#include <string>

#include "render/RenderError.hpp"
#include "render/ZipWriter.hpp"
#include "report/TextUtil.hpp"
#include "report/Timestamps.hpp"

namespace render {

using doc::FlowBlock;
using doc::FlowKind;

static const char* kWordNs = "http://schemas.openxmlformats.org/wordprocessingml/2006/main";
static const char* kRelNs = "http://schemas.openxmlformats.org/officeDocument/2006/relationships";
static const char* kXmlDecl = "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n";

static std::string xml_escape(const std::string& raw) {
    const std::string s = textutil::sanitize_utf8(raw);
    std::string out;
    out.reserve(s.size() + 16);
    for (size_t i = 0; i < s.size(); ++i) {
        const char ch = s[i];
        const unsigned char c = static_cast<unsigned char>(ch);
        // U+FFFE and U+FFFF are not XML characters either
        if (c == 0xEF && i + 2 < s.size() && static_cast<unsigned char>(s[i + 1]) == 0xBF &&
            (static_cast<unsigned char>(s[i + 2]) & 0xFE) == 0xBE) {
            out += "\xEF\xBF\xBD";
            i += 2;
            continue;
        }
        switch (ch) {
            case '&':  out += "&amp;";  break;
            case '<':  out += "&lt;";   break;
            case '>':  out += "&gt;";   break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default:
                // XML 1.0 forbids most control characters
                if (c < 0x20 && ch != '\t' && ch != '\n' && ch != '\r') break;
                out += ch;
                break;
        }
    }
    return out;
}

// "#4f46e5" -> "4F46E5"; empty when not a six digit hex colour.
static std::string word_color(const std::string& hex) {
    std::string h = hex;
    if (!h.empty() && h[0] == '#') h = h.substr(1);
    if (h.size() != 6) return "";
    for (char& c : h) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return "";
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return h;
}

static std::string run_xml(const doc::FlowRun& run) {
    std::string props;
    if (run.bold) props += "<w:b/>";
    if (run.italic) props += "<w:i/>";
    const std::string color = word_color(run.color);
    if (!color.empty()) props += "<w:color w:val=\"" + color + "\"/>";
    if (run.half_points > 0) props += "<w:sz w:val=\"" + std::to_string(run.half_points) + "\"/>";

    std::string out = "<w:r>";
    if (!props.empty()) out += "<w:rPr>" + props + "</w:rPr>";
    out += "<w:t xml:space=\"preserve\">" + xml_escape(run.text) + "</w:t></w:r>";
    return out;
}

static std::string paragraph_xml(const FlowBlock& b) {
    std::string style;
    switch (b.kind) {
        case FlowKind::Title:    style = "Title";    break;
        case FlowKind::Heading1: style = "Heading1"; break;
        case FlowKind::Heading2: style = "Heading2"; break;
        case FlowKind::Bullet:   style = "ListBullet"; break;
        default: break;
    }

    std::string ppr;
    if (!style.empty()) ppr += "<w:pStyle w:val=\"" + style + "\"/>";
    if (b.centered) ppr += "<w:jc w:val=\"center\"/>";

    std::string out = "<w:p>";
    if (!ppr.empty()) out += "<w:pPr>" + ppr + "</w:pPr>";
    if (b.kind == FlowKind::Bullet) out += "<w:r><w:t xml:space=\"preserve\">\xE2\x80\xA2 </w:t></w:r>";
    for (const auto& run : b.runs) out += run_xml(run);
    out += "</w:p>";
    return out;
}

static std::string cell_xml(const std::string& text, bool header) {
    std::string out = "<w:tc>";
    if (header) out += "<w:tcPr><w:shd w:val=\"clear\" w:color=\"auto\" w:fill=\"F3F4F6\"/></w:tcPr>";
    out += "<w:p>";
    out += header ? "<w:r><w:rPr><w:b/><w:sz w:val=\"18\"/></w:rPr>" : "<w:r><w:rPr><w:sz w:val=\"18\"/></w:rPr>";
    out += "<w:t xml:space=\"preserve\">" + xml_escape(text) + "</w:t></w:r></w:p></w:tc>";
    return out;
}

static std::string table_xml(const doc::FlowTable& t) {
    if (t.header.empty()) return "";
    const size_t cols = t.header.size();
    const int col_width = static_cast<int>(9638 / cols);   // A4 text width in twips

    std::string out = "<w:tbl><w:tblPr><w:tblW w:w=\"5000\" w:type=\"pct\"/><w:tblBorders>";
    for (const char* side : {"top", "bottom", "insideH"}) {
        out += std::string("<w:") + side + " w:val=\"single\" w:sz=\"4\" w:space=\"0\" w:color=\"E5E7EB\"/>";
    }
    out += "</w:tblBorders></w:tblPr><w:tblGrid>";
    for (size_t i = 0; i < cols; ++i) out += "<w:gridCol w:w=\"" + std::to_string(col_width) + "\"/>";
    out += "</w:tblGrid>";

    out += "<w:tr><w:trPr><w:tblHeader/></w:trPr>";
    for (const auto& h : t.header) out += cell_xml(h, true);
    out += "</w:tr>";

    for (const auto& row : t.rows) {
        out += "<w:tr>";
        for (size_t i = 0; i < cols; ++i) out += cell_xml(i < row.size() ? row[i] : "", false);
        out += "</w:tr>";
    }
    out += "</w:tbl>";
    // adjacent tables would merge without a paragraph between them
    out += "<w:p/>";
    return out;
}

static std::string document_xml(const doc::FlowReport& r) {
    std::string body;
    for (const auto& b : r.blocks) {
        switch (b.kind) {
            case FlowKind::Table:
                body += table_xml(b.table);
                break;
            case FlowKind::PageBreak:
                body += "<w:p><w:r><w:br w:type=\"page\"/></w:r></w:p>";
                break;
            default:
                body += paragraph_xml(b);
                break;
        }
    }

    return std::string(kXmlDecl) + "<w:document xmlns:w=\"" + kWordNs + "\" xmlns:r=\"" + kRelNs + "\"><w:body>" +
           body +
           "<w:sectPr><w:headerReference w:type=\"default\" r:id=\"rId2\"/>"
           "<w:footerReference w:type=\"default\" r:id=\"rId3\"/>"
           "<w:pgSz w:w=\"11906\" w:h=\"16838\"/>"
           "<w:pgMar w:top=\"1440\" w:right=\"1134\" w:bottom=\"1440\" w:left=\"1134\" w:header=\"708\" "
           "w:footer=\"708\" w:gutter=\"0\"/></w:sectPr></w:body></w:document>";
}

static std::string styles_xml(const report::Brand& brand) {
    std::string accent = word_color(brand.color);
    if (accent.empty()) accent = word_color(report::kDefaultBrandColor);

    auto para_style = [](const std::string& id, const std::string& name, const std::string& ppr,
                         const std::string& rpr) {
        return "<w:style w:type=\"paragraph\" w:styleId=\"" + id + "\"><w:name w:val=\"" + name +
               "\"/><w:basedOn w:val=\"Normal\"/><w:next w:val=\"Normal\"/><w:qFormat/><w:pPr>" + ppr +
               "</w:pPr><w:rPr>" + rpr + "</w:rPr></w:style>";
    };

    return std::string(kXmlDecl) + "<w:styles xmlns:w=\"" + kWordNs + "\">" +
           "<w:docDefaults><w:rPrDefault><w:rPr><w:rFonts w:ascii=\"Calibri\" w:hAnsi=\"Calibri\" w:cs=\"Calibri\"/>"
           "<w:color w:val=\"111827\"/><w:sz w:val=\"21\"/></w:rPr></w:rPrDefault>"
           "<w:pPrDefault><w:pPr><w:spacing w:after=\"80\" w:line=\"264\" w:lineRule=\"auto\"/></w:pPr></w:pPrDefault>"
           "</w:docDefaults>"
           "<w:style w:type=\"paragraph\" w:default=\"1\" w:styleId=\"Normal\"><w:name w:val=\"Normal\"/><w:qFormat/>"
           "</w:style>" +
           para_style("Title", "Title", "<w:spacing w:before=\"240\" w:after=\"240\"/><w:jc w:val=\"center\"/>",
                      "<w:b/><w:color w:val=\"" + accent + "\"/><w:sz w:val=\"48\"/>") +
           para_style("Heading1", "heading 1", "<w:keepNext/><w:spacing w:before=\"360\" w:after=\"120\"/>",
                      "<w:b/><w:sz w:val=\"32\"/>") +
           para_style("Heading2", "heading 2", "<w:keepNext/><w:spacing w:before=\"240\" w:after=\"80\"/>",
                      "<w:b/><w:sz w:val=\"26\"/>") +
           para_style("ListBullet", "List Bullet", "<w:ind w:left=\"360\" w:hanging=\"240\"/>", "") +
           "</w:styles>";
}

static std::string header_xml(const doc::FlowReport& r) {
    return std::string(kXmlDecl) + "<w:hdr xmlns:w=\"" + kWordNs + "\"><w:p><w:pPr><w:jc w:val=\"right\"/></w:pPr>" +
           "<w:r><w:rPr><w:color w:val=\"6B7280\"/><w:sz w:val=\"16\"/></w:rPr><w:t xml:space=\"preserve\">" +
           xml_escape(r.header_text) + "</w:t></w:r></w:p></w:hdr>";
}

static std::string footer_xml(const doc::FlowReport& r) {
    const std::string rpr = "<w:rPr><w:color w:val=\"6B7280\"/><w:sz w:val=\"16\"/></w:rPr>";
    return std::string(kXmlDecl) + "<w:ftr xmlns:w=\"" + kWordNs + "\"><w:p><w:pPr><w:jc w:val=\"center\"/></w:pPr>" +
           "<w:r>" + rpr + "<w:t xml:space=\"preserve\">" + xml_escape(r.footer_text) + " | Page </w:t></w:r>" +
           "<w:r>" + rpr + "<w:fldChar w:fldCharType=\"begin\"/></w:r>" +
           "<w:r>" + rpr + "<w:instrText xml:space=\"preserve\"> PAGE </w:instrText></w:r>" +
           "<w:r>" + rpr + "<w:fldChar w:fldCharType=\"separate\"/></w:r>" +
           "<w:r>" + rpr + "<w:t>1</w:t></w:r>" +
           "<w:r>" + rpr + "<w:fldChar w:fldCharType=\"end\"/></w:r></w:p></w:ftr>";
}

static std::string core_xml(const doc::FlowReport& r, const std::string& created_at) {
    std::string out = std::string(kXmlDecl) +
                      "<cp:coreProperties "
                      "xmlns:cp=\"http://schemas.openxmlformats.org/package/2006/metadata/core-properties\" "
                      "xmlns:dc=\"http://purl.org/dc/elements/1.1/\" xmlns:dcterms=\"http://purl.org/dc/terms/\" "
                      "xmlns:dcmitype=\"http://purl.org/dc/dcmitype/\" "
                      "xmlns:xsi=\"http://www.w3.org/2001/XMLSchema-instance\">" +
                      "<dc:title>" + xml_escape(r.title) + "</dc:title>" +
                      "<dc:creator>" + xml_escape(r.brand.name) + "</dc:creator>";
    const auto t = report::parse_iso8601(created_at);
    if (t) {
        const std::string iso = report::format_iso8601(*t);
        out += "<dcterms:created xsi:type=\"dcterms:W3CDTF\">" + iso + "</dcterms:created>";
        out += "<dcterms:modified xsi:type=\"dcterms:W3CDTF\">" + iso + "</dcterms:modified>";
    }
    out += "</cp:coreProperties>";
    return out;
}

static const char* kContentTypes =
    "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
    "<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">"
    "<Default Extension=\"rels\" ContentType=\"application/vnd.openxmlformats-package.relationships+xml\"/>"
    "<Default Extension=\"xml\" ContentType=\"application/xml\"/>"
    "<Override PartName=\"/word/document.xml\" "
    "ContentType=\"application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml\"/>"
    "<Override PartName=\"/word/styles.xml\" "
    "ContentType=\"application/vnd.openxmlformats-officedocument.wordprocessingml.styles+xml\"/>"
    "<Override PartName=\"/word/header1.xml\" "
    "ContentType=\"application/vnd.openxmlformats-officedocument.wordprocessingml.header+xml\"/>"
    "<Override PartName=\"/word/footer1.xml\" "
    "ContentType=\"application/vnd.openxmlformats-officedocument.wordprocessingml.footer+xml\"/>"
    "<Override PartName=\"/docProps/core.xml\" "
    "ContentType=\"application/vnd.openxmlformats-package.core-properties+xml\"/>"
    "</Types>";

static const char* kPackageRels =
    "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
    "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
    "<Relationship Id=\"rId1\" "
    "Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument\" "
    "Target=\"word/document.xml\"/>"
    "<Relationship Id=\"rId2\" "
    "Type=\"http://schemas.openxmlformats.org/package/2006/relationships/metadata/core-properties\" "
    "Target=\"docProps/core.xml\"/>"
    "</Relationships>";

static const char* kDocumentRels =
    "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
    "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
    "<Relationship Id=\"rId1\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles\" "
    "Target=\"styles.xml\"/>"
    "<Relationship Id=\"rId2\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/header\" "
    "Target=\"header1.xml\"/>"
    "<Relationship Id=\"rId3\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/footer\" "
    "Target=\"footer1.xml\"/>"
    "</Relationships>";

std::string write_flow_docx(const doc::FlowReport& report, const std::string& created_at) {
    ZipWriter zip(created_at);
    zip.add("[Content_Types].xml", kContentTypes);
    zip.add("_rels/.rels", kPackageRels);
    zip.add("word/document.xml", document_xml(report));
    zip.add("word/styles.xml", styles_xml(report.brand));
    zip.add("word/header1.xml", header_xml(report));
    zip.add("word/footer1.xml", footer_xml(report));
    zip.add("word/_rels/document.xml.rels", kDocumentRels);
    zip.add("docProps/core.xml", core_xml(report, created_at));
    return zip.finish();
}

std::string render_docx(const report::ReportData& data, report::TemplateType type) {
    const doc::FlowReport flow = type == report::TemplateType::Detailed ? doc::assemble_detailed_flow(data)
                                                                        : doc::assemble_summary_flow(data);
    try {
        return write_flow_docx(flow, data.generated_at);
    } catch (const std::exception& e) {
        std::cerr << "DocxRenderer: " << e.what() << "\n";
        throw RenderError(data.crawl.id, report::OutputFormat::Docx, e.what());
    }
}

}  // namespace render
