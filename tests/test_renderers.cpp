#include <catch2/catch.hpp>

#include <algorithm>
#include <utility>

#include "doc/Format.hpp"
#include "doc/Limits.hpp"
#include "render/PdfWriter.hpp"
#include "render/RenderError.hpp"
#include "render/Renderers.hpp"
#include "render/ZipWriter.hpp"
#include "report/TextUtil.hpp"
#include "report/Timestamps.hpp"
#include "support/Fixtures.hpp"
#include "support/TextExtract.hpp"

using namespace render;
using report::OutputFormat;
using report::TemplateType;

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static bool has_text(const std::string& haystack, const std::string& needle) {
    return textextract::collapse_whitespace(haystack).find(textextract::collapse_whitespace(needle)) !=
           std::string::npos;
}

// Strings both formats must print for the given report and template.
static std::vector<std::string> parity_strings(const report::ReportData& d, TemplateType type) {
    std::vector<std::string> out;
    out.push_back(doc::score_text(d.scores.overall));
    for (const auto& line : doc::category_lines(d)) out.push_back(line.label + " " + doc::score_text(line.score));

    const size_t wins = type == TemplateType::Summary ? std::min(d.quick_wins.size(), doc::kSummaryQuickWins)
                                                      : d.quick_wins.size();
    for (size_t i = 0; i < wins; ++i) out.push_back(d.quick_wins[i].recommendation);

    if (d.history.size() > 1) {
        for (const auto& h : d.history) {
            out.push_back(report::short_date_label(h.completed_at) + " " + doc::score_text(h.overall));
        }
    }

    if (type == TemplateType::Detailed) {
        for (const auto& i : d.issues.items) {
            out.push_back(i.message);
            if (!i.recommendation.empty()) out.push_back(i.recommendation);
        }
        if (d.history.size() > 1) {
            for (const auto& h : d.history) {
                out.push_back(report::short_date_label(h.completed_at) + " " + doc::score_text(h.technical) + " " +
                              doc::score_text(h.content) + " " + doc::score_text(h.ai_readiness) + " " +
                              doc::score_text(h.performance.value_or(0.0)));
            }
        }
    }
    return out;
}

TEST_CASE("Renderers: pdf container", "[renderers][pdf]") {
    const report::ReportData d = fixtures::make_report_data();
    const std::string pdf = render_pdf(d, TemplateType::Summary);

    CHECK(starts_with(pdf, "%PDF-1.4\n"));
    CHECK(ends_with(pdf, "%%EOF"));
    CHECK(pdf.find("/Type /Catalog") != std::string::npos);
    CHECK(pdf.find("/BaseFont /Helvetica") != std::string::npos);
    CHECK(pdf.find("startxref") != std::string::npos);

    const auto streams = textextract::pdf_content_streams(pdf);
    CHECK(streams.size() >= 2);

    const std::string text = textextract::pdf_text(pdf);
    CHECK(has_text(text, "Category Scorecard"));
    CHECK(has_text(text, "acme.example"));
    CHECK(has_text(text, "Page 2"));
}

TEST_CASE("Renderers: docx container", "[renderers][docx]") {
    const report::ReportData d = fixtures::make_report_data();
    const std::string docx = render_docx(d, TemplateType::Summary);

    CHECK(starts_with(docx, "PK"));
    const auto names = textextract::zip_entry_names(docx);
    for (const char* part : {"[Content_Types].xml", "_rels/.rels", "word/document.xml", "word/styles.xml",
                             "word/_rels/document.xml.rels", "word/footer1.xml", "docProps/core.xml"}) {
        INFO(part);
        CHECK(std::find(names.begin(), names.end(), part) != names.end());
    }

    const std::string document = textextract::zip_entry(docx, "word/document.xml");
    CHECK(document.find("<w:document") != std::string::npos);
    CHECK(document.find("<w:tbl>") != std::string::npos);

    const std::string core = textextract::zip_entry(docx, "docProps/core.xml");
    CHECK(core.find(fixtures::kGeneratedAt) != std::string::npos);

    const std::string text = textextract::docx_text(docx);
    CHECK(has_text(text, "Category Scorecard"));
}

TEST_CASE("Renderers: cross-format parity", "[renderers][parity]") {
    const report::ReportData d = fixtures::make_report_data();

    for (TemplateType type : {TemplateType::Summary, TemplateType::Detailed}) {
        const std::string pdf_text = textextract::pdf_text(render_pdf(d, type));
        const std::string docx_text = textextract::docx_text(render_docx(d, type));

        const auto expected = parity_strings(d, type);
        REQUIRE(expected.size() > 8);
        for (const auto& s : expected) {
            INFO(s);
            CHECK(has_text(pdf_text, s));
            CHECK(has_text(docx_text, s));
        }
    }
}

TEST_CASE("Renderers: malformed UTF-8 in input text", "[renderers][utf8]") {
    report::ReportData d = fixtures::make_report_data();
    d.issues.items[0].message = "bad \xff\xfe utf8 and a cut \xe2\x82 sequence";
    d.project.name = "Acme \xc0\xaf";

    SECTION("every docx part stays well formed") {
        const std::string docx = render_docx(d, TemplateType::Detailed);
        for (const auto& name : textextract::zip_entry_names(docx)) {
            INFO(name);
            CHECK(textextract::xml_problem(textextract::zip_entry(docx, name)).empty());
        }
        CHECK(has_text(textextract::docx_text(docx), "bad \xEF\xBF\xBD\xEF\xBF\xBD utf8 and a cut \xEF\xBF\xBD sequence"));
    }
    SECTION("text outside WinAnsi survives only in docx") {
        const std::string cyrillic = "\xd0\x9d\xd0\xb5\xd1\x82 title";
        d.issues.items[0].message = cyrillic;
        CHECK(has_text(textextract::docx_text(render_docx(d, TemplateType::Detailed)), cyrillic));
        CHECK(has_text(textextract::pdf_text(render_pdf(d, TemplateType::Detailed)), "??? title"));
    }
    SECTION("pdf prints the same replacements as question marks") {
        CHECK(has_text(textextract::pdf_text(render_pdf(d, TemplateType::Detailed)),
                       "bad ?? utf8 and a cut ? sequence"));
    }
}

TEST_CASE("Renderers: truncation lines stay with their list", "[renderers][pdf][pagination]") {
    report::ReportData d = fixtures::make_report_data();
    report::Issue critical = d.issues.items.front();
    for (size_t i = 0; i < 24; ++i) {
        critical.code = "CRIT_" + std::to_string(i);
        d.issues.items.push_back(critical);
    }

    const auto pages = textextract::pdf_page_texts(render_pdf(d, TemplateType::Detailed));
    const std::vector<std::pair<std::string, std::string>> kept = {
        {"...and 2 more controls", "Compliant pages:"},
        {"...and 5 more critical issues", critical.message},
    };
    for (const auto& k : kept) {
        INFO(k.first);
        const auto it = std::find_if(pages.begin(), pages.end(),
                                     [&](const std::string& t) { return has_text(t, k.first); });
        REQUIRE(it != pages.end());
        CHECK(has_text(*it, k.second));
    }
}

TEST_CASE("Renderers: output is deterministic", "[renderers][determinism]") {
    const report::ReportData d = fixtures::make_report_data();

    CHECK(render_pdf(d, TemplateType::Detailed) == render_pdf(d, TemplateType::Detailed));
    CHECK(render_docx(d, TemplateType::Detailed) == render_docx(d, TemplateType::Detailed));
}

TEST_CASE("Renderers: format dispatch", "[renderers]") {
    const report::ReportData d = fixtures::make_report_data();

    CHECK(starts_with(render_report(d, TemplateType::Summary, OutputFormat::Pdf), "%PDF"));
    CHECK(starts_with(render_report(d, TemplateType::Summary, OutputFormat::Docx), "PK"));
    CHECK(std::string(content_type(OutputFormat::Pdf)) == "application/pdf");
    CHECK(std::string(file_extension(OutputFormat::Docx)) == "docx");
}

TEST_CASE("Renderers: sparse reports still render", "[renderers]") {
    report::ReportData d;
    d.project.domain = "empty.example";
    d.crawl.id = "crawl-empty";
    d.generated_at = fixtures::kGeneratedAt;

    for (TemplateType type : {TemplateType::Summary, TemplateType::Detailed}) {
        CHECK(ends_with(render_pdf(d, type), "%%EOF"));
        CHECK(has_text(textextract::docx_text(render_docx(d, type)), "No issues were found in this crawl.") ==
              (type == TemplateType::Detailed));
    }
}

TEST_CASE("Renderers: errors", "[renderers][errors]") {
    SECTION("a document without pages cannot be written") {
        doc::PagedReport empty;
        CHECK_THROWS_AS(write_paged_pdf(empty, fixtures::kGeneratedAt), std::runtime_error);
    }
    SECTION("render errors carry the report and format") {
        const RenderError e("rep-1", OutputFormat::Docx, "zip failed");
        CHECK(e.report_id() == "rep-1");
        CHECK(e.format() == OutputFormat::Docx);
        CHECK(std::string(e.what()) == "docx render failed for report 'rep-1': zip failed");
    }
}

TEST_CASE("PdfWriter: text helpers", "[renderers][pdf]") {
    SECTION("colours") {
        const Rgb c = parse_color("#ff0000");
        CHECK(c.r == Approx(1.0));
        CHECK(c.g == Approx(0.0));
        const Rgb fallback = parse_color("red", Rgb{0.5, 0.5, 0.5});
        CHECK(fallback.r == Approx(0.5));
        CHECK(blend_with_white(Rgb{0.0, 0.0, 0.0}, 0.25).r == Approx(0.75));
    }
    SECTION("win ansi") {
        CHECK(to_win_ansi("abc") == "abc");
        CHECK(to_win_ansi("a\xff" "b") == "a?b");
        CHECK(to_win_ansi("caf\xc3\xa9") == "caf\xe9");
        CHECK(to_win_ansi("\xe2\x9c\x93") == "?");
    }
    SECTION("wrapping keeps every word") {
        const std::string text = "Add a unique descriptive title to every page of the site so answer engines can cite it.";
        const auto lines = wrap_to_width(text, 10.0, false, 120.0);
        REQUIRE(lines.size() > 1);
        std::string joined;
        for (const auto& l : lines) {
            CHECK(text_width(l, 10.0, false) <= Approx(120.0));
            joined += (joined.empty() ? "" : " ") + l;
        }
        CHECK(joined == text);
    }
    SECTION("fit appends an ellipsis") {
        const std::string fitted = fit_to_width("https://acme.example/a/very/long/path/to/a/page", 8.0, false, 60.0);
        CHECK(ends_with(fitted, "..."));
        CHECK(text_width(fitted, 8.0, false) <= Approx(60.0));
        CHECK(fit_to_width("short", 8.0, false, 200.0) == "short");
    }
}

TEST_CASE("TextUtil: utf8 sanitising", "[renderers][utf8]") {
    const std::string fffd = "\xEF\xBF\xBD";
    CHECK(textutil::sanitize_utf8("plain") == "plain");
    CHECK(textutil::sanitize_utf8("caf\xc3\xa9 \xe2\x9c\x93 \xf0\x9f\x98\x80") == "caf\xc3\xa9 \xe2\x9c\x93 \xf0\x9f\x98\x80");
    CHECK(textutil::sanitize_utf8("a\xff" "b") == "a" + fffd + "b");
    CHECK(textutil::sanitize_utf8("\xc0\xaf") == fffd);
    CHECK(textutil::sanitize_utf8("\xed\xa0\x80") == fffd);
    CHECK(textutil::sanitize_utf8("\xe2\x82x") == fffd + "x");
    CHECK(textutil::sanitize_utf8("end\xe2") == "end" + fffd);
}

TEST_CASE("ZipWriter: entries round trip", "[renderers][zip]") {
    ZipWriter zip("2026-03-02T08:00:00Z");
    zip.add("a.txt", "hello hello hello");
    zip.add("dir/b.xml", "<x/>");
    const std::string bytes = zip.finish();

    CHECK(textextract::zip_entry(bytes, "a.txt") == "hello hello hello");
    CHECK(textextract::zip_entry(bytes, "dir/b.xml") == "<x/>");
    CHECK(bytes.find(std::string("PK\x05\x06", 4)) != std::string::npos);
    CHECK_THROWS(textextract::zip_entry(bytes, "missing"));
}
