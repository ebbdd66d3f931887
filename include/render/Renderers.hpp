#pragma once

#include <string>

#include "doc/FlowLayout.hpp"
#include "doc/PageLayout.hpp"
#include "report/Models.hpp"

namespace render {

// Both renderers work in memory and return the complete file. Backend
// failures surface as RenderError tagged with the crawl id.
std::string render_pdf(const report::ReportData& data, report::TemplateType type);
std::string render_docx(const report::ReportData& data, report::TemplateType type);

std::string render_report(const report::ReportData& data, report::TemplateType type, report::OutputFormat format);

// Layout-level entry points. `created_at` stamps document metadata (PDF info,
// zip entry times, DOCX core properties).
std::string write_paged_pdf(const doc::PagedReport& report, const std::string& created_at);
std::string write_flow_docx(const doc::FlowReport& report, const std::string& created_at);

// "application/pdf", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"
const char* content_type(report::OutputFormat format);

// "pdf", "docx"
const char* file_extension(report::OutputFormat format);

}  // namespace render
