#include "render/Renderers.hpp"

namespace render {

std::string render_report(const report::ReportData& data, report::TemplateType type, report::OutputFormat format) {
    switch (format) {
        case report::OutputFormat::Pdf:  return render_pdf(data, type);
        case report::OutputFormat::Docx: return render_docx(data, type);
    }
    return render_pdf(data, type);
}

const char* content_type(report::OutputFormat format) {
    switch (format) {
        case report::OutputFormat::Pdf:
            return "application/pdf";
        case report::OutputFormat::Docx:
            return "application/vnd.openxmlformats-officedocument.wordprocessingml.document";
    }
    return "application/octet-stream";
}

const char* file_extension(report::OutputFormat format) {
    return format == report::OutputFormat::Docx ? "docx" : "pdf";
}

}  // namespace render
