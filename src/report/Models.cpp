#include "report/Models.hpp"

#include "report/TextUtil.hpp"

namespace report {

using textutil::to_lower_copy;

const char* to_string(Severity s) {
    switch (s) {
        case Severity::Critical: return "critical";
        case Severity::Warning: return "warning";
        case Severity::Info: return "info";
        default: return "unknown";
    }
}

const char* to_string(Pillar p) {
    switch (p) {
        case Pillar::Technical: return "technical";
        case Pillar::Content: return "content";
        case Pillar::AiReadiness: return "ai_readiness";
        default: return "unknown";
    }
}

const char* to_string(VisibilityImpact v) {
    switch (v) {
        case VisibilityImpact::High: return "high";
        case VisibilityImpact::Medium: return "medium";
        case VisibilityImpact::Low: return "low";
        default: return "unknown";
    }
}

const char* to_string(Effort e) {
    switch (e) {
        case Effort::Low: return "low";
        case Effort::Medium: return "medium";
        case Effort::High: return "high";
        default: return "unknown";
    }
}

const char* to_string(TemplateType t) {
    switch (t) {
        case TemplateType::Summary: return "summary";
        case TemplateType::Detailed: return "detailed";
        default: return "unknown";
    }
}

const char* to_string(OutputFormat f) {
    switch (f) {
        case OutputFormat::Pdf: return "pdf";
        case OutputFormat::Docx: return "docx";
        default: return "unknown";
    }
}

std::optional<Severity> parse_severity(const std::string& s) {
    const std::string k = to_lower_copy(s);
    if (k == "critical") return Severity::Critical;
    if (k == "warning") return Severity::Warning;
    if (k == "info") return Severity::Info;
    return std::nullopt;
}

std::optional<Pillar> parse_pillar(const std::string& s) {
    const std::string k = to_lower_copy(s);
    if (k == "technical") return Pillar::Technical;
    if (k == "content") return Pillar::Content;
    if (k == "ai_readiness" || k == "ai-readiness") return Pillar::AiReadiness;
    return std::nullopt;
}

std::optional<Effort> parse_effort(const std::string& s) {
    const std::string k = to_lower_copy(s);
    if (k == "low") return Effort::Low;
    if (k == "medium") return Effort::Medium;
    if (k == "high") return Effort::High;
    return std::nullopt;
}

std::optional<TemplateType> parse_template_type(const std::string& s) {
    const std::string k = to_lower_copy(s);
    if (k == "summary") return TemplateType::Summary;
    if (k == "detailed") return TemplateType::Detailed;
    return std::nullopt;
}

std::optional<OutputFormat> parse_output_format(const std::string& s) {
    const std::string k = to_lower_copy(s);
    if (k == "pdf") return OutputFormat::Pdf;
    if (k == "docx") return OutputFormat::Docx;
    return std::nullopt;
}

Brand resolve_brand(const ReportData& data) {
    Brand b;
    b.name = kDefaultBrandName;
    b.color = kDefaultBrandColor;

    if (data.project.branding) {
        const Branding& br = *data.project.branding;
        if (!br.company_name.empty()) {
            b.name = br.company_name;
            b.is_default = false;
        }
        if (!br.primary_color.empty()) b.color = br.primary_color;
    }
    if (!data.config.branding_color.empty()) b.color = data.config.branding_color;

    return b;
}

}  // namespace report
