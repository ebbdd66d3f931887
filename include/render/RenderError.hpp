#pragma once

#include <stdexcept>
#include <string>

#include "report/Models.hpp"

namespace render {

// Raised when a backend cannot produce the document. Carries enough context
// for the dispatcher to mark the right report as failed.
class RenderError : public std::runtime_error {
public:
    RenderError(const std::string& report_id, report::OutputFormat format, const std::string& detail)
        : std::runtime_error(std::string(report::to_string(format)) + " render failed for report '" + report_id +
                             "': " + detail),
          report_id_(report_id),
          format_(format) {}

    const std::string& report_id() const { return report_id_; }
    report::OutputFormat format() const { return format_; }

private:
    std::string report_id_;
    report::OutputFormat format_;
};

}  // namespace render
