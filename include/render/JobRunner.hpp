#pragma once

#include <functional>
#include <string>
#include <vector>

#include "report/Aggregator.hpp"
#include "report/Models.hpp"

namespace render {

// One render request as the dispatcher hands it over.
struct RenderJob {
    std::string report_id;
    std::string project_id;
    std::string crawl_id;
    std::string user_id;
    report::TemplateType type = report::TemplateType::Summary;
    report::OutputFormat format = report::OutputFormat::Pdf;
    report::ReportConfig config;
};

enum class JobError {
    None,
    LoadFailed,       // raw inputs could not be fetched
    InvalidInput,     // aggregation rejected the inputs
    RenderFailed
};

const char* to_string(JobError e);

struct JobOutcome {
    std::string report_id;
    JobError error = JobError::None;
    std::string message;
    std::string bytes;
    std::string content_type;

    bool ok() const { return error == JobError::None; }
};

// Fetches the raw collaborator output for a job. May throw; the failure is
// reported as JobError::LoadFailed.
using InputLoader = std::function<report::RawInputs(const RenderJob&)>;

// Aggregates and renders one job. `base` supplies ROI constants, weights and
// the timestamp; the job's own config replaces base.config. Never throws.
JobOutcome run_job(const RenderJob& job, const report::RawInputs& raw, const report::AggregateOptions& base = {});

// Runs independent jobs on `workers` threads (at least one). Outcomes keep
// the order of `jobs`.
std::vector<JobOutcome> run_jobs(const std::vector<RenderJob>& jobs, const InputLoader& load,
                                 const report::AggregateOptions& base = {}, size_t workers = 4);

}  // namespace render
