#include "render/JobRunner.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <iostream>
#include <thread>

#include "render/Renderers.hpp"

namespace render {

const char* to_string(JobError e) {
    switch (e) {
        case JobError::None: return "none";
        case JobError::LoadFailed: return "load_failed";
        case JobError::InvalidInput: return "invalid_input";
        case JobError::RenderFailed: return "render_failed";
        default: return "unknown";
    }
}

static JobOutcome failed(const RenderJob& job, JobError error, const std::string& message) {
    std::cerr << "JobRunner: report " << job.report_id << " " << to_string(error) << ": " << message << "\n";
    JobOutcome out;
    out.report_id = job.report_id;
    out.error = error;
    out.message = message;
    return out;
}

JobOutcome run_job(const RenderJob& job, const report::RawInputs& raw, const report::AggregateOptions& base) {
    report::AggregateOptions opt = base;
    opt.config = job.config;

    report::ReportData data;
    try {
        data = report::aggregate(raw, opt);
    } catch (const std::exception& e) {
        return failed(job, JobError::InvalidInput, e.what());
    }

    try {
        JobOutcome out;
        out.report_id = job.report_id;
        out.bytes = render_report(data, job.type, job.format);
        out.content_type = content_type(job.format);
        return out;
    } catch (const std::exception& e) {
        return failed(job, JobError::RenderFailed, e.what());
    }
}

std::vector<JobOutcome> run_jobs(const std::vector<RenderJob>& jobs, const InputLoader& load,
                                 const report::AggregateOptions& base, size_t workers) {
    std::vector<JobOutcome> outcomes(jobs.size());
    std::atomic<size_t> next{0};

    auto worker = [&]() {
        for (size_t i = next++; i < jobs.size(); i = next++) {
            const RenderJob& job = jobs[i];
            report::RawInputs raw;
            try {
                raw = load(job);
            } catch (const std::exception& e) {
                outcomes[i] = failed(job, JobError::LoadFailed, e.what());
                continue;
            }
            outcomes[i] = run_job(job, raw, base);
        }
    };

    const size_t n = std::max<size_t>(1, std::min(workers, jobs.size()));
    std::vector<std::thread> pool;
    pool.reserve(n);
    for (size_t t = 0; t < n; ++t) pool.emplace_back(worker);
    for (auto& th : pool) th.join();

    return outcomes;
}

}  // namespace render
