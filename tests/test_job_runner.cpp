#include <catch2/catch.hpp>

#include <map>
#include <stdexcept>

#include "render/JobRunner.hpp"
#include "support/Fixtures.hpp"
#include "support/TextExtract.hpp"

using namespace render;
using report::OutputFormat;
using report::TemplateType;

static RenderJob make_job(const std::string& report_id, const std::string& crawl_id, TemplateType type,
                          OutputFormat format) {
    RenderJob job;
    job.report_id = report_id;
    job.project_id = "project-1";
    job.crawl_id = crawl_id;
    job.user_id = "user-1";
    job.type = type;
    job.format = format;
    return job;
}

TEST_CASE("JobRunner: single job", "[job_runner]") {
    const auto raw = fixtures::make_raw_inputs();

    SECTION("renders and tags the content type") {
        const JobOutcome out = run_job(make_job("rep-1", "crawl-3", TemplateType::Summary, OutputFormat::Docx), raw,
                                       fixtures::make_options());
        REQUIRE(out.ok());
        CHECK(out.report_id == "rep-1");
        CHECK(out.content_type == "application/vnd.openxmlformats-officedocument.wordprocessingml.document");
        CHECK(out.bytes.compare(0, 2, "PK") == 0);
        CHECK(out.message.empty());
    }
    SECTION("job config reaches the document") {
        RenderJob job = make_job("rep-2", "crawl-3", TemplateType::Summary, OutputFormat::Docx);
        job.config.prepared_for = "Jordan";
        const JobOutcome out = run_job(job, raw, fixtures::make_options());
        REQUIRE(out.ok());
        const std::string text = textextract::docx_text(out.bytes);
        CHECK(text.find("Prepared for Jordan") != std::string::npos);
    }
    SECTION("rejected inputs are reported, not thrown") {
        auto bad = raw;
        bad.crawl.pages_found = -3;
        const JobOutcome out = run_job(make_job("rep-3", "crawl-3", TemplateType::Summary, OutputFormat::Pdf), bad);
        CHECK_FALSE(out.ok());
        CHECK(out.error == JobError::InvalidInput);
        CHECK(out.bytes.empty());
        CHECK(out.message.find("pages_found") != std::string::npos);
    }
}

TEST_CASE("JobRunner: batch", "[job_runner][batch]") {
    const std::map<std::string, report::RawInputs> inputs = {
        {"crawl-3", fixtures::make_raw_inputs()},
        {"crawl-min", fixtures::make_minimal_inputs()},
    };
    const InputLoader load = [&inputs](const RenderJob& job) {
        const auto it = inputs.find(job.crawl_id);
        if (it == inputs.end()) throw std::runtime_error("no inputs for crawl " + job.crawl_id);
        return it->second;
    };

    const std::vector<RenderJob> jobs = {
        make_job("a", "crawl-3", TemplateType::Summary, OutputFormat::Pdf),
        make_job("b", "crawl-min", TemplateType::Detailed, OutputFormat::Docx),
        make_job("c", "crawl-missing", TemplateType::Summary, OutputFormat::Pdf),
        make_job("d", "crawl-3", TemplateType::Detailed, OutputFormat::Pdf),
        make_job("e", "crawl-min", TemplateType::Summary, OutputFormat::Docx),
    };

    for (size_t workers : {1u, 3u, 16u}) {
        INFO("workers " << workers);
        const auto outcomes = run_jobs(jobs, load, fixtures::make_options(), workers);

        REQUIRE(outcomes.size() == jobs.size());
        for (size_t i = 0; i < jobs.size(); ++i) CHECK(outcomes[i].report_id == jobs[i].report_id);

        CHECK(outcomes[0].ok());
        CHECK(outcomes[0].content_type == "application/pdf");
        CHECK(outcomes[1].ok());
        CHECK(outcomes[2].error == JobError::LoadFailed);
        CHECK(outcomes[2].message == "no inputs for crawl crawl-missing");
        CHECK(outcomes[3].ok());
        CHECK(outcomes[4].ok());
    }

    SECTION("results match a sequential run") {
        const auto parallel = run_jobs(jobs, load, fixtures::make_options(), 4);
        for (size_t i = 0; i < jobs.size(); ++i) {
            if (!parallel[i].ok()) continue;
            const JobOutcome single = run_job(jobs[i], load(jobs[i]), fixtures::make_options());
            CHECK(single.bytes == parallel[i].bytes);
        }
    }
    SECTION("empty batch") {
        CHECK(run_jobs({}, load).empty());
    }
}

TEST_CASE("JobRunner: error names", "[job_runner]") {
    CHECK(std::string(to_string(JobError::None)) == "none");
    CHECK(std::string(to_string(JobError::LoadFailed)) == "load_failed");
    CHECK(std::string(to_string(JobError::InvalidInput)) == "invalid_input");
    CHECK(std::string(to_string(JobError::RenderFailed)) == "render_failed");
}
