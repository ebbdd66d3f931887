#include "commands/render.hpp"

#include "io/JsonIO.hpp"
#include "render/JobRunner.hpp"
#include "render/Renderers.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static render::RenderJob job_from_flags(int argc, char** argv) {
    render::RenderJob job;
    job.report_id = get_arg(argc, argv, "--report_id", "local");

    const std::string type = get_arg(argc, argv, "--type", "summary");
    const auto t = report::parse_template_type(type);
    if (!t) throw std::runtime_error("--type must be summary or detailed, got: " + type);
    job.type = *t;

    const std::string format = get_arg(argc, argv, "--format", "pdf");
    const auto f = report::parse_output_format(format);
    if (!f) throw std::runtime_error("--format must be pdf or docx, got: " + format);
    job.format = *f;
    return job;
}

int cmd_render(int argc, char** argv) {
    try {
        const std::string input = get_arg(argc, argv, "--input", "");
        const std::string job_path = get_arg(argc, argv, "--job", "");
        const std::string config_path = get_arg(argc, argv, "--config", "");
        const std::string generated_at = get_arg(argc, argv, "--generated_at", "");

        if (input.empty()) throw std::runtime_error("missing --input <raw.json>");

        report::AggregateOptions base;
        base.generated_at = generated_at;

        render::RenderJob job;
        if (!job_path.empty()) {
            const auto jobs = load_jobs(job_path);
            if (jobs.size() != 1) throw std::runtime_error("--job must hold exactly one job, use batch for more");
            job = jobs.front();
        } else {
            job = job_from_flags(argc, argv);
        }
        if (!config_path.empty()) {
            const RenderSettings settings = load_config(config_path);
            base.roi = settings.roi;
            if (job_path.empty()) job.config = settings.config;
        }

        const std::string outp =
            get_arg(argc, argv, "--out", job.report_id + "." + render::file_extension(job.format));

        const report::RawInputs raw = load_raw_inputs(input);
        const render::JobOutcome outcome = render::run_job(job, raw, base);
        if (!outcome.ok()) {
            std::cerr << "render failed: " << render::to_string(outcome.error) << ": " << outcome.message << "\n";
            return 1;
        }

        write_binary_file(outp, outcome.bytes);
        std::cout << "REPORT: " << job.report_id << "\n";
        std::cout << "TYPE: " << report::to_string(job.type) << "\n";
        std::cout << "FORMAT: " << report::to_string(job.format) << "\n";
        std::cout << "BYTES: " << outcome.bytes.size() << "\n";
        std::cout << "OUT: " << outp << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "render failed: " << e.what() << "\n";
        return 1;
    }
}
