#include "commands/batch.hpp"

#include "io/JsonIO.hpp"
#include "render/JobRunner.hpp"
#include "render/Renderers.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static int get_arg_int(int argc, char** argv, const std::string& key, int def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        std::cerr << "batch: ignoring non-numeric " << key << " value '" << s << "'\n";
        return def;
    }
}

int cmd_batch(int argc, char** argv) {
    try {
        const std::string jobs_path = get_arg(argc, argv, "--jobs", "");
        const fs::path inputs_dir = get_arg(argc, argv, "--inputs", "data/inputs");
        const fs::path outdir = get_arg(argc, argv, "--outdir", "out");
        const std::string config_path = get_arg(argc, argv, "--config", "");
        const int workers = get_arg_int(argc, argv, "--workers", 4);

        if (jobs_path.empty()) throw std::runtime_error("missing --jobs <jobs.json>");

        report::AggregateOptions base;
        base.generated_at = get_arg(argc, argv, "--generated_at", "");
        if (!config_path.empty()) base.roi = load_config(config_path).roi;

        const std::vector<render::RenderJob> jobs = load_jobs(jobs_path);
        fs::create_directories(outdir);

        // one raw input file per crawl: <inputs>/<crawlId>.json
        auto loader = [&](const render::RenderJob& job) {
            return load_raw_inputs((inputs_dir / (job.crawl_id + ".json")).string());
        };

        const auto outcomes =
            render::run_jobs(jobs, loader, base, workers <= 0 ? 1u : static_cast<size_t>(workers));

        int failures = 0;
        for (size_t i = 0; i < outcomes.size(); ++i) {
            const auto& o = outcomes[i];
            if (!o.ok()) {
                ++failures;
                std::cout << "FAILED " << o.report_id << " [" << render::to_string(o.error) << "] " << o.message << "\n";
                continue;
            }
            const fs::path outp = outdir / (o.report_id + "." + render::file_extension(jobs[i].format));
            write_binary_file(outp.string(), o.bytes);
            std::cout << "OK " << o.report_id << " -> " << outp.string() << " (" << o.bytes.size() << " bytes)\n";
        }

        std::cout << "JOBS: " << outcomes.size() << "\n";
        std::cout << "FAILED: " << failures << "\n";
        return failures == 0 ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "batch failed: " << e.what() << "\n";
        return 1;
    }
}
