#include "commands/aggregate.hpp"

#include "io/JsonIO.hpp"
#include "report/Aggregator.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

int cmd_aggregate(int argc, char** argv) {
    try {
        const std::string input = get_arg(argc, argv, "--input", "");
        const std::string config_path = get_arg(argc, argv, "--config", "");
        const std::string generated_at = get_arg(argc, argv, "--generated_at", "");
        const std::string outp = get_arg(argc, argv, "--out", "");

        if (input.empty()) throw std::runtime_error("missing --input <raw.json>");

        report::AggregateOptions opt;
        opt.generated_at = generated_at;
        if (!config_path.empty()) {
            const RenderSettings settings = load_config(config_path);
            opt.config = settings.config;
            opt.roi = settings.roi;
        }

        const report::RawInputs raw = load_raw_inputs(input);
        const report::ReportData data = report::aggregate(raw, opt);
        const std::string dumped = report_data_to_json(data).dump(2) + "\n";

        if (outp.empty()) {
            std::cout << dumped;
            return 0;
        }

        write_binary_file(outp, dumped);
        std::cout << "OUT_REPORT_DATA: " << outp << "\n";
        std::cout << "ISSUES: " << data.issues.total << "\n";
        std::cout << "QUICK_WINS: " << data.quick_wins.size() << "\n";
        std::cout << "OVERALL: " << data.scores.overall << " (" << data.scores.letter_grade << ")\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "aggregate failed: " << e.what() << "\n";
        return 1;
    }
}
