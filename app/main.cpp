#include "commands/aggregate.hpp"
#include "commands/batch.hpp"
#include "commands/render.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  reportgen aggregate [args]\n"
        << "  reportgen render [args]\n"
        << "  reportgen batch [args]\n"
        << "  reportgen help\n";
    return 1;
}

static int print_aggregate_help() {
    std::cerr
        << "usage:\n"
        << "  reportgen aggregate --input <raw.json> [options]\n"
        << "\n"
        << "options:\n"
        << "  --input <path>               (required) raw collaborator output\n"
        << "  --config <path>              optional: render config (branding, ROI constants)\n"
        << "  --generated_at <iso>         default: current UTC time\n"
        << "  --out <path>                 default: print ReportData JSON to stdout\n";
    return 0;
}

static int print_render_help() {
    std::cerr
        << "usage:\n"
        << "  reportgen render --input <raw.json> [options]\n"
        << "\n"
        << "job:\n"
        << "  --job <path>                 job descriptor {reportId, projectId, crawlId, userId, type, format, config}\n"
        << "  --type <summary|detailed>    default: summary (ignored with --job)\n"
        << "  --format <pdf|docx>          default: pdf (ignored with --job)\n"
        << "  --report_id <str>            default: local (ignored with --job)\n"
        << "\n"
        << "common:\n"
        << "  --input <path>               (required)\n"
        << "  --config <path>              optional: render config\n"
        << "  --generated_at <iso>         default: current UTC time\n"
        << "  --out <path>                 default: <reportId>.<pdf|docx>\n";
    return 0;
}

static int print_batch_help() {
    std::cerr
        << "usage:\n"
        << "  reportgen batch --jobs <jobs.json> [options]\n"
        << "\n"
        << "options:\n"
        << "  --jobs <path>                (required) job array or {\"jobs\": [...]}\n"
        << "  --inputs <dir>               default: data/inputs (reads <crawlId>.json)\n"
        << "  --outdir <dir>               default: out\n"
        << "  --workers <n>                default: 4\n"
        << "  --config <path>              optional: ROI constants\n"
        << "  --generated_at <iso>         default: current UTC time\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    // subcommand help
    const bool wants_help = argc >= 3 && std::string(argv[2]) == "--help";
    if (cmd == "aggregate" && wants_help) return print_aggregate_help();
    if (cmd == "render" && wants_help) return print_render_help();
    if (cmd == "batch" && wants_help) return print_batch_help();

    if (cmd == "aggregate") return cmd_aggregate(argc - 1, argv + 1);
    if (cmd == "render")    return cmd_render(argc - 1, argv + 1);
    if (cmd == "batch")     return cmd_batch(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
