#pragma once

// reportgen aggregate --input <raw.json> [--config <cfg.json>] [--generated_at <iso>] [--out <path>]
int cmd_aggregate(int argc, char** argv);
