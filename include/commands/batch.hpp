#pragma once

// reportgen batch --jobs <jobs.json> --inputs <dir> [--outdir <dir>] [--workers <n>]
int cmd_batch(int argc, char** argv);
