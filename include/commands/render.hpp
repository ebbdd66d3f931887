#pragma once

// reportgen render --input <raw.json> (--job <job.json> | --type <t> --format <f>) --out <path>
int cmd_render(int argc, char** argv);
