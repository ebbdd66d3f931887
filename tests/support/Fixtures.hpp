#pragma once

#include <string>

#include "report/Aggregator.hpp"

namespace fixtures {

constexpr const char* kGeneratedAt = "2026-03-02T08:00:00Z";

// Four pages, duplicated issue rows across all severities, three completed
// history crawls plus a failed one, visibility probes with competitor
// mentions, and gsc/ga4/clarity envelopes.
report::RawInputs make_raw_inputs();

// Same project with pages and issues only; every optional collaborator absent.
report::RawInputs make_minimal_inputs();

report::AggregateOptions make_options();

report::ReportData make_report_data();

}  // namespace fixtures
