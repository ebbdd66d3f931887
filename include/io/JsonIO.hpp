#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "render/JobRunner.hpp"
#include "report/Aggregator.hpp"
#include "report/Models.hpp"
#include "report/Roi.hpp"

// Loaders throw std::runtime_error naming the offending JSON path
// ("root.issues[3].severity must be a string").

nlohmann::json read_json_file(const std::string& path);

// {project, crawl, pages, issues, history, visibility_checks?, enrichments?, gsc_impressions?}
report::RawInputs parse_raw_inputs(const nlohmann::json& j, const std::string& where = "root");
report::RawInputs load_raw_inputs(const std::string& path);

// {reportId, projectId, crawlId, userId, type, format, config?}
render::RenderJob parse_job(const nlohmann::json& j, const std::string& where = "root");

// A single job object, a job array, or {"jobs": [...]}.
std::vector<render::RenderJob> load_jobs(const std::string& path);

struct RenderSettings {
    report::ReportConfig config;
    report::RoiConstants roi;
};

// {brandingColor?, preparedFor?, isPublic?, roi?: {ctrImprovementPer10Points}}
RenderSettings parse_config(const nlohmann::json& j, const std::string& where = "root");
RenderSettings load_config(const std::string& path);

// Canonical dump, keys sorted, used for determinism checks and debugging.
nlohmann::json report_data_to_json(const report::ReportData& d);

void write_binary_file(const std::string& path, const std::string& bytes);
