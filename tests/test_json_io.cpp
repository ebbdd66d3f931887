#include <catch2/catch.hpp>

#include <filesystem>

#include "io/JsonIO.hpp"
#include "support/Fixtures.hpp"

using json = nlohmann::json;

static json raw_json() {
    return json::parse(R"({
        "project": {"name": "Acme", "domain": "acme.example",
                    "branding": {"company_name": "Acme Agency", "primary_color": "#111111"}},
        "crawl": {"id": "crawl-3", "completed_at": "2026-03-01T10:00:00Z", "pages_scored": 2,
                  "summary": "Two pages scored."},
        "pages": [
            {"url": "https://acme.example/", "overall": 88, "technical": 90, "content": 85,
             "ai_readiness": 80, "lighthouse_perf": 0.9, "lighthouse_seo": 0.95, "word_count": 640,
             "llm_scores": {"clarity": 80, "authority": null}},
            {"url": "https://acme.example/pricing", "overall": 52}
        ],
        "issues": [
            {"code": "MISSING_TITLE", "category": "technical", "severity": "critical",
             "message": "Page is missing a title tag", "recommendation": "Add a title."},
            {"code": "MISSING_TITLE", "category": "technical", "severity": "critical",
             "message": "Page is missing a title tag"}
        ],
        "history": [
            {"id": "crawl-2", "completed_at": "2026-02-01T10:00:00Z", "overall": 70, "technical": 70,
             "content": 70, "ai_readiness": 70}
        ],
        "visibility_checks": [
            {"provider": "chatgpt", "query": "crm", "brand_mentioned": false,
             "competitor_mentions": [{"domain": "rival.example", "mentioned": true}]}
        ],
        "enrichments": [
            {"provider": "gsc", "data": {"query": "crm", "impressions": 10}},
            {"provider": "clarity"}
        ],
        "gsc_impressions": 5000
    })");
}

static std::string error_of(const json& j) {
    try {
        parse_raw_inputs(j);
    } catch (const std::runtime_error& e) {
        return e.what();
    }
    return "";
}

TEST_CASE("JsonIO: raw inputs", "[json_io][inputs]") {
    const report::RawInputs raw = parse_raw_inputs(raw_json());

    CHECK(raw.project.domain == "acme.example");
    REQUIRE(raw.project.branding);
    CHECK(raw.project.branding->company_name == "Acme Agency");
    CHECK(raw.crawl.pages_scored == 2);
    CHECK_FALSE(raw.crawl.pages_found);
    REQUIRE(raw.crawl.summary);

    REQUIRE(raw.pages.size() == 2);
    REQUIRE(raw.pages[0].llm_scores);
    CHECK(raw.pages[0].llm_scores->clarity == 80.0);
    CHECK_FALSE(raw.pages[0].llm_scores->authority);
    CHECK_FALSE(raw.pages[1].technical);

    REQUIRE(raw.issues.size() == 2);
    CHECK_FALSE(raw.issues[1].recommendation);

    REQUIRE(raw.history.size() == 1);
    CHECK(raw.history[0].status == "completed");
    CHECK_FALSE(raw.history[0].performance);

    REQUIRE(raw.visibility_checks);
    CHECK((*raw.visibility_checks)[0].competitor_mentions.size() == 1);
    REQUIRE(raw.enrichments);
    CHECK((*raw.enrichments)[1].data.is_object());
    CHECK(raw.gsc_impressions == 5000.0);

    SECTION("absent collaborators stay absent") {
        json j = raw_json();
        j.erase("visibility_checks");
        j["enrichments"] = nullptr;
        const report::RawInputs partial = parse_raw_inputs(j);
        CHECK_FALSE(partial.visibility_checks);
        CHECK_FALSE(partial.enrichments);
    }
    SECTION("aggregates end to end") {
        report::AggregateOptions opt;
        opt.generated_at = fixtures::kGeneratedAt;
        const report::ReportData d = report::aggregate(raw, opt);
        CHECK(d.issues.total == 1);
        CHECK(d.issues.items[0].affected_pages == 2);
        REQUIRE(d.gap_queries);
        CHECK(d.gap_queries->size() == 1);
    }
}

TEST_CASE("JsonIO: raw input errors name the path", "[json_io][errors]") {
    SECTION("missing required field") {
        json j = raw_json();
        j["issues"][0].erase("code");
        CHECK(error_of(j) == "root.issues[0] missing required field: code");
    }
    SECTION("wrong type") {
        json j = raw_json();
        j["pages"][1]["overall"] = "52";
        CHECK(error_of(j) == "root.pages[1].overall must be a number");
    }
    SECTION("nested list element") {
        json j = raw_json();
        j["visibility_checks"][0]["competitor_mentions"][0]["mentioned"] = "yes";
        CHECK(error_of(j) == "root.visibility_checks[0].competitor_mentions[0].mentioned must be a boolean");
    }
    SECTION("non-array list") {
        json j = raw_json();
        j["history"] = json::object();
        CHECK(error_of(j) == "root.history must be an array");
    }
    SECTION("missing project") {
        json j = raw_json();
        j.erase("project");
        CHECK(error_of(j) == "root missing required field: project");
    }
    SECTION("fractional page count") {
        json j = raw_json();
        j["crawl"]["pages_scored"] = 2.5;
        CHECK(error_of(j) == "root.crawl.pages_scored must be an integer");
    }
}

TEST_CASE("JsonIO: config", "[json_io][config]") {
    SECTION("all fields") {
        const RenderSettings s = parse_config(json::parse(
            R"({"brandingColor": "#ff0000", "preparedFor": "Jordan", "isPublic": true,
                "roi": {"ctrImprovementPer10Points": 0.03}})"));
        CHECK(s.config.branding_color == "#ff0000");
        CHECK(s.config.prepared_for == "Jordan");
        CHECK(s.config.is_public);
        CHECK(s.roi.ctr_improvement_per_10_points == Approx(0.03));
    }
    SECTION("defaults") {
        const RenderSettings s = parse_config(json::object());
        CHECK(s.config.branding_color.empty());
        CHECK_FALSE(s.config.is_public);
        CHECK(s.roi.ctr_improvement_per_10_points == Approx(0.02));
    }
    SECTION("negative ctr rejected") {
        CHECK_THROWS_WITH(parse_config(json::parse(R"({"roi": {"ctrImprovementPer10Points": -1}})")),
                          "root.roi.ctrImprovementPer10Points must not be negative");
    }
}

TEST_CASE("JsonIO: jobs", "[json_io][jobs]") {
    const json job = json::parse(R"({"reportId": "rep-1", "projectId": "p-1", "crawlId": "crawl-3",
                                     "userId": "u-1", "type": "detailed", "format": "docx",
                                     "config": {"preparedFor": "Jordan"}})");

    SECTION("single job") {
        const render::RenderJob j = parse_job(job);
        CHECK(j.report_id == "rep-1");
        CHECK(j.type == report::TemplateType::Detailed);
        CHECK(j.format == report::OutputFormat::Docx);
        CHECK(j.config.prepared_for == "Jordan");
    }
    SECTION("unknown type") {
        json bad = job;
        bad["type"] = "brief";
        CHECK_THROWS_WITH(parse_job(bad), "root.type must be one of: summary, detailed");
    }
    SECTION("unknown format") {
        json bad = job;
        bad["format"] = "html";
        CHECK_THROWS_WITH(parse_job(bad, "root.jobs[2]"), "root.jobs[2].format must be one of: pdf, docx");
    }
    SECTION("job files") {
        const auto dir = std::filesystem::temp_directory_path() / "reportgen_json_io_test";
        std::filesystem::create_directories(dir);

        const std::string single = (dir / "single.json").string();
        write_binary_file(single, job.dump());
        CHECK(load_jobs(single).size() == 1);

        const std::string wrapped = (dir / "wrapped.json").string();
        write_binary_file(wrapped, json{{"jobs", json::array({job, job})}}.dump());
        CHECK(load_jobs(wrapped).size() == 2);

        const std::string list = (dir / "list.json").string();
        json broken = job;
        broken.erase("userId");
        write_binary_file(list, json::array({job, broken}).dump());
        CHECK_THROWS_WITH(load_jobs(list), "root[1] missing required field: userId");

        std::filesystem::remove_all(dir);
    }
    SECTION("unreadable file") {
        CHECK_THROWS_AS(load_jobs("/nonexistent/reportgen/jobs.json"), std::runtime_error);
    }
}

TEST_CASE("JsonIO: report dump", "[json_io][dump]") {
    const report::ReportData d = fixtures::make_report_data();
    const json j = report_data_to_json(d);

    CHECK(j.at("scores").at("letterGrade") == "C");
    CHECK(j.at("issues").at("total") == 4);
    CHECK(j.at("issues").at("bySeverity").size() == 3);
    CHECK(j.at("quickWins").size() == 3);
    CHECK(j.at("generatedAt") == fixtures::kGeneratedAt);
    CHECK(j.at("project").at("branding").is_null());

    SECTION("absent sections dump as null") {
        const report::ReportData minimal = report::aggregate(fixtures::make_minimal_inputs(), fixtures::make_options());
        const json m = report_data_to_json(minimal);
        CHECK(m.at("visibility").is_null());
        CHECK(m.at("competitors").is_null());
        CHECK(m.at("integrations").is_null());
    }
}
