#include <catch2/catch.hpp>

#include "enrich/Competitors.hpp"

using namespace enrich;

static VisibilityCheck check(const std::string& provider,
                             const std::string& query,
                             bool brand,
                             std::vector<CompetitorMention> mentions) {
    VisibilityCheck c;
    c.provider = provider;
    c.query = query;
    c.brand_mentioned = brand;
    c.competitor_mentions = std::move(mentions);
    return c;
}

TEST_CASE("Competitors: mention counts and ordering", "[competitors]") {
    const std::vector<VisibilityCheck> checks = {
        check("chatgpt", "q1", true, {{"b.example", true}, {"a.example", true}}),
        check("perplexity", "q1", false, {{"b.example", true}}),
        check("chatgpt", "q2", false, {{"a.example", true}, {"c.example", false}}),
        check("gemini", "q3", false, {{"b.example", true}}),
    };

    const auto analysis = aggregate_competitors(checks);
    REQUIRE(analysis);
    REQUIRE(analysis->competitors.size() == 2);

    const auto& top = analysis->competitors[0];
    CHECK(top.domain == "b.example");
    CHECK(top.mention_count == 3);
    CHECK(top.platforms == std::vector<std::string>{"chatgpt", "perplexity", "gemini"});
    CHECK(top.queries == std::vector<std::string>{"q1", "q3"});

    const auto& second = analysis->competitors[1];
    CHECK(second.domain == "a.example");
    CHECK(second.mention_count == 2);
    CHECK(second.platforms == std::vector<std::string>{"chatgpt"});
}

TEST_CASE("Competitors: ties break on domain", "[competitors]") {
    const auto analysis = aggregate_competitors({
        check("chatgpt", "q", true, {{"z.example", true}}),
        check("chatgpt", "q", true, {{"m.example", true}}),
    });
    REQUIRE(analysis);
    REQUIRE(analysis->competitors.size() == 2);
    CHECK(analysis->competitors[0].domain == "m.example");
    CHECK(analysis->competitors[1].domain == "z.example");
    CHECK(analysis->gap_queries.empty());
}

TEST_CASE("Competitors: gap queries", "[competitors]") {
    SECTION("probes are merged per query and platform") {
        const auto analysis = aggregate_competitors({
            check("chatgpt", "crm", false, {{"a.example", true}}),
            check("chatgpt", "crm", false, {{"b.example", true}, {"a.example", true}}),
            check("claude", "crm", false, {{"a.example", true}}),
        });
        REQUIRE(analysis);
        REQUIRE(analysis->gap_queries.size() == 2);
        CHECK(analysis->gap_queries[0].query == "crm");
        CHECK(analysis->gap_queries[0].platform == "chatgpt");
        CHECK(analysis->gap_queries[0].competitors_cited == std::vector<std::string>{"a.example", "b.example"});
        CHECK(analysis->gap_queries[1].platform == "claude");
    }
    SECTION("brand mentioned means no gap") {
        const auto analysis = aggregate_competitors({check("chatgpt", "crm", true, {{"a.example", true}})});
        REQUIRE(analysis);
        CHECK(analysis->gap_queries.empty());
    }
    SECTION("unknown brand status counts as not mentioned") {
        auto c = check("chatgpt", "crm", false, {{"a.example", true}});
        c.brand_mentioned.reset();
        const auto analysis = aggregate_competitors({c});
        REQUIRE(analysis);
        CHECK(analysis->gap_queries.size() == 1);
    }
}

TEST_CASE("Competitors: nothing mentioned", "[competitors]") {
    CHECK_FALSE(aggregate_competitors({}));
    CHECK_FALSE(aggregate_competitors({check("chatgpt", "q", false, {{"a.example", false}})}));
}
