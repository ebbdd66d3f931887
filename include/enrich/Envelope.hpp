#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace enrich {

// One record from the enrichment store. `data` has no fixed shape.
struct RawEnrichment {
    std::string provider;
    nlohmann::json data;
};

template <typename T>
struct SingleRecord {
    T record;
};

template <typename T>
struct RecordList {
    std::vector<T> records;
};

// A provider payload is either one inline record or a list of them. An
// envelope can carry both, so parsers return every payload they find.
template <typename T>
using Payload = std::variant<SingleRecord<T>, RecordList<T>>;

template <typename T>
void append_records(const Payload<T>& p, std::vector<T>& out) {
    if (const auto* single = std::get_if<SingleRecord<T>>(&p)) {
        out.push_back(single->record);
        return;
    }
    const auto& list = std::get<RecordList<T>>(p);
    out.insert(out.end(), list.records.begin(), list.records.end());
}

struct QueryRecord {
    std::string query;
    double impressions = 0.0;
    double clicks = 0.0;
    double position = 0.0;
};

struct PageSessionRecord {
    std::string url;
    double sessions = 0.0;
};

// gsc: {query, impressions, clicks, position} and/or {queries: [...]}.
// List entries without a query string are skipped.
std::vector<Payload<QueryRecord>> parse_query_payloads(const nlohmann::json& data);

// ga4: {url, sessions} and/or {pages: [{url, sessions}]}.
std::vector<Payload<PageSessionRecord>> parse_page_payloads(const nlohmann::json& data);

// Numbers pass through, numeric strings are parsed, anything else is nullopt.
std::optional<double> try_number(const nlohmann::json& v);

// try_number on data[key], 0 when absent or not numeric.
double number_or_zero(const nlohmann::json& data, const char* key);

// Non-empty string value of data[key]; numbers are printed.
std::optional<std::string> try_text(const nlohmann::json& data, const char* key);

}  // namespace enrich
