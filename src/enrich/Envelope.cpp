#include "enrich/Envelope.hpp"

#include <cmath>
#include <cstdlib>

using json = nlohmann::json;

namespace enrich {

std::optional<double> try_number(const json& v) {
    if (v.is_number()) {
        const double d = v.get<double>();
        if (!std::isfinite(d)) return std::nullopt;
        return d;
    }
    if (v.is_string()) {
        const std::string s = v.get<std::string>();
        if (s.empty()) return std::nullopt;
        char* end = nullptr;
        const double d = std::strtod(s.c_str(), &end);
        if (end == s.c_str() || *end != '\0' || !std::isfinite(d)) return std::nullopt;
        return d;
    }
    return std::nullopt;
}

double number_or_zero(const json& data, const char* key) {
    if (!data.is_object() || !data.contains(key)) return 0.0;
    return try_number(data.at(key)).value_or(0.0);
}

std::optional<std::string> try_text(const json& data, const char* key) {
    if (!data.is_object() || !data.contains(key)) return std::nullopt;
    const json& v = data.at(key);
    if (v.is_string()) {
        std::string s = v.get<std::string>();
        if (s.empty()) return std::nullopt;
        return s;
    }
    if (v.is_number_integer()) return std::to_string(v.get<long long>());
    return std::nullopt;
}

static QueryRecord query_from(const json& j, const std::string& query) {
    QueryRecord q;
    q.query = query;
    q.impressions = number_or_zero(j, "impressions");
    q.clicks = number_or_zero(j, "clicks");
    q.position = number_or_zero(j, "position");
    return q;
}

std::vector<Payload<QueryRecord>> parse_query_payloads(const json& data) {
    std::vector<Payload<QueryRecord>> out;
    if (!data.is_object()) return out;

    if (data.contains("queries") && data.at("queries").is_array()) {
        RecordList<QueryRecord> list;
        for (const auto& item : data.at("queries")) {
            const auto query = try_text(item, "query");
            if (!query) continue;
            list.records.push_back(query_from(item, *query));
        }
        out.push_back(std::move(list));
    }

    if (const auto query = try_text(data, "query")) {
        out.push_back(SingleRecord<QueryRecord>{query_from(data, *query)});
    }

    return out;
}

std::vector<Payload<PageSessionRecord>> parse_page_payloads(const json& data) {
    std::vector<Payload<PageSessionRecord>> out;
    if (!data.is_object()) return out;

    const auto url = try_text(data, "url");
    if (url && data.contains("sessions") && !data.at("sessions").is_null()) {
        out.push_back(SingleRecord<PageSessionRecord>{{*url, number_or_zero(data, "sessions")}});
    }

    if (data.contains("pages") && data.at("pages").is_array()) {
        RecordList<PageSessionRecord> list;
        for (const auto& item : data.at("pages")) {
            const auto page_url = try_text(item, "url");
            if (!page_url) continue;
            list.records.push_back({*page_url, number_or_zero(item, "sessions")});
        }
        out.push_back(std::move(list));
    }

    return out;
}

}  // namespace enrich
