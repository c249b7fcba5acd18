#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sqlbridge::protocol {

enum class Verb {
    Select,
    Count,
    Insert,
    Update,
    Delete,
    Describe
};

// Each kind is present only when its lexical scan matched.
struct Conditions {
    std::optional<std::string> location;
    std::optional<int> limit;
    std::optional<std::string> status;
    std::optional<std::string> where_clause;

    bool empty() const {
        return !location && !limit && !status && !where_clause;
    }
};

struct AnalyzedIntent {
    Verb verb = Verb::Select;
    std::vector<std::string> target_entities;  // first is primary
    Conditions conditions;
    std::string original_input;

    const std::string* primary_entity() const {
        return target_entities.empty() ? nullptr : &target_entities.front();
    }
};

inline std::string to_string(const Verb verb) {
    switch (verb) {
        case Verb::Select:
            return "SELECT";
        case Verb::Count:
            return "COUNT";
        case Verb::Insert:
            return "INSERT";
        case Verb::Update:
            return "UPDATE";
        case Verb::Delete:
            return "DELETE";
        case Verb::Describe:
            return "DESCRIBE";
        default:
            return "UNKNOWN";
    }
}

inline nlohmann::json to_json(const Conditions& conditions) {
    nlohmann::json out = nlohmann::json::object();
    if (conditions.location) {
        out["location"] = *conditions.location;
    }
    if (conditions.limit) {
        out["limit"] = *conditions.limit;
    }
    if (conditions.status) {
        out["status"] = *conditions.status;
    }
    if (conditions.where_clause) {
        out["whereClause"] = *conditions.where_clause;
    }
    return out;
}

inline nlohmann::json to_json(const AnalyzedIntent& intent) {
    return nlohmann::json{{"verb", to_string(intent.verb)},
                          {"targetEntities", intent.target_entities},
                          {"conditions", to_json(intent.conditions)}};
}

}  // namespace sqlbridge::protocol
