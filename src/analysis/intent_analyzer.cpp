#include "analysis/intent_analyzer.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/json_rpc.hpp"

namespace sqlbridge::analysis {

using protocol::AnalyzedIntent;
using protocol::Conditions;
using protocol::Verb;

namespace {

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

bool is_space(const char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool starts_word(const std::string& text, const std::size_t pos) {
    return pos == 0 || !std::isalnum(static_cast<unsigned char>(text[pos - 1]));
}

bool contains_word(const std::string& text, const std::string& word) {
    for (auto pos = text.find(word); pos != std::string::npos; pos = text.find(word, pos + 1)) {
        if (starts_word(text, pos)) {
            return true;
        }
    }
    return false;
}

std::optional<int> parse_positive_int(const std::string& token) {
    if (token.empty() ||
        !std::all_of(token.begin(), token.end(), [](const unsigned char c) {
            return std::isdigit(c) != 0;
        })) {
        return std::nullopt;
    }
    errno = 0;
    const long value = std::strtol(token.c_str(), nullptr, 10);
    if (errno == ERANGE || value <= 0 || value > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return static_cast<int>(value);
}

// First keyword present in the text wins, even when nothing follows it.
std::optional<std::string> first_keyword_token(const std::string& text,
                                               const std::vector<std::string>& keywords,
                                               const bool word_start = false) {
    for (const auto& keyword : keywords) {
        if (word_start ? contains_word(text, keyword) : contains(text, keyword)) {
            return token_after(text, keyword, word_start);
        }
    }
    return std::nullopt;
}

}  // namespace

std::string normalize(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::optional<std::string> token_after(const std::string& text, const std::string& keyword,
                                       const bool word_start) {
    if (keyword.empty()) {
        return std::nullopt;
    }
    std::size_t pos = text.find(keyword);
    while (pos != std::string::npos) {
        std::size_t cursor = pos + keyword.size();
        if (cursor < text.size() && is_space(text[cursor]) &&
            (!word_start || starts_word(text, pos))) {
            while (cursor < text.size() && is_space(text[cursor])) {
                ++cursor;
            }
            if (cursor == text.size()) {
                return std::nullopt;
            }
            std::size_t end = cursor;
            while (end < text.size() && !is_space(text[end])) {
                ++end;
            }
            return text.substr(cursor, end - cursor);
        }
        pos = text.find(keyword, pos + 1);
    }
    return std::nullopt;
}

const std::vector<VerbKeywords>& IntentAnalyzer::default_verb_keywords() {
    static const std::vector<VerbKeywords> keywords = {
        {Verb::Select, {"show", "list", "get", "find", "select", "display"}},
        {Verb::Count, {"count", "how many", "total"}},
        {Verb::Insert, {"create", "add", "insert"}},
        {Verb::Update, {"update", "change", "modify"}},
        {Verb::Delete, {"delete", "remove", "drop"}},
        {Verb::Describe, {"describe", "structure", "schema", "columns"}}};
    return keywords;
}

const core::config::EntityTable& IntentAnalyzer::default_entity_table() {
    static const core::config::EntityTable table = {
        {"customers", {"customer", "client", "user"}},
        {"orders", {"order", "purchase", "sale"}},
        {"products", {"product", "item"}},
        {"employees", {"employee", "staff", "worker"}},
        {"payments", {"payment", "invoice", "billing"}},
        {"support_tickets", {"ticket", "issue", "support"}}};
    return table;
}

IntentAnalyzer::IntentAnalyzer(core::config::EntityTable entities,
                               ConditionKeywords condition_keywords)
    : entities_(entities.empty() ? default_entity_table() : std::move(entities)),
      condition_keywords_(std::move(condition_keywords)) {}

AnalyzedIntent IntentAnalyzer::analyze(const std::string& text) const {
    const std::string normalized = normalize(text);

    AnalyzedIntent intent;
    intent.verb = classify_verb(normalized);
    intent.target_entities = extract_entities(normalized);
    intent.conditions = extract_conditions(normalized);
    intent.original_input = text;

    LOG_DEBUG("Analyzed intent: " + protocol::display_json(protocol::to_json(intent)));
    return intent;
}

Verb IntentAnalyzer::classify_verb(const std::string& normalized) const {
    for (const auto& entry : default_verb_keywords()) {
        for (const auto& keyword : entry.keywords) {
            if (contains(normalized, keyword)) {
                return entry.verb;
            }
        }
    }
    return Verb::Select;
}

std::vector<std::string> IntentAnalyzer::extract_entities(const std::string& normalized) const {
    std::vector<std::string> found;
    for (const auto& [entity, synonyms] : entities_) {
        const bool matched =
            std::any_of(synonyms.begin(), synonyms.end(),
                        [&normalized](const std::string& synonym) {
                            return !synonym.empty() && contains(normalized, synonym);
                        });
        if (matched) {
            found.push_back(entity);
        }
    }
    return found;
}

Conditions IntentAnalyzer::extract_conditions(const std::string& normalized) const {
    Conditions conditions;
    conditions.location = first_keyword_token(normalized, condition_keywords_.location);
    const auto& status = condition_keywords_.status;
    const bool status_named = std::any_of(
        status.begin(), status.end(),
        [&normalized](const std::string& keyword) { return contains(normalized, keyword); });
    conditions.status =
        status_named ? first_keyword_token(normalized, status)
                     : first_keyword_token(normalized, condition_keywords_.status_words, true);

    for (const auto& keyword : condition_keywords_.limit) {
        const auto token = token_after(normalized, keyword);
        if (!token) {
            continue;
        }
        if (const auto limit = parse_positive_int(*token)) {
            conditions.limit = limit;
            break;
        }
    }
    return conditions;
}

}  // namespace sqlbridge::analysis
