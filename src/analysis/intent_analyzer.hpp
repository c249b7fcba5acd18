#pragma once

#include <optional>
#include <string>
#include <vector>
#include "core/config/bridge_config.hpp"
#include "protocol/intent_contract.hpp"

namespace sqlbridge::analysis {

struct VerbKeywords {
    protocol::Verb verb;
    std::vector<std::string> keywords;
};

// Keyword lists for the three condition scans, tried in order.
struct ConditionKeywords {
    std::vector<std::string> location = {"from", "in"};
    std::vector<std::string> limit = {"top", "first", "limit"};
    std::vector<std::string> status = {"status", "state"};
    // Tried after `status`, and only where the keyword starts a word.
    std::vector<std::string> status_words = {"are"};
};

// Lexical classifier: no I/O, same input always gives the same intent.
class IntentAnalyzer {
public:
    static const std::vector<VerbKeywords>& default_verb_keywords();
    static const core::config::EntityTable& default_entity_table();

    // An empty table selects the default one.
    explicit IntentAnalyzer(core::config::EntityTable entities = {},
                            ConditionKeywords condition_keywords = {});

    protocol::AnalyzedIntent analyze(const std::string& text) const;

    const core::config::EntityTable& entities() const { return entities_; }

private:
    protocol::Verb classify_verb(const std::string& normalized) const;
    std::vector<std::string> extract_entities(const std::string& normalized) const;
    protocol::Conditions extract_conditions(const std::string& normalized) const;

    core::config::EntityTable entities_;
    ConditionKeywords condition_keywords_;
};

std::string normalize(const std::string& text);

// The whitespace-delimited token following the first occurrence of `keyword`
// that is itself followed by whitespace. No word-boundary check on the left
// unless `word_start` is set.
std::optional<std::string> token_after(const std::string& text, const std::string& keyword,
                                       bool word_start = false);

}  // namespace sqlbridge::analysis
