#pragma once

#include <QString>
#include <QStringList>

#include <array>
#include <optional>

namespace mc {

enum class SearchIntent {
    Entity,
    Aspect,
    Temporal,
    Exploratory,
    Relationship,
};

struct IntentClassification {
    SearchIntent intent = SearchIntent::Exploratory;
    float confidence = 0.0f;
    QStringList extractedTerms;
    QStringList suggestedTypes;   // known category labels present in the query
};

// Multipliers a caller applies on top of the fused ranking.
struct IntentWeights {
    double ftsBoost = 1.0;
    double vectorBoost = 1.0;
    double recencyBoost = 1.0;
    double priorityBoost = 1.0;
    double graphBoost = 0.0;
};

QString searchIntentToString(SearchIntent intent);
std::optional<SearchIntent> searchIntentFromString(const QString& value);
const std::array<SearchIntent, 5>& allSearchIntents();

class IntentClassifier {
public:
    // Rules, first match wins:
    //   path separator                          -> entity 0.9
    //   single PascalCase / snake_case word     -> entity 0.85
    //   trailing file extension                 -> entity 0.8
    //   <= 3 words, no question or other cue    -> entity 0.6
    //   recency / change language               -> temporal 0.85
    //   connective language                     -> relationship 0.8
    //   convention language or category label   -> aspect 0.75
    //   otherwise                               -> exploratory 0.5
    // A blank query is exploratory with confidence 0.
    static IntentClassification classify(const QString& query);

    static IntentWeights weights(SearchIntent intent);

    // Runs of [A-Za-z0-9/_.-] longer than one character.
    static QStringList extractTerms(const QString& query);

    // Category labels found in the query, either literally ("coding_style")
    // or with underscores read as spaces ("coding style").
    static QStringList suggestTypes(const QString& query);

    static const QStringList& categoryLabels();
};

} // namespace mc
