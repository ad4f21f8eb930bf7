#include "core/query/intent_classifier.h"

#include <QRegularExpression>

namespace mc {

namespace {

const QRegularExpression& temporalPattern()
{
    static const QRegularExpression re(
        QStringLiteral(R"(\b(recent(ly)?|latest|last\s+week|changed|new(ly)?|updated|since|yesterday|today)\b)"),
        QRegularExpression::CaseInsensitiveOption);
    return re;
}

const QRegularExpression& relationshipPattern()
{
    static const QRegularExpression re(
        QStringLiteral(R"(\b(related\s+to|depends\s+on|connected|linked|references|impacts|affects)\b)"),
        QRegularExpression::CaseInsensitiveOption);
    return re;
}

const QRegularExpression& aspectPattern()
{
    static const QRegularExpression re(
        QStringLiteral(R"(\b(conventions?|rules?|patterns?|how\s+to|best\s+practice|style|strategy)\b)"),
        QRegularExpression::CaseInsensitiveOption);
    return re;
}

const QRegularExpression& questionPattern()
{
    static const QRegularExpression re(
        QStringLiteral(R"(^(what|how|why|where|when|which|who|show|tell)\b)"),
        QRegularExpression::CaseInsensitiveOption);
    return re;
}

bool matches(const QRegularExpression& re, const QString& text)
{
    return re.match(text).hasMatch();
}

IntentClassification make(SearchIntent intent, float confidence, const QString& query)
{
    IntentClassification result;
    result.intent = intent;
    result.confidence = confidence;
    result.extractedTerms = IntentClassifier::extractTerms(query);
    result.suggestedTypes = IntentClassifier::suggestTypes(query);
    return result;
}

} // namespace

QString searchIntentToString(SearchIntent intent)
{
    switch (intent) {
    case SearchIntent::Entity:
        return QStringLiteral("entity");
    case SearchIntent::Aspect:
        return QStringLiteral("aspect");
    case SearchIntent::Temporal:
        return QStringLiteral("temporal");
    case SearchIntent::Relationship:
        return QStringLiteral("relationship");
    case SearchIntent::Exploratory:
    default:
        return QStringLiteral("exploratory");
    }
}

std::optional<SearchIntent> searchIntentFromString(const QString& value)
{
    const QString normalized = value.trimmed().toLower();
    for (const SearchIntent intent : allSearchIntents()) {
        if (searchIntentToString(intent) == normalized) {
            return intent;
        }
    }
    return std::nullopt;
}

const std::array<SearchIntent, 5>& allSearchIntents()
{
    static const std::array<SearchIntent, 5> intents = {
        SearchIntent::Entity,
        SearchIntent::Aspect,
        SearchIntent::Temporal,
        SearchIntent::Exploratory,
        SearchIntent::Relationship,
    };
    return intents;
}

const QStringList& IntentClassifier::categoryLabels()
{
    static const QStringList labels = {
        QStringLiteral("testing"),
        QStringLiteral("architecture"),
        QStringLiteral("coding_style"),
        QStringLiteral("constraints"),
        QStringLiteral("lessons_learned"),
        QStringLiteral("file_map"),
        QStringLiteral("folder_structure"),
        QStringLiteral("workflows"),
        QStringLiteral("dependencies"),
        QStringLiteral("deployment"),
        QStringLiteral("security"),
    };
    return labels;
}

QStringList IntentClassifier::extractTerms(const QString& query)
{
    static const QRegularExpression nonTermChars(QStringLiteral(R"([^a-zA-Z0-9/_.\-])"));
    static const QRegularExpression whitespace(QStringLiteral(R"(\s+)"));

    QString cleaned = query;
    cleaned.replace(nonTermChars, QStringLiteral(" "));

    QStringList terms;
    for (const QString& term : cleaned.split(whitespace, Qt::SkipEmptyParts)) {
        if (term.size() > 1) {
            terms.append(term);
        }
    }
    return terms;
}

QStringList IntentClassifier::suggestTypes(const QString& query)
{
    const QString lower = query.toLower();
    QStringList matched;
    for (const QString& label : categoryLabels()) {
        QString spaced = label;
        spaced.replace(QLatin1Char('_'), QLatin1Char(' '));
        if (lower.contains(spaced) || lower.contains(label)) {
            matched.append(label);
        }
    }
    return matched;
}

IntentClassification IntentClassifier::classify(const QString& query)
{
    static const QRegularExpression fileExtension(QStringLiteral(R"(\.\w{1,6}$)"));
    static const QRegularExpression identifier(
        QStringLiteral(R"(^[A-Z][a-zA-Z0-9]+$|^[a-z]+(_[a-z]+)+$)"));
    static const QRegularExpression whitespace(QStringLiteral(R"(\s+)"));

    const QString trimmed = query.trimmed();
    if (trimmed.isEmpty()) {
        return make(SearchIntent::Exploratory, 0.0f, trimmed);
    }

    const QStringList words = trimmed.split(whitespace, Qt::SkipEmptyParts);

    if (trimmed.contains(QLatin1Char('/'))) {
        return make(SearchIntent::Entity, 0.9f, trimmed);
    }
    if (words.size() == 1 && matches(identifier, words.front())) {
        return make(SearchIntent::Entity, 0.85f, trimmed);
    }
    if (matches(fileExtension, trimmed)) {
        return make(SearchIntent::Entity, 0.8f, trimmed);
    }

    const bool temporal = matches(temporalPattern(), trimmed);
    const bool relationship = matches(relationshipPattern(), trimmed);
    const bool aspect = matches(aspectPattern(), trimmed);

    if (words.size() <= 3 && !matches(questionPattern(), trimmed)
        && !temporal && !relationship && !aspect) {
        return make(SearchIntent::Entity, 0.6f, trimmed);
    }
    if (temporal) {
        return make(SearchIntent::Temporal, 0.85f, trimmed);
    }
    if (relationship) {
        return make(SearchIntent::Relationship, 0.8f, trimmed);
    }

    IntentClassification result = make(SearchIntent::Exploratory, 0.5f, trimmed);
    if (aspect || !result.suggestedTypes.isEmpty()) {
        result.intent = SearchIntent::Aspect;
        result.confidence = 0.75f;
    }
    return result;
}

IntentWeights IntentClassifier::weights(SearchIntent intent)
{
    switch (intent) {
    case SearchIntent::Entity:
        return {2.0, 0.5, 0.3, 1.0, 0.0};
    case SearchIntent::Temporal:
        return {0.7, 0.5, 3.0, 0.5, 0.0};
    case SearchIntent::Relationship:
        return {0.5, 1.5, 1.0, 1.0, 2.0};
    case SearchIntent::Aspect:
        return {1.0, 1.5, 0.5, 1.5, 0.0};
    case SearchIntent::Exploratory:
    default:
        return {1.0, 1.2, 1.0, 1.0, 0.0};
    }
}

} // namespace mc
