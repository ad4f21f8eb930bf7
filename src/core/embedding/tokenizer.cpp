#include "core/embedding/tokenizer.h"
#include "core/shared/logging.h"

#include <QFile>
#include <QRegularExpression>
#include <QStringConverter>
#include <QTextStream>

#include <algorithm>
#include <utility>

namespace mc {

WordPieceTokenizer::WordPieceTokenizer(const QString& vocabPath, int maxSequenceLength)
    : m_maxSequenceLength(std::max(maxSequenceLength, 3))
{
    QFile file(vocabPath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        LOG_WARN(mcEmbedding, "WordPieceTokenizer failed to open vocab: %s",
                 qUtf8Printable(vocabPath));
        return;
    }

    QTextStream in(&file);
    in.setEncoding(QStringConverter::Utf8);

    // Blank lines still consume an id.
    QStringList tokens;
    while (!in.atEnd()) {
        tokens.append(in.readLine().trimmed());
    }
    loadTokens(tokens);

    if (!m_loaded) {
        LOG_WARN(mcEmbedding, "WordPieceTokenizer loaded empty vocab from %s",
                 qUtf8Printable(vocabPath));
    }
}

WordPieceTokenizer::WordPieceTokenizer(const QStringList& vocabTokens, int maxSequenceLength)
    : m_maxSequenceLength(std::max(maxSequenceLength, 3))
{
    loadTokens(vocabTokens);
}

void WordPieceTokenizer::loadTokens(const QStringList& tokens)
{
    int index = 0;
    for (const QString& token : tokens) {
        if (!token.isEmpty()) {
            m_vocab.emplace(token.toStdString(), index);
        }
        ++index;
    }
    m_loaded = !m_vocab.empty();
}

bool WordPieceTokenizer::isLoaded() const
{
    return m_loaded;
}

QString WordPieceTokenizer::normalize(const QString& text) const
{
    QString normalized = text.toLower().normalized(QString::NormalizationForm_D);

    // Drop accents, and split punctuation off into its own word.
    QString stripped;
    stripped.reserve(normalized.size() * 2);
    for (const QChar ch : normalized) {
        const QChar::Category category = ch.category();
        const bool isCombiningMark = category == QChar::Mark_NonSpacing
                                   || category == QChar::Mark_SpacingCombining
                                   || category == QChar::Mark_Enclosing;
        if (isCombiningMark) {
            continue;
        }
        if (ch.isPunct() || ch.isSymbol()) {
            stripped.append(QLatin1Char(' '));
            stripped.append(ch);
            stripped.append(QLatin1Char(' '));
            continue;
        }
        stripped.append(ch);
    }

    static const QRegularExpression whitespaceRegex(QStringLiteral("\\s+"));
    stripped.replace(whitespaceRegex, QStringLiteral(" "));
    return stripped.trimmed();
}

void WordPieceTokenizer::appendWordPieces(const QString& token, std::vector<int64_t>* output) const
{
    const int limit = maxContentTokens();
    if (!output || token.isEmpty() || static_cast<int>(output->size()) >= limit) {
        return;
    }

    const int tokenLength = token.size();
    int start = 0;

    // Greedy longest-match-first. A word with any unmatched span becomes a
    // single [UNK].
    std::vector<int64_t> pieces;
    while (start < tokenLength) {
        int end = tokenLength;
        int matchedId = -1;

        while (end > start) {
            QString piece = token.mid(start, end - start);
            if (start > 0) {
                piece.prepend(QStringLiteral("##"));
            }

            const auto it = m_vocab.find(piece.toStdString());
            if (it != m_vocab.end()) {
                matchedId = it->second;
                break;
            }
            --end;
        }

        if (matchedId < 0) {
            pieces.assign(1, kUnkTokenId);
            break;
        }
        pieces.push_back(static_cast<int64_t>(matchedId));
        start = end;
    }

    for (const int64_t id : pieces) {
        if (static_cast<int>(output->size()) >= limit) {
            break;
        }
        output->push_back(id);
    }
}

std::vector<int64_t> WordPieceTokenizer::tokenizeContent(const QString& normalizedText) const
{
    std::vector<int64_t> content;
    if (!m_loaded || normalizedText.isEmpty()) {
        return content;
    }

    const QStringList words = normalizedText.split(QLatin1Char(' '), Qt::SkipEmptyParts);
    for (const QString& word : words) {
        if (static_cast<int>(content.size()) >= maxContentTokens()) {
            break;
        }
        appendWordPieces(word, &content);
    }
    return content;
}

TokenizerOutput WordPieceTokenizer::tokenize(const QString& text, int padToLength) const
{
    TokenizerOutput output;
    if (!m_loaded) {
        return output;
    }

    const std::vector<int64_t> content = tokenizeContent(normalize(text));

    output.inputIds.reserve(content.size() + 2);
    output.inputIds.push_back(kClsTokenId);
    output.inputIds.insert(output.inputIds.end(), content.begin(), content.end());
    output.inputIds.push_back(kSepTokenId);

    const int unpaddedLength = static_cast<int>(output.inputIds.size());
    const int clampedPadLength = std::min(padToLength, m_maxSequenceLength);
    const int targetLength = std::max(unpaddedLength, clampedPadLength);

    output.attentionMask.assign(static_cast<size_t>(targetLength), 0);
    output.tokenTypeIds.assign(static_cast<size_t>(targetLength), 0);
    std::fill_n(output.attentionMask.begin(), unpaddedLength, 1);

    if (targetLength > unpaddedLength) {
        output.inputIds.resize(static_cast<size_t>(targetLength), kPadTokenId);
    }

    output.seqLength = targetLength;
    return output;
}

BatchTokenizerOutput WordPieceTokenizer::tokenizeBatch(const std::vector<QString>& texts) const
{
    BatchTokenizerOutput batch;
    if (!m_loaded || texts.empty()) {
        return batch;
    }

    std::vector<TokenizerOutput> tokenized;
    tokenized.reserve(texts.size());

    int maxLength = 0;
    for (const QString& text : texts) {
        TokenizerOutput single = tokenize(text);
        maxLength = std::max(maxLength, single.seqLength);
        tokenized.push_back(std::move(single));
    }

    batch.batchSize = static_cast<int>(texts.size());
    batch.seqLength = maxLength;
    const size_t total = static_cast<size_t>(batch.batchSize) * static_cast<size_t>(maxLength);
    batch.inputIds.reserve(total);
    batch.attentionMask.reserve(total);
    batch.tokenTypeIds.reserve(total);

    for (TokenizerOutput& row : tokenized) {
        if (row.seqLength < maxLength) {
            row.inputIds.resize(static_cast<size_t>(maxLength), kPadTokenId);
            row.attentionMask.resize(static_cast<size_t>(maxLength), 0);
            row.tokenTypeIds.resize(static_cast<size_t>(maxLength), 0);
            row.seqLength = maxLength;
        }

        batch.inputIds.insert(batch.inputIds.end(), row.inputIds.begin(), row.inputIds.end());
        batch.attentionMask.insert(batch.attentionMask.end(), row.attentionMask.begin(), row.attentionMask.end());
        batch.tokenTypeIds.insert(batch.tokenTypeIds.end(), row.tokenTypeIds.begin(), row.tokenTypeIds.end());
    }

    return batch;
}

} // namespace mc
