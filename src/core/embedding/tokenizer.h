#pragma once

#include <QString>
#include <QStringList>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace mc {

struct TokenizerOutput {
    std::vector<int64_t> inputIds;
    std::vector<int64_t> attentionMask;
    std::vector<int64_t> tokenTypeIds;
    int seqLength = 0;
};

struct BatchTokenizerOutput {
    std::vector<int64_t> inputIds;      // flattened [batch * seqLength]
    std::vector<int64_t> attentionMask;
    std::vector<int64_t> tokenTypeIds;
    int batchSize = 0;
    int seqLength = 0;
};

// BERT-style uncased WordPiece tokenizer. Output is [CLS] pieces [SEP],
// truncated to maxSequenceLength.
class WordPieceTokenizer {
public:
    static constexpr int kDefaultMaxSequenceLength = 256;

    explicit WordPieceTokenizer(const QString& vocabPath,
                                int maxSequenceLength = kDefaultMaxSequenceLength);
    // One token per line index, as in vocab.txt.
    explicit WordPieceTokenizer(const QStringList& vocabTokens,
                                int maxSequenceLength = kDefaultMaxSequenceLength);

    bool isLoaded() const;
    int maxSequenceLength() const { return m_maxSequenceLength; }

    TokenizerOutput tokenize(const QString& text, int padToLength = 0) const;
    BatchTokenizerOutput tokenizeBatch(const std::vector<QString>& texts) const;

    static constexpr int kPadTokenId = 0;
    static constexpr int kUnkTokenId = 100;
    static constexpr int kClsTokenId = 101;
    static constexpr int kSepTokenId = 102;

private:
    void loadTokens(const QStringList& tokens);
    int maxContentTokens() const { return m_maxSequenceLength - 2; }

    QString normalize(const QString& text) const;
    std::vector<int64_t> tokenizeContent(const QString& normalizedText) const;
    void appendWordPieces(const QString& token, std::vector<int64_t>* output) const;

    std::unordered_map<std::string, int> m_vocab;
    int m_maxSequenceLength = kDefaultMaxSequenceLength;
    bool m_loaded = false;
};

} // namespace mc
