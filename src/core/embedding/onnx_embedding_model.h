#pragma once

#include "core/embedding/embedding_model.h"

#include <QString>

#include <memory>
#include <vector>

namespace mc {

class ModelSession;
class WordPieceTokenizer;

// Sentence-embedding model backed by an ONNX Runtime session and a
// WordPiece tokenizer. Token outputs are mean-pooled over the attention mask
// (or the [CLS] row, per the manifest) and L2-normalized.
class OnnxEmbeddingModel : public EmbeddingModel {
public:
    ~OnnxEmbeddingModel() override;

    // Reads <modelsDir>/manifest.json and builds the model registered under
    // `role`. Returns nullptr when any piece is missing or fails to load.
    static std::unique_ptr<OnnxEmbeddingModel> load(const QString& modelsDir,
                                                    const QString& role);

    int dimensions() const override { return m_dimensions; }
    bool supportsBatch() const override { return true; }

    // Throws std::runtime_error (or Ort::Exception) on inference failure.
    std::vector<float> run(const std::vector<QString>& texts) override;

    static void normalize(std::vector<float>& embedding);

private:
    OnnxEmbeddingModel(std::unique_ptr<ModelSession> session,
                       std::unique_ptr<WordPieceTokenizer> tokenizer);

    std::unique_ptr<ModelSession> m_session;
    std::unique_ptr<WordPieceTokenizer> m_tokenizer;
    int m_dimensions = 0;
    bool m_clsPooling = false;
};

} // namespace mc
