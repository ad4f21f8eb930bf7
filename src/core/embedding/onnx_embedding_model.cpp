#include "core/embedding/onnx_embedding_model.h"
#include "core/embedding/tokenizer.h"
#include "core/models/model_manifest.h"
#include "core/models/model_session.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>

#include <onnxruntime_cxx_api.h>

#include <cmath>
#include <stdexcept>
#include <string>

namespace mc {

OnnxEmbeddingModel::OnnxEmbeddingModel(std::unique_ptr<ModelSession> session,
                                       std::unique_ptr<WordPieceTokenizer> tokenizer)
    : m_session(std::move(session))
    , m_tokenizer(std::move(tokenizer))
{
    m_dimensions = m_session->manifest().dimensions;
    m_clsPooling = m_session->manifest().poolingStrategy == QLatin1String("cls");
}

OnnxEmbeddingModel::~OnnxEmbeddingModel() = default;

std::unique_ptr<OnnxEmbeddingModel> OnnxEmbeddingModel::load(const QString& modelsDir,
                                                             const QString& role)
{
    const QDir dir(modelsDir);
    const std::optional<ModelManifest> manifest =
        ModelManifest::loadFromFile(dir.filePath(QStringLiteral("manifest.json")));
    if (!manifest) {
        return nullptr;
    }

    const ModelManifestEntry* entry = manifest->find(role);
    if (!entry) {
        LOG_WARN(mcEmbedding, "OnnxEmbeddingModel: no '%s' model in %s",
                 qPrintable(role), qPrintable(modelsDir));
        return nullptr;
    }
    if (entry->dimensions <= 0) {
        LOG_WARN(mcEmbedding, "OnnxEmbeddingModel: invalid dimensions %d for '%s'",
                 entry->dimensions, qPrintable(entry->name));
        return nullptr;
    }

    auto tokenizer = std::make_unique<WordPieceTokenizer>(dir.filePath(entry->vocab),
                                                          entry->maxSeqLength);
    if (!tokenizer->isLoaded()) {
        return nullptr;
    }

    auto session = std::make_unique<ModelSession>(*entry);
    if (!session->initialize(dir.filePath(entry->file))) {
        return nullptr;
    }

    return std::unique_ptr<OnnxEmbeddingModel>(
        new OnnxEmbeddingModel(std::move(session), std::move(tokenizer)));
}

void OnnxEmbeddingModel::normalize(std::vector<float>& embedding)
{
    double sumSquares = 0.0;
    for (const float value : embedding) {
        sumSquares += static_cast<double>(value) * static_cast<double>(value);
    }

    const double norm = std::sqrt(sumSquares);
    if (norm <= 0.0) {
        return;
    }

    for (float& value : embedding) {
        value = static_cast<float>(static_cast<double>(value) / norm);
    }
}

std::vector<float> OnnxEmbeddingModel::run(const std::vector<QString>& texts)
{
    if (texts.empty()) {
        return {};
    }

    auto* session = static_cast<Ort::Session*>(m_session->rawSession());
    if (!session) {
        throw std::runtime_error("ONNX session is not initialized");
    }

    const BatchTokenizerOutput tokenized = m_tokenizer->tokenizeBatch(texts);
    if (tokenized.batchSize <= 0 || tokenized.seqLength <= 0) {
        throw std::runtime_error("tokenizer produced an empty batch");
    }

    const int64_t inputShape[2] = {
        static_cast<int64_t>(tokenized.batchSize),
        static_cast<int64_t>(tokenized.seqLength),
    };

    Ort::MemoryInfo memoryInfo = Ort::MemoryInfo::CreateCpu(OrtAllocatorType::OrtArenaAllocator,
                                                             OrtMemTypeDefault);

    // Feed only the inputs the graph declares; some exports omit token_type_ids.
    std::vector<const char*> inputNames;
    std::vector<Ort::Value> inputTensors;
    for (const std::string& name : m_session->inputNames()) {
        const std::vector<int64_t>* source = nullptr;
        if (name == "input_ids") {
            source = &tokenized.inputIds;
        } else if (name == "attention_mask") {
            source = &tokenized.attentionMask;
        } else if (name == "token_type_ids") {
            source = &tokenized.tokenTypeIds;
        } else {
            throw std::runtime_error("unsupported model input: " + name);
        }
        inputNames.push_back(name.c_str());
        inputTensors.push_back(Ort::Value::CreateTensor<int64_t>(
            memoryInfo,
            const_cast<int64_t*>(source->data()),
            source->size(),
            inputShape,
            2));
    }

    const char* outputNames[1] = {m_session->outputNames().front().c_str()};

    std::vector<Ort::Value> outputs = session->Run(
        Ort::RunOptions{nullptr},
        inputNames.data(),
        inputTensors.data(),
        inputTensors.size(),
        outputNames,
        1);

    if (outputs.empty() || !outputs[0].IsTensor()) {
        throw std::runtime_error("missing tensor output");
    }

    const std::vector<int64_t> shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
    const float* data = outputs[0].GetTensorData<float>();
    if (!data) {
        throw std::runtime_error("null output tensor data");
    }

    const size_t dims = static_cast<size_t>(m_dimensions);
    const size_t batch = static_cast<size_t>(tokenized.batchSize);
    std::vector<float> flat;
    flat.reserve(batch * dims);

    if (shape.size() == 2 && shape[0] == tokenized.batchSize && shape[1] == m_dimensions) {
        // Already pooled by the graph.
        for (size_t i = 0; i < batch; ++i) {
            std::vector<float> embedding(data + i * dims, data + (i + 1) * dims);
            normalize(embedding);
            flat.insert(flat.end(), embedding.begin(), embedding.end());
        }
        return flat;
    }

    if (shape.size() == 3 && shape[0] == tokenized.batchSize
        && shape[1] == tokenized.seqLength && shape[2] == m_dimensions) {
        const size_t seqLen = static_cast<size_t>(shape[1]);
        for (size_t i = 0; i < batch; ++i) {
            const float* tokens = data + i * seqLen * dims;
            std::vector<float> embedding(dims, 0.0f);

            if (m_clsPooling) {
                embedding.assign(tokens, tokens + dims);
            } else {
                double maskTotal = 0.0;
                for (size_t t = 0; t < seqLen; ++t) {
                    if (tokenized.attentionMask[i * seqLen + t] == 0) {
                        continue;
                    }
                    maskTotal += 1.0;
                    const float* row = tokens + t * dims;
                    for (size_t j = 0; j < dims; ++j) {
                        embedding[j] += row[j];
                    }
                }
                if (maskTotal > 0.0) {
                    for (float& value : embedding) {
                        value = static_cast<float>(value / maskTotal);
                    }
                }
            }

            normalize(embedding);
            flat.insert(flat.end(), embedding.begin(), embedding.end());
        }
        return flat;
    }

    throw std::runtime_error("unsupported embedding output shape");
}

} // namespace mc
