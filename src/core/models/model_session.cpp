#include "core/models/model_session.h"

#include "core/shared/logging.h"

#include <QFile>

#include <onnxruntime_cxx_api.h>

#include <algorithm>

namespace mc {

namespace {

Ort::Env& ortEnvironment()
{
    static Ort::Env env(ORT_LOGGING_LEVEL_WARNING, "memctl-models");
    return env;
}

} // anonymous namespace

class ModelSession::Impl {
public:
    Ort::SessionOptions sessionOptions;
    std::unique_ptr<Ort::Session> session;
};

ModelSession::ModelSession(const ModelManifestEntry& manifest)
    : m_impl(std::make_unique<Impl>())
    , m_manifest(manifest)
{
}

ModelSession::~ModelSession() = default;

bool ModelSession::initialize(const QString& modelPath)
{
    m_available = false;
    if (modelPath.isEmpty() || !QFile::exists(modelPath)) {
        LOG_WARN(mcEmbedding, "ModelSession: model file missing at %s", qPrintable(modelPath));
        return false;
    }

    try {
        m_impl->sessionOptions.SetIntraOpNumThreads(std::max(1, m_manifest.intraOpThreads));
        m_impl->sessionOptions.SetInterOpNumThreads(1);
        m_impl->sessionOptions.SetExecutionMode(ExecutionMode::ORT_SEQUENTIAL);
        m_impl->sessionOptions.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

        m_impl->session = std::make_unique<Ort::Session>(
            ortEnvironment(), modelPath.toUtf8().constData(), m_impl->sessionOptions);

        Ort::AllocatorWithDefaultOptions allocator;
        const size_t inputCount = m_impl->session->GetInputCount();

        m_inputNames.clear();
        m_inputNames.reserve(inputCount);
        for (size_t i = 0; i < inputCount; ++i) {
            Ort::AllocatedStringPtr inputName = m_impl->session->GetInputNameAllocated(i, allocator);
            if (inputName.get() != nullptr) {
                m_inputNames.emplace_back(inputName.get());
            }
        }

        // Validate that all expected inputs exist in the model
        for (const QString& expectedInput : m_manifest.inputs) {
            const std::string expected = expectedInput.toStdString();
            if (std::find(m_inputNames.begin(), m_inputNames.end(), expected) == m_inputNames.end()) {
                LOG_WARN(mcEmbedding, "ModelSession: required input '%s' not found in model",
                         qPrintable(expectedInput));
                m_impl->session.reset();
                return false;
            }
        }

        const size_t outputCount = m_impl->session->GetOutputCount();
        m_outputNames.clear();
        m_outputNames.reserve(outputCount);
        for (size_t i = 0; i < outputCount; ++i) {
            Ort::AllocatedStringPtr outputName = m_impl->session->GetOutputNameAllocated(i, allocator);
            if (outputName.get() != nullptr && outputName.get()[0] != '\0') {
                m_outputNames.emplace_back(outputName.get());
            }
        }

        if (m_outputNames.empty()) {
            LOG_WARN(mcEmbedding, "ModelSession: no output names found in model");
            m_impl->session.reset();
            return false;
        }

        LOG_INFO(mcEmbedding, "ModelSession: initialized '%s', %zu inputs, %zu outputs",
                 qPrintable(m_manifest.name), m_inputNames.size(), m_outputNames.size());

        m_available = true;
        return true;
    } catch (const Ort::Exception& ex) {
        LOG_WARN(mcEmbedding, "ModelSession: ONNX initialization failed: %s", ex.what());
    }

    m_impl->session.reset();
    return false;
}

bool ModelSession::isAvailable() const
{
    return m_available;
}

const ModelManifestEntry& ModelSession::manifest() const
{
    return m_manifest;
}

const std::vector<std::string>& ModelSession::inputNames() const
{
    return m_inputNames;
}

const std::vector<std::string>& ModelSession::outputNames() const
{
    return m_outputNames;
}

void* ModelSession::rawSession() const
{
    return m_impl->session.get();
}

} // namespace mc
