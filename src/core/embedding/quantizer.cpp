#include "core/embedding/quantizer.h"
#include "core/shared/logging.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

#include <algorithm>
#include <cmath>
#include <limits>

namespace mc {

namespace {

constexpr double kLevels = 255.0;
constexpr int kOffset = 128;

double effectiveRange(double minValue, double maxValue)
{
    const double range = maxValue - minValue;
    return range == 0.0 ? 1.0 : range;
}

bool allFinite(const std::vector<float>& values)
{
    return std::all_of(values.begin(), values.end(),
                       [](float value) { return std::isfinite(value); });
}

std::optional<std::vector<float>> decodeQuantized(const QJsonObject& object)
{
    const QJsonValue minValue = object.value(QStringLiteral("min"));
    const QJsonValue maxValue = object.value(QStringLiteral("max"));
    if (!maxValue.isDouble()) {
        return std::nullopt;
    }

    const double minBound = minValue.toDouble();
    const double maxBound = maxValue.toDouble();
    if (!std::isfinite(minBound) || !std::isfinite(maxBound)
        || std::fabs(minBound) > std::numeric_limits<float>::max()
        || std::fabs(maxBound) > std::numeric_limits<float>::max()) {
        return std::nullopt;
    }

    const QJsonArray values = object.value(QStringLiteral("values")).toArray();
    QuantizedVector qv;
    qv.min = static_cast<float>(minBound);
    qv.max = static_cast<float>(maxBound);
    qv.values.reserve(static_cast<size_t>(values.size()));
    for (const QJsonValue& value : values) {
        if (!value.isDouble()) {
            return std::nullopt;
        }
        const double raw = value.toDouble();
        if (raw < -128.0 || raw > 127.0 || std::floor(raw) != raw) {
            return std::nullopt;
        }
        qv.values.push_back(static_cast<int8_t>(raw));
    }
    return Quantizer::dequantize(qv);
}

std::optional<std::vector<float>> decodeLegacy(const QJsonArray& array)
{
    std::vector<float> output;
    output.reserve(static_cast<size_t>(array.size()));
    for (const QJsonValue& value : array) {
        if (!value.isDouble()) {
            return std::nullopt;
        }
        output.push_back(static_cast<float>(value.toDouble()));
    }
    return output;
}

} // namespace

QuantizedVector Quantizer::quantize(const std::vector<float>& embedding)
{
    QuantizedVector qv;
    if (embedding.empty()) {
        return qv;
    }

    float minValue = std::numeric_limits<float>::infinity();
    float maxValue = -std::numeric_limits<float>::infinity();
    for (const float value : embedding) {
        minValue = std::min(minValue, value);
        maxValue = std::max(maxValue, value);
    }

    const double range = effectiveRange(minValue, maxValue);
    qv.min = minValue;
    qv.max = maxValue;
    qv.values.resize(embedding.size());
    for (size_t i = 0; i < embedding.size(); ++i) {
        const double normalized = (static_cast<double>(embedding[i]) - minValue) / range;
        const long level = std::lround(normalized * kLevels) - kOffset;
        qv.values[i] = static_cast<int8_t>(std::clamp<long>(level, -128, 127));
    }
    return qv;
}

std::vector<float> Quantizer::dequantize(const QuantizedVector& qv)
{
    std::vector<float> output(qv.values.size());
    const double range = effectiveRange(qv.min, qv.max);
    for (size_t i = 0; i < qv.values.size(); ++i) {
        const double level = static_cast<double>(static_cast<int>(qv.values[i]) + kOffset);
        output[i] = static_cast<float>((level / kLevels) * range + qv.min);
    }
    return output;
}

QByteArray Quantizer::toJson(const QuantizedVector& qv)
{
    QJsonArray values;
    for (const int8_t value : qv.values) {
        values.append(static_cast<int>(value));
    }

    QJsonObject object;
    object.insert(QStringLiteral("values"), values);
    object.insert(QStringLiteral("min"), static_cast<double>(qv.min));
    object.insert(QStringLiteral("max"), static_cast<double>(qv.max));
    return QJsonDocument(object).toJson(QJsonDocument::Compact);
}

QByteArray Quantizer::serialize(const std::vector<float>& embedding)
{
    if (embedding.empty() || !allFinite(embedding)) {
        LOG_WARN(mcEmbedding, "Quantizer::serialize rejected %s embedding (%zu values)",
                 embedding.empty() ? "empty" : "non-finite", embedding.size());
        return {};
    }
    return toJson(quantize(embedding));
}

std::optional<std::vector<float>> Quantizer::deserialize(const QByteArray& stored)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(stored, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return std::nullopt;
    }

    if (doc.isObject()) {
        const QJsonObject object = doc.object();
        if (object.value(QStringLiteral("values")).isArray()
            && object.value(QStringLiteral("min")).isDouble()) {
            return decodeQuantized(object);
        }
        return std::nullopt;
    }

    if (doc.isArray()) {
        return decodeLegacy(doc.array());
    }
    return std::nullopt;
}

} // namespace mc
