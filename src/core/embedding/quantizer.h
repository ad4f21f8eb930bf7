#pragma once

#include <QByteArray>

#include <cstdint>
#include <optional>
#include <vector>

namespace mc {

// Int8 linear quantization of an embedding: every element is mapped into
// [min, max] with 256 steps.
struct QuantizedVector {
    std::vector<int8_t> values;
    float min = 0.0F;
    float max = 0.0F;
};

class Quantizer {
public:
    static QuantizedVector quantize(const std::vector<float>& embedding);
    static std::vector<float> dequantize(const QuantizedVector& qv);

    // Serialized shape is JSON: {"values":[...],"min":m,"max":M}.
    // Returns an empty array for empty or non-finite input.
    static QByteArray serialize(const std::vector<float>& embedding);

    // Accepts the quantized object above or a legacy plain JSON array of
    // floats. The two are told apart by shape only. Returns nullopt for
    // anything else (unparsable text, non-finite bounds, out-of-range values).
    static std::optional<std::vector<float>> deserialize(const QByteArray& stored);

    static QByteArray toJson(const QuantizedVector& qv);
};

} // namespace mc
