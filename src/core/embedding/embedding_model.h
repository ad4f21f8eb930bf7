#pragma once

#include <QString>

#include <vector>

namespace mc {

// A loaded sentence-embedding network. Implementations may throw from run();
// EmbeddingProvider is the boundary that turns failures into "unavailable".
class EmbeddingModel {
public:
    virtual ~EmbeddingModel() = default;

    virtual int dimensions() const = 0;
    virtual bool supportsBatch() const = 0;

    // Runs inference over all texts and returns one flat buffer of
    // texts.size() * dimensions() values, row-major.
    virtual std::vector<float> run(const std::vector<QString>& texts) = 0;
};

} // namespace mc
