#pragma once

#include <QString>
#include <QStringList>

#include <vector>

namespace mc {

struct FusedEntry {
    QString id;
    double score = 0.0;
};

// Reciprocal-rank fusion. An id at 0-based position i of a list contributes
// 1 / (k + i + 1); contributions are summed across lists.
class RankFusion {
public:
    static constexpr int kDefaultK = 60;

    // Ties keep the order in which ids were first seen (list order, then
    // position). Repeats inside one list count once.
    static std::vector<FusedEntry> fuseScored(const std::vector<QStringList>& lists,
                                              int limit,
                                              int k = kDefaultK);

    static QStringList fuse(const std::vector<QStringList>& lists,
                            int limit,
                            int k = kDefaultK);
};

} // namespace mc
