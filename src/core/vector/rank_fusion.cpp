#include "core/vector/rank_fusion.h"

#include <QHash>
#include <QSet>

#include <algorithm>

namespace mc {

std::vector<FusedEntry> RankFusion::fuseScored(const std::vector<QStringList>& lists,
                                               int limit,
                                               int k)
{
    std::vector<FusedEntry> fused;
    if (limit <= 0) {
        return fused;
    }

    const int rrfK = std::max(0, k);
    QHash<QString, size_t> slotById;

    for (const QStringList& list : lists) {
        QSet<QString> seenInList;
        for (int i = 0; i < list.size(); ++i) {
            const QString& id = list.at(i);
            if (seenInList.contains(id)) {
                continue;
            }
            seenInList.insert(id);

            const double contribution = 1.0 / static_cast<double>(rrfK + i + 1);
            const auto it = slotById.constFind(id);
            if (it == slotById.constEnd()) {
                slotById.insert(id, fused.size());
                fused.push_back({id, contribution});
            } else {
                fused[it.value()].score += contribution;
            }
        }
    }

    std::stable_sort(fused.begin(), fused.end(), [](const FusedEntry& a, const FusedEntry& b) {
        return a.score > b.score;
    });

    if (static_cast<int>(fused.size()) > limit) {
        fused.resize(static_cast<size_t>(limit));
    }
    return fused;
}

QStringList RankFusion::fuse(const std::vector<QStringList>& lists, int limit, int k)
{
    QStringList ids;
    for (const FusedEntry& entry : fuseScored(lists, limit, k)) {
        ids.append(entry.id);
    }
    return ids;
}

} // namespace mc
