#include "stitch/OffsetMatcher.h"

#include <algorithm>

int OffsetMatcher::scoreAt(const QVector<quint64> &previous,
                           const QVector<quint64> &current,
                           int offset)
{
    if (offset < 0 || offset >= previous.size()) {
        return 0;
    }

    const int limit = std::min(static_cast<int>(previous.size()) - offset,
                               static_cast<int>(current.size()));
    const quint64 *prev = previous.constData();
    const quint64 *curr = current.constData();

    int score = 0;
    for (int z = 0; z < limit; ++z) {
        if (curr[z] == prev[z + offset]) {
            ++score;
        }
    }
    return score;
}

OffsetMatch OffsetMatcher::findBestOffset(const QVector<quint64> &previous,
                                          const QVector<quint64> &current)
{
    OffsetMatch best;
    const int height = previous.size();
    if (height == 0 || current.isEmpty()) {
        return best;
    }

    // '>=' lets a later (larger) offset replace an equal score.
    best.valid = true;
    for (int offset = 0; offset < height; ++offset) {
        const int score = scoreAt(previous, current, offset);
        if (score >= best.score) {
            best.score = score;
            best.offset = offset;
        }
    }

    return best;
}
