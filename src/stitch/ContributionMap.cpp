#include "stitch/ContributionMap.h"

#include "stitch/OffsetMatcher.h"

#include <QDebug>

void ContributionMap::clear()
{
    m_rows.clear();
    m_sampleCount = 0;
}

bool ContributionMap::addFrame(int frameIndex, int frameHeight, int absoluteOffset)
{
    if (frameHeight <= 0 || absoluteOffset < 0) {
        return false;
    }

    const int requiredRows = absoluteOffset + frameHeight;
    if (requiredRows > m_rows.size()) {
        m_rows.resize(requiredRows);
    }

    for (int y = 0; y < frameHeight; ++y) {
        m_rows[y + absoluteOffset].append(RowSample{frameIndex, y});
    }
    m_sampleCount += frameHeight;
    return true;
}

const QVector<RowSample> &ContributionMap::samplesAt(int y) const
{
    static const QVector<RowSample> kNoSamples;
    if (y < 0 || y >= m_rows.size()) {
        return kNoSamples;
    }
    return m_rows.at(y);
}

int ContributionMap::firstGapRow() const
{
    for (int y = 0; y < m_rows.size(); ++y) {
        if (m_rows.at(y).isEmpty()) {
            return y;
        }
    }
    return -1;
}

AggregationResult ContributionAggregator::aggregate(const QVector<QVector<quint64>> &rowHashes)
{
    AggregationResult result;
    if (rowHashes.isEmpty()) {
        return result;
    }

    if (!result.map.addFrame(0, rowHashes.first().size(), 0)) {
        qWarning() << "ContributionAggregator: frame 0 has no rows";
    }
    result.alignments.append(FrameAlignment());

    int absoluteOffset = 0;
    for (int i = 1; i < rowHashes.size(); ++i) {
        const OffsetMatch match = OffsetMatcher::findBestOffset(rowHashes.at(i - 1), rowHashes.at(i));
        qDebug() << "ContributionAggregator: Match for frame" << i
                 << "- (" << match.score << "," << match.offset << ")";

        absoluteOffset += match.offset;

        FrameAlignment alignment;
        alignment.frameIndex = i;
        alignment.offset = match.offset;
        alignment.absoluteOffset = absoluteOffset;
        alignment.score = match.score;
        result.alignments.append(alignment);

        if (!result.map.addFrame(i, rowHashes.at(i).size(), absoluteOffset)) {
            qWarning() << "ContributionAggregator: frame" << i << "has no rows";
        }
    }

    return result;
}
