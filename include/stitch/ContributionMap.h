#ifndef CONTRIBUTIONMAP_H
#define CONTRIBUTIONMAP_H

#include "stitch/StitchTypes.h"

#include <QVector>
#include <QtGlobal>

// One source row that lands on a given output row.
struct RowSample {
    int frameIndex = 0;
    int row = 0;
};

/**
 * @brief Output row -> ordered list of (frame, source row) samples.
 *
 * Rows are stored densely from 0 to height() - 1. Samples within a row keep
 * insertion order, which is frame index ascending because frames are added
 * in sequence.
 */
class ContributionMap
{
public:
    void clear();

    /**
     * @brief Place rows [0, frameHeight) of a frame at output rows
     *        [absoluteOffset, absoluteOffset + frameHeight).
     * @return false for a negative offset or a non-positive height.
     */
    bool addFrame(int frameIndex, int frameHeight, int absoluteOffset);

    // Empty for rows outside [0, height()).
    const QVector<RowSample> &samplesAt(int y) const;

    // max(output row) + 1
    int height() const { return m_rows.size(); }
    int sampleCount() const { return m_sampleCount; }

    // First output row without any sample, or -1.
    int firstGapRow() const;
    bool hasGaps() const { return firstGapRow() >= 0; }

private:
    QVector<QVector<RowSample>> m_rows;
    int m_sampleCount = 0;
};

struct AggregationResult {
    ContributionMap map;
    QVector<FrameAlignment> alignments;
};

/**
 * @brief Chains pairwise offsets into absolute frame positions.
 *
 * Frame i is matched against frame i - 1 only, so each absolute offset is
 * the running sum of the pairwise offsets before it.
 */
class ContributionAggregator
{
public:
    static AggregationResult aggregate(const QVector<QVector<quint64>> &rowHashes);
};

#endif // CONTRIBUTIONMAP_H
