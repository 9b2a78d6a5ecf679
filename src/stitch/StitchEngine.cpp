#include "stitch/StitchEngine.h"

#include "stitch/Compositor.h"
#include "stitch/ContributionMap.h"
#include "stitch/RowHasher.h"

#include <QDebug>

StitchEngine::StitchEngine(const StitchOptions &options)
    : m_options(options)
{
}

QString StitchEngine::validateFrames(const QVector<QImage> &frames)
{
    if (frames.isEmpty()) {
        return QStringLiteral("No frames to stitch");
    }

    for (int i = 0; i < frames.size(); ++i) {
        if (frames.at(i).isNull()) {
            return QStringLiteral("Frame %1 is empty").arg(i);
        }
    }

    const int width = frames.first().width();
    for (int i = 1; i < frames.size(); ++i) {
        if (frames.at(i).width() != width) {
            return QStringLiteral("Frame %1 width %2 differs from frame 0 width %3")
                .arg(i)
                .arg(frames.at(i).width())
                .arg(width);
        }
    }

    return QString();
}

StitchResult StitchEngine::stitch(const QVector<QImage> &frames) const
{
    StitchResult result;

    const QString validationError = validateFrames(frames);
    if (!validationError.isEmpty()) {
        qWarning() << "StitchEngine:" << validationError;
        result.error = StitchError::InputError;
        result.errorMessage = validationError;
        return result;
    }

    QVector<QImage> argbFrames;
    argbFrames.reserve(frames.size());
    for (const QImage &frame : frames) {
        argbFrames.append(frame.convertToFormat(QImage::Format_ARGB32));
    }

    const int width = argbFrames.first().width();
    if (RowHasher::hasDegenerateBand(width)) {
        StitchWarning warning;
        warning.kind = StitchWarningKind::DegenerateHash;
        warning.message = QStringLiteral("Frame width %1 leaves no columns to hash; "
                                         "every row hashes identically").arg(width);
        qWarning() << "StitchEngine:" << warning.message;
        result.warnings.append(warning);
    }

    QVector<QVector<quint64>> rowHashes;
    rowHashes.reserve(argbFrames.size());
    for (const QImage &frame : argbFrames) {
        rowHashes.append(RowHasher::computeRowHashes(frame));
    }

    const AggregationResult aggregation = ContributionAggregator::aggregate(rowHashes);
    result.alignments = aggregation.alignments;

    qInfo() << "StitchEngine: Producing an image with height" << aggregation.map.height();

    const CompositeResult composite = Compositor::compose(aggregation.map, argbFrames, m_options);
    if (composite.canvas.isNull()) {
        result.error = StitchError::AllocationError;
        result.errorMessage = QStringLiteral("Failed to allocate a %1x%2 canvas")
            .arg(width)
            .arg(aggregation.map.height());
        qWarning() << "StitchEngine:" << result.errorMessage;
        return result;
    }

    for (int row : composite.gapRows) {
        StitchWarning warning;
        warning.kind = StitchWarningKind::CompositingGap;
        warning.row = row;
        warning.message = QStringLiteral("Output row %1 has pixels with no usable sample; left transparent").arg(row);
        qWarning() << "StitchEngine:" << warning.message;
        result.warnings.append(warning);
    }

    result.canvas = composite.canvas;
    result.success = true;
    return result;
}
