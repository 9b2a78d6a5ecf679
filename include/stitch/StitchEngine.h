#ifndef STITCHENGINE_H
#define STITCHENGINE_H

#include "stitch/StitchTypes.h"

#include <QImage>
#include <QString>
#include <QVector>

/**
 * @brief Aligns an ordered list of vertically scrolled captures and
 *        composites them into one image.
 *
 * The pipeline is hash rows -> match each frame against its predecessor ->
 * accumulate absolute offsets -> composite. It has no I/O and no global
 * state; the same frames and options always produce the same result.
 */
class StitchEngine
{
public:
    explicit StitchEngine(const StitchOptions &options = StitchOptions());

    void setOptions(const StitchOptions &options) { m_options = options; }
    const StitchOptions &options() const { return m_options; }

    StitchResult stitch(const QVector<QImage> &frames) const;

    /**
     * @brief Checks the frame list before any hashing.
     * @return Empty string when the frames can be stitched, otherwise the reason.
     */
    static QString validateFrames(const QVector<QImage> &frames);

private:
    StitchOptions m_options;
};

#endif // STITCHENGINE_H
