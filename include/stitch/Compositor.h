#ifndef COMPOSITOR_H
#define COMPOSITOR_H

#include "stitch/ContributionMap.h"
#include "stitch/StitchTypes.h"

#include <QImage>
#include <QVector>

struct CompositeResult {
    QImage canvas;          // Format_ARGB32, width of frame 0, map.height() rows
    QVector<int> gapRows;   // Rows with a pixel that had no usable sample and was left transparent
};

/**
 * @brief Resolves every output pixel from the contribution map.
 *
 * Among the samples covering a pixel, the one whose source row is closest to
 * the vertical center of its frame wins. With a circular mask, samples outside
 * the display's inscribed circle are only used near the top and bottom of the
 * output; elsewhere the pixel two rows above is repeated instead.
 *
 * Rows are resolved strictly top to bottom because of that repeat.
 */
class Compositor
{
public:
    /**
     * @brief Whether (x, row) of a frame is physically visible.
     *
     * Always true without a mask. With the mask, the point must lie strictly
     * inside the circle of radius H/2 - 2 centered at ((H-1)/2, (H-1)/2).
     */
    static bool isOnScreen(int x, int row, int frameHeight, bool useCircularMask);

    // Frames must share one width; frame 0's height defines the display geometry.
    static CompositeResult compose(const ContributionMap &map,
                                   const QVector<QImage> &frames,
                                   const StitchOptions &options);
};

#endif // COMPOSITOR_H
