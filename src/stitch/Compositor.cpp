#include "stitch/Compositor.h"

#include <QDebug>

#include <cmath>

namespace {

constexpr int kRepeatRowDistance = 2;
constexpr int kMaskInset = 2;

const QRgb kTransparentPixel = qRgba(0, 0, 0, 0);

} // namespace

bool Compositor::isOnScreen(int x, int row, int frameHeight, bool useCircularMask)
{
    if (!useCircularMask) {
        return true;
    }

    const double middle = (frameHeight - 1) / 2.0;
    const double radius = frameHeight / 2.0 - kMaskInset;
    const double dx = x - middle;
    const double dy = row - middle;
    return dx * dx + dy * dy < radius * radius;
}

CompositeResult Compositor::compose(const ContributionMap &map,
                                    const QVector<QImage> &frames,
                                    const StitchOptions &options)
{
    CompositeResult result;
    if (frames.isEmpty() || frames.first().isNull() || map.height() <= 0) {
        return result;
    }

    QVector<QImage> argbFrames;
    argbFrames.reserve(frames.size());
    for (const QImage &frame : frames) {
        argbFrames.append(frame.convertToFormat(QImage::Format_ARGB32));
    }

    const int width = argbFrames.first().width();
    const int frameHeight = argbFrames.first().height();
    const int outputHeight = map.height();
    const double middle = (frameHeight - 1) / 2.0;
    const double halfHeight = frameHeight / 2.0;

    QImage canvas(width, outputHeight, QImage::Format_ARGB32);
    if (canvas.isNull()) {
        qWarning() << "Compositor: failed to allocate canvas" << width << "x" << outputHeight;
        return result;
    }
    canvas.fill(Qt::transparent);

    QVector<const QRgb *> lines;
    for (int y = 0; y < outputHeight; ++y) {
        const QVector<RowSample> &samples = map.samplesAt(y);

        lines.clear();
        for (const RowSample &sample : samples) {
            const QRgb *line = nullptr;
            if (sample.frameIndex >= 0 && sample.frameIndex < argbFrames.size()) {
                const QImage &source = argbFrames.at(sample.frameIndex);
                if (sample.row >= 0 && sample.row < source.height() && source.width() == width) {
                    line = reinterpret_cast<const QRgb *>(source.constScanLine(sample.row));
                }
            }
            lines.append(line);
        }

        // Interior rows repeat the already-finalized row two above when no
        // sample is visible; rows near the top and bottom edge cannot.
        const bool interior = y >= halfHeight && y < outputHeight - halfHeight;
        const QRgb *repeatLine = y >= kRepeatRowDistance
            ? reinterpret_cast<const QRgb *>(canvas.constScanLine(y - kRepeatRowDistance))
            : nullptr;
        QRgb *out = reinterpret_cast<QRgb *>(canvas.scanLine(y));
        bool rowHasGap = false;

        for (int x = 0; x < width; ++x) {
            int bestOnScreen = -1;
            double bestOnScreenDistance = 0.0;
            int bestOffScreen = -1;
            double bestOffScreenDistance = 0.0;

            for (int i = 0; i < samples.size(); ++i) {
                if (!lines.at(i)) {
                    continue;
                }

                const int row = samples.at(i).row;
                const double distance = std::fabs(row - middle);
                if (isOnScreen(x, row, frameHeight, options.useCircularMask)) {
                    if (bestOnScreen < 0 || distance < bestOnScreenDistance) {
                        bestOnScreen = i;
                        bestOnScreenDistance = distance;
                    }
                } else if (bestOffScreen < 0 || distance < bestOffScreenDistance) {
                    bestOffScreen = i;
                    bestOffScreenDistance = distance;
                }
            }

            if (bestOnScreen >= 0) {
                out[x] = lines.at(bestOnScreen)[x];
            } else if (interior) {
                if (repeatLine) {
                    out[x] = repeatLine[x];
                } else {
                    // Only frames of height 2 or less have interior rows this high.
                    out[x] = kTransparentPixel;
                    rowHasGap = true;
                }
            } else if (options.useTransparency) {
                out[x] = kTransparentPixel;
            } else if (bestOffScreen >= 0) {
                out[x] = lines.at(bestOffScreen)[x];
            } else {
                out[x] = kTransparentPixel;
                rowHasGap = true;
            }
        }

        if (rowHasGap) {
            result.gapRows.append(y);
        }
    }

    result.canvas = canvas;
    return result;
}
