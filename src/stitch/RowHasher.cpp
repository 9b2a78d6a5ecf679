#include "stitch/RowHasher.h"

#include <QDebug>

#include <opencv2/core.hpp>

namespace {

constexpr double kBandStartRatio = 0.3;
constexpr double kBandEndRatio = 0.7;

} // namespace

RowHasher::Band RowHasher::sampleBand(int width)
{
    Band band;
    if (width <= 0) {
        return band;
    }

    // Truncation matches int(width * ratio) on the double product.
    band.begin = static_cast<int>(width * kBandStartRatio);
    band.end = static_cast<int>(width * kBandEndRatio);
    return band;
}

bool RowHasher::hasDegenerateBand(int width)
{
    return sampleBand(width).isEmpty();
}

quint64 RowHasher::packRgb(QRgb pixel)
{
    return static_cast<quint64>(qRed(pixel)) * 0x10000
        + static_cast<quint64>(qGreen(pixel)) * 0x100
        + static_cast<quint64>(qBlue(pixel));
}

quint64 RowHasher::hashRow(const QRgb *line, const Band &band)
{
    quint64 hash = kSeed;
    if (!line) {
        return hash;
    }

    for (int x = band.begin; x < band.end; ++x) {
        hash = hash * kMultiplier + packRgb(line[x]);
    }
    return hash;
}

QVector<quint64> RowHasher::computeRowHashes(const QImage &frame)
{
    if (frame.isNull()) {
        qWarning() << "RowHasher: received null frame";
        return {};
    }

    const QImage argb = frame.format() == QImage::Format_ARGB32
        ? frame
        : frame.convertToFormat(QImage::Format_ARGB32);
    const int height = argb.height();
    const Band band = sampleBand(argb.width());

    QVector<quint64> hashes(height, kSeed);
    if (band.isEmpty()) {
        return hashes;
    }

    const cv::Mat pixels(height, argb.width(), CV_8UC4,
                         const_cast<uchar *>(argb.constBits()),
                         static_cast<size_t>(argb.bytesPerLine()));
    const cv::Mat columns = pixels(cv::Rect(band.begin, 0, band.end - band.begin, height));
    const Band columnRange{0, columns.cols};

    for (int y = 0; y < height; ++y) {
        hashes[y] = hashRow(columns.ptr<QRgb>(y), columnRange);
    }

    return hashes;
}
