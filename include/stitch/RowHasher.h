#ifndef ROWHASHER_H
#define ROWHASHER_H

#include <QImage>
#include <QVector>
#include <QtGlobal>

/**
 * @brief Per-row content fingerprints used to detect vertical overlap.
 *
 * Each row is hashed with a polynomial (Horner) hash over the central 40% of
 * its columns. The left and right edges are skipped because round displays
 * crop them, which would make otherwise identical rows differ.
 */
class RowHasher
{
public:
    static constexpr quint64 kSeed = 1;
    static constexpr quint64 kMultiplier = 31;

    // Half-open column range [begin, end) that contributes to a row hash.
    struct Band {
        int begin = 0;
        int end = 0;
        bool isEmpty() const { return end <= begin; }
    };

    static Band sampleBand(int width);

    /**
     * @brief True when no column falls inside the sampling band.
     *
     * Such frames still hash deterministically (every row yields kSeed),
     * but every row looks the same to the offset matcher.
     */
    static bool hasDegenerateBand(int width);

    // R * 65536 + G * 256 + B; alpha is discarded.
    static quint64 packRgb(QRgb pixel);

    // Arithmetic is modulo 2^64 (unsigned wrap-around).
    static quint64 hashRow(const QRgb *line, const Band &band);

    /**
     * @brief Hash every row of a frame.
     * @return One value per row, top to bottom. Empty for a null image.
     */
    static QVector<quint64> computeRowHashes(const QImage &frame);
};

#endif // ROWHASHER_H
