#ifndef CAPTURESEQUENCE_H
#define CAPTURESEQUENCE_H

#include <QImage>
#include <QString>
#include <QStringList>
#include <QVector>

/**
 * @brief Locates and decodes a numbered set of captures on disk.
 *
 * Captures are named <prefix><index>.png, where the index is zero-padded to
 * the number of digits needed for maxCaptures (e.g. stitch_07.png for 50).
 */
class CaptureSequence
{
public:
    struct Error {
        QString message;
        QString path;
    };

    static QString paddedIndex(int maxCaptures, int index);

    static QString captureFilePath(const QString &dir,
                                   const QString &prefix,
                                   int maxCaptures,
                                   int index);

    // "<basename of outputFile without its last suffix>_", or empty.
    static QString capturePrefixForOutput(const QString &outputFile);

    // Consecutive existing captures starting at index 0, capped at maxCaptures.
    static int countCaptures(const QString &dir, const QString &prefix, int maxCaptures);

    static QStringList discover(const QString &dir, const QString &prefix, int maxCaptures);

    /**
     * @brief Decode every file in order.
     * @return The frames, or an empty list when any file cannot be read.
     */
    static QVector<QImage> loadFrames(const QStringList &paths, Error *error = nullptr);

    // Delete the given capture files. Returns false if any removal failed.
    static bool removeCaptures(const QStringList &paths, Error *error = nullptr);

private:
    static void setError(Error *error, const QString &path, const QString &message);
};

#endif // CAPTURESEQUENCE_H
