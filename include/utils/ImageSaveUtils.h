#ifndef IMAGESAVEUTILS_H
#define IMAGESAVEUTILS_H

#include <QByteArray>
#include <QImage>
#include <QString>

/**
 * @brief Writes the stitched canvas so that a failed write never leaves a
 *        truncated file behind.
 */
class ImageSaveUtils
{
public:
    struct Error {
        QString message;
        QString stage; // directory / format / open / write / commit
    };

    /**
     * @brief Encode and atomically replace filePath.
     * @param explicitFormat Writer format; when empty it is taken from the
     *        file suffix, falling back to PNG.
     * @param createParentDirectory Create missing parent directories first.
     */
    static bool saveImageAtomically(const QImage& image,
                                    const QString& filePath,
                                    const QByteArray& explicitFormat = QByteArray(),
                                    Error* error = nullptr,
                                    bool createParentDirectory = false);

    // Lower-cased writer format for filePath, or empty if unsupported.
    static QByteArray resolveFormat(const QString& filePath,
                                    const QByteArray& explicitFormat,
                                    Error* error = nullptr);

private:
    static void setError(Error* error, const QString& stage, const QString& message);
};

#endif // IMAGESAVEUTILS_H
