#include "utils/ImageSaveUtils.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QImageWriter>
#include <QSaveFile>
#include <QStringList>

namespace {

QByteArray normalizeFormat(QByteArray format)
{
    format = format.trimmed().toLower();
    while (format.startsWith('.')) {
        format.remove(0, 1);
    }
    if (format == "jpg") {
        return QByteArrayLiteral("jpeg");
    }
    if (format == "tif") {
        return QByteArrayLiteral("tiff");
    }
    return format;
}

QStringList writerFormats()
{
    QStringList formats;
    const QList<QByteArray> supported = QImageWriter::supportedImageFormats();
    for (const QByteArray& format : supported) {
        const QString name = QString::fromLatin1(normalizeFormat(format));
        if (!formats.contains(name)) {
            formats.append(name);
        }
    }
    formats.sort();
    return formats;
}

} // namespace

bool ImageSaveUtils::saveImageAtomically(const QImage& image,
                                         const QString& filePath,
                                         const QByteArray& explicitFormat,
                                         Error* error,
                                         bool createParentDirectory)
{
    if (image.isNull()) {
        setError(error, QStringLiteral("write"), QStringLiteral("Image is null"));
        return false;
    }

    const QByteArray format = resolveFormat(filePath, explicitFormat, error);
    if (format.isEmpty()) {
        return false;
    }

    if (createParentDirectory) {
        const QString parentDir = QFileInfo(filePath).absolutePath();
        if (!QDir().mkpath(parentDir)) {
            setError(error, QStringLiteral("directory"),
                     QStringLiteral("Failed to create directory %1").arg(parentDir));
            return false;
        }
    }

    QSaveFile saveFile(filePath);
    // Overwriting inside a read-only directory cannot use a temp sibling.
    saveFile.setDirectWriteFallback(true);
    if (!saveFile.open(QIODevice::WriteOnly)) {
        const QString openError = saveFile.errorString().trimmed();
        setError(error, QStringLiteral("open"),
                 openError.isEmpty() ? QStringLiteral("Failed to open output file") : openError);
        return false;
    }

    QImageWriter writer(&saveFile, format);
    if (!writer.write(image)) {
        saveFile.cancelWriting();
        const QString writeError = writer.errorString().trimmed();
        setError(error, QStringLiteral("write"),
                 writeError.isEmpty() ? QStringLiteral("Failed to encode image") : writeError);
        return false;
    }

    if (!saveFile.commit()) {
        const QString commitError = saveFile.errorString().trimmed();
        setError(error, QStringLiteral("commit"),
                 commitError.isEmpty() ? QStringLiteral("Failed to commit output file") : commitError);
        return false;
    }

    qDebug() << "ImageSaveUtils: Wrote" << image.size() << "to" << filePath;
    return true;
}

QByteArray ImageSaveUtils::resolveFormat(const QString& filePath,
                                         const QByteArray& explicitFormat,
                                         Error* error)
{
    QByteArray format = normalizeFormat(explicitFormat);
    if (format.isEmpty()) {
        format = normalizeFormat(QFileInfo(filePath).suffix().toLatin1());
    }
    if (format.isEmpty()) {
        format = QByteArrayLiteral("png");
    }

    const QStringList formats = writerFormats();
    if (!formats.contains(QString::fromLatin1(format))) {
        setError(error, QStringLiteral("format"),
                 QStringLiteral("Unsupported image format '%1' (supported: %2)")
                     .arg(QString::fromLatin1(format), formats.join(QStringLiteral(", "))));
        return QByteArray();
    }

    return format;
}

void ImageSaveUtils::setError(Error* error, const QString& stage, const QString& message)
{
    if (!error) {
        return;
    }
    error->stage = stage;
    error->message = message;
}
