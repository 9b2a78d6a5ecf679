#include "capture/CaptureSequence.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QImageReader>

#include <cmath>

QString CaptureSequence::paddedIndex(int maxCaptures, int index)
{
    int digits = 0;
    if (maxCaptures > 1) {
        digits = static_cast<int>(std::ceil(std::log10(static_cast<double>(maxCaptures))));
    }
    return QString::number(index).rightJustified(digits, QLatin1Char('0'));
}

QString CaptureSequence::captureFilePath(const QString &dir,
                                         const QString &prefix,
                                         int maxCaptures,
                                         int index)
{
    const QString fileName = QStringLiteral("%1%2.png").arg(prefix, paddedIndex(maxCaptures, index));
    return QDir(dir).filePath(fileName);
}

QString CaptureSequence::capturePrefixForOutput(const QString &outputFile)
{
    const QString baseName = QFileInfo(outputFile).completeBaseName();
    if (baseName.isEmpty()) {
        return QString();
    }
    return baseName + QLatin1Char('_');
}

int CaptureSequence::countCaptures(const QString &dir, const QString &prefix, int maxCaptures)
{
    for (int i = 0; i < maxCaptures; ++i) {
        if (!QFileInfo::exists(captureFilePath(dir, prefix, maxCaptures, i))) {
            return i;
        }
    }
    return qMax(0, maxCaptures);
}

QStringList CaptureSequence::discover(const QString &dir, const QString &prefix, int maxCaptures)
{
    QStringList paths;
    const int count = countCaptures(dir, prefix, maxCaptures);
    paths.reserve(count);
    for (int i = 0; i < count; ++i) {
        paths.append(captureFilePath(dir, prefix, maxCaptures, i));
    }
    return paths;
}

QVector<QImage> CaptureSequence::loadFrames(const QStringList &paths, Error *error)
{
    QVector<QImage> frames;
    frames.reserve(paths.size());

    for (const QString &path : paths) {
        QImageReader reader(path);
        const QImage frame = reader.read();
        if (frame.isNull()) {
            const QString readerError = reader.errorString().trimmed();
            setError(error, path,
                     QStringLiteral("Failed to read capture %1: %2")
                         .arg(path, readerError.isEmpty() ? QStringLiteral("unknown error") : readerError));
            qWarning() << "CaptureSequence: failed to read" << path << readerError;
            return {};
        }
        frames.append(frame);
    }

    qDebug() << "CaptureSequence: Loaded" << frames.size() << "captures";
    return frames;
}

bool CaptureSequence::removeCaptures(const QStringList &paths, Error *error)
{
    bool ok = true;
    for (const QString &path : paths) {
        QFile file(path);
        if (file.exists() && !file.remove()) {
            qWarning() << "CaptureSequence: failed to remove" << path << file.errorString();
            if (ok) {
                setError(error, path,
                         QStringLiteral("Failed to remove capture %1: %2").arg(path, file.errorString()));
            }
            ok = false;
        }
    }
    return ok;
}

void CaptureSequence::setError(Error *error, const QString &path, const QString &message)
{
    if (!error) {
        return;
    }
    error->path = path;
    error->message = message;
}
