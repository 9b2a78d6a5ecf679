#include <QtTest>

#include <QDir>
#include <QFile>
#include <QImageReader>
#include <QImageWriter>
#include <QTemporaryDir>

#include "utils/ImageSaveUtils.h"

namespace {

// Opaque top half, transparent bottom half, like a stitched canvas with
// transparent corners.
QImage makeCanvas(int width, int height)
{
    QImage image(width, height, QImage::Format_ARGB32);
    image.fill(Qt::transparent);
    for (int y = 0; y < height / 2; ++y) {
        QRgb *line = reinterpret_cast<QRgb *>(image.scanLine(y));
        for (int x = 0; x < width; ++x) {
            line[x] = qRgb(20, 120, 220);
        }
    }
    return image;
}

} // namespace

class tst_ImageSaveUtils : public QObject
{
    Q_OBJECT

private slots:
    void testSavePngKeepsAlpha();
    void testSaveWithoutExtensionDefaultsToPng();
    void testResolveFormatAliases();
    void testUnsupportedExtensionFails();
    void testNullImageFails();
    void testMissingParentDirectoryFailsToOpen();
    void testCreatesParentDirectoryWhenAsked();
    void testOverwriteExistingFile();
};

void tst_ImageSaveUtils::testSavePngKeepsAlpha()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    const QImage canvas = makeCanvas(16, 10);
    const QString filePath = tempDir.filePath("stitch.png");
    ImageSaveUtils::Error error;
    QVERIFY(ImageSaveUtils::saveImageAtomically(canvas, filePath, QByteArray(), &error));

    const QImage loaded(filePath);
    QVERIFY(!loaded.isNull());
    QCOMPARE(loaded.size(), QSize(16, 10));
    QVERIFY(loaded.hasAlphaChannel());
    QCOMPARE(loaded.pixelColor(3, 2), QColor(20, 120, 220, 255));
    QCOMPARE(loaded.pixelColor(3, 8).alpha(), 0);
}

void tst_ImageSaveUtils::testSaveWithoutExtensionDefaultsToPng()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    const QString filePath = tempDir.filePath("stitch_no_ext");
    ImageSaveUtils::Error error;
    QVERIFY(ImageSaveUtils::saveImageAtomically(makeCanvas(8, 8), filePath, QByteArray(), &error));

    QImageReader reader(filePath);
    QVERIFY(reader.canRead());
    QCOMPARE(reader.format().toLower(), QByteArrayLiteral("png"));
}

void tst_ImageSaveUtils::testResolveFormatAliases()
{
    QCOMPARE(ImageSaveUtils::resolveFormat("out.PNG", QByteArray()), QByteArrayLiteral("png"));
    QCOMPARE(ImageSaveUtils::resolveFormat("out", QByteArray()), QByteArrayLiteral("png"));
    QCOMPARE(ImageSaveUtils::resolveFormat("out.bin", QByteArrayLiteral(".PNG")), QByteArrayLiteral("png"));

    if (QImageWriter::supportedImageFormats().contains("jpeg")) {
        QCOMPARE(ImageSaveUtils::resolveFormat("out.jpg", QByteArray()), QByteArrayLiteral("jpeg"));
    }
}

void tst_ImageSaveUtils::testUnsupportedExtensionFails()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    const QString filePath = tempDir.filePath("stitch.unsupported_ext");
    ImageSaveUtils::Error error;
    QVERIFY(!ImageSaveUtils::saveImageAtomically(makeCanvas(8, 8), filePath, QByteArray(), &error));
    QCOMPARE(error.stage, QStringLiteral("format"));
    QVERIFY(error.message.contains("Unsupported image format"));
    QVERIFY(!QFile::exists(filePath));
}

void tst_ImageSaveUtils::testNullImageFails()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    const QString filePath = tempDir.filePath("empty.png");
    ImageSaveUtils::Error error;
    QVERIFY(!ImageSaveUtils::saveImageAtomically(QImage(), filePath, QByteArray(), &error));
    QCOMPARE(error.stage, QStringLiteral("write"));
    QVERIFY(!QFile::exists(filePath));
}

void tst_ImageSaveUtils::testMissingParentDirectoryFailsToOpen()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    const QString filePath = tempDir.filePath("missing/nested/stitch.png");
    ImageSaveUtils::Error error;
    QVERIFY(!ImageSaveUtils::saveImageAtomically(makeCanvas(8, 8), filePath, QByteArray(), &error));
    QCOMPARE(error.stage, QStringLiteral("open"));
    QVERIFY(!error.message.isEmpty());
}

void tst_ImageSaveUtils::testCreatesParentDirectoryWhenAsked()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    const QString filePath = tempDir.filePath("missing/nested/stitch.png");
    ImageSaveUtils::Error error;
    QVERIFY2(ImageSaveUtils::saveImageAtomically(makeCanvas(8, 8), filePath, QByteArray(), &error, true),
             qPrintable(QStringLiteral("stage=%1 message=%2").arg(error.stage, error.message)));
    QVERIFY(QDir(tempDir.filePath("missing/nested")).exists());
    QVERIFY(QFile::exists(filePath));
}

void tst_ImageSaveUtils::testOverwriteExistingFile()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    const QString filePath = tempDir.filePath("overwrite.png");

    QImage red(12, 12, QImage::Format_ARGB32);
    red.fill(QColor(255, 0, 0, 255));
    QVERIFY(ImageSaveUtils::saveImageAtomically(red, filePath));

    QImage green(12, 20, QImage::Format_ARGB32);
    green.fill(QColor(0, 255, 0, 255));
    QVERIFY(ImageSaveUtils::saveImageAtomically(green, filePath));

    const QImage loaded(filePath);
    QCOMPARE(loaded.size(), QSize(12, 20));
    QCOMPARE(loaded.pixelColor(0, 0), QColor(0, 255, 0, 255));
}

QTEST_MAIN(tst_ImageSaveUtils)
#include "tst_ImageSaveUtils.moc"
