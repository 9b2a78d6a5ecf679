#include "cli/commands/StitchCommand.h"

#include "capture/CaptureSequence.h"
#include "settings/StitchSettingsManager.h"
#include "stitch/StitchEngine.h"
#include "utils/ImageSaveUtils.h"

#include <QDir>
#include <QFileInfo>
#include <QTextStream>

namespace WearStitch {
namespace CLI {

namespace {

CLIResult conflictingOptions(const QString& first, const QString& second)
{
    return CLIResult::error(
        CLIResult::Code::InvalidArguments,
        QString("Options --%1 and --%2 are mutually exclusive").arg(first, second));
}

} // namespace

QString StitchCommand::name() const { return "stitch"; }

QString StitchCommand::description() const { return "Stitch scrolled captures into one image"; }

void StitchCommand::setupOptions(QCommandLineParser& parser)
{
    parser.addOption({{"d", "dir"}, "Directory holding the numbered captures", "dir"});
    parser.addOption({{"o", "output"}, "Output file path", "file"});
    parser.addOption({{"p", "prefix"}, "Capture file prefix (default: <output name>_)", "prefix"});
    parser.addOption({{"m", "max-captures"}, "Maximum number of captures", "num"});
    parser.addOption({"round", "Round display: mask the corners outside the screen circle"});
    parser.addOption({"square", "Square display: every pixel of a capture is visible"});
    parser.addOption({"transparency", "Make the cut-off corners at the top and bottom transparent"});
    parser.addOption({"no-transparency", "Fill the cut-off corners with the nearest capture pixels"});
    parser.addOption({"remove-captures", "Delete the stitched captures after writing the output"});
    parser.addPositionalArgument("files", "Captures to stitch, in scroll order", "[files...]");
}

CLIResult StitchCommand::execute(const QCommandLineParser& parser)
{
    auto& settings = StitchSettingsManager::instance();

    if (parser.isSet("round") && parser.isSet("square")) {
        return conflictingOptions("round", "square");
    }
    if (parser.isSet("transparency") && parser.isSet("no-transparency")) {
        return conflictingOptions("transparency", "no-transparency");
    }

    StitchOptions options;
    options.useCircularMask = settings.loadRoundDisplay();
    if (parser.isSet("round")) {
        options.useCircularMask = true;
    }
    else if (parser.isSet("square")) {
        options.useCircularMask = false;
    }

    options.useTransparency = settings.loadTransparency();
    if (parser.isSet("transparency")) {
        options.useTransparency = true;
    }
    else if (parser.isSet("no-transparency")) {
        options.useTransparency = false;
    }

    int maxCaptures = settings.loadMaxCaptures();
    if (parser.isSet("max-captures")) {
        const QString value = parser.value("max-captures");
        bool ok = false;
        maxCaptures = value.toInt(&ok);
        if (!ok || maxCaptures <= 0) {
            return CLIResult::error(
                CLIResult::Code::InvalidArguments, QString("Invalid max captures: %1").arg(value));
        }
    }

    const QString dir = parser.isSet("dir") ? parser.value("dir") : settings.loadOutputDir();
    QString outputFile = parser.value("output");
    if (outputFile.isEmpty()) {
        outputFile = QDir(dir).filePath(settings.loadFilePrefix() + QStringLiteral(".png"));
    }

    QStringList captureFiles = parser.positionalArguments();
    if (captureFiles.isEmpty()) {
        QString prefix = parser.value("prefix");
        if (prefix.isEmpty()) {
            prefix = CaptureSequence::capturePrefixForOutput(outputFile);
        }
        if (prefix.isEmpty()) {
            return CLIResult::error(
                CLIResult::Code::InvalidArguments,
                QString("Cannot derive a capture prefix from output file: %1").arg(outputFile));
        }

        if (!QDir(dir).exists()) {
            return CLIResult::error(
                CLIResult::Code::FileError,
                QString("Capture directory does not exist: %1").arg(dir));
        }

        captureFiles = CaptureSequence::discover(dir, prefix, maxCaptures);
        if (captureFiles.isEmpty()) {
            return CLIResult::error(
                CLIResult::Code::FileError,
                QString("No captures found, expected %1")
                    .arg(CaptureSequence::captureFilePath(dir, prefix, maxCaptures, 0)));
        }
    }
    else if (captureFiles.size() > maxCaptures) {
        return CLIResult::error(
            CLIResult::Code::InvalidArguments,
            QString("Too many captures: %1 (maximum %2)").arg(captureFiles.size()).arg(maxCaptures));
    }

    if (parser.isSet("remove-captures")) {
        const QString outputPath = QDir::cleanPath(QFileInfo(outputFile).absoluteFilePath());
        for (const QString& capture : captureFiles) {
            if (QDir::cleanPath(QFileInfo(capture).absoluteFilePath()) == outputPath) {
                return CLIResult::error(
                    CLIResult::Code::InvalidArguments,
                    QString("Output file %1 is also a capture; --remove-captures would delete it")
                        .arg(outputFile));
            }
        }
    }

    CaptureSequence::Error loadError;
    const QVector<QImage> frames = CaptureSequence::loadFrames(captureFiles, &loadError);
    if (frames.isEmpty()) {
        return CLIResult::error(CLIResult::Code::FileError, loadError.message);
    }

    const StitchEngine engine(options);
    const StitchResult result = engine.stitch(frames);
    if (!result.success) {
        return CLIResult::error(CLIResult::Code::StitchError, result.errorMessage);
    }

    ImageSaveUtils::Error saveError;
    if (!ImageSaveUtils::saveImageAtomically(result.canvas, outputFile, QByteArray(), &saveError, true)) {
        return CLIResult::error(
            CLIResult::Code::FileError,
            QString("Failed to save stitched image to %1: %2").arg(outputFile, saveError.message));
    }

    QString message;
    QTextStream out(&message);
    for (const StitchWarning& warning : result.warnings) {
        out << "Warning: " << warning.message << "\n";
    }
    out << QString("Wrote %1 (%2x%3 from %4 captures)")
               .arg(outputFile)
               .arg(result.canvas.width())
               .arg(result.canvas.height())
               .arg(frames.size());

    if (parser.isSet("remove-captures")) {
        CaptureSequence::Error removeError;
        if (!CaptureSequence::removeCaptures(captureFiles, &removeError)) {
            return CLIResult::error(CLIResult::Code::FileError,
                                    message + QStringLiteral("\n") + removeError.message);
        }
    }

    return CLIResult::success(message);
}

} // namespace CLI
} // namespace WearStitch
