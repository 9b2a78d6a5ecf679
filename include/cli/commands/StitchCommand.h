#ifndef STITCH_COMMAND_H
#define STITCH_COMMAND_H

#include "cli/CLICommand.h"

namespace WearStitch {
namespace CLI {

/**
 * @brief Stitch numbered captures (or an explicit file list) into one image
 */
class StitchCommand : public CLICommand
{
public:
    QString name() const override;
    QString description() const override;
    void setupOptions(QCommandLineParser& parser) override;
    CLIResult execute(const QCommandLineParser& parser) override;
};

} // namespace CLI
} // namespace WearStitch

#endif // STITCH_COMMAND_H
