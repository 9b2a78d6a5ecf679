#include "cli/commands/ConfigCommand.h"

#include "settings/StitchSettingsManager.h"

#include <QStringList>
#include <QTextStream>

#include <functional>
#include <vector>

namespace WearStitch {
namespace CLI {

namespace {

// A configurable key with its effective value and a validating setter.
struct ConfigEntry {
    QString key;
    std::function<QString()> load;
    std::function<bool(const QString&)> save;
};

QString boolText(bool value) { return value ? QStringLiteral("true") : QStringLiteral("false"); }

bool parseBool(const QString& text, bool* value)
{
    const QString normalized = text.trimmed().toLower();
    if (normalized == "true" || normalized == "1" || normalized == "yes" || normalized == "on") {
        *value = true;
        return true;
    }
    if (normalized == "false" || normalized == "0" || normalized == "no" || normalized == "off") {
        *value = false;
        return true;
    }
    return false;
}

std::vector<ConfigEntry> configEntries()
{
    auto& manager = StitchSettingsManager::instance();
    return {
        {StitchSettingsManager::kSettingsKeyRoundDisplay,
         [&manager]() { return boolText(manager.loadRoundDisplay()); },
         [&manager](const QString& text) {
             bool value = false;
             if (!parseBool(text, &value)) {
                 return false;
             }
             manager.saveRoundDisplay(value);
             return true;
         }},
        {StitchSettingsManager::kSettingsKeyTransparency,
         [&manager]() { return boolText(manager.loadTransparency()); },
         [&manager](const QString& text) {
             bool value = false;
             if (!parseBool(text, &value)) {
                 return false;
             }
             manager.saveTransparency(value);
             return true;
         }},
        {StitchSettingsManager::kSettingsKeyMaxCaptures,
         [&manager]() { return QString::number(manager.loadMaxCaptures()); },
         [&manager](const QString& text) {
             bool ok = false;
             const int value = text.trimmed().toInt(&ok);
             if (!ok || value <= 0) {
                 return false;
             }
             manager.saveMaxCaptures(value);
             return true;
         }},
        {StitchSettingsManager::kSettingsKeyOutputDir,
         [&manager]() { return manager.loadOutputDir(); },
         [&manager](const QString& text) {
             if (text.isEmpty()) {
                 return false;
             }
             manager.saveOutputDir(text);
             return true;
         }},
        {StitchSettingsManager::kSettingsKeyFilePrefix,
         [&manager]() { return manager.loadFilePrefix(); },
         [&manager](const QString& text) {
             if (text.trimmed().isEmpty()) {
                 return false;
             }
             manager.saveFilePrefix(text);
             return true;
         }},
    };
}

const ConfigEntry* findEntry(const std::vector<ConfigEntry>& entries, const QString& key)
{
    for (const ConfigEntry& entry : entries) {
        if (entry.key == key) {
            return &entry;
        }
    }
    return nullptr;
}

CLIResult unknownKey(const std::vector<ConfigEntry>& entries, const QString& key)
{
    QStringList keys;
    for (const ConfigEntry& entry : entries) {
        keys.append(entry.key);
    }
    return CLIResult::error(
        CLIResult::Code::InvalidArguments,
        QString("Unknown setting: %1 (known: %2)").arg(key, keys.join(", ")));
}

} // namespace

QString ConfigCommand::name() const { return "config"; }

QString ConfigCommand::description() const { return "Manage stitching defaults"; }

void ConfigCommand::setupOptions(QCommandLineParser& parser)
{
    parser.addOption({"get", "Get setting value", "key"});
    parser.addOption({"set", "Set setting value (use with positional arg)", "key"});
    parser.addOption({"list", "List all settings"});
    parser.addOption({"reset", "Reset to default values"});
    parser.addPositionalArgument("value", "Value to set (when using --set)");
}

CLIResult ConfigCommand::execute(const QCommandLineParser& parser)
{
    const std::vector<ConfigEntry> entries = configEntries();

    if (parser.isSet("list")) {
        QString output;
        QTextStream out(&output);
        out << "Current settings:\n";
        for (const ConfigEntry& entry : entries) {
            out << QString("  %1 = %2\n").arg(entry.key, entry.load());
        }
        return CLIResult::success(output);
    }

    if (parser.isSet("get")) {
        const QString key = parser.value("get");
        const ConfigEntry* entry = findEntry(entries, key);
        if (!entry) {
            return unknownKey(entries, key);
        }
        return CLIResult::success(entry->load());
    }

    if (parser.isSet("set")) {
        const QString key = parser.value("set");
        const ConfigEntry* entry = findEntry(entries, key);
        if (!entry) {
            return unknownKey(entries, key);
        }
        const QStringList positionalArgs = parser.positionalArguments();
        if (positionalArgs.isEmpty()) {
            return CLIResult::error(CLIResult::Code::InvalidArguments, "Value required for --set");
        }
        const QString value = positionalArgs.first();
        if (!entry->save(value)) {
            return CLIResult::error(
                CLIResult::Code::InvalidArguments,
                QString("Invalid value for %1: %2").arg(key, value));
        }
        return CLIResult::success(QString("Set %1 = %2").arg(key, entry->load()));
    }

    if (parser.isSet("reset")) {
        StitchSettingsManager::instance().resetToDefaults();
        return CLIResult::success("Settings reset to defaults");
    }

    return CLIResult::error(
        CLIResult::Code::InvalidArguments, "One of --list, --get, --set or --reset is required");
}

} // namespace CLI
} // namespace WearStitch
