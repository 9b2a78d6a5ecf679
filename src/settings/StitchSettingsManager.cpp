#include "settings/StitchSettingsManager.h"
#include "settings/Settings.h"

StitchSettingsManager& StitchSettingsManager::instance()
{
    static StitchSettingsManager instance;
    return instance;
}

bool StitchSettingsManager::loadRoundDisplay() const
{
    auto settings = WearStitch::getSettings();
    return settings.value(kSettingsKeyRoundDisplay, defaultRoundDisplay()).toBool();
}

void StitchSettingsManager::saveRoundDisplay(bool round)
{
    auto settings = WearStitch::getSettings();
    settings.setValue(kSettingsKeyRoundDisplay, round);
}

bool StitchSettingsManager::loadTransparency() const
{
    auto settings = WearStitch::getSettings();
    return settings.value(kSettingsKeyTransparency, defaultTransparency()).toBool();
}

void StitchSettingsManager::saveTransparency(bool enabled)
{
    auto settings = WearStitch::getSettings();
    settings.setValue(kSettingsKeyTransparency, enabled);
}

int StitchSettingsManager::loadMaxCaptures() const
{
    auto settings = WearStitch::getSettings();
    bool ok = false;
    const int value = settings.value(kSettingsKeyMaxCaptures, defaultMaxCaptures()).toInt(&ok);
    return (ok && value > 0) ? value : defaultMaxCaptures();
}

void StitchSettingsManager::saveMaxCaptures(int maxCaptures)
{
    if (maxCaptures <= 0) {
        return;
    }
    auto settings = WearStitch::getSettings();
    settings.setValue(kSettingsKeyMaxCaptures, maxCaptures);
}

QString StitchSettingsManager::loadOutputDir() const
{
    auto settings = WearStitch::getSettings();
    const QString dir = settings.value(kSettingsKeyOutputDir, defaultOutputDir()).toString();
    return dir.isEmpty() ? defaultOutputDir() : dir;
}

void StitchSettingsManager::saveOutputDir(const QString& dir)
{
    auto settings = WearStitch::getSettings();
    settings.setValue(kSettingsKeyOutputDir, dir);
}

QString StitchSettingsManager::loadFilePrefix() const
{
    auto settings = WearStitch::getSettings();
    const QString prefix = settings.value(kSettingsKeyFilePrefix, defaultFilePrefix()).toString().trimmed();
    return prefix.isEmpty() ? defaultFilePrefix() : prefix;
}

void StitchSettingsManager::saveFilePrefix(const QString& prefix)
{
    auto settings = WearStitch::getSettings();
    settings.setValue(kSettingsKeyFilePrefix, prefix.trimmed());
}

void StitchSettingsManager::resetToDefaults()
{
    auto settings = WearStitch::getSettings();
    settings.remove(kSettingsKeyRoundDisplay);
    settings.remove(kSettingsKeyTransparency);
    settings.remove(kSettingsKeyMaxCaptures);
    settings.remove(kSettingsKeyOutputDir);
    settings.remove(kSettingsKeyFilePrefix);
    settings.sync();
}
