#ifndef STITCHSETTINGSMANAGER_H
#define STITCHSETTINGSMANAGER_H

#include <QString>

/**
 * @brief Singleton class for persisted stitching defaults.
 *
 * Command line flags override these values for a single run.
 */
class StitchSettingsManager
{
public:
    static StitchSettingsManager& instance();

    // Display shape: true for round (circular mask), false for square
    bool loadRoundDisplay() const;
    void saveRoundDisplay(bool round);

    // Transparent corners at the top and bottom of the output
    bool loadTransparency() const;
    void saveTransparency(bool enabled);

    // Upper bound on the capture index, also sets the index padding width
    int loadMaxCaptures() const;
    void saveMaxCaptures(int maxCaptures);

    QString loadOutputDir() const;
    void saveOutputDir(const QString& dir);

    QString loadFilePrefix() const;
    void saveFilePrefix(const QString& prefix);

    // Remove every stored stitching value so the defaults apply again
    void resetToDefaults();

    // Default values
    static bool defaultRoundDisplay() { return true; }
    static bool defaultTransparency() { return false; }
    static int defaultMaxCaptures() { return 50; }
    static QString defaultOutputDir() { return QStringLiteral("."); }
    static QString defaultFilePrefix() { return QStringLiteral("stitch"); }

    static constexpr const char* kSettingsKeyRoundDisplay = "stitch/roundDisplay";
    static constexpr const char* kSettingsKeyTransparency = "stitch/transparency";
    static constexpr const char* kSettingsKeyMaxCaptures = "stitch/maxCaptures";
    static constexpr const char* kSettingsKeyOutputDir = "files/outputDir";
    static constexpr const char* kSettingsKeyFilePrefix = "files/filePrefix";

private:
    StitchSettingsManager() = default;
    StitchSettingsManager(const StitchSettingsManager&) = delete;
    StitchSettingsManager& operator=(const StitchSettingsManager&) = delete;
};

#endif // STITCHSETTINGSMANAGER_H
