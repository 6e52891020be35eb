#ifndef DOSEPROFILE_APP_TOOL_SETTINGS_H
#define DOSEPROFILE_APP_TOOL_SETTINGS_H

#include "app/profile_options.h"

#include <QString>

class QSettings;

namespace DoseProfile {

// Values remembered between runs under "profile/*"
struct ToolSettings {
    ProfileOptions options;
    QString dicomFolder;
    QString pointsFile;
    QString outputFile;

    static ToolSettings load();
    static ToolSettings load(QSettings &settings);
    void save() const;
    void save(QSettings &settings) const;
};

} // namespace DoseProfile

#endif // DOSEPROFILE_APP_TOOL_SETTINGS_H
