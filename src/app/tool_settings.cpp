#include "app/tool_settings.h"

#include "core/errors.h"
#include "core/logging.h"

#include <QSettings>

namespace DoseProfile {

namespace {

QString zeroPointKey(ZeroPoint::Mode mode)
{
    switch (mode) {
    case ZeroPoint::Mode::Origin:
        return QStringLiteral("origin");
    case ZeroPoint::Mode::Explicit:
        return QStringLiteral("explicit");
    case ZeroPoint::Mode::CaxSurfaceIntercept:
        break;
    }
    return QStringLiteral("cax-surface");
}

ZeroPoint::Mode zeroPointFromKey(const QString &key)
{
    if (key == QLatin1String("origin")) {
        return ZeroPoint::Mode::Origin;
    }
    // An explicit point is never persisted, fall back to the default
    return ZeroPoint::Mode::CaxSurfaceIntercept;
}

} // namespace

ToolSettings ToolSettings::load()
{
    QSettings settings("DoseProfileTool", "DoseProfileTool");
    return load(settings);
}

ToolSettings ToolSettings::load(QSettings &settings)
{
    ToolSettings result;
    ProfileOptions &o = result.options;

    settings.beginGroup("profile");
    bool ok = false;
    const double spacing = settings.value("spacing", o.spacing).toDouble(&ok);
    if (ok && spacing > 0.0) {
        o.spacing = spacing;
    }

    // Stale values from a hand-edited file must not block start-up
    try {
        o.interpolation = parseInterpolationMethod(
            settings.value("interpolation", interpolationMethodName(o.interpolation)).toString());
    } catch (const UnsupportedInterpolationMethodError &e) {
        qCWarning(AppLog) << "Ignoring stored interpolation:" << e.what();
    }
    try {
        o.doseUnit = parseDoseUnit(settings.value("units", doseUnitCode(o.doseUnit)).toString());
        if (o.doseUnit == DoseUnit::Relative) {
            o.doseUnit = DoseUnit::Gy;
        }
    } catch (const InvalidDoseUnitError &e) {
        qCWarning(AppLog) << "Ignoring stored dose units:" << e.what();
    }

    o.normalizeByMonitorUnits = settings.value("normalizeMu", o.normalizeByMonitorUnits).toBool();
    o.zeroPoint = zeroPointFromKey(settings.value("zeroPoint", zeroPointKey(o.zeroPoint)).toString());

    const QString delimiter = settings.value("delimiter", QString(o.delimiter)).toString();
    if (delimiter.size() == 1) {
        o.delimiter = delimiter.at(0);
    }
    o.skipRows = qMax(0, settings.value("skipRows", o.skipRows).toInt());
    o.beamIndex = qMax(0, settings.value("beam", o.beamIndex).toInt());
    o.parallelBatch = settings.value("parallel", o.parallelBatch).toBool();

    result.dicomFolder = settings.value("dicomFolder").toString();
    result.pointsFile = settings.value("pointsFile").toString();
    result.outputFile = settings.value("outputFile").toString();
    settings.endGroup();
    return result;
}

void ToolSettings::save() const
{
    QSettings settings("DoseProfileTool", "DoseProfileTool");
    save(settings);
}

void ToolSettings::save(QSettings &settings) const
{
    settings.beginGroup("profile");
    settings.setValue("spacing", options.spacing);
    settings.setValue("interpolation", interpolationMethodName(options.interpolation));
    settings.setValue("units", doseUnitCode(options.doseUnit));
    settings.setValue("normalizeMu", options.normalizeByMonitorUnits);
    settings.setValue("zeroPoint", zeroPointKey(options.zeroPoint));
    settings.setValue("delimiter", QString(options.delimiter));
    settings.setValue("skipRows", options.skipRows);
    settings.setValue("beam", options.beamIndex);
    settings.setValue("parallel", options.parallelBatch);
    settings.setValue("dicomFolder", dicomFolder);
    settings.setValue("pointsFile", pointsFile);
    settings.setValue("outputFile", outputFile);
    settings.endGroup();
}

} // namespace DoseProfile
