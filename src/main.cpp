#include <QApplication>
#include <QCommandLineParser>
#include <QLoggingCategory>
#include <QStyleFactory>
#include <limits>

#include "app/profile_tool.h"
#include "app/tool_settings.h"
#include "core/errors.h"
#include "core/logging.h"
#include "visualization/profile_tool_window.h"

using namespace DoseProfile;

namespace {

// Applies command line overrides on top of the persisted settings
ProfileOptions optionsFromCommandLine(const QCommandLineParser &parser, ProfileOptions options) {
  if (parser.isSet("spacing")) {
    bool ok = false;
    options.spacing = parser.value("spacing").toDouble(&ok);
    if (!ok) {
      throw InvalidSpacingError(std::numeric_limits<double>::quiet_NaN());
    }
  }
  if (parser.isSet("interpolation")) {
    options.interpolation = parseInterpolationMethod(parser.value("interpolation"));
  }
  if (parser.isSet("units")) {
    options.doseUnit = parseDoseUnit(parser.value("units"));
  }
  if (parser.isSet("normalize-mu")) {
    options.normalizeByMonitorUnits = true;
  }
  if (parser.isSet("no-zero-point")) {
    options.zeroPoint = ZeroPoint::Mode::Origin;
  }
  if (parser.isSet("beam")) {
    options.beamIndex = qMax(0, parser.value("beam").toInt());
  }
  if (parser.isSet("delimiter")) {
    const QString delimiter = parser.value("delimiter");
    if (delimiter == QLatin1String("\\t")) {
      options.delimiter = QLatin1Char('\t');
    } else if (!delimiter.isEmpty()) {
      options.delimiter = delimiter.at(0);
    }
  }
  if (parser.isSet("skip-rows")) {
    options.skipRows = qMax(0, parser.value("skip-rows").toInt());
  }
  if (parser.isSet("parallel")) {
    options.parallelBatch = true;
  }
  return options;
}

int runHeadless(const QCommandLineParser &parser, const ProfileOptions &options) {
  ProfileTool tool;
  tool.loadFolder(parser.value("dicom"), options.beamIndex, options.interpolation);
  const std::size_t count =
      tool.profilesFromFile(parser.value("points"), parser.value("output"), options);
  qCInfo(AppLog) << "Wrote" << count << "profiles to" << parser.value("output");
  return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    app.setApplicationName("DoseProfileTool");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("DoseProfileTool");
    app.setStyle(QStyleFactory::create("Fusion"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QCoreApplication::translate("main", "Extracts dose profiles from DICOM RTDOSE/RTPLAN data."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOptions({
        {"dicom", "Folder holding the RTDOSE and RTPLAN files.", "folder"},
        {"points", "Profile points file (z0,z1,x0,x1,y0,y1 in cm).", "file"},
        {"output", "Output CSV file.", "file"},
        {"spacing", "Point spacing in cm.", "cm"},
        {"interpolation", "nearest or linear.", "method"},
        {"units", "Output dose units, Gy or cGy.", "units"},
        {"normalize-mu", "Divide doses by the beam monitor units."},
        {"no-zero-point", "Report coordinates relative to the DICOM origin."},
        {"beam", "Beam index in the RTPLAN beam sequence.", "index"},
        {"delimiter", "Delimiter of the points file.", "char"},
        {"skip-rows", "Header lines to skip in the points file.", "count"},
        {"parallel", "Extract profiles on the thread pool."},
        {"verbose", "Enable debug logging."},
    });
    parser.process(app);

    if (parser.isSet("verbose")) {
        QLoggingCategory::setFilterRules(QStringLiteral("doseprofile.*.debug=true"));
    }

    ToolSettings settings = ToolSettings::load();
    const bool headless = parser.isSet("dicom") && parser.isSet("points") && parser.isSet("output");

    try {
        settings.options = optionsFromCommandLine(parser, settings.options);
        if (headless) {
            return runHeadless(parser, settings.options);
        }
    } catch (const ProfileToolError &e) {
        qCCritical(AppLog) << e.what();
        return 1;
    }

    if (parser.isSet("dicom")) {
        settings.dicomFolder = parser.value("dicom");
    }
    if (parser.isSet("points")) {
        settings.pointsFile = parser.value("points");
    }

    ProfileToolWindow window(settings);
    window.show();

    qCDebug(AppLog) << "DoseProfileTool started";

    return app.exec();
}
