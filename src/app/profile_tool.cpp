#include "app/profile_tool.h"

#include "core/errors.h"
#include "core/logging.h"
#include "dicom/rtdose_reader.h"
#include "dicom/rtplan_reader.h"
#include "io/profile_csv_writer.h"
#include "profile/profile_sampler.h"

#include <QList>
#include <QtConcurrent>
#include <exception>

namespace DoseProfile {

namespace {

struct SegmentOutcome {
    Profile profile;
    std::exception_ptr error;
};

} // namespace

void ProfileTool::loadFolder(const QString &folder, int beamIndex, InterpolationMethod method)
{
    DicomFolderContents contents = DicomFolderScanner::scan(folder);
    contents.requireRtDoseAndPlan();

    auto grid = std::make_unique<DoseGrid>(RTDoseReader::read(contents.rtDosePath()), method);
    const BeamGeometry beam = RTPlanReader::read(contents.rtPlanPath(), beamIndex);

    qCInfo(AppLog) << "Loaded" << grid->columns() << "x" << grid->rows() << "x" << grid->frames()
                   << "dose grid, units" << doseUnitCode(grid->units())
                   << "max" << grid->maxDose() << "; beam" << beam.beamName;

    m_contents = std::move(contents);
    setInputs(std::move(grid), beam);
}

void ProfileTool::setInputs(std::unique_ptr<DoseGrid> grid, const BeamGeometry &beam)
{
    if (!grid) {
        throw ProfileToolError(QStringLiteral("No dose grid supplied"));
    }
    m_grid = std::move(grid);
    m_beam = beam;
}

DoseGrid &ProfileTool::requireGrid() const
{
    if (!m_grid) {
        throw ProfileToolError(QStringLiteral("No RTDOSE/RTPLAN loaded"));
    }
    return *m_grid;
}

const DoseGrid &ProfileTool::grid() const
{
    return requireGrid();
}

std::optional<cv::Vec3d> ProfileTool::zeroPoint(ZeroPointDerivation mode) const
{
    return m_beam.deriveZeroPoint(mode);
}

Profile ProfileTool::profile(const LineSegment &segment, const ProfileOptions &options)
{
    DoseGrid &grid = requireGrid();
    grid.setInterpolationMethod(options.interpolation);
    const ProfileSampler sampler(grid, m_beam);
    return sampler.sampleCentimetres(segment.start, segment.end, options.spacing,
                                     options.resolvedZeroPoint(), options.doseUnit,
                                     options.normalizeByMonitorUnits);
}

std::vector<Profile> ProfileTool::profiles(const std::vector<LineSegment> &segments,
                                           const ProfileOptions &options)
{
    DoseGrid &grid = requireGrid();
    grid.setInterpolationMethod(options.interpolation);

    std::vector<Profile> result;
    result.reserve(segments.size());

    if (!options.parallelBatch || segments.size() < 2) {
        for (const LineSegment &segment : segments) {
            result.push_back(profile(segment, options));
        }
        return result;
    }

    // Build once so workers only take the read lock
    grid.prepareInterpolator();
    const ProfileSampler sampler(grid, m_beam);
    const ZeroPoint zero = options.resolvedZeroPoint();

    const QList<SegmentOutcome> outcomes = QtConcurrent::blockingMapped<QList<SegmentOutcome>>(
        segments, [&](const LineSegment &segment) {
            SegmentOutcome outcome;
            try {
                outcome.profile = sampler.sampleCentimetres(segment.start, segment.end, options.spacing,
                                                            zero, options.doseUnit,
                                                            options.normalizeByMonitorUnits);
            } catch (...) {
                outcome.error = std::current_exception();
            }
            return outcome;
        });

    for (const SegmentOutcome &outcome : outcomes) {
        if (outcome.error) {
            std::rethrow_exception(outcome.error);
        }
        result.push_back(outcome.profile);
    }
    return result;
}

std::size_t ProfileTool::profilesFromFile(const QString &pointsPath, const QString &outputPath,
                                          const ProfileOptions &options)
{
    const std::vector<LineSegment> segments =
        ProfilePointsReader::read(pointsPath, options.delimiter, options.skipRows);
    const std::vector<Profile> extracted = profiles(segments, options);
    ProfileCsvWriter::write(outputPath, extracted);
    return extracted.size();
}

} // namespace DoseProfile
