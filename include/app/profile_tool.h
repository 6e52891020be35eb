#ifndef DOSEPROFILE_APP_PROFILE_TOOL_H
#define DOSEPROFILE_APP_PROFILE_TOOL_H

#include "app/profile_options.h"
#include "dicom/dicom_folder_scanner.h"
#include "dose/dose_grid.h"
#include "geometry/beam_geometry.h"
#include "io/profile_points_reader.h"
#include "profile/profile.h"

#include <QString>
#include <memory>
#include <optional>
#include <vector>

namespace DoseProfile {

/**
 * @brief Batch profile extraction over one RTDOSE / RTPLAN pair
 *
 * Either loadFolder() or setInputs() must be called before extracting.
 * profiles() stops at the first failing segment and propagates its error;
 * no partial batch is returned or written.
 */
class ProfileTool
{
public:
    ProfileTool() = default;

    // Scans @p folder, reads the RTDOSE and beam @p beamIndex of the RTPLAN
    void loadFolder(const QString &folder, int beamIndex = 0,
                    InterpolationMethod method = InterpolationMethod::Linear);
    void setInputs(std::unique_ptr<DoseGrid> grid, const BeamGeometry &beam);

    bool hasInputs() const { return m_grid != nullptr; }
    const DoseGrid &grid() const;
    const BeamGeometry &beam() const { return m_beam; }
    const DicomFolderContents &folderContents() const { return m_contents; }

    // CAX/surface intercept in mm, nullopt when the beam geometry is incomplete
    std::optional<cv::Vec3d> zeroPoint(
        ZeroPointDerivation mode = ZeroPointDerivation::InterceptCaxSurface) const;

    Profile profile(const LineSegment &segment, const ProfileOptions &options);
    std::vector<Profile> profiles(const std::vector<LineSegment> &segments,
                                  const ProfileOptions &options);

    // Reads segments, extracts all profiles and writes them; returns the profile count
    std::size_t profilesFromFile(const QString &pointsPath, const QString &outputPath,
                                 const ProfileOptions &options);

private:
    DoseGrid &requireGrid() const;

    std::unique_ptr<DoseGrid> m_grid;
    BeamGeometry m_beam;
    DicomFolderContents m_contents;
};

} // namespace DoseProfile

#endif // DOSEPROFILE_APP_PROFILE_TOOL_H
