#ifndef DOSEPROFILE_GEOMETRY_BEAM_GEOMETRY_H
#define DOSEPROFILE_GEOMETRY_BEAM_GEOMETRY_H

#include <QString>
#include <opencv2/core.hpp>
#include <optional>

namespace DoseProfile {

enum class ZeroPointDerivation {
    // Central axis / patient surface crossing, gantry rotating in the
    // transverse (XY) plane.
    InterceptCaxSurface
};

/**
 * @brief Beam delivery parameters of one RT plan beam
 *
 * Lengths in mm (same unit as the dose grid), gantry angle in degrees.
 * Fields the plan does not provide stay empty.
 */
struct BeamGeometry {
    std::optional<cv::Vec3d> isocenter;
    std::optional<double> gantryAngle;
    std::optional<double> ssd;
    std::optional<double> sad;
    std::optional<double> monitorUnits;

    QString beamName;
    int beamNumber{0};

    bool isComplete() const { return isocenter && gantryAngle && ssd && sad; }

    // std::nullopt when isocenter, gantry angle, SSD or SAD is missing
    std::optional<cv::Vec3d> deriveZeroPoint(
        ZeroPointDerivation mode = ZeroPointDerivation::InterceptCaxSurface) const;
};

} // namespace DoseProfile

#endif // DOSEPROFILE_GEOMETRY_BEAM_GEOMETRY_H
