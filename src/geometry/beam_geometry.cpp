#include "geometry/beam_geometry.h"

#include "core/logging.h"

#include <QtMath>
#include <cmath>

namespace DoseProfile {

std::optional<cv::Vec3d> BeamGeometry::deriveZeroPoint(ZeroPointDerivation mode) const
{
    switch (mode) {
    case ZeroPointDerivation::InterceptCaxSurface: {
        if (!isComplete()) {
            qCDebug(GeometryLog) << "Zero point unavailable for beam" << beamName
                                 << "iso" << bool(isocenter) << "gantry" << bool(gantryAngle)
                                 << "ssd" << bool(ssd) << "sad" << bool(sad);
            return std::nullopt;
        }
        // The surface lies (SAD - SSD) from the isocenter toward the source.
        const double theta = qDegreesToRadians(*gantryAngle);
        const double offset = *ssd - *sad;
        const cv::Vec3d &iso = *isocenter;
        return cv::Vec3d(iso[0] - offset * std::sin(theta),
                         iso[1] + offset * std::cos(theta),
                         iso[2]);
    }
    }
    return std::nullopt;
}

} // namespace DoseProfile
