#ifndef DOSEPROFILE_PROFILE_PROFILE_H
#define DOSEPROFILE_PROFILE_PROFILE_H

#include "dose/dose_units.h"

#include <QString>
#include <opencv2/core.hpp>
#include <cstddef>
#include <vector>

namespace DoseProfile {

struct ProfileSample {
    double x{0.0};
    double y{0.0};
    double z{0.0};
    double dose{0.0};
};

enum class LengthUnit { Millimetre, Centimetre };

/**
 * @brief Reference point that reported profile coordinates are relative to
 */
struct ZeroPoint {
    enum class Mode {
        Origin,              // patient coordinate origin, no offset
        Explicit,            // caller supplied point
        CaxSurfaceIntercept  // derived from the beam geometry
    };

    Mode mode{Mode::CaxSurfaceIntercept};
    cv::Vec3d point{0.0, 0.0, 0.0};

    static ZeroPoint origin() { return {Mode::Origin, cv::Vec3d(0.0, 0.0, 0.0)}; }
    static ZeroPoint at(const cv::Vec3d &p) { return {Mode::Explicit, p}; }
    static ZeroPoint caxSurfaceIntercept() { return {Mode::CaxSurfaceIntercept, cv::Vec3d(0.0, 0.0, 0.0)}; }
};

// Samples along one line segment. Coordinates are relative to zeroPoint,
// dose is absolute in doseUnit (per MU when muNormalized).
struct Profile {
    std::vector<ProfileSample> samples;
    DoseUnit doseUnit{DoseUnit::Gy};
    bool muNormalized{false};
    cv::Vec3d zeroPoint{0.0, 0.0, 0.0};
    LengthUnit coordinateUnit{LengthUnit::Millimetre};

    std::size_t size() const { return samples.size(); }
    bool empty() const { return samples.empty(); }

    // Header spelling: "Gy", "cGy", "Gy/MU", "cGy/MU"
    QString doseUnitLabel() const {
        QString label = DoseProfile::doseUnitLabel(doseUnit);
        if (muNormalized) {
            label += QStringLiteral("/MU");
        }
        return label;
    }
};

} // namespace DoseProfile

#endif // DOSEPROFILE_PROFILE_PROFILE_H
