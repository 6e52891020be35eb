#ifndef DOSEPROFILE_APP_PROFILE_OPTIONS_H
#define DOSEPROFILE_APP_PROFILE_OPTIONS_H

#include "dose/dose_units.h"
#include "dose/grid_interpolator.h"
#include "profile/profile.h"

#include <QChar>

namespace DoseProfile {

// Per-run extraction settings. Lengths in centimetres.
struct ProfileOptions {
    double spacing{0.1};
    InterpolationMethod interpolation{InterpolationMethod::Linear};
    DoseUnit doseUnit{DoseUnit::Gy};
    bool normalizeByMonitorUnits{false};
    ZeroPoint::Mode zeroPoint{ZeroPoint::Mode::CaxSurfaceIntercept};
    cv::Vec3d explicitZeroPoint{0.0, 0.0, 0.0}; // only with ZeroPoint::Mode::Explicit
    QChar delimiter{QLatin1Char(',')};
    int skipRows{2};
    int beamIndex{0};
    bool parallelBatch{false};

    ZeroPoint resolvedZeroPoint() const
    {
        switch (zeroPoint) {
        case ZeroPoint::Mode::Origin:
            return ZeroPoint::origin();
        case ZeroPoint::Mode::Explicit:
            return ZeroPoint::at(explicitZeroPoint);
        case ZeroPoint::Mode::CaxSurfaceIntercept:
            break;
        }
        return ZeroPoint::caxSurfaceIntercept();
    }
};

} // namespace DoseProfile

#endif // DOSEPROFILE_APP_PROFILE_OPTIONS_H
