#include "profile/profile_sampler.h"

#include "core/errors.h"
#include "core/logging.h"

#include <cmath>

namespace DoseProfile {

namespace {

bool isFinite(const cv::Vec3d &p)
{
    return std::isfinite(p[0]) && std::isfinite(p[1]) && std::isfinite(p[2]);
}

cv::Vec3d toVec3(const std::vector<double> &p)
{
    return cv::Vec3d(p[0], p[1], p[2]);
}

} // namespace

ProfileSampler::ProfileSampler(const DoseGrid &grid, const BeamGeometry &beam)
    : m_grid(grid)
    , m_beam(beam)
{
}

std::size_t ProfileSampler::sampleCount(double distance, double spacing)
{
    if (!std::isfinite(spacing) || spacing <= 0.0) {
        throw InvalidSpacingError(spacing);
    }
    if (!std::isfinite(distance) || distance < 0.0) {
        throw InvalidProfilePointError(QStringLiteral("segment length %1").arg(distance));
    }
    const double steps = std::floor(distance / spacing);
    if (!std::isfinite(steps) || steps >= static_cast<double>(kMaxSamples)) {
        throw SampleCountLimitError(distance, spacing, kMaxSamples);
    }
    return static_cast<std::size_t>(steps) + 1;
}

cv::Vec3d ProfileSampler::resolveZeroPoint(const ZeroPoint &zeroPoint) const
{
    switch (zeroPoint.mode) {
    case ZeroPoint::Mode::Origin:
        return cv::Vec3d(0.0, 0.0, 0.0);
    case ZeroPoint::Mode::Explicit:
        return zeroPoint.point;
    case ZeroPoint::Mode::CaxSurfaceIntercept: {
        const std::optional<cv::Vec3d> derived =
            m_beam.deriveZeroPoint(ZeroPointDerivation::InterceptCaxSurface);
        if (!derived) {
            throw ZeroPointUnavailableError();
        }
        return *derived;
    }
    }
    throw ZeroPointUnavailableError();
}

Profile ProfileSampler::sample(const std::vector<double> &p0,
                               const std::vector<double> &p1,
                               double spacing,
                               const ZeroPoint &zeroPoint,
                               DoseUnit requestedUnit,
                               bool normalizeByMonitorUnits) const
{
    if (p0.size() != p1.size()) {
        throw DimensionMismatchError(QStringLiteral("Profile end point must match start point"),
                                     static_cast<int>(p0.size()), static_cast<int>(p1.size()));
    }
    if (p0.size() != 3) {
        throw DimensionMismatchError(QStringLiteral("Profile points must be 3-D"),
                                     3, static_cast<int>(p0.size()));
    }
    if (!std::isfinite(spacing) || spacing <= 0.0) {
        throw InvalidSpacingError(spacing);
    }

    const cv::Vec3d zero = resolveZeroPoint(zeroPoint);
    const cv::Vec3d start = toVec3(p0) + zero;
    const cv::Vec3d end = toVec3(p1) + zero;
    if (!isFinite(start) || !isFinite(end)) {
        throw InvalidProfilePointError(QStringLiteral("(%1, %2, %3) -> (%4, %5, %6)")
                                           .arg(start[0]).arg(start[1]).arg(start[2])
                                           .arg(end[0]).arg(end[1]).arg(end[2]));
    }
    const double distance = cv::norm(end - start);
    const std::size_t count = sampleCount(distance, spacing);

    // linspace: start + i * step, last point pinned to end
    std::vector<cv::Vec3d> points;
    points.reserve(count);
    if (count == 1) {
        points.push_back(start);
    } else {
        const cv::Vec3d step = (end - start) * (1.0 / static_cast<double>(count - 1));
        for (std::size_t i = 0; i + 1 < count; ++i) {
            const double t = static_cast<double>(i);
            points.emplace_back(t * step[0] + start[0],
                                t * step[1] + start[1],
                                t * step[2] + start[2]);
        }
        points.push_back(end);
    }

    const std::vector<double> doses = m_grid.evaluatePatientPoints(points);

    Profile profile;
    profile.zeroPoint = zero;
    profile.coordinateUnit = LengthUnit::Millimetre;
    profile.samples.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const cv::Vec3d rel = points[i] - zero;
        profile.samples.push_back({rel[0], rel[1], rel[2], doses[i]});
    }

    const double factor = doseConversionFactor(m_grid.units(), requestedUnit);
    if (factor != 1.0) {
        for (ProfileSample &s : profile.samples) {
            s.dose *= factor;
        }
    }
    profile.doseUnit = requestedUnit;

    if (normalizeByMonitorUnits) {
        if (m_beam.monitorUnits && *m_beam.monitorUnits > 0.0) {
            const double mu = *m_beam.monitorUnits;
            for (ProfileSample &s : profile.samples) {
                s.dose /= mu;
            }
            profile.muNormalized = true;
        } else {
            qCWarning(ProfileLog) << "Monitor units unavailable for beam" << m_beam.beamName
                                  << "- MU normalization skipped";
        }
    }

    qCDebug(ProfileLog) << "Profile sampled:" << count << "points over" << distance
                        << "mm, spacing" << spacing << "unit" << profile.doseUnitLabel();
    return profile;
}

Profile ProfileSampler::sampleCentimetres(const std::vector<double> &p0,
                                          const std::vector<double> &p1,
                                          double spacing,
                                          const ZeroPoint &zeroPoint,
                                          DoseUnit requestedUnit,
                                          bool normalizeByMonitorUnits) const
{
    auto toMm = [](std::vector<double> p) {
        for (double &v : p) {
            v *= kMillimetresPerCentimetre;
        }
        return p;
    };

    ZeroPoint zeroMm = zeroPoint;
    if (zeroPoint.mode == ZeroPoint::Mode::Explicit) {
        zeroMm.point = zeroPoint.point * kMillimetresPerCentimetre;
    }

    Profile profile = sample(toMm(p0), toMm(p1), spacing * kMillimetresPerCentimetre,
                             zeroMm, requestedUnit, normalizeByMonitorUnits);

    for (ProfileSample &s : profile.samples) {
        s.x /= kMillimetresPerCentimetre;
        s.y /= kMillimetresPerCentimetre;
        s.z /= kMillimetresPerCentimetre;
    }
    profile.zeroPoint = profile.zeroPoint * (1.0 / kMillimetresPerCentimetre);
    profile.coordinateUnit = LengthUnit::Centimetre;
    return profile;
}

} // namespace DoseProfile
