#ifndef DOSEPROFILE_PROFILE_PROFILE_SAMPLER_H
#define DOSEPROFILE_PROFILE_PROFILE_SAMPLER_H

#include "dose/dose_grid.h"
#include "geometry/beam_geometry.h"
#include "profile/profile.h"

#include <cstddef>
#include <vector>

namespace DoseProfile {

/**
 * @brief Samples a DoseGrid along a straight segment
 *
 * Stateless apart from the grid and beam it reads; sample() is a pure
 * function of its arguments, so one sampler may serve several threads once
 * the grid interpolator is built.
 *
 * The number of samples is floor(distance / spacing) + 1 and both endpoints
 * are always included, so the realised spacing is never coarser than the
 * requested one.
 */
class ProfileSampler
{
public:
    ProfileSampler(const DoseGrid &grid, const BeamGeometry &beam);

    /**
     * @brief Samples in the grid's native unit (mm)
     * @param p0 Start point, patient coordinates relative to the zero point
     * @param p1 End point, patient coordinates relative to the zero point
     * @param spacing Requested distance between samples
     * @param zeroPoint Reference for input and reported coordinates
     * @param requestedUnit Output dose unit
     * @param normalizeByMonitorUnits Divide by the beam MU when available
     */
    Profile sample(const std::vector<double> &p0,
                   const std::vector<double> &p1,
                   double spacing,
                   const ZeroPoint &zeroPoint = ZeroPoint::origin(),
                   DoseUnit requestedUnit = DoseUnit::Gy,
                   bool normalizeByMonitorUnits = false) const;

    // Same as sample() with every length (points, spacing, explicit zero
    // point, reported coordinates) in centimetres.
    Profile sampleCentimetres(const std::vector<double> &p0,
                              const std::vector<double> &p1,
                              double spacing,
                              const ZeroPoint &zeroPoint = ZeroPoint::origin(),
                              DoseUnit requestedUnit = DoseUnit::Gy,
                              bool normalizeByMonitorUnits = false) const;

    // Throws ZeroPointUnavailableError when the intercept cannot be derived.
    cv::Vec3d resolveZeroPoint(const ZeroPoint &zeroPoint) const;

    // Throws InvalidSpacingError, InvalidProfilePointError for a non-finite
    // distance and SampleCountLimitError above kMaxSamples.
    static std::size_t sampleCount(double distance, double spacing);

    static constexpr double kMillimetresPerCentimetre = 10.0;
    static constexpr std::size_t kMaxSamples = 10000000;

private:
    const DoseGrid &m_grid;
    const BeamGeometry &m_beam;
};

} // namespace DoseProfile

#endif // DOSEPROFILE_PROFILE_PROFILE_SAMPLER_H
