#ifndef DOSEPROFILE_DOSE_DOSE_GRID_H
#define DOSEPROFILE_DOSE_DOSE_GRID_H

#include "dose/dose_units.h"
#include "dose/grid_interpolator.h"
#include "geometry/affine_transform_builder.h"

#include <QReadWriteLock>
#include <QString>
#include <opencv2/core.hpp>
#include <array>
#include <memory>
#include <optional>
#include <vector>

namespace DoseProfile {

/**
 * @brief Dose grid values as delivered by a dataset reader
 *
 * Every field is optional so that the reader can hand over whatever it
 * found; DoseGrid decides what is required.
 */
struct DoseGridSource {
    std::optional<cv::Vec3d> imagePosition;               // (0020,0032)
    std::optional<std::array<double, 6>> imageOrientation; // (0020,0037) row xyz, column xyz
    std::optional<std::array<double, 2>> pixelSpacing;     // (0028,0030) row, column
    std::optional<double> sliceThickness;                  // (0018,0050)
    std::optional<double> gridScaling;                     // (3004,000E)
    std::optional<QString> doseUnits;                      // (3004,0002)
    cv::Mat pixels;                                        // raw stored values, frames x rows x columns
    QString frameOfReferenceUid;
};

/**
 * @brief Scaled RT dose volume queried in patient coordinates
 *
 * Owns voxels * DoseGridScaling, the index->patient transform and its
 * inverse. The interpolator is built lazily: changing the method moves it
 * to the stale state and the next query rebuilds it. Queries and rebuilds
 * are serialised by a read/write lock, so a grid may be shared by threads
 * extracting different profiles.
 */
class DoseGrid
{
public:
    explicit DoseGrid(const DoseGridSource &source,
                      InterpolationMethod method = InterpolationMethod::Linear);

    DoseGrid(const DoseGrid&) = delete;
    DoseGrid& operator=(const DoseGrid&) = delete;

    std::vector<double> evaluatePatientPoints(const std::vector<cv::Vec3d> &points) const;
    double evaluatePatientPoint(const cv::Vec3d &point) const;

    void setInterpolationMethod(InterpolationMethod method);
    InterpolationMethod interpolationMethod() const;
    bool interpolatorReady() const;
    // Incremented on every interpolator rebuild
    int interpolatorGeneration() const;
    // Builds the interpolator now instead of on the next query
    void prepareInterpolator() const;

    const cv::Mat &doseArray() const { return m_dose; }
    DoseUnit units() const { return m_units; }
    const cv::Matx44d &indexToPatient() const { return m_indexToPatient; }
    const cv::Matx44d &patientToIndex() const { return m_patientToIndex; }
    const ImageGeometry &geometry() const { return m_geometry; }
    const QString &frameOfReferenceUid() const { return m_frameUid; }

    int columns() const { return m_dose.size[2]; }
    int rows() const { return m_dose.size[1]; }
    int frames() const { return m_dose.size[0]; }
    double maxDose() const { return m_maxDose; }

    cv::Vec3d voxelToPatient(const cv::Vec3d &index) const;
    cv::Vec3d patientToVoxel(const cv::Vec3d &patient) const;

private:
    enum class InterpolatorState { Stale, Ready };

    std::shared_ptr<const GridInterpolator> interpolator() const;

    cv::Mat m_dose; // float64 3D: frames x rows x columns, already scaled
    DoseUnit m_units{DoseUnit::Gy};
    ImageGeometry m_geometry;
    cv::Matx44d m_indexToPatient;
    cv::Matx44d m_patientToIndex;
    QString m_frameUid;
    double m_maxDose{0.0};

    mutable QReadWriteLock m_lock;
    InterpolationMethod m_method;
    mutable InterpolatorState m_state{InterpolatorState::Stale};
    mutable std::shared_ptr<const GridInterpolator> m_interpolator;
    mutable int m_generation{0};
};

} // namespace DoseProfile

#endif // DOSEPROFILE_DOSE_DOSE_GRID_H
