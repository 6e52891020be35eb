#ifndef DOSEPROFILE_GEOMETRY_AFFINE_TRANSFORM_BUILDER_H
#define DOSEPROFILE_GEOMETRY_AFFINE_TRANSFORM_BUILDER_H

#include <opencv2/core.hpp>

namespace DoseProfile {

// Geometry of a regularly spaced volume as stored in the Image Plane module.
struct ImageGeometry {
    cv::Vec3d imagePosition{0.0, 0.0, 0.0};  // patient position of voxel (0,0,0), mm
    cv::Vec3d rowDirection{1.0, 0.0, 0.0};   // direction of increasing column index
    cv::Vec3d columnDirection{0.0, 1.0, 0.0}; // direction of increasing row index
    double rowSpacing{1.0};    // PixelSpacing[0]: distance between rows (mm)
    double columnSpacing{1.0}; // PixelSpacing[1]: distance between columns (mm)
    double sliceThickness{1.0};
};

/**
 * @brief Builds the homogeneous voxel-index -> patient transform
 *
 * DICOM PS3.3 Equation C.7.6.2.1-1 extended with the slice axis:
 *
 *   | x |   | Xr*dc  Xc*dr  Xs*dt  Sx | | i |
 *   | y | = | Yr*dc  Yc*dr  Ys*dt  Sy | | j |
 *   | z |   | Zr*dc  Zc*dr  Zs*dt  Sz | | k |
 *   | 1 |   |   0      0      0    1  | | 1 |
 *
 * with i the column index, j the row index, k the frame index and
 * s = r x c the through-slice direction.
 */
class AffineTransformBuilder
{
public:
    static cv::Matx44d build(const ImageGeometry &geometry);

    // patient -> index. Throws DegenerateGeometryError for a singular matrix.
    static cv::Matx44d invert(const cv::Matx44d &transform);

    static cv::Vec3d apply(const cv::Matx44d &transform, const cv::Vec3d &point);

    static constexpr double kDegenerateTolerance = 1e-9;
};

} // namespace DoseProfile

#endif // DOSEPROFILE_GEOMETRY_AFFINE_TRANSFORM_BUILDER_H
