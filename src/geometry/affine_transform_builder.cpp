#include "geometry/affine_transform_builder.h"

#include "core/errors.h"
#include "core/logging.h"

#include <QString>
#include <cmath>

namespace DoseProfile {

cv::Matx44d AffineTransformBuilder::build(const ImageGeometry &geometry)
{
    const cv::Vec3d &r = geometry.rowDirection;
    const cv::Vec3d &c = geometry.columnDirection;
    const cv::Vec3d s = r.cross(c);

    // 行・列方向が平行だとスライス方向が定義できない
    if (cv::norm(s) < kDegenerateTolerance) {
        throw DegenerateGeometryError(
            QStringLiteral("Image orientation row (%1,%2,%3) and column (%4,%5,%6) directions are not linearly independent")
                .arg(r[0]).arg(r[1]).arg(r[2]).arg(c[0]).arg(c[1]).arg(c[2]),
            0.0);
    }

    const double dc = geometry.columnSpacing;
    const double dr = geometry.rowSpacing;
    const double dt = geometry.sliceThickness;
    const cv::Vec3d &o = geometry.imagePosition;

    const cv::Matx44d transform(r[0] * dc, c[0] * dr, s[0] * dt, o[0],
                                r[1] * dc, c[1] * dr, s[1] * dt, o[1],
                                r[2] * dc, c[2] * dr, s[2] * dt, o[2],
                                0.0,       0.0,       0.0,       1.0);

    const double det = cv::determinant(transform);
    if (!std::isfinite(det) || std::abs(det) < kDegenerateTolerance) {
        throw DegenerateGeometryError(
            QStringLiteral("Index to patient transform is singular (det=%1, spacing %2 x %3, thickness %4)")
                .arg(det).arg(dr).arg(dc).arg(dt),
            det);
    }

    qCDebug(GeometryLog) << "Index->patient transform built, det =" << det
                         << "origin" << o[0] << o[1] << o[2];
    return transform;
}

cv::Matx44d AffineTransformBuilder::invert(const cv::Matx44d &transform)
{
    const double det = cv::determinant(transform);
    if (!std::isfinite(det) || std::abs(det) < kDegenerateTolerance) {
        throw DegenerateGeometryError(
            QStringLiteral("Cannot invert singular transform (det=%1)").arg(det), det);
    }
    return transform.inv(cv::DECOMP_LU);
}

cv::Vec3d AffineTransformBuilder::apply(const cv::Matx44d &transform, const cv::Vec3d &point)
{
    const cv::Vec4d h = transform * cv::Vec4d(point[0], point[1], point[2], 1.0);
    return cv::Vec3d(h[0], h[1], h[2]);
}

} // namespace DoseProfile
