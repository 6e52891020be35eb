#include "dose/grid_interpolator.h"

#include "core/errors.h"
#include "core/logging.h"

#include <algorithm>
#include <cmath>

namespace DoseProfile {

InterpolationMethod parseInterpolationMethod(const QString &name)
{
    const QString key = name.trimmed().toLower();
    if (key == QLatin1String("nearest")) {
        return InterpolationMethod::Nearest;
    }
    if (key == QLatin1String("linear")) {
        return InterpolationMethod::Linear;
    }
    throw UnsupportedInterpolationMethodError(name);
}

QString interpolationMethodName(InterpolationMethod method)
{
    switch (method) {
    case InterpolationMethod::Nearest:
        return QStringLiteral("nearest");
    case InterpolationMethod::Linear:
        return QStringLiteral("linear");
    }
    return QString();
}

GridInterpolator::GridInterpolator(const cv::Mat &volume, InterpolationMethod method)
    : m_volume(volume)
    , m_method(method)
{
    if (method != InterpolationMethod::Nearest && method != InterpolationMethod::Linear) {
        throw UnsupportedInterpolationMethodError(QString::number(static_cast<int>(method)));
    }
    if (volume.empty()) {
        throw MissingGridMetadataError(QStringLiteral("PixelData"));
    }
    if (volume.dims != 3) {
        throw DimensionMismatchError(QStringLiteral("Dose volume"), 3, volume.dims);
    }
    if (volume.type() != CV_64F) {
        volume.convertTo(m_volume, CV_64F);
    } else if (!volume.isContinuous()) {
        m_volume = volume.clone();
    }
    m_frames = m_volume.size[0];
    m_rows = m_volume.size[1];
    m_columns = m_volume.size[2];
    qCDebug(DoseLog) << "Interpolator ready:" << interpolationMethodName(m_method)
                     << m_columns << "x" << m_rows << "x" << m_frames;
}

double GridInterpolator::evaluate(const cv::Vec3d &index) const
{
    const double i = index[0];
    const double j = index[1];
    const double k = index[2];
    // NaN も範囲外として扱う
    if (!(i >= 0.0 && i <= m_columns - 1) ||
        !(j >= 0.0 && j <= m_rows - 1) ||
        !(k >= 0.0 && k <= m_frames - 1)) {
        return 0.0;
    }
    return (m_method == InterpolationMethod::Nearest) ? evaluateNearest(i, j, k)
                                                      : evaluateLinear(i, j, k);
}

std::vector<double> GridInterpolator::evaluate(const std::vector<cv::Vec3d> &indices) const
{
    std::vector<double> values;
    values.reserve(indices.size());
    for (const cv::Vec3d &index : indices) {
        values.push_back(evaluate(index));
    }
    return values;
}

double GridInterpolator::evaluateNearest(double i, double j, double k) const
{
    auto nearest = [](double x, int n) {
        const int lower = static_cast<int>(std::floor(x));
        const int idx = (x - lower <= 0.5) ? lower : lower + 1;
        return std::min(idx, n - 1);
    };
    return voxel(nearest(i, m_columns), nearest(j, m_rows), nearest(k, m_frames));
}

double GridInterpolator::evaluateLinear(double i, double j, double k) const
{
    const int i0 = static_cast<int>(std::floor(i));
    const int j0 = static_cast<int>(std::floor(j));
    const int k0 = static_cast<int>(std::floor(k));

    // On the last node the upper neighbour is clamped; its weight is zero there.
    const int i1 = std::min(i0 + 1, m_columns - 1);
    const int j1 = std::min(j0 + 1, m_rows - 1);
    const int k1 = std::min(k0 + 1, m_frames - 1);

    const double fi = i - i0;
    const double fj = j - j0;
    const double fk = k - k0;

    const double v000 = voxel(i0, j0, k0);
    const double v100 = voxel(i1, j0, k0);
    const double v010 = voxel(i0, j1, k0);
    const double v110 = voxel(i1, j1, k0);
    const double v001 = voxel(i0, j0, k1);
    const double v101 = voxel(i1, j0, k1);
    const double v011 = voxel(i0, j1, k1);
    const double v111 = voxel(i1, j1, k1);

    const double c00 = v000 * (1.0 - fi) + v100 * fi;
    const double c10 = v010 * (1.0 - fi) + v110 * fi;
    const double c01 = v001 * (1.0 - fi) + v101 * fi;
    const double c11 = v011 * (1.0 - fi) + v111 * fi;

    const double c0 = c00 * (1.0 - fj) + c10 * fj;
    const double c1 = c01 * (1.0 - fj) + c11 * fj;

    return c0 * (1.0 - fk) + c1 * fk;
}

} // namespace DoseProfile
