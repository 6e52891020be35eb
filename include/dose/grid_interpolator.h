#ifndef DOSEPROFILE_DOSE_GRID_INTERPOLATOR_H
#define DOSEPROFILE_DOSE_GRID_INTERPOLATOR_H

#include <QString>
#include <opencv2/core.hpp>
#include <vector>

namespace DoseProfile {

enum class InterpolationMethod { Nearest, Linear };

// "nearest" / "linear" (any case). Throws UnsupportedInterpolationMethodError.
InterpolationMethod parseInterpolationMethod(const QString &name);
QString interpolationMethodName(InterpolationMethod method);

/**
 * @brief Interpolates a regular 3-D scalar grid at fractional index coordinates
 *
 * The grid is a CV_64F cv::Mat with dims (frames, rows, columns). Query
 * points are (i, j, k) = (column, row, frame). Points outside [0, n-1] on
 * any axis read exactly 0: the grid is treated as zero padded, so dose
 * profiles leaving the scored volume fall to zero dose.
 *
 * NEAREST picks the closest node with ties going to the lower index.
 * LINEAR is trilinear over the 8 surrounding nodes.
 */
class GridInterpolator
{
public:
    GridInterpolator(const cv::Mat &volume, InterpolationMethod method);

    InterpolationMethod method() const { return m_method; }
    int columns() const { return m_columns; }
    int rows() const { return m_rows; }
    int frames() const { return m_frames; }

    double evaluate(const cv::Vec3d &index) const;
    std::vector<double> evaluate(const std::vector<cv::Vec3d> &indices) const;

private:
    double evaluateNearest(double i, double j, double k) const;
    double evaluateLinear(double i, double j, double k) const;
    double voxel(int i, int j, int k) const {
        return m_volume.ptr<double>(k)[j * m_columns + i];
    }

    cv::Mat m_volume; // float64 3D: frames x rows x columns
    InterpolationMethod m_method;
    int m_columns{0};
    int m_rows{0};
    int m_frames{0};
};

} // namespace DoseProfile

#endif // DOSEPROFILE_DOSE_GRID_INTERPOLATOR_H
