#include "dose/dose_grid.h"

#include "core/errors.h"
#include "core/logging.h"

#include <QReadLocker>
#include <QWriteLocker>

namespace DoseProfile {

DoseGrid::DoseGrid(const DoseGridSource &source, InterpolationMethod method)
    : m_frameUid(source.frameOfReferenceUid)
    , m_method(method)
{
    if (!source.imagePosition) {
        throw MissingGridMetadataError(QStringLiteral("ImagePositionPatient"));
    }
    if (!source.imageOrientation) {
        throw MissingGridMetadataError(QStringLiteral("ImageOrientationPatient"));
    }
    if (!source.pixelSpacing) {
        throw MissingGridMetadataError(QStringLiteral("PixelSpacing"));
    }
    if (!source.sliceThickness) {
        throw MissingGridMetadataError(QStringLiteral("SliceThickness"));
    }
    if (!source.gridScaling) {
        throw MissingGridMetadataError(QStringLiteral("DoseGridScaling"));
    }
    if (!source.doseUnits) {
        throw MissingGridMetadataError(QStringLiteral("DoseUnits"));
    }
    if (source.pixels.empty()) {
        throw MissingGridMetadataError(QStringLiteral("PixelData"));
    }
    if (source.pixels.dims != 3) {
        throw DimensionMismatchError(QStringLiteral("Dose pixel array"), 3, source.pixels.dims);
    }
    if (method != InterpolationMethod::Nearest && method != InterpolationMethod::Linear) {
        throw UnsupportedInterpolationMethodError(QString::number(static_cast<int>(method)));
    }

    m_units = parseDoseUnit(*source.doseUnits);

    const std::array<double, 6> &iop = *source.imageOrientation;
    m_geometry.imagePosition = *source.imagePosition;
    m_geometry.rowDirection = cv::Vec3d(iop[0], iop[1], iop[2]);
    m_geometry.columnDirection = cv::Vec3d(iop[3], iop[4], iop[5]);
    m_geometry.rowSpacing = (*source.pixelSpacing)[0];
    m_geometry.columnSpacing = (*source.pixelSpacing)[1];
    m_geometry.sliceThickness = *source.sliceThickness;

    m_indexToPatient = AffineTransformBuilder::build(m_geometry);
    m_patientToIndex = AffineTransformBuilder::invert(m_indexToPatient);

    source.pixels.convertTo(m_dose, CV_64F, *source.gridScaling);

    double minValue = 0.0;
    cv::minMaxIdx(m_dose, &minValue, &m_maxDose);

    qCDebug(DoseLog) << "Dose grid" << columns() << "x" << rows() << "x" << frames()
                     << "units" << doseUnitCode(m_units)
                     << "scaling" << *source.gridScaling
                     << "max" << m_maxDose;
}

std::shared_ptr<const GridInterpolator> DoseGrid::interpolator() const
{
    {
        QReadLocker reader(&m_lock);
        if (m_state == InterpolatorState::Ready) {
            return m_interpolator;
        }
    }
    QWriteLocker writer(&m_lock);
    // 別スレッドが先に再構築している可能性がある
    if (m_state != InterpolatorState::Ready) {
        m_interpolator = std::make_shared<const GridInterpolator>(m_dose, m_method);
        m_state = InterpolatorState::Ready;
        ++m_generation;
        qCDebug(DoseLog) << "Interpolator rebuilt, generation" << m_generation;
    }
    return m_interpolator;
}

void DoseGrid::prepareInterpolator() const
{
    interpolator();
}

void DoseGrid::setInterpolationMethod(InterpolationMethod method)
{
    if (method != InterpolationMethod::Nearest && method != InterpolationMethod::Linear) {
        throw UnsupportedInterpolationMethodError(QString::number(static_cast<int>(method)));
    }
    QWriteLocker writer(&m_lock);
    if (method == m_method) {
        return;
    }
    m_method = method;
    m_state = InterpolatorState::Stale;
    m_interpolator.reset();
}

InterpolationMethod DoseGrid::interpolationMethod() const
{
    QReadLocker reader(&m_lock);
    return m_method;
}

bool DoseGrid::interpolatorReady() const
{
    QReadLocker reader(&m_lock);
    return m_state == InterpolatorState::Ready;
}

int DoseGrid::interpolatorGeneration() const
{
    QReadLocker reader(&m_lock);
    return m_generation;
}

cv::Vec3d DoseGrid::voxelToPatient(const cv::Vec3d &index) const
{
    return AffineTransformBuilder::apply(m_indexToPatient, index);
}

cv::Vec3d DoseGrid::patientToVoxel(const cv::Vec3d &patient) const
{
    return AffineTransformBuilder::apply(m_patientToIndex, patient);
}

std::vector<double> DoseGrid::evaluatePatientPoints(const std::vector<cv::Vec3d> &points) const
{
    std::vector<cv::Vec3d> indices;
    indices.reserve(points.size());
    for (const cv::Vec3d &p : points) {
        indices.push_back(patientToVoxel(p));
    }
    return interpolator()->evaluate(indices);
}

double DoseGrid::evaluatePatientPoint(const cv::Vec3d &point) const
{
    return interpolator()->evaluate(patientToVoxel(point));
}

} // namespace DoseProfile
