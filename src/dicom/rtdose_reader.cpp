#include "dicom/rtdose_reader.h"

#include "core/errors.h"
#include "core/logging.h"
#include "dicom/dicom_attributes.h"

#include <dcmtk/dcmdata/dctk.h>
#include <algorithm>
#include <cmath>
#include <cstring>
#include <vector>

namespace DoseProfile {

namespace {

// GridFrameOffsetVector spacing when the offsets are evenly spaced
std::optional<double> uniformFrameSpacing(const std::vector<double> &offsets)
{
    if (offsets.size() < 2) {
        return std::nullopt;
    }
    const double step = offsets[1] - offsets[0];
    for (std::size_t i = 2; i < offsets.size(); ++i) {
        if (std::abs((offsets[i] - offsets[i - 1]) - step) > 1e-4) {
            return std::nullopt;
        }
    }
    if (std::abs(step) <= 0.0) {
        return std::nullopt;
    }
    return step;
}

template <typename T>
void copyFrames(const T *data, cv::Mat &dst)
{
    double *out = dst.ptr<double>();
    const std::size_t total = dst.total();
    for (std::size_t i = 0; i < total; ++i) {
        out[i] = static_cast<double>(data[i]);
    }
}

} // namespace

DoseGridSource RTDoseReader::read(const QString &path)
{
    qCDebug(DicomLog) << "Loading RTDOSE" << path;

    DcmFileFormat file;
    const OFCondition status = file.loadFile(path.toLocal8Bit().data());
    if (status.bad()) {
        throw DicomReadError(path, QStringLiteral("cannot load file (%1)").arg(QString::fromLatin1(status.text())));
    }
    return readDataset(*file.getDataset(), path);
}

DoseGridSource RTDoseReader::readDataset(DcmDataset &ds, const QString &origin)
{
    using namespace DicomAttributes;

    DoseGridSource source;

    const QString modality = readString(ds, DCM_Modality);
    if (!modality.isEmpty() && modality != QLatin1String("RTDOSE")) {
        throw DicomReadError(origin, QStringLiteral("modality is %1, expected RTDOSE").arg(modality));
    }

    if (const auto ipp = readNumbers(ds, DCM_ImagePositionPatient, 3)) {
        source.imagePosition = cv::Vec3d((*ipp)[0], (*ipp)[1], (*ipp)[2]);
    }
    if (const auto iop = readNumbers(ds, DCM_ImageOrientationPatient, 6)) {
        std::array<double, 6> orientation{};
        std::copy(iop->begin(), iop->end(), orientation.begin());
        source.imageOrientation = orientation;
    }
    if (const auto spacing = readNumbers(ds, DCM_PixelSpacing, 2)) {
        source.pixelSpacing = std::array<double, 2>{(*spacing)[0], (*spacing)[1]};
    }

    // マルチフレーム RTDOSE では SliceThickness が空のことが多い
    std::optional<double> thickness = readNumber(ds, DCM_SliceThickness);
    if (!thickness || *thickness == 0.0) {
        const std::vector<double> offsets = readAllNumbers(ds, DCM_GridFrameOffsetVector);
        if (const auto step = uniformFrameSpacing(offsets)) {
            qCWarning(DicomLog) << "SliceThickness missing in" << origin
                                << "- using GridFrameOffsetVector spacing" << *step;
            thickness = step;
        } else if (thickness) {
            thickness.reset();
        }
    }
    source.sliceThickness = thickness;

    source.gridScaling = readNumber(ds, DCM_DoseGridScaling);
    const QString units = readString(ds, DCM_DoseUnits);
    if (!units.isEmpty()) {
        source.doseUnits = units;
    }
    source.frameOfReferenceUid = readString(ds, DCM_FrameOfReferenceUID);

    Uint16 rows = 0;
    Uint16 cols = 0;
    ds.findAndGetUint16(DCM_Rows, rows);
    ds.findAndGetUint16(DCM_Columns, cols);
    int frames = 1;
    const QString framesText = readString(ds, DCM_NumberOfFrames);
    if (!framesText.isEmpty()) {
        bool ok = false;
        const int value = framesText.toInt(&ok);
        if (ok && value > 0) {
            frames = value;
        }
    }
    qCDebug(DicomLog) << "RTDOSE grid" << cols << "x" << rows << "x" << frames
                      << "units" << units << "scaling" << source.gridScaling.value_or(0.0);

    DcmElement *pixelElement = nullptr;
    if (ds.findAndGetElement(DCM_PixelData, pixelElement).bad() || !pixelElement) {
        // DoseGrid reports the missing PixelData
        return source;
    }
    if (rows == 0 || cols == 0) {
        throw DicomReadError(origin, QStringLiteral("Rows/Columns missing for pixel data"));
    }

    ds.chooseRepresentation(EXS_LittleEndianExplicit, nullptr);

    Uint16 bitsAllocated = 16;
    Uint16 pixelRepresentation = 0;
    ds.findAndGetUint16(DCM_BitsAllocated, bitsAllocated);
    ds.findAndGetUint16(DCM_PixelRepresentation, pixelRepresentation);

    const int sizes[3] = {frames, static_cast<int>(rows), static_cast<int>(cols)};
    cv::Mat pixels(3, sizes, CV_64F);
    const unsigned long expected = static_cast<unsigned long>(pixels.total());
    unsigned long count = 0;

    if (bitsAllocated == 16) {
        // PixelData is OW; signed samples share the word layout
        const Uint16 *data = nullptr;
        if (ds.findAndGetUint16Array(DCM_PixelData, data, &count).good() && data && count >= expected) {
            if (pixelRepresentation == 1) {
                std::vector<Sint16> signedData(expected);
                std::memcpy(signedData.data(), data, expected * sizeof(Sint16));
                copyFrames(signedData.data(), pixels);
            } else {
                copyFrames(data, pixels);
            }
        } else {
            count = 0;
        }
    } else if (bitsAllocated == 32) {
        const Uint32 *data32 = nullptr;
        const Sint32 *dataS32 = nullptr;
        const Uint16 *data16 = nullptr;
        if (pixelRepresentation == 1
            && ds.findAndGetSint32Array(DCM_PixelData, dataS32, &count).good() && dataS32 && count >= expected) {
            copyFrames(dataS32, pixels);
        } else if (pixelRepresentation == 0
                   && ds.findAndGetUint32Array(DCM_PixelData, data32, &count).good() && data32 && count >= expected) {
            copyFrames(data32, pixels);
        } else if (ds.findAndGetUint16Array(DCM_PixelData, data16, &count).good() && data16
                   && count >= 2 * expected) {
            // 32-bit samples stored as OW words
            std::vector<Uint32> packed(expected);
            std::memcpy(packed.data(), data16, expected * sizeof(Uint32));
            if (pixelRepresentation == 1) {
                std::vector<Sint32> signedPacked(expected);
                std::memcpy(signedPacked.data(), packed.data(), expected * sizeof(Sint32));
                copyFrames(signedPacked.data(), pixels);
            } else {
                copyFrames(packed.data(), pixels);
            }
            count = expected;
        } else {
            count = 0;
        }
    } else {
        throw DicomReadError(origin, QStringLiteral("unsupported BitsAllocated %1").arg(bitsAllocated));
    }

    if (count < expected) {
        throw DicomReadError(origin, QStringLiteral("pixel data shorter than %1 x %2 x %3")
                                         .arg(cols).arg(rows).arg(frames));
    }
    source.pixels = pixels;
    return source;
}

} // namespace DoseProfile
