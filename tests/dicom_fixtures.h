#ifndef DOSEPROFILE_TESTS_DICOM_FIXTURES_H
#define DOSEPROFILE_TESTS_DICOM_FIXTURES_H

#include <QString>
#include <QStringList>
#include <dcmtk/dcmdata/dctk.h>
#include <opencv2/core.hpp>
#include <cstdint>
#include <cstring>
#include <functional>
#include <vector>

namespace DoseProfile {
namespace Testing {

// Synthetic RTDOSE: 1 mm voxels, identity orientation.
// Default dose is (i + 1) Gy at column i.
struct DoseFixture {
    int columns{21};
    int rows{5};
    int frames{5};
    cv::Vec3d origin{-10.0, -2.0, -2.0};
    double scaling{0.001};
    QString units{QStringLiteral("GY")};
    bool sliceThickness{true};
    bool frameOffsets{true};
    bool pixelData{true};
    int bitsAllocated{16};
    bool signedPixels{false};
    std::function<std::int64_t(int, int, int)> raw = [](int i, int, int) {
        return static_cast<std::int64_t>((i + 1) * 1000);
    };
};

inline QString joinNumbers(const std::vector<double> &values)
{
    QStringList parts;
    for (double v : values) {
        parts << QString::number(v, 'g', 10);
    }
    return parts.join(QLatin1Char('\\'));
}

inline void putString(DcmItem &item, const DcmTagKey &tag, const QString &value)
{
    item.putAndInsertString(tag, value.toLatin1().constData());
}

inline void fillRtDose(DcmDataset &ds, const DoseFixture &f)
{
    char uid[100];
    ds.putAndInsertString(DCM_SOPClassUID, UID_RTDoseStorage);
    ds.putAndInsertString(DCM_SOPInstanceUID, dcmGenerateUniqueIdentifier(uid, SITE_INSTANCE_UID_ROOT));
    ds.putAndInsertString(DCM_Modality, "RTDOSE");
    ds.putAndInsertString(DCM_FrameOfReferenceUID, "1.2.826.0.1.3680043.2.1125.1");

    ds.putAndInsertUint16(DCM_Rows, static_cast<Uint16>(f.rows));
    ds.putAndInsertUint16(DCM_Columns, static_cast<Uint16>(f.columns));
    putString(ds, DCM_NumberOfFrames, QString::number(f.frames));
    ds.putAndInsertString(DCM_PixelSpacing, "1\\1");
    putString(ds, DCM_ImagePositionPatient, joinNumbers({f.origin[0], f.origin[1], f.origin[2]}));
    ds.putAndInsertString(DCM_ImageOrientationPatient, "1\\0\\0\\0\\1\\0");
    if (f.sliceThickness) {
        ds.putAndInsertString(DCM_SliceThickness, "1");
    }
    if (f.frameOffsets) {
        std::vector<double> offsets;
        for (int k = 0; k < f.frames; ++k) {
            offsets.push_back(k);
        }
        putString(ds, DCM_GridFrameOffsetVector, joinNumbers(offsets));
    }
    putString(ds, DCM_DoseGridScaling, QString::number(f.scaling, 'g', 10));
    if (!f.units.isEmpty()) {
        putString(ds, DCM_DoseUnits, f.units);
    }

    ds.putAndInsertUint16(DCM_SamplesPerPixel, 1);
    ds.putAndInsertString(DCM_PhotometricInterpretation, "MONOCHROME2");
    ds.putAndInsertUint16(DCM_BitsAllocated, static_cast<Uint16>(f.bitsAllocated));
    ds.putAndInsertUint16(DCM_BitsStored, static_cast<Uint16>(f.bitsAllocated));
    ds.putAndInsertUint16(DCM_HighBit, static_cast<Uint16>(f.bitsAllocated - 1));
    ds.putAndInsertUint16(DCM_PixelRepresentation, f.signedPixels ? 1 : 0);

    if (!f.pixelData) {
        return;
    }
    const std::size_t count = static_cast<std::size_t>(f.columns) * f.rows * f.frames;
    if (f.bitsAllocated == 16) {
        std::vector<Uint16> words(count);
        std::size_t n = 0;
        for (int k = 0; k < f.frames; ++k) {
            for (int j = 0; j < f.rows; ++j) {
                for (int i = 0; i < f.columns; ++i) {
                    words[n++] = static_cast<Uint16>(static_cast<Sint16>(f.raw(i, j, k)) & 0xFFFF);
                }
            }
        }
        ds.putAndInsertUint16Array(DCM_PixelData, words.data(), static_cast<unsigned long>(words.size()));
    } else {
        std::vector<Uint32> values(count);
        std::size_t n = 0;
        for (int k = 0; k < f.frames; ++k) {
            for (int j = 0; j < f.rows; ++j) {
                for (int i = 0; i < f.columns; ++i) {
                    values[n++] = static_cast<Uint32>(f.raw(i, j, k));
                }
            }
        }
        std::vector<Uint16> words(count * 2);
        std::memcpy(words.data(), values.data(), count * sizeof(Uint32));
        ds.putAndInsertUint16Array(DCM_PixelData, words.data(), static_cast<unsigned long>(words.size()));
    }
}

inline bool writeRtDose(const QString &path, const DoseFixture &f = DoseFixture())
{
    DcmFileFormat file;
    fillRtDose(*file.getDataset(), f);
    return file.saveFile(path.toLocal8Bit().data(), EXS_LittleEndianExplicit).good();
}

struct PlanFixture {
    cv::Vec3d isocenter{0.0, 0.0, 0.0};
    double gantry{0.0};
    double ssd{1000.0};
    double sad{1000.0};
    bool withSsd{true};
    bool fractionGroup{true};
    double beamMeterset{200.0};
    double finalMetersetWeight{1.0};
};

inline void fillRtPlan(DcmDataset &ds, const PlanFixture &f)
{
    char uid[100];
    ds.putAndInsertString(DCM_SOPClassUID, UID_RTPlanStorage);
    ds.putAndInsertString(DCM_SOPInstanceUID, dcmGenerateUniqueIdentifier(uid, SITE_INSTANCE_UID_ROOT));
    ds.putAndInsertString(DCM_Modality, "RTPLAN");

    // beam 1 follows the fixture, beam 2 is a lateral field with 5 MU
    for (int number = 1; number <= 2; ++number) {
        DcmItem *beam = nullptr;
        ds.findOrCreateSequenceItem(DCM_BeamSequence, beam, -2);
        putString(*beam, DCM_BeamNumber, QString::number(number));
        putString(*beam, DCM_BeamName, number == 1 ? QStringLiteral("AP") : QStringLiteral("LAT"));
        putString(*beam, DCM_SourceAxisDistance, QString::number(f.sad, 'g', 10));
        putString(*beam, DCM_FinalCumulativeMetersetWeight, QString::number(f.finalMetersetWeight, 'g', 10));

        DcmItem *cp = nullptr;
        beam->findOrCreateSequenceItem(DCM_ControlPointSequence, cp, -2);
        putString(*cp, DCM_ControlPointIndex, QStringLiteral("0"));
        putString(*cp, DCM_IsocenterPosition,
                  joinNumbers({f.isocenter[0], f.isocenter[1], f.isocenter[2]}));
        putString(*cp, DCM_GantryAngle, QString::number(number == 1 ? f.gantry : 90.0, 'g', 10));
        if (f.withSsd) {
            putString(*cp, DCM_SourceToSurfaceDistance, QString::number(f.ssd, 'g', 10));
        }
    }

    if (f.fractionGroup) {
        DcmItem *fraction = nullptr;
        ds.findOrCreateSequenceItem(DCM_FractionGroupSequence, fraction, -2);
        for (int number = 1; number <= 2; ++number) {
            DcmItem *ref = nullptr;
            fraction->findOrCreateSequenceItem(DCM_ReferencedBeamSequence, ref, -2);
            putString(*ref, DCM_ReferencedBeamNumber, QString::number(number));
            putString(*ref, DCM_BeamMeterset,
                      QString::number(number == 1 ? f.beamMeterset : 5.0, 'g', 10));
        }
    }
}

inline bool writeRtPlan(const QString &path, const PlanFixture &f = PlanFixture())
{
    DcmFileFormat file;
    fillRtPlan(*file.getDataset(), f);
    return file.saveFile(path.toLocal8Bit().data(), EXS_LittleEndianExplicit).good();
}

} // namespace Testing
} // namespace DoseProfile

#endif // DOSEPROFILE_TESTS_DICOM_FIXTURES_H
