#include "dicom/rtplan_reader.h"

#include "core/errors.h"
#include "core/logging.h"
#include "dicom/dicom_attributes.h"

#include <dcmtk/dcmdata/dctk.h>

namespace DoseProfile {

namespace {

std::optional<double> beamMeterset(DcmDataset &ds, int beamNumber)
{
    DcmSequenceOfItems *fractionSeq = nullptr;
    if (ds.findAndGetSequence(DCM_FractionGroupSequence, fractionSeq).bad() || !fractionSeq) {
        return std::nullopt;
    }
    for (unsigned long i = 0; i < fractionSeq->card(); ++i) {
        DcmItem *fractionItem = fractionSeq->getItem(i);
        DcmSequenceOfItems *refBeamSeq = nullptr;
        if (!fractionItem
            || fractionItem->findAndGetSequence(DCM_ReferencedBeamSequence, refBeamSeq).bad()
            || !refBeamSeq) {
            continue;
        }
        for (unsigned long j = 0; j < refBeamSeq->card(); ++j) {
            DcmItem *refItem = refBeamSeq->getItem(j);
            if (!refItem) {
                continue;
            }
            const auto number = DicomAttributes::readNumber(*refItem, DCM_ReferencedBeamNumber);
            if (number && static_cast<int>(*number) == beamNumber) {
                return DicomAttributes::readNumber(*refItem, DCM_BeamMeterset);
            }
        }
    }
    return std::nullopt;
}

} // namespace

BeamGeometry RTPlanReader::read(const QString &path, int beamIndex)
{
    qCDebug(DicomLog) << "Loading RTPLAN" << path << "beam" << beamIndex;

    DcmFileFormat file;
    const OFCondition status = file.loadFile(path.toLocal8Bit().data());
    if (status.bad()) {
        throw DicomReadError(path, QStringLiteral("cannot load file (%1)").arg(QString::fromLatin1(status.text())));
    }
    return readDataset(*file.getDataset(), beamIndex, path);
}

int RTPlanReader::beamCount(DcmDataset &ds)
{
    DcmSequenceOfItems *beamSeq = nullptr;
    if (ds.findAndGetSequence(DCM_BeamSequence, beamSeq).bad() || !beamSeq) {
        return 0;
    }
    return static_cast<int>(beamSeq->card());
}

BeamGeometry RTPlanReader::readDataset(DcmDataset &ds, int beamIndex, const QString &origin)
{
    using namespace DicomAttributes;

    DcmSequenceOfItems *beamSeq = nullptr;
    if (ds.findAndGetSequence(DCM_BeamSequence, beamSeq).bad() || !beamSeq) {
        throw DicomReadError(origin, QStringLiteral("RTPLAN has no Beam Sequence"));
    }
    if (beamIndex < 0 || static_cast<unsigned long>(beamIndex) >= beamSeq->card()) {
        throw DicomReadError(origin, QStringLiteral("beam index %1 out of range (%2 beams)")
                                         .arg(beamIndex).arg(beamSeq->card()));
    }
    DcmItem *beamItem = beamSeq->getItem(static_cast<unsigned long>(beamIndex));
    if (!beamItem) {
        throw DicomReadError(origin, QStringLiteral("beam %1 cannot be read").arg(beamIndex));
    }

    BeamGeometry beam;
    beam.beamName = readString(*beamItem, DCM_BeamName);
    if (const auto number = readNumber(*beamItem, DCM_BeamNumber)) {
        beam.beamNumber = static_cast<int>(*number);
    }
    beam.sad = readNumber(*beamItem, DCM_SourceAxisDistance);

    DcmItem *controlPoint = nullptr;
    if (beamItem->findAndGetSequenceItem(DCM_ControlPointSequence, controlPoint, 0).good() && controlPoint) {
        if (const auto iso = readNumbers(*controlPoint, DCM_IsocenterPosition, 3)) {
            beam.isocenter = cv::Vec3d((*iso)[0], (*iso)[1], (*iso)[2]);
        }
        beam.ssd = readNumber(*controlPoint, DCM_SourceToSurfaceDistance);
        beam.gantryAngle = readNumber(*controlPoint, DCM_GantryAngle);
    }

    beam.monitorUnits = beamMeterset(ds, beam.beamNumber);
    if (!beam.monitorUnits) {
        beam.monitorUnits = readNumber(*beamItem, DCM_FinalCumulativeMetersetWeight);
    }

    qCDebug(DicomLog) << "Beam" << beam.beamNumber << beam.beamName
                      << "SAD" << beam.sad.value_or(-1.0)
                      << "SSD" << beam.ssd.value_or(-1.0)
                      << "gantry" << beam.gantryAngle.value_or(-1.0)
                      << "MU" << beam.monitorUnits.value_or(-1.0);
    return beam;
}

} // namespace DoseProfile
