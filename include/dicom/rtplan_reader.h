#ifndef DOSEPROFILE_DICOM_RTPLAN_READER_H
#define DOSEPROFILE_DICOM_RTPLAN_READER_H

#include "geometry/beam_geometry.h"

#include <QString>

class DcmDataset;

namespace DoseProfile {

/**
 * @brief Resolves the beam geometry of one RTPLAN beam
 *
 * Beam Sequence item -> SAD, name, number; first Control Point -> isocenter,
 * SSD, gantry angle. Monitor units come from the Fraction Group Sequence
 * (Beam Meterset of the referenced beam), else from the beam's
 * FinalCumulativeMetersetWeight. Absent attributes stay empty.
 */
class RTPlanReader
{
public:
    static BeamGeometry read(const QString &path, int beamIndex = 0);
    static BeamGeometry readDataset(DcmDataset &dataset, int beamIndex = 0,
                                    const QString &origin = QString());
    static int beamCount(DcmDataset &dataset);
};

} // namespace DoseProfile

#endif // DOSEPROFILE_DICOM_RTPLAN_READER_H
