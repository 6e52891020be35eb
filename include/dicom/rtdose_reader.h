#ifndef DOSEPROFILE_DICOM_RTDOSE_READER_H
#define DOSEPROFILE_DICOM_RTDOSE_READER_H

#include "dose/dose_grid.h"

#include <QString>

class DcmDataset;

namespace DoseProfile {

/**
 * @brief Reads the dose grid attributes of an RTDOSE object
 *
 * Attributes the dataset lacks are left empty in the returned source;
 * DoseGrid decides which of them are required. Only unreadable files and
 * pixel data that do not match Rows x Columns x NumberOfFrames raise
 * DicomReadError here.
 */
class RTDoseReader
{
public:
    static DoseGridSource read(const QString &path);
    // @p origin only labels error messages
    static DoseGridSource readDataset(DcmDataset &dataset, const QString &origin = QString());
};

} // namespace DoseProfile

#endif // DOSEPROFILE_DICOM_RTDOSE_READER_H
