#ifndef DOSEPROFILE_DICOM_DICOM_ATTRIBUTES_H
#define DOSEPROFILE_DICOM_DICOM_ATTRIBUTES_H

#include <QString>
#include <dcmtk/dcmdata/dctk.h>
#include <optional>
#include <vector>

namespace DoseProfile {
namespace DicomAttributes {

// Multi-valued DS/IS read through its backslash separated string form.
// nullopt when the element is absent or has fewer than @p count values.
std::optional<std::vector<double>> readNumbers(DcmItem &item, const DcmTagKey &tag,
                                               std::size_t count);

// All values of a multi-valued numeric element (empty when absent)
std::vector<double> readAllNumbers(DcmItem &item, const DcmTagKey &tag);

std::optional<double> readNumber(DcmItem &item, const DcmTagKey &tag);

// Trimmed string value, empty when absent
QString readString(DcmItem &item, const DcmTagKey &tag);

} // namespace DicomAttributes
} // namespace DoseProfile

#endif // DOSEPROFILE_DICOM_DICOM_ATTRIBUTES_H
