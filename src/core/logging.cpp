#include "core/logging.h"

namespace DoseProfile {

// Debug output is off by default; "--verbose" turns on doseprofile.*.debug
Q_LOGGING_CATEGORY(GeometryLog, "doseprofile.geometry", QtInfoMsg)
Q_LOGGING_CATEGORY(DoseLog, "doseprofile.dose", QtInfoMsg)
Q_LOGGING_CATEGORY(ProfileLog, "doseprofile.profile", QtInfoMsg)
Q_LOGGING_CATEGORY(DicomLog, "doseprofile.dicom", QtInfoMsg)
Q_LOGGING_CATEGORY(IoLog, "doseprofile.io", QtInfoMsg)
Q_LOGGING_CATEGORY(AppLog, "doseprofile.app", QtInfoMsg)

} // namespace DoseProfile
