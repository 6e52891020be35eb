#ifndef DOSEPROFILE_CORE_LOGGING_H
#define DOSEPROFILE_CORE_LOGGING_H

#include <QLoggingCategory>

namespace DoseProfile {

Q_DECLARE_LOGGING_CATEGORY(GeometryLog)
Q_DECLARE_LOGGING_CATEGORY(DoseLog)
Q_DECLARE_LOGGING_CATEGORY(ProfileLog)
Q_DECLARE_LOGGING_CATEGORY(DicomLog)
Q_DECLARE_LOGGING_CATEGORY(IoLog)
Q_DECLARE_LOGGING_CATEGORY(AppLog)

} // namespace DoseProfile

#endif // DOSEPROFILE_CORE_LOGGING_H
