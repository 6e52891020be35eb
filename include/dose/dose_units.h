#ifndef DOSEPROFILE_DOSE_DOSE_UNITS_H
#define DOSEPROFILE_DOSE_DOSE_UNITS_H

#include <QString>

namespace DoseProfile {

// DoseUnits (3004,0002) values. RELATIVE cannot be used for profiles.
enum class DoseUnit { Gy, CGy, Relative };

// Accepts "GY", "CGY", "RELATIVE" in any case; throws InvalidDoseUnitError otherwise.
DoseUnit parseDoseUnit(const QString &text);

// DICOM spelling ("GY", "CGY", "RELATIVE")
QString doseUnitCode(DoseUnit unit);

// Display spelling ("Gy", "cGy", "Relative"), also used in output headers
QString doseUnitLabel(DoseUnit unit);

/**
 * @brief Factor applied to doses stored in @p native to express them in @p requested
 *
 * Same unit gives 1, GY to CGY gives 100. Throws UnsupportedDoseUnitError
 * when @p native is Relative and InvalidDoseUnitError for any other pair
 * (requested Relative, native CGY requested as GY).
 */
double doseConversionFactor(DoseUnit native, DoseUnit requested);

} // namespace DoseProfile

#endif // DOSEPROFILE_DOSE_DOSE_UNITS_H
