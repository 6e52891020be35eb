#include "dose/dose_units.h"

#include "core/errors.h"

namespace DoseProfile {

DoseUnit parseDoseUnit(const QString &text)
{
    const QString code = text.trimmed().toUpper();
    if (code == QLatin1String("GY")) {
        return DoseUnit::Gy;
    }
    if (code == QLatin1String("CGY")) {
        return DoseUnit::CGy;
    }
    if (code == QLatin1String("RELATIVE")) {
        return DoseUnit::Relative;
    }
    throw InvalidDoseUnitError(text);
}

QString doseUnitCode(DoseUnit unit)
{
    switch (unit) {
    case DoseUnit::Gy:
        return QStringLiteral("GY");
    case DoseUnit::CGy:
        return QStringLiteral("CGY");
    case DoseUnit::Relative:
        return QStringLiteral("RELATIVE");
    }
    return QString();
}

QString doseUnitLabel(DoseUnit unit)
{
    switch (unit) {
    case DoseUnit::Gy:
        return QStringLiteral("Gy");
    case DoseUnit::CGy:
        return QStringLiteral("cGy");
    case DoseUnit::Relative:
        return QStringLiteral("Relative");
    }
    return QString();
}

double doseConversionFactor(DoseUnit native, DoseUnit requested)
{
    if (native == DoseUnit::Relative) {
        throw UnsupportedDoseUnitError(doseUnitCode(native));
    }
    if (requested == DoseUnit::Relative) {
        throw InvalidDoseUnitError(doseUnitCode(requested));
    }
    if (native == requested) {
        return 1.0;
    }
    if (native == DoseUnit::Gy && requested == DoseUnit::CGy) {
        return 100.0;
    }
    // cGy grids are only reported as stored
    throw InvalidDoseUnitError(doseUnitCode(native));
}

} // namespace DoseProfile
