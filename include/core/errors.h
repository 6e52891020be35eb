#ifndef DOSEPROFILE_CORE_ERRORS_H
#define DOSEPROFILE_CORE_ERRORS_H

#include <QString>
#include <cstddef>
#include <stdexcept>

namespace DoseProfile {

// Base class for every failure raised by the profile tool.
class ProfileToolError : public std::runtime_error
{
public:
    explicit ProfileToolError(const QString &message)
        : std::runtime_error(message.toStdString())
    {}
};

// index->patient transform is not invertible
class DegenerateGeometryError : public ProfileToolError
{
public:
    DegenerateGeometryError(const QString &message, double determinant)
        : ProfileToolError(message)
        , m_determinant(determinant)
    {}

    double determinant() const { return m_determinant; }

private:
    double m_determinant;
};

class MissingGridMetadataError : public ProfileToolError
{
public:
    explicit MissingGridMetadataError(const QString &field)
        : ProfileToolError(QStringLiteral("Dose grid metadata is missing required field: %1").arg(field))
        , m_field(field)
    {}

    const QString &field() const { return m_field; }

private:
    QString m_field;
};

class UnsupportedInterpolationMethodError : public ProfileToolError
{
public:
    explicit UnsupportedInterpolationMethodError(const QString &method)
        : ProfileToolError(QStringLiteral("Interpolation method '%1' not supported. Supported are \"nearest\" and \"linear\"")
                               .arg(method))
        , m_method(method)
    {}

    const QString &method() const { return m_method; }

private:
    QString m_method;
};

class DimensionMismatchError : public ProfileToolError
{
public:
    DimensionMismatchError(const QString &what, int expected, int actual)
        : ProfileToolError(QStringLiteral("%1: expected %2 components, got %3")
                               .arg(what).arg(expected).arg(actual))
        , m_expected(expected)
        , m_actual(actual)
    {}

    int expected() const { return m_expected; }
    int actual() const { return m_actual; }

private:
    int m_expected;
    int m_actual;
};

// RELATIVE dose cannot be converted without a reference the tool does not model.
class UnsupportedDoseUnitError : public ProfileToolError
{
public:
    explicit UnsupportedDoseUnitError(const QString &units)
        : ProfileToolError(QStringLiteral("DICOM dose units == \"%1\". Relative dose not supported.").arg(units))
        , m_units(units)
    {}

    const QString &units() const { return m_units; }

private:
    QString m_units;
};

class InvalidDoseUnitError : public ProfileToolError
{
public:
    explicit InvalidDoseUnitError(const QString &units)
        : ProfileToolError(QStringLiteral("Invalid dose units %1").arg(units))
        , m_units(units)
    {}

    const QString &units() const { return m_units; }

private:
    QString m_units;
};

class ZeroPointUnavailableError : public ProfileToolError
{
public:
    ZeroPointUnavailableError()
        : ProfileToolError(QStringLiteral("Zero point requested at the CAX/surface intercept, "
                                          "but the beam is missing isocenter, gantry angle, SSD or SAD"))
    {}
};

class InvalidSpacingError : public ProfileToolError
{
public:
    explicit InvalidSpacingError(double spacing)
        : ProfileToolError(QStringLiteral("Profile spacing must be a positive finite number (got %1)").arg(spacing))
        , m_spacing(spacing)
    {}

    double spacing() const { return m_spacing; }

private:
    double m_spacing;
};

class InvalidProfilePointError : public ProfileToolError
{
public:
    explicit InvalidProfilePointError(const QString &what)
        : ProfileToolError(QStringLiteral("Profile end points must be finite: %1").arg(what))
    {}
};

// distance / spacing would produce more samples than a profile may hold
class SampleCountLimitError : public ProfileToolError
{
public:
    SampleCountLimitError(double distance, double spacing, std::size_t limit)
        : ProfileToolError(QStringLiteral("Profile of length %1 at spacing %2 exceeds %3 samples")
                               .arg(distance).arg(spacing).arg(static_cast<qulonglong>(limit)))
    {}
};

class DicomReadError : public ProfileToolError
{
public:
    DicomReadError(const QString &path, const QString &reason)
        : ProfileToolError(QStringLiteral("%1: %2").arg(path, reason))
        , m_path(path)
    {}

    const QString &path() const { return m_path; }

private:
    QString m_path;
};

class ProfileFileError : public ProfileToolError
{
public:
    ProfileFileError(const QString &path, const QString &reason, int line = -1)
        : ProfileToolError(line > 0 ? QStringLiteral("%1 (line %2): %3").arg(path).arg(line).arg(reason)
                                    : QStringLiteral("%1: %2").arg(path, reason))
        , m_path(path)
        , m_line(line)
    {}

    const QString &path() const { return m_path; }
    int line() const { return m_line; }

private:
    QString m_path;
    int m_line;
};

} // namespace DoseProfile

#endif // DOSEPROFILE_CORE_ERRORS_H
