#include "dicom/dicom_attributes.h"

#include <QStringList>

namespace DoseProfile {
namespace DicomAttributes {

std::vector<double> readAllNumbers(DcmItem &item, const DcmTagKey &tag)
{
    std::vector<double> values;
    OFString text;
    if (item.findAndGetOFStringArray(tag, text).bad()) {
        return values;
    }
    const QStringList parts = QString::fromLatin1(text.c_str())
                                  .split(QLatin1Char('\\'), Qt::SkipEmptyParts);
    values.reserve(static_cast<std::size_t>(parts.size()));
    for (const QString &part : parts) {
        bool ok = false;
        const double v = part.trimmed().toDouble(&ok);
        if (!ok) {
            return {};
        }
        values.push_back(v);
    }
    return values;
}

std::optional<std::vector<double>> readNumbers(DcmItem &item, const DcmTagKey &tag,
                                               std::size_t count)
{
    std::vector<double> values = readAllNumbers(item, tag);
    if (values.size() < count) {
        return std::nullopt;
    }
    values.resize(count);
    return values;
}

std::optional<double> readNumber(DcmItem &item, const DcmTagKey &tag)
{
    const auto values = readNumbers(item, tag, 1);
    if (!values) {
        return std::nullopt;
    }
    return values->front();
}

QString readString(DcmItem &item, const DcmTagKey &tag)
{
    OFString value;
    if (item.findAndGetOFString(tag, value).good()) {
        return QString::fromLatin1(value.c_str()).trimmed();
    }
    return QString();
}

} // namespace DicomAttributes
} // namespace DoseProfile
