#include "io/profile_points_reader.h"

#include "core/errors.h"
#include "core/logging.h"

#include <QFile>
#include <QStringList>
#include <QTextStream>

#include <cmath>

namespace DoseProfile {

std::vector<LineSegment> ProfilePointsReader::read(const QString &path, QChar delimiter, int skipRows)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        throw ProfileFileError(path, QStringLiteral("cannot open points file (%1)").arg(file.errorString()));
    }
    QTextStream stream(&file);
    return parse(stream.readAll(), delimiter, skipRows, path);
}

std::vector<LineSegment> ProfilePointsReader::parse(const QString &text, QChar delimiter, int skipRows,
                                                    const QString &origin)
{
    std::vector<LineSegment> segments;
    const QStringList lines = text.split(QLatin1Char('\n'));
    for (int i = qMax(skipRows, 0); i < lines.size(); ++i) {
        const QString line = lines.at(i).trimmed();
        if (line.isEmpty()) {
            continue;
        }
        const int lineNumber = i + 1;

        std::vector<double> values;
        const QStringList fields = line.split(delimiter);
        for (const QString &field : fields) {
            const QString trimmed = field.trimmed();
            if (trimmed.isEmpty()) {
                continue;
            }
            bool ok = false;
            const double value = trimmed.toDouble(&ok);
            if (!ok) {
                throw ProfileFileError(origin, QStringLiteral("'%1' is not a number").arg(trimmed), lineNumber);
            }
            if (!std::isfinite(value)) {
                throw ProfileFileError(origin, QStringLiteral("'%1' is not a finite coordinate").arg(trimmed),
                                       lineNumber);
            }
            values.push_back(value);
        }
        if (values.size() != 6) {
            throw ProfileFileError(origin,
                                   QStringLiteral("expected 6 values (z0, z1, x0, x1, y0, y1), got %1")
                                       .arg(values.size()),
                                   lineNumber);
        }

        const double z0 = values[0], z1 = values[1];
        const double x0 = values[2], x1 = values[3];
        const double y0 = values[4], y1 = values[5];
        segments.push_back({{x0, y0, z0}, {x1, y1, z1}, lineNumber});
    }

    qCDebug(IoLog) << "Read" << segments.size() << "profile segments from" << origin;
    return segments;
}

} // namespace DoseProfile
