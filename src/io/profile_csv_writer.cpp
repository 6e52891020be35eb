#include "io/profile_csv_writer.h"

#include "core/errors.h"
#include "core/logging.h"

#include <QFileInfo>
#include <QSaveFile>
#include <QTextStream>

namespace DoseProfile {

QString ProfileCsvWriter::format(const std::vector<Profile> &profiles)
{
    QString out;
    QTextStream stream(&out);
    int index = 1;
    for (const Profile &profile : profiles) {
        stream << index++ << '\n';
        stream << "Crossline (X),Inline (Z),Depth (Y),Dose (" << profile.doseUnitLabel() << ")\n";
        // 値は x, y, z の順。ヘッダの列名の並びとは一致しない
        for (const ProfileSample &s : profile.samples) {
            stream << QString::number(s.x, 'f', 3) << ','
                   << QString::number(s.y, 'f', 3) << ','
                   << QString::number(s.z, 'f', 3) << ','
                   << QString::number(s.dose, 'f', 3) << '\n';
        }
        stream << "\n\n";
    }
    stream.flush();
    return out;
}

void ProfileCsvWriter::write(const QString &path, const std::vector<Profile> &profiles)
{
    if (QFileInfo(path).suffix().compare(QLatin1String("csv"), Qt::CaseInsensitive) != 0) {
        throw ProfileFileError(path, QStringLiteral("Only writing to CSV files is supported."));
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        throw ProfileFileError(path, QStringLiteral("cannot open for writing (%1)").arg(file.errorString()));
    }
    file.write(format(profiles).toUtf8());
    if (!file.commit()) {
        throw ProfileFileError(path, QStringLiteral("write failed (%1)").arg(file.errorString()));
    }
    qCInfo(IoLog) << "Wrote" << profiles.size() << "profiles to" << path;
}

} // namespace DoseProfile
