#ifndef DOSEPROFILE_DICOM_DICOM_FOLDER_SCANNER_H
#define DOSEPROFILE_DICOM_DICOM_FOLDER_SCANNER_H

#include <QMap>
#include <QString>
#include <QStringList>

namespace DoseProfile {

struct DicomFolderContents {
    QString folder;
    // Modality -> file. CT images are not recorded.
    QMap<QString, QString> filesByModality;
    QStringList skippedFiles;

    QString rtDosePath() const { return filesByModality.value(QStringLiteral("RTDOSE")); }
    QString rtPlanPath() const { return filesByModality.value(QStringLiteral("RTPLAN")); }
    bool hasRtDose() const { return filesByModality.contains(QStringLiteral("RTDOSE")); }
    bool hasRtPlan() const { return filesByModality.contains(QStringLiteral("RTPLAN")); }

    // Throws DicomReadError naming the missing modality
    void requireRtDoseAndPlan() const;
};

class DicomFolderScanner
{
public:
    // Recursive walk over *.dcm files; throws DicomReadError if the folder does not exist.
    static DicomFolderContents scan(const QString &folder);

    // Empty when the file cannot be loaded or has no Modality
    static QString readModality(const QString &path);

    // DCMTK text dump of the whole file
    static QString dumpFile(const QString &path);
};

} // namespace DoseProfile

#endif // DOSEPROFILE_DICOM_DICOM_FOLDER_SCANNER_H
