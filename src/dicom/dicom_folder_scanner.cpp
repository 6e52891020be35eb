#include "dicom/dicom_folder_scanner.h"

#include "core/errors.h"
#include "core/logging.h"

#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <dcmtk/dcmdata/dctk.h>
#include <sstream>

namespace DoseProfile {

void DicomFolderContents::requireRtDoseAndPlan() const
{
    if (!hasRtDose()) {
        throw DicomReadError(folder, QStringLiteral("no RTDOSE file found"));
    }
    if (!hasRtPlan()) {
        throw DicomReadError(folder, QStringLiteral("no RTPLAN file found"));
    }
}

QString DicomFolderScanner::readModality(const QString &path)
{
    DcmFileFormat ff;
    // Header only; pixel data is not needed to classify the file
    if (ff.loadFileUntilTag(path.toLocal8Bit().data(), EXS_Unknown, EGL_noChange,
                            DCM_MaxReadLength, ERM_autoDetect, DCM_PixelData).bad()) {
        return QString();
    }
    OFString value;
    if (ff.getDataset()->findAndGetOFString(DCM_Modality, value).good()) {
        return QString::fromLatin1(value.c_str()).trimmed().toUpper();
    }
    return QString();
}

QString DicomFolderScanner::dumpFile(const QString &path)
{
    DcmFileFormat ff;
    const OFCondition status = ff.loadFile(path.toLocal8Bit().data());
    if (status.bad()) {
        throw DicomReadError(path, QStringLiteral("cannot load file (%1)").arg(QString::fromLatin1(status.text())));
    }
    std::ostringstream out;
    ff.print(out);
    return QString::fromStdString(out.str());
}

DicomFolderContents DicomFolderScanner::scan(const QString &folder)
{
    const QFileInfo info(folder);
    if (!info.exists() || !info.isDir()) {
        throw DicomReadError(folder, QStringLiteral("folder does not exist"));
    }

    DicomFolderContents contents;
    contents.folder = info.absoluteFilePath();

    QStringList files;
    QDirIterator it(folder, QStringList() << QStringLiteral("*.dcm") << QStringLiteral("*.DCM"),
                    QDir::Files, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        files << it.next();
    }
    // Stable "last file wins" regardless of directory enumeration order
    files.sort();
    files.removeDuplicates();

    for (const QString &path : files) {
        const QString modality = readModality(path);
        if (modality.isEmpty()) {
            qCWarning(DicomLog) << "Skipping unreadable DICOM file" << path;
            contents.skippedFiles << path;
            continue;
        }
        if (modality == QLatin1String("CT")) {
            continue;
        }
        if (contents.filesByModality.contains(modality)) {
            qCWarning(DicomLog) << "Multiple" << modality << "files in" << folder << "- using" << path;
        }
        contents.filesByModality.insert(modality, path);
    }

    qCInfo(DicomLog) << "Scanned" << files.size() << "files in" << contents.folder
                     << "modalities" << contents.filesByModality.keys();
    return contents;
}

} // namespace DoseProfile
