#ifndef DOSEPROFILE_IO_PROFILE_CSV_WRITER_H
#define DOSEPROFILE_IO_PROFILE_CSV_WRITER_H

#include "profile/profile.h"

#include <QString>
#include <vector>

namespace DoseProfile {

/**
 * @brief Writes profiles as numbered CSV blocks
 *
 * Each block: sequence number (from 1), header
 * "Crossline (X),Inline (Z),Depth (Y),Dose (<units>)", one row per sample
 * with three decimals, then two blank lines.
 */
class ProfileCsvWriter
{
public:
    // Only ".csv" paths are accepted; an existing file is replaced.
    static void write(const QString &path, const std::vector<Profile> &profiles);
    static QString format(const std::vector<Profile> &profiles);
};

} // namespace DoseProfile

#endif // DOSEPROFILE_IO_PROFILE_CSV_WRITER_H
