#ifndef DOSEPROFILE_IO_PROFILE_POINTS_READER_H
#define DOSEPROFILE_IO_PROFILE_POINTS_READER_H

#include <QChar>
#include <QString>
#include <vector>

namespace DoseProfile {

// One requested profile, endpoints in centimetres relative to the zero point
struct LineSegment {
    std::vector<double> start; // x, y, z
    std::vector<double> end;
    int sourceLine{0};
};

/**
 * @brief Reads profile endpoints from a delimited text file
 *
 * After @p skipRows header lines every non-blank line must hold six numbers
 * in the order z0, z1, x0, x1, y0, y1 (inline, crossline and depth
 * start/end). Empty fields are ignored.
 */
class ProfilePointsReader
{
public:
    static std::vector<LineSegment> read(const QString &path,
                                         QChar delimiter = QLatin1Char(','),
                                         int skipRows = 2);
    static std::vector<LineSegment> parse(const QString &text,
                                          QChar delimiter = QLatin1Char(','),
                                          int skipRows = 2,
                                          const QString &origin = QString());
};

} // namespace DoseProfile

#endif // DOSEPROFILE_IO_PROFILE_POINTS_READER_H
