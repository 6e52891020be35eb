#include <gtest/gtest.h>

#include "core/errors.h"
#include "io/profile_csv_writer.h"

#include <QFile>
#include <QTemporaryDir>

using namespace DoseProfile;

namespace {

Profile makeProfile(DoseUnit unit, bool perMu)
{
    Profile profile;
    profile.doseUnit = unit;
    profile.muNormalized = perMu;
    profile.coordinateUnit = LengthUnit::Centimetre;
    profile.samples.push_back({1.0, 2.0, 3.0, 0.5});
    profile.samples.push_back({-1.23456, 0.0, 10.5, 123.4567});
    return profile;
}

} // namespace

TEST(ProfileCsvWriterTest, FormatsNumberedBlocks) {
    const QString text = ProfileCsvWriter::format({makeProfile(DoseUnit::Gy, false),
                                                   makeProfile(DoseUnit::CGy, true)});
    const QString expected =
        "1\n"
        "Crossline (X),Inline (Z),Depth (Y),Dose (Gy)\n"
        "1.000,2.000,3.000,0.500\n"
        "-1.235,0.000,10.500,123.457\n"
        "\n\n"
        "2\n"
        "Crossline (X),Inline (Z),Depth (Y),Dose (cGy/MU)\n"
        "1.000,2.000,3.000,0.500\n"
        "-1.235,0.000,10.500,123.457\n"
        "\n\n";
    EXPECT_EQ(text, expected);
}

TEST(ProfileCsvWriterTest, EmptyBatchWritesNothing) {
    EXPECT_TRUE(ProfileCsvWriter::format({}).isEmpty());
}

TEST(ProfileCsvWriterTest, WritesAndReplacesFile) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("out.CSV");
    {
        QFile old(path);
        ASSERT_TRUE(old.open(QIODevice::WriteOnly));
        old.write("stale content that is longer than the new file\n"
                  "stale content that is longer than the new file\n"
                  "stale content that is longer than the new file\n"
                  "stale content that is longer than the new file\n");
    }
    const std::vector<Profile> profiles{makeProfile(DoseUnit::Gy, false)};
    ProfileCsvWriter::write(path, profiles);

    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly | QIODevice::Text));
    EXPECT_EQ(QString::fromUtf8(file.readAll()), ProfileCsvWriter::format(profiles));
}

TEST(ProfileCsvWriterTest, OnlyCsvExtensionIsAccepted) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("out.txt");
    EXPECT_THROW(ProfileCsvWriter::write(path, {makeProfile(DoseUnit::Gy, false)}), ProfileFileError);
    EXPECT_FALSE(QFile::exists(path));
}
