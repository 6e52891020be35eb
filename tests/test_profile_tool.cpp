#include <gtest/gtest.h>

#include "app/profile_tool.h"
#include "core/errors.h"
#include "dicom_fixtures.h"
#include "test_support.h"

#include <QFile>
#include <QTemporaryDir>

using namespace DoseProfile;
using namespace DoseProfile::Testing;

namespace {

// Dose grid x -10..10 mm with dose x + 11 Gy, beam zero point at the origin, 200 MU
class ProfileToolTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(dir.isValid());
        ASSERT_TRUE(writeRtDose(dir.filePath("RD.dcm")));
        ASSERT_TRUE(writeRtPlan(dir.filePath("RP.dcm")));

        pointsPath = dir.filePath("points.csv");
        QFile points(pointsPath);
        ASSERT_TRUE(points.open(QIODevice::WriteOnly | QIODevice::Text));
        points.write("Inline,,Crossline,,Depth,\n"
                     "z0,z1,x0,x1,y0,y1\n"
                     "0,0,-0.5,0.5,0,0\n"
                     "0.1,0.1,0,0,-0.1,0.1\n");
        points.close();

        tool.loadFolder(dir.path());
    }

    QTemporaryDir dir;
    QString pointsPath;
    ProfileTool tool;
};

std::vector<LineSegment> twoSegments()
{
    return {{{-0.5, 0.0, 0.0}, {0.5, 0.0, 0.0}, 3}, {{0.0, -0.1, 0.1}, {0.0, 0.1, 0.1}, 4}};
}

} // namespace

TEST_F(ProfileToolTest, LoadsDoseAndPlanFromFolder) {
    ASSERT_TRUE(tool.hasInputs());
    EXPECT_EQ(tool.grid().columns(), 21);
    EXPECT_EQ(tool.beam().beamName, QStringLiteral("AP"));
    const std::optional<cv::Vec3d> zero = tool.zeroPoint();
    ASSERT_TRUE(zero.has_value());
    EXPECT_NEAR(cv::norm(*zero), 0.0, 1e-12);
}

TEST_F(ProfileToolTest, ExtractsProfilesInCentimetres) {
    const std::vector<Profile> profiles = tool.profiles(twoSegments(), ProfileOptions());
    ASSERT_EQ(profiles.size(), 2u);

    ASSERT_EQ(profiles[0].size(), 11u);
    EXPECT_NEAR(profiles[0].samples.front().x, -0.5, 1e-12);
    EXPECT_NEAR(profiles[0].samples.front().dose, 6.0, 1e-4);
    EXPECT_NEAR(profiles[0].samples[5].dose, 11.0, 1e-4);
    EXPECT_NEAR(profiles[0].samples.back().dose, 16.0, 1e-4);

    ASSERT_EQ(profiles[1].size(), 3u);
    EXPECT_NEAR(profiles[1].samples[1].z, 0.1, 1e-12);
    EXPECT_NEAR(profiles[1].samples[1].dose, 11.0, 1e-4);
}

TEST_F(ProfileToolTest, CentigrayPerMonitorUnit) {
    ProfileOptions options;
    options.doseUnit = DoseUnit::CGy;
    options.normalizeByMonitorUnits = true;
    const Profile profile = tool.profile(twoSegments().front(), options);
    EXPECT_NEAR(profile.samples.front().dose, 600.0 / 200.0, 1e-4);
    EXPECT_EQ(profile.doseUnitLabel(), QStringLiteral("cGy/MU"));
}

TEST_F(ProfileToolTest, ParallelBatchMatchesSequential) {
    std::vector<LineSegment> segments;
    for (int n = 0; n < 16; ++n) {
        const double y = -0.15 + 0.02 * n;
        segments.push_back({{-0.9, y, 0.05}, {0.9, y, -0.05}, n + 3});
    }
    ProfileOptions options;
    const std::vector<Profile> sequential = tool.profiles(segments, options);
    options.parallelBatch = true;
    const std::vector<Profile> parallel = tool.profiles(segments, options);

    ASSERT_EQ(sequential.size(), parallel.size());
    for (std::size_t n = 0; n < sequential.size(); ++n) {
        ASSERT_EQ(sequential[n].size(), parallel[n].size());
        for (std::size_t i = 0; i < sequential[n].size(); ++i) {
            EXPECT_EQ(sequential[n].samples[i].dose, parallel[n].samples[i].dose);
            EXPECT_EQ(sequential[n].samples[i].x, parallel[n].samples[i].x);
        }
    }
}

TEST_F(ProfileToolTest, WritesProfilesFile) {
    const QString output = dir.filePath("profiles.csv");
    EXPECT_EQ(tool.profilesFromFile(pointsPath, output, ProfileOptions()), 2u);

    QFile file(output);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly | QIODevice::Text));
    const QString text = QString::fromUtf8(file.readAll());
    EXPECT_TRUE(text.startsWith("1\n"
                                "Crossline (X),Inline (Z),Depth (Y),Dose (Gy)\n"
                                "-0.500,0.000,0.000,6.000\n"
                                "-0.400,0.000,0.000,7.000\n"));
    EXPECT_TRUE(text.contains("\n\n\n2\nCrossline (X)"));
    EXPECT_TRUE(text.endsWith("0.000,0.100,0.100,11.000\n\n\n"));
}

TEST_F(ProfileToolTest, FailedBatchWritesNoFile) {
    BeamGeometry incomplete = tool.beam();
    incomplete.ssd.reset();
    tool.setInputs(std::make_unique<DoseGrid>(makeRampSource()), incomplete);

    const QString output = dir.filePath("profiles.csv");
    EXPECT_THROW(tool.profilesFromFile(pointsPath, output, ProfileOptions()), ZeroPointUnavailableError);
    EXPECT_FALSE(QFile::exists(output));

    ProfileOptions parallel;
    parallel.parallelBatch = true;
    EXPECT_THROW(tool.profiles(twoSegments(), parallel), ZeroPointUnavailableError);

    parallel.zeroPoint = ZeroPoint::Mode::Origin;
    EXPECT_EQ(tool.profiles(twoSegments(), parallel).size(), 2u);
}

TEST_F(ProfileToolTest, ExplicitZeroPointInCentimetres) {
    ProfileOptions options;
    options.zeroPoint = ZeroPoint::Mode::Explicit;
    options.explicitZeroPoint = cv::Vec3d(0.5, 0.0, 0.0);
    const Profile profile = tool.profile({{0.0, 0.0, 0.0}, {0.0, 0.0, 0.0}, 0}, options);
    ASSERT_EQ(profile.size(), 1u);
    EXPECT_NEAR(profile.samples[0].dose, 16.0, 1e-4);
}

TEST(ProfileToolWithoutInputsTest, ExtractionNeedsInputs) {
    ProfileTool tool;
    EXPECT_FALSE(tool.hasInputs());
    EXPECT_THROW(tool.profile({{0.0, 0.0, 0.0}, {1.0, 0.0, 0.0}, 0}, ProfileOptions()), ProfileToolError);
    EXPECT_THROW(tool.setInputs(nullptr, BeamGeometry()), ProfileToolError);
    EXPECT_THROW(tool.loadFolder("/nonexistent/dose-profile-folder"), DicomReadError);
}
