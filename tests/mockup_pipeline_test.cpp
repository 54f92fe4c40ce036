#include "mockup_pipeline/mockup_pipeline.hpp"

#include <gtest/gtest.h>

#include <map>
#include <sstream>

#include "Fixtures.hpp"

using namespace mockup;

namespace {

MockupCatalog sampleCatalog()
{
	MockupCatalog::Entries entries;
	entries[Orientation::Vertical] = {"vertical_small", "vertical_large"};
	entries[Orientation::Horizontal] = {"horizontal_large"};
	return MockupCatalog(std::move(entries));
}

ImageLoader sampleLoader()
{
	std::map<std::string, cv::Mat> images;
	images["vertical_small"] = fixtures::makeMockup(cv::Size(300, 400), cv::Rect(50, 50, 200, 200));  // 1.0
	images["vertical_large"] = fixtures::makeMockup(cv::Size(400, 600), cv::Rect(50, 60, 240, 320));  // 0.75
	images["horizontal_large"] = fixtures::makeMockup(cv::Size(600, 400), cv::Rect(40, 40, 480, 240)); // 2.0
	return [images](const std::string &path) {
		auto it = images.find(path);
		return it == images.end() ? cv::Mat() : it->second;
	};
}

} // namespace

TEST(MockupPipelineTest, TallArtworkUsesClosestVerticalMockup)
{
	std::ostringstream progress;
	cv::Mat art = fixtures::makeArtwork(cv::Size(300, 400)); // 0.75

	auto result = runMockupPipeline(sampleCatalog(), art, MockupSettings{}, progress, sampleLoader());
	ASSERT_TRUE(result.ok()) << result.error().message;

	const MockupResult &r = result.value();
	EXPECT_EQ(r.orientation, Orientation::Vertical);
	EXPECT_EQ(r.match.mockupPath, "vertical_large");
	EXPECT_EQ(r.match.frame, cv::Rect(50, 60, 240, 320));
	EXPECT_EQ(r.image.size(), cv::Size(400, 600));
	EXPECT_EQ(r.artworkPx, cv::Size(300, 400));
	EXPECT_DOUBLE_EQ(r.widthIn, 300.0 / 96.0);
	EXPECT_DOUBLE_EQ(r.heightIn, 400.0 / 96.0);
}

TEST(MockupPipelineTest, WideArtworkUsesHorizontalMockup)
{
	std::ostringstream progress;
	cv::Mat art = fixtures::makeArtwork(cv::Size(500, 200));

	auto result = runMockupPipeline(sampleCatalog(), art, MockupSettings{}, progress, sampleLoader());
	ASSERT_TRUE(result.ok());
	EXPECT_EQ(result.value().orientation, Orientation::Horizontal);
	EXPECT_EQ(result.value().match.mockupPath, "horizontal_large");
	EXPECT_EQ(result.value().image.size(), cv::Size(600, 400));
}

TEST(MockupPipelineTest, ReportsProgress)
{
	std::ostringstream progress;
	cv::Mat art = fixtures::makeArtwork(cv::Size(192, 96));

	auto result = runMockupPipeline(sampleCatalog(), art, MockupSettings{}, progress, sampleLoader());
	ASSERT_TRUE(result.ok());
	const std::string text = progress.str();
	EXPECT_NE(text.find("192x96 px (2.00 x 1.00 in"), std::string::npos) << text;
	EXPECT_NE(text.find("Orientation: horizontal"), std::string::npos);
	EXPECT_NE(text.find("Frame: x=40 y=40 w=480 h=240"), std::string::npos);
	EXPECT_NE(text.find("Mockup: horizontal_large"), std::string::npos);
}

TEST(MockupPipelineTest, ProgressSurvivesFailure)
{
	std::ostringstream progress;
	MockupCatalog::Entries entries;
	entries[Orientation::Vertical] = {"vertical_small"};
	MockupCatalog verticalOnly(std::move(entries));

	auto result = runMockupPipeline(verticalOnly, fixtures::makeArtwork(cv::Size(500, 200)), MockupSettings{},
					progress, sampleLoader());
	ASSERT_FALSE(result.ok());
	EXPECT_EQ(result.kind(), ErrorKind::Configuration);
	EXPECT_NE(progress.str().find("Orientation: horizontal"), std::string::npos);
}

TEST(MockupPipelineTest, MarginErrorPropagates)
{
	std::ostringstream progress;
	MockupSettings settings;
	settings.marginInch = 1.0; // 300 px per side

	auto result = runMockupPipeline(sampleCatalog(), fixtures::makeArtwork(cv::Size(300, 400)), settings,
					progress, sampleLoader());
	ASSERT_FALSE(result.ok());
	EXPECT_EQ(result.kind(), ErrorKind::Margin);
}

TEST(MockupPipelineTest, EmptyForegroundIsInputError)
{
	std::ostringstream progress;
	auto result = runMockupPipeline(sampleCatalog(), cv::Mat(), MockupSettings{}, progress, sampleLoader());
	ASSERT_FALSE(result.ok());
	EXPECT_EQ(result.kind(), ErrorKind::Input);
}
