#include "http_service/mockup_service.hpp"
#include "util/ImageOps.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "Fixtures.hpp"

using namespace mockup;
using namespace mockup::http_service;

namespace {

const std::string kBoundary = "XyZBoundary";

std::string pngBytes(const cv::Mat &img)
{
	std::vector<uchar> buf;
	cv::imencode(".png", img, buf);
	return std::string(buf.begin(), buf.end());
}

Request uploadRequest(const std::string &field, const std::string &filename, const std::string &payload)
{
	Request req{http::verb::post, "/", 11};
	req.set(http::field::content_type, "multipart/form-data; boundary=" + kBoundary);
	req.body() = "--" + kBoundary + "\r\n"
		     "Content-Disposition: form-data; name=\"" + field + "\"; filename=\"" + filename + "\"\r\n"
		     "Content-Type: image/png\r\n"
		     "\r\n" + payload + "\r\n"
		     "--" + kBoundary + "--\r\n";
	req.prepare_payload();
	return req;
}

// Uploads are already background-free in these tests
ForegroundPreparer passThrough()
{
	return [](const cv::Mat &img) -> Result<cv::Mat> { return util::toBgra(img); };
}

class MockupServiceTest : public ::testing::Test {
protected:
	void SetUp() override
	{
		const std::string vertical = dir.file("vertical.png");
		const std::string horizontal = dir.file("horizontal.png");
		ASSERT_TRUE(cv::imwrite(vertical, fixtures::makeMockup(cv::Size(300, 400), cv::Rect(50, 50, 200, 300))));
		ASSERT_TRUE(cv::imwrite(horizontal, fixtures::makeMockup(cv::Size(400, 300), cv::Rect(20, 100, 360, 20))));
		MockupCatalog::Entries entries;
		entries[Orientation::Vertical] = {vertical};
		entries[Orientation::Horizontal] = {horizontal};
		catalog = MockupCatalog(std::move(entries));
	}

	fixtures::TempDir dir;
	MockupCatalog catalog;
};

} // namespace

TEST_F(MockupServiceTest, ReturnsPngAttachment)
{
	MockupService service(catalog, MockupSettings{}, SubjectMaskSettings{}, passThrough());
	Response res = service.handle(uploadRequest("file", "art.png", pngBytes(fixtures::makeArtwork(cv::Size(60, 90)))));

	ASSERT_EQ(res.result(), http::status::ok) << res.body();
	EXPECT_EQ(res[http::field::content_type], "image/png");
	EXPECT_EQ(res[http::field::content_disposition], "attachment; filename=\"final_artwork.png\"");

	cv::Mat out;
	ASSERT_TRUE(util::decodeImage(res.body(), out));
	EXPECT_EQ(out.size(), cv::Size(300, 400));
	EXPECT_EQ(out.channels(), 4);
}

TEST_F(MockupServiceTest, MissingFileFieldIs400)
{
	MockupService service(catalog, MockupSettings{}, SubjectMaskSettings{}, passThrough());
	Response res = service.handle(uploadRequest("picture", "art.png", pngBytes(fixtures::makeArtwork(cv::Size(10, 10)))));
	EXPECT_EQ(res.result(), http::status::bad_request);
	EXPECT_EQ(res.body(), "No file uploaded");
}

TEST_F(MockupServiceTest, NonMultipartIs400)
{
	MockupService service(catalog, MockupSettings{}, SubjectMaskSettings{}, passThrough());
	Request req{http::verb::post, "/", 11};
	req.set(http::field::content_type, "application/json");
	req.body() = "{}";
	req.prepare_payload();
	EXPECT_EQ(service.handle(req).result(), http::status::bad_request);
}

TEST_F(MockupServiceTest, EmptyFilenameIs400)
{
	MockupService service(catalog, MockupSettings{}, SubjectMaskSettings{}, passThrough());
	Response res = service.handle(uploadRequest("file", "", ""));
	EXPECT_EQ(res.result(), http::status::bad_request);
	EXPECT_EQ(res.body(), "No file selected");
}

TEST_F(MockupServiceTest, UndecodableUploadIs400)
{
	MockupService service(catalog, MockupSettings{}, SubjectMaskSettings{}, passThrough());
	Response res = service.handle(uploadRequest("file", "art.png", "definitely not an image"));
	EXPECT_EQ(res.result(), http::status::bad_request);
}

TEST_F(MockupServiceTest, MarginErrorIs422)
{
	// horizontal frame is 20 px tall; 0.01 in @ 300 dpi keeps 14 px, 0.05 in keeps none
	MockupSettings settings;
	settings.marginInch = 0.05;
	MockupService service(catalog, settings, SubjectMaskSettings{}, passThrough());
	Response res = service.handle(uploadRequest("file", "wide.png", pngBytes(fixtures::makeArtwork(cv::Size(90, 30)))));
	EXPECT_EQ(res.result(), http::status::unprocessable_entity);
}

TEST_F(MockupServiceTest, DetectionErrorIs500)
{
	const std::string dark = dir.file("dark.png");
	ASSERT_TRUE(cv::imwrite(dark, cv::Mat(100, 100, CV_8UC3, cv::Scalar(10, 10, 10))));
	MockupCatalog::Entries entries;
	entries[Orientation::Vertical] = {dark};
	MockupCatalog darkCatalog(std::move(entries));

	MockupService service(darkCatalog, MockupSettings{}, SubjectMaskSettings{}, passThrough());
	Response res = service.handle(uploadRequest("file", "art.png", pngBytes(fixtures::makeArtwork(cv::Size(20, 40)))));
	EXPECT_EQ(res.result(), http::status::internal_server_error);
}

TEST_F(MockupServiceTest, FileFieldWithoutFilenameIsNotAnUpload)
{
	MockupService service(catalog, MockupSettings{}, SubjectMaskSettings{}, passThrough());
	Request req{http::verb::post, "/", 11};
	req.set(http::field::content_type, "multipart/form-data; boundary=" + kBoundary);
	req.body() = "--" + kBoundary + "\r\n"
		     "Content-Disposition: form-data; name=\"file\"\r\n"
		     "\r\n"
		     "plain value\r\n"
		     "--" + kBoundary + "--\r\n";
	req.prepare_payload();

	Response res = service.handle(req);
	EXPECT_EQ(res.result(), http::status::bad_request);
	EXPECT_EQ(res.body(), "No file uploaded");
}

TEST_F(MockupServiceTest, MissingTempDirectoryUsesHeuristicMask)
{
	fixtures::EnvGuard command("BACKGROUND_REMOVAL_CMD", "cp \"{input}\" \"{output}\"");
	fixtures::EnvGuard tmp("TMPDIR", "/nonexistent_art_mockup_tmp");

	// Default preparer: external remover first, heuristic mask on failure
	MockupService service(catalog, MockupSettings{});
	cv::Mat photo(300, 240, CV_8UC3, cv::Scalar(255, 255, 255));
	photo(cv::Rect(60, 75, 120, 150)).setTo(cv::Scalar(40, 60, 90));

	Response res = service.handle(uploadRequest("file", "photo.png", pngBytes(photo)));
	ASSERT_EQ(res.result(), http::status::ok) << res.body();
	EXPECT_EQ(res[http::field::content_type], "image/png");
}

TEST_F(MockupServiceTest, UnexpectedExceptionIs500)
{
	ForegroundPreparer throwing = [](const cv::Mat &) -> Result<cv::Mat> {
		throw std::runtime_error("preparer exploded");
	};
	MockupService service(catalog, MockupSettings{}, SubjectMaskSettings{}, throwing);

	Response res = service.handle(uploadRequest("file", "art.png", pngBytes(fixtures::makeArtwork(cv::Size(20, 40)))));
	EXPECT_EQ(res.result(), http::status::internal_server_error);
}

TEST_F(MockupServiceTest, RoutesOnlyPostRoot)
{
	MockupService service(catalog, MockupSettings{}, SubjectMaskSettings{}, passThrough());
	Request get{http::verb::get, "/", 11};
	EXPECT_EQ(service.handle(get).result(), http::status::method_not_allowed);
	Request other{http::verb::post, "/upload", 11};
	EXPECT_EQ(service.handle(other).result(), http::status::not_found);
}

TEST(StatusMappingTest, ErrorKindsMapToStatus)
{
	EXPECT_EQ(statusFor(ErrorKind::Input), http::status::bad_request);
	EXPECT_EQ(statusFor(ErrorKind::Margin), http::status::unprocessable_entity);
	EXPECT_EQ(statusFor(ErrorKind::Detection), http::status::internal_server_error);
	EXPECT_EQ(statusFor(ErrorKind::Configuration), http::status::internal_server_error);
	EXPECT_EQ(statusFor(ErrorKind::NoMatch), http::status::internal_server_error);
	EXPECT_EQ(statusFor(ErrorKind::Io), http::status::internal_server_error);
}
