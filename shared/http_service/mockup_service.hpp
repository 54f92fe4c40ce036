/*========================  mockup_service.hpp  ========================

   HTTP front of the mockup pipeline.
   --------------------------------------------------------------------
   • POST / with a multipart `file` field → PNG attachment
   • missing/empty upload or undecodable image → 400
   • margin larger than the frame → 422
   • detection, catalog or I/O failures → 500

   The handler holds only read-only state, so one instance can serve every
   request of the process.

=====================================================================*/
#pragma once
#include "models/MockupCatalog.hpp"
#include "models/MockupError.hpp"
#include "models/MockupSettings.hpp"
#include "models/SubjectMaskSettings.hpp"

#include <boost/beast/http.hpp>
#include <opencv2/core.hpp>
#include <functional>

namespace mockup::http_service {

namespace http = boost::beast::http;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

// Turns the decoded upload into a BGRA foreground; removeBackground() by default.
using ForegroundPreparer = std::function<Result<cv::Mat>(const cv::Mat&)>;

constexpr const char* kResultFilename = "final_artwork.png";

// HTTP status for a pipeline error kind.
http::status statusFor(ErrorKind kind);

class MockupService
{
public:
    MockupService(const MockupCatalog& catalog,
                  MockupSettings settings,
                  SubjectMaskSettings maskSettings = SubjectMaskSettings{},
                  ForegroundPreparer prepare = ForegroundPreparer{});

    Response handle(const Request& req) const;

private:
    Response processUpload(const Request& req) const;

    const MockupCatalog& catalog_;
    MockupSettings settings_;
    SubjectMaskSettings maskSettings_;
    ForegroundPreparer prepare_;
};

}
