#include "mockup_service.hpp"
#include "multipart.hpp"
#include "background_removal/background_removal.hpp"
#include "mockup_pipeline/mockup_pipeline.hpp"
#include "util/ImageOps.hpp"

#include <exception>
#include <iostream>
#include <sstream>
#include <string_view>
#include <utility>

namespace mockup::http_service {

namespace {

Response textResponse(const Request& req, http::status status, const std::string& text)
{
    Response res{status, req.version()};
    res.set(http::field::content_type, "text/plain; charset=utf-8");
    res.keep_alive(req.keep_alive());
    res.body() = text;
    res.prepare_payload();
    return res;
}

}

http::status statusFor(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::Input:  return http::status::bad_request;
    case ErrorKind::Margin: return http::status::unprocessable_entity;
    default:                return http::status::internal_server_error;
    }
}

MockupService::MockupService(const MockupCatalog& catalog, MockupSettings settings,
                             SubjectMaskSettings maskSettings, ForegroundPreparer prepare)
    : catalog_(catalog), settings_(settings), maskSettings_(maskSettings), prepare_(std::move(prepare))
{
    if (!prepare_)
    {
        SubjectMaskSettings s = maskSettings_;
        prepare_ = [s](const cv::Mat& img) { return removeBackground(img, s); };
    }
}

Response MockupService::handle(const Request& req) const
{
    if (req.target() != "/")
        return textResponse(req, http::status::not_found, "Not found");
    if (req.method() != http::verb::post)
    {
        Response res = textResponse(req, http::status::method_not_allowed, "Method not allowed");
        res.set(http::field::allow, "POST");
        return res;
    }

    try
    {
        return processUpload(req);
    }
    catch (const cv::Exception& e)
    {
        std::cerr << "[MockupService] OpenCV failure: " << e.what() << "\n";
        return textResponse(req, http::status::internal_server_error, "Image processing failed");
    }
    catch (const std::exception& e)
    {
        std::cerr << "[MockupService] " << e.what() << "\n";
        return textResponse(req, http::status::internal_server_error, "Internal error");
    }
}

Response MockupService::processUpload(const Request& req) const
{
    const auto contentType = req[http::field::content_type];
    auto boundary = boundaryFromContentType(std::string_view(contentType.data(), contentType.size()));
    if (!boundary)
        return textResponse(req, http::status::bad_request, "No file uploaded");

    std::vector<FormPart> parts = parseMultipart(req.body(), *boundary);
    const FormPart* file = findPart(parts, "file");
    if (!file)
        return textResponse(req, http::status::bad_request, "No file uploaded");
    // A part without a filename parameter is a plain form field, not an upload
    if (!file->filename)
        return textResponse(req, http::status::bad_request, "No file uploaded");
    if (file->filename->empty())
        return textResponse(req, http::status::bad_request, "No file selected");

    cv::Mat input;
    if (!util::decodeImage(file->body, input))
        return textResponse(req, http::status::bad_request, "Uploaded file is not a readable image");

    std::cerr << "[MockupService] " << *file->filename << ": " << input.cols << "x" << input.rows << "\n";

    Result<cv::Mat> foreground = prepare_(input);
    if (!foreground)
    {
        std::cerr << "[MockupService] " << toString(foreground.kind()) << ": " << foreground.error().message << "\n";
        return textResponse(req, statusFor(foreground.kind()), foreground.error().message);
    }

    std::ostringstream progress;
    Result<MockupResult> result = runMockupPipeline(catalog_, foreground.value(), settings_, progress);
    std::cerr << progress.str();
    if (!result)
    {
        std::cerr << "[MockupService] " << toString(result.kind()) << ": " << result.error().message << "\n";
        return textResponse(req, statusFor(result.kind()), result.error().message);
    }

    std::vector<uchar> png;
    if (!util::encodePng(result.value().image, png))
        return textResponse(req, http::status::internal_server_error, "Cannot encode result");

    Response res{http::status::ok, req.version()};
    res.set(http::field::content_type, "image/png");
    res.set(http::field::content_disposition, std::string("attachment; filename=\"") + kResultFilename + "\"");
    res.keep_alive(req.keep_alive());
    res.body().assign(png.begin(), png.end());
    res.prepare_payload();
    return res;
}

}
