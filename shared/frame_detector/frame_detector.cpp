#include "frame_detector.hpp"
#include "util/ImageOps.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <vector>

namespace mockup {

Result<cv::Rect> detectFrame(const cv::Mat& image, int whiteThreshold, const std::string& name)
{
    if (image.empty())
        return MockupError(ErrorKind::Io, "Cannot read image " + name);

    cv::Mat gray = util::toGray(image);
    cv::Mat thresh;
    cv::threshold(gray, thresh, whiteThreshold, 255, cv::THRESH_BINARY);

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(thresh, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);
    if (contours.empty())
        return MockupError(ErrorKind::Detection, "No contours found in image " + name);

    // max_element keeps the first of equal areas
    auto largest = std::max_element(contours.begin(), contours.end(),
        [](const std::vector<cv::Point>& a, const std::vector<cv::Point>& b)
        { return cv::contourArea(a) < cv::contourArea(b); });
    return cv::boundingRect(*largest);
}

Result<cv::Rect> detectFrameInFile(const std::string& path, int whiteThreshold)
{
    cv::Mat img;
    if (!util::readImage(path, img))
        return MockupError(ErrorKind::Io, "Cannot read image " + path);
    return detectFrame(img, whiteThreshold, path);
}

}
