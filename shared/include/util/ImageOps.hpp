#pragma once
#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

namespace util {

// Owned 8-bit BGRA copy of a grey, BGR or BGRA image
cv::Mat toBgra(const cv::Mat& img);

// Single intensity channel of a grey, BGR or BGRA image (alpha ignored)
cv::Mat toGray(const cv::Mat& img);

// Size `src` takes when shrunk to fit inside `box` with its aspect kept.
// Never enlarges; returns `src` unchanged when it already fits.
cv::Size thumbnailSize(const cv::Size& src, const cv::Size& box);

// Blend BGRA `src` onto BGRA `dst` at `pos`, using src alpha as the mask.
// The part of src that falls outside dst is clipped.
void pasteWithAlpha(cv::Mat& dst, const cv::Mat& src, const cv::Point& pos);

// Wrappers around imread/imwrite/imencode/imdecode that turn cv::Exception
// into a false return.
bool readImage(const std::string& path, cv::Mat& out, int flags = cv::IMREAD_UNCHANGED);
bool writeImage(const std::string& path, const cv::Mat& img);
bool encodePng(const cv::Mat& img, std::vector<uchar>& out);
bool decodeImage(const std::string& bytes, cv::Mat& out, int flags = cv::IMREAD_UNCHANGED);

}
