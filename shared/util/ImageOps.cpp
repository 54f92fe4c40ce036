#include "util/ImageOps.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace util {

namespace {

cv::Mat to8Bit(const cv::Mat& img)
{
    if (img.depth() == CV_8U) return img;
    cv::Mat out;
    double scale = 1.0;
    if (img.depth() == CV_16U) scale = 1.0 / 257.0;
    else if (img.depth() == CV_32F || img.depth() == CV_64F) scale = 255.0;
    img.convertTo(out, CV_8U, scale);
    return out;
}

}

cv::Mat toBgra(const cv::Mat& img)
{
    cv::Mat src = to8Bit(img);
    cv::Mat out;
    switch (src.channels())
    {
    case 1: cv::cvtColor(src, out, cv::COLOR_GRAY2BGRA); break;
    case 3: cv::cvtColor(src, out, cv::COLOR_BGR2BGRA); break;
    default: out = src.clone(); break;
    }
    return out;
}

cv::Mat toGray(const cv::Mat& img)
{
    cv::Mat src = to8Bit(img);
    cv::Mat gray;
    switch (src.channels())
    {
    case 1: gray = src; break;
    case 3: cv::cvtColor(src, gray, cv::COLOR_BGR2GRAY); break;
    default: cv::cvtColor(src, gray, cv::COLOR_BGRA2GRAY); break;
    }
    return gray;
}

cv::Size thumbnailSize(const cv::Size& src, const cv::Size& box)
{
    if (box.width >= src.width && box.height >= src.height) return src;

    const double aspect = static_cast<double>(src.width) / src.height;
    int x = box.width;
    int y = box.height;

    // Of floor/ceil, keep whichever preserves the aspect better (floor on a tie)
    if (static_cast<double>(x) / y >= aspect)
    {
        double exact = y * aspect;
        int lo = static_cast<int>(std::floor(exact));
        int hi = static_cast<int>(std::ceil(exact));
        double errLo = std::abs(aspect - static_cast<double>(lo) / y);
        double errHi = std::abs(aspect - static_cast<double>(hi) / y);
        x = std::max(errHi < errLo ? hi : lo, 1);
    }
    else
    {
        double exact = x / aspect;
        int lo = static_cast<int>(std::floor(exact));
        int hi = static_cast<int>(std::ceil(exact));
        double errLo = lo == 0 ? 0.0 : std::abs(aspect - static_cast<double>(x) / lo);
        double errHi = hi == 0 ? 0.0 : std::abs(aspect - static_cast<double>(x) / hi);
        y = std::max(errHi < errLo ? hi : lo, 1);
    }
    return cv::Size(x, y);
}

void pasteWithAlpha(cv::Mat& dst, const cv::Mat& src, const cv::Point& pos)
{
    CV_Assert(dst.type() == CV_8UC4 && src.type() == CV_8UC4);

    cv::Rect target(pos, src.size());
    cv::Rect clipped = target & cv::Rect(0, 0, dst.cols, dst.rows);
    if (clipped.empty()) return;

    cv::Mat srcRoi = src(cv::Rect(clipped.tl() - pos, clipped.size()));
    cv::Mat dstRoi = dst(clipped);
    for (int r = 0; r < srcRoi.rows; ++r)
    {
        const cv::Vec4b* s = srcRoi.ptr<cv::Vec4b>(r);
        cv::Vec4b* d = dstRoi.ptr<cv::Vec4b>(r);
        for (int c = 0; c < srcRoi.cols; ++c)
        {
            const int a = s[c][3];
            if (a == 0) continue;
            if (a == 255) { d[c] = s[c]; continue; }
            for (int k = 0; k < 4; ++k)
                d[c][k] = static_cast<uchar>((s[c][k] * a + d[c][k] * (255 - a) + 127) / 255);
        }
    }
}

bool readImage(const std::string& path, cv::Mat& out, int flags)
{
    try
    {
        out = cv::imread(path, flags);
    }
    catch (const cv::Exception& e)
    {
        std::cerr << "[readImage] " << path << ": " << e.what() << "\n";
        out.release();
    }
    return !out.empty();
}

bool writeImage(const std::string& path, const cv::Mat& img)
{
    try
    {
        return cv::imwrite(path, img);
    }
    catch (const cv::Exception& e)
    {
        std::cerr << "[writeImage] " << path << ": " << e.what() << "\n";
        return false;
    }
}

bool encodePng(const cv::Mat& img, std::vector<uchar>& out)
{
    try
    {
        return cv::imencode(".png", img, out);
    }
    catch (const cv::Exception& e)
    {
        std::cerr << "[encodePng] " << e.what() << "\n";
        return false;
    }
}

bool decodeImage(const std::string& bytes, cv::Mat& out, int flags)
{
    if (bytes.empty()) { out.release(); return false; }
    try
    {
        std::vector<uchar> buf(bytes.begin(), bytes.end());
        out = cv::imdecode(buf, flags);
    }
    catch (const cv::Exception& e)
    {
        std::cerr << "[decodeImage] " << e.what() << "\n";
        out.release();
    }
    return !out.empty();
}

}
