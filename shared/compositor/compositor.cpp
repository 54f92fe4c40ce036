#include "compositor.hpp"
#include "util/ImageOps.hpp"

#include <opencv2/imgproc.hpp>
#include <cmath>
#include <sstream>

namespace mockup {

double marginPixels(double marginInch, double dpi)
{
    return std::floor(marginInch * dpi);
}

Result<cv::Mat> compositeIntoFrame(const cv::Mat& mockup, const cv::Rect& frame,
                                   const cv::Mat& foreground, double marginInch, double dpi)
{
    if (mockup.empty()) return MockupError(ErrorKind::Input, "Mockup image is empty");
    if (foreground.empty()) return MockupError(ErrorKind::Input, "Foreground image is empty");
    if (!std::isfinite(dpi) || dpi <= 0.0)
        return MockupError(ErrorKind::Configuration, "DPI must be a positive number");
    if (!std::isfinite(marginInch) || marginInch < 0.0)
        return MockupError(ErrorKind::Margin, "Margin must be a non-negative number of inches");

    // Checked in double; the int conversion below only sees margins that fit the frame
    const double marginPx = marginPixels(marginInch, dpi);
    if (!std::isfinite(marginPx) || 2.0 * marginPx >= frame.width || 2.0 * marginPx >= frame.height)
    {
        std::ostringstream msg;
        msg << "Margin too large compared to frame size! (margin " << marginPx
            << " px, frame " << frame.width << "x" << frame.height << ")";
        return MockupError(ErrorKind::Margin, msg.str());
    }

    cv::Mat canvas = util::toBgra(mockup);
    cv::Mat fg = util::toBgra(foreground);

    const int margin = static_cast<int>(marginPx);
    cv::Rect inner(frame.x + margin, frame.y + margin,
                   frame.width - 2 * margin, frame.height - 2 * margin);

    cv::Size fitted = util::thumbnailSize(fg.size(), inner.size());
    if (fitted != fg.size())
        cv::resize(fg, fg, fitted, 0, 0, cv::INTER_LANCZOS4);

    cv::Point pos(inner.x + (inner.width - fg.cols) / 2,
                  inner.y + (inner.height - fg.rows) / 2);
    util::pasteWithAlpha(canvas, fg, pos);
    return canvas;
}

}
