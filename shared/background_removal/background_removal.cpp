#include "background_removal.hpp"
#include "util/ImageOps.hpp"

#include <opencv2/opencv.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace mockup {

namespace {
    const char* kDefaultCommand = "rembg i -ppm \"{input}\" \"{output}\"";

    bool fileExists(const std::filesystem::path& p)
    {
        std::error_code ec;
        return std::filesystem::exists(p, ec);
    }

    void replaceAll(std::string& s, const std::string& from, const std::string& to)
    {
        for (std::size_t pos = s.find(from); pos != std::string::npos; pos = s.find(from, pos + to.size()))
            s.replace(pos, from.size(), to);
    }

    // Empty path when the system has no usable temp directory
    std::filesystem::path tempPath(const std::string& stem)
    {
        static std::atomic<unsigned> counter {0};
        std::error_code ec;
        std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
        if (ec)
        {
            std::cerr << "[removeBackground] no temp directory: " << ec.message() << "\n";
            return {};
        }
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        return dir / (stem + "_" + std::to_string(stamp) + "_" + std::to_string(counter++) + ".png");
    }

    static int autoPaperThreshold(const cv::Mat& gray)
    {
        int cx = gray.cols / 2;
        int w = std::min(40, std::max(1, std::min(cx - 1, gray.cols - cx - 1)));
        int h = std::max(1, gray.rows / 10);
        cv::Rect topR(cx - w, 0, 2*w + 1, h);
        cv::Rect botR(cx - w, gray.rows - h, 2*w + 1, h);
        topR &= cv::Rect(0, 0, gray.cols, gray.rows);
        botR &= cv::Rect(0, 0, gray.cols, gray.rows);
        double mt = cv::mean(gray(topR))[0], mb = cv::mean(gray(botR))[0];
        int thr = int(std::min(mt, mb) - 5.0);
        return std::clamp(thr, 200, 254);
    }

    // Runs the external remover on `image`; true when it produced a BGRA result
    bool externalRemoval(const cv::Mat& image, cv::Mat& out)
    {
        std::string cmd = removalCommand();
        if (cmd.empty())
        {
            std::cerr << "[removeBackground] external remover disabled. Using heuristic mask.\n";
            return false;
        }

        std::filesystem::path inPath = tempPath("mockup_in");
        std::filesystem::path outPath = tempPath("mockup_out");
        if (inPath.empty() || outPath.empty())
        {
            std::cerr << "[removeBackground] Falling back to heuristic mask.\n";
            return false;
        }
        if (!util::writeImage(inPath.string(), image)) return false;

        replaceAll(cmd, "{input}", inPath.string());
        replaceAll(cmd, "{output}", outPath.string());
        int rc = std::system(cmd.c_str());

        bool ok = false;
        if (rc == 0 && fileExists(outPath))
            ok = util::readImage(outPath.string(), out, cv::IMREAD_UNCHANGED) && out.channels() == 4;
        if (!ok)
            std::cerr << "[removeBackground] external remover failed (rc=" << rc
                      << ") or output missing. Falling back to heuristic mask.\n";

        std::error_code ec;
        std::filesystem::remove(inPath, ec);
        std::filesystem::remove(outPath, ec);
        return ok;
    }
}

std::string removalCommand()
{
    const char* env = std::getenv("BACKGROUND_REMOVAL_CMD");
    return env ? std::string(env) : std::string(kDefaultCommand);
}

Result<cv::Mat> removeBackground(const cv::Mat& image, const SubjectMaskSettings& settings)
{
    if (image.empty())
        return MockupError(ErrorKind::Input, "Cannot remove background of an empty image");

    cv::Mat removed;
    if (externalRemoval(image, removed)) return removed;

    cv::Mat bgra = util::toBgra(image);
    cv::Mat mask;
    if (!computeSubjectMask(bgra, mask, settings))
        return MockupError(ErrorKind::Input, "Cannot compute a subject mask");

    std::vector<cv::Mat> channels;
    cv::split(bgra, channels);
    channels[3] = mask;
    cv::merge(channels, bgra);
    return bgra;
}

bool computeSubjectMask(const cv::Mat& img, cv::Mat& outMask, const SubjectMaskSettings& s)
{
    if (img.empty()) return false;
    cv::Mat gray = util::toGray(img).clone();
    cv::medianBlur(gray, gray, 5);

    // Paper/wall assistance: anything darker than the sampled paper is subject
    cv::Mat subjectMask;
    if (s.usePaperAssist)
    {
        int thr = (s.paperThreshold >= 0 && s.paperThreshold <= 255) ? s.paperThreshold : autoPaperThreshold(gray);
        cv::threshold(gray, subjectMask, thr, 255, cv::THRESH_BINARY_INV);
    }

    // Edges
    cv::Mat edges; cv::Canny(gray, edges, std::min(s.cannyLow, s.cannyHigh), std::max(s.cannyLow, s.cannyHigh));

    cv::Mat mask;
    if (!subjectMask.empty()) cv::bitwise_or(edges, subjectMask, mask);
    else mask = edges;

    // Close small gaps along the outline
    int k = std::max(1, s.morphKernel | 1); // force odd
    cv::Mat kernel = cv::getStructuringElement(cv::MORPH_ELLIPSE, cv::Size(k, k));
    if (s.closeIters > 0) cv::morphologyEx(mask, mask, cv::MORPH_CLOSE, kernel, cv::Point(-1,-1), s.closeIters);
    cv::threshold(mask, mask, 1, 255, cv::THRESH_BINARY);

    // Remove small components
    if (s.minArea > 0)
    {
        cv::Mat labels, stats, centroids;
        int n = cv::connectedComponentsWithStats(mask, labels, stats, centroids, 8, CV_32S);
        cv::Mat filtered = cv::Mat::zeros(mask.size(), CV_8U);
        for (int i = 1; i < n; ++i)
        {
            if (stats.at<int>(i, cv::CC_STAT_AREA) >= s.minArea)
                filtered.setTo(255, labels == i);
        }
        mask = filtered;
    }

    // Fill holes: flood the padded background from the corner, what stays unreached is a hole
    {
        cv::Mat padded;
        cv::copyMakeBorder(mask, padded, 1, 1, 1, 1, cv::BORDER_CONSTANT, cv::Scalar(0));
        cv::Mat inv; cv::bitwise_not(padded, inv);
        cv::floodFill(inv, cv::Point(0, 0), cv::Scalar(0));
        cv::bitwise_or(padded, inv, padded);
        mask = padded(cv::Rect(1, 1, mask.cols, mask.rows)).clone();
    }

    if (s.featherRadius > 0)
    {
        int rr = std::max(1, s.featherRadius * 2 + 1);
        cv::GaussianBlur(mask, mask, cv::Size(rr, rr), 0);
    }

    outMask = mask;
    return true;
}

}
