#pragma once

#include <opencv2/opencv.hpp>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <string>

namespace fixtures {

// Dark photograph with a single near-white frame interior at `frame`
inline cv::Mat makeMockup(cv::Size size, cv::Rect frame, uchar wall = 60, uchar interior = 255)
{
	cv::Mat img(size, CV_8UC3, cv::Scalar(wall, wall + 10, wall + 20));
	img(frame).setTo(cv::Scalar(interior, interior, interior));
	return img;
}

// Opaque BGRA artwork of one colour
inline cv::Mat makeArtwork(cv::Size size, cv::Scalar bgra = cv::Scalar(10, 20, 200, 255))
{
	return cv::Mat(size, CV_8UC4, bgra);
}

// Fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
	TempDir()
	{
		static std::atomic<unsigned> counter{0};
		auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
		path_ = std::filesystem::temp_directory_path() /
			("art_mockup_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
		std::filesystem::create_directories(path_);
	}
	~TempDir()
	{
		std::error_code ec;
		std::filesystem::remove_all(path_, ec);
	}
	TempDir(const TempDir &) = delete;
	TempDir &operator=(const TempDir &) = delete;

	const std::filesystem::path &path() const { return path_; }
	std::string file(const std::string &name) const { return (path_ / name).string(); }

private:
	std::filesystem::path path_;
};

// Sets an environment variable for the lifetime of the guard
class EnvGuard {
public:
	EnvGuard(const char *name, const char *value) : name_(name)
	{
		const char *old = std::getenv(name);
		if (old) {
			hadOld_ = true;
			old_ = old;
		}
		setenv(name, value, 1);
	}
	~EnvGuard()
	{
		if (hadOld_)
			setenv(name_.c_str(), old_.c_str(), 1);
		else
			unsetenv(name_.c_str());
	}
	EnvGuard(const EnvGuard &) = delete;
	EnvGuard &operator=(const EnvGuard &) = delete;

private:
	std::string name_;
	std::string old_;
	bool hadOld_ = false;
};

} // namespace fixtures
