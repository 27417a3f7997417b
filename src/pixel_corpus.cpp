#include "pixel_corpus.hpp"
#include <opencv2/core/utils/filesystem.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cctype>

cv::Mat loadImageRGB(const std::string& path)
{
	if (!cv::utils::fs::exists(path))
		CV_Error(cv::Error::StsObjectNotFound, "Image not found: " + path);

	cv::Mat bgr = cv::imread(path, cv::IMREAD_COLOR); // Always decodes to 3-channel BGR
	if (bgr.empty())
		CV_Error(cv::Error::StsError, "Failed to load image: " + path);

	cv::Mat rgb;
	cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);
	return rgb;
}

PixelPopulation filterGrayPixels(const PixelPopulation& pixels, int gray_threshold)
{
	PixelPopulation kept;
	kept.reserve(pixels.size());
	for (const PixelSample& p : pixels) {
		int hi = std::max(p[0], std::max(p[1], p[2]));
		int lo = std::min(p[0], std::min(p[1], p[2]));
		if (hi - lo >= gray_threshold)
			kept.push_back(p);
	}
	return kept;
}

PixelPopulation extractPixels(const cv::Mat& image, bool filter_gray, int gray_threshold)
{
	CV_Assert(image.empty() || image.type() == CV_8UC3);

	PixelPopulation pixels;
	pixels.reserve(image.total());
	for (int r = 0; r < image.rows; ++r) {
		const cv::Vec3b* row = image.ptr<cv::Vec3b>(r);
		pixels.insert(pixels.end(), row, row + image.cols);
	}

	if (filter_gray)
		return filterGrayPixels(pixels, gray_threshold);
	return pixels;
}

PixelPopulation loadAndExtractPixels(const std::string& path, bool filter_gray, int gray_threshold)
{
	return extractPixels(loadImageRGB(path), filter_gray, gray_threshold);
}

bool isSupportedImageFile(const std::string& path)
{
	static const char* extensions[] = { ".png", ".jpg", ".jpeg", ".gif", ".bmp", ".tiff" };

	std::string lower = path;
	std::transform(lower.begin(), lower.end(), lower.begin(),
		[](unsigned char ch) { return (char)std::tolower(ch); });

	for (const char* ext : extensions) {
		std::string e(ext);
		if (lower.size() >= e.size() && lower.compare(lower.size() - e.size(), e.size(), e) == 0)
			return true;
	}
	return false;
}

std::vector<std::string> listImageFiles(const std::string& folder)
{
	if (!cv::utils::fs::isDirectory(folder))
		CV_Error(cv::Error::StsBadArg, "Not a directory: " + folder);

	std::vector<cv::String> entries;
	cv::glob(cv::utils::fs::join(folder, "*"), entries, false); // Non-recursive

	std::vector<std::string> files;
	for (const cv::String& entry : entries) {
		if (isSupportedImageFile(entry))
			files.push_back(entry);
	}
	std::sort(files.begin(), files.end());
	return files;
}

std::string baseName(const std::string& path)
{
	size_t slash = path.find_last_of("/\\");
	return slash == std::string::npos ? path : path.substr(slash + 1);
}
