#pragma once
#include "color_types.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

// Load an image from disk as a CV_8UC3 matrix in RGB order
//
// Throws:
//   cv::Exception if the file does not exist or cannot be decoded
cv::Mat loadImageRGB(const std::string& path);

// Remove gray and near-gray pixels: a pixel is kept when max(R,G,B) - min(R,G,B) >= gray_threshold
PixelPopulation filterGrayPixels(const PixelPopulation& pixels, int gray_threshold);

// Flatten an RGB image (CV_8UC3) into its pixel population, row by row
//
// Args:
//   image: RGB image
//   filter_gray: drop gray pixels (see filterGrayPixels)
//   gray_threshold: spread under which a pixel counts as gray
PixelPopulation extractPixels(const cv::Mat& image, bool filter_gray = true, int gray_threshold = 1);

// loadImageRGB() followed by extractPixels()
PixelPopulation loadAndExtractPixels(const std::string& path, bool filter_gray = true, int gray_threshold = 1);

// true if the file name ends with a supported image extension (png, jpg, jpeg, gif, bmp, tiff), any case
bool isSupportedImageFile(const std::string& path);

// Sorted full paths of the supported images directly inside `folder` (no recursion)
//
// Throws:
//   cv::Exception if `folder` is not a directory
std::vector<std::string> listImageFiles(const std::string& folder);

// The file name part of a path
std::string baseName(const std::string& path);
