#pragma once
#include "color_types.hpp"
#include "clustering.hpp"
#include "config.hpp"
#include "cooccurrence.hpp"
#include <string>
#include <vector>

// Palette of one image of a folder
struct ImagePalette {
	std::string filename;
	Palette palette;
};

// Dominant colors of a single image file, sorted by descending weight
// An image without any non-gray pixel gives an empty palette
//
// Throws:
//   cv::Exception if the image cannot be read
Palette extractPaletteFromImage(const std::string& path, const ColorClusterer& clusterer, const ExtractorConfig& extractor);

// Dominant colors of a whole folder: the pixels of every readable image are pooled and clustered together.
// Unreadable images are skipped (and logged), they never abort the run.
//
// Args:
//   folder: directory holding the images
//   clusterer: clustering settings
//   extractor: gray filtering settings
//   progress: optional, called with (index, total, filename) before each image
//
// Returns:
//   The sorted palette of the pooled pixels, empty if no image contributed a pixel
//   or if fewer pixels than k were pooled
Palette extractPaletteFromFolder(
	const std::string& folder,
	const ColorClusterer& clusterer,
	const ExtractorConfig& extractor,
	const FileProgressCallback& progress = FileProgressCallback());

// One sorted palette per image of a folder. Unreadable images and images left without pixels
// after gray filtering are left out.
std::vector<ImagePalette> extractPalettesPerImage(
	const std::string& folder,
	const ColorClusterer& clusterer,
	const ExtractorConfig& extractor,
	const FileProgressCallback& progress = FileProgressCallback());

// Presence-agreement matrix of `colors` over the images of a folder (no gray filtering).
// Unreadable images are skipped and excluded from the divisor.
cv::Mat analyzeFolderCooccurrence(
	const std::string& folder,
	const std::vector<cv::Vec3f>& colors,
	const CooccurrenceEngine& engine,
	const FileProgressCallback& progress = FileProgressCallback());
