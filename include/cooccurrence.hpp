#pragma once
#include "color_types.hpp"
#include <opencv2/core.hpp>
#include <functional>
#include <string>
#include <vector>

// Check whether a color shows up in a pixel population
//
// Args:
//   pixels: RGB pixel population
//   color: RGB color to look for
//   distance_threshold: maximum Euclidean RGB distance for a pixel to count as a match
//
// Returns:
//   true if at least one pixel lies within distance_threshold of color
bool isColorPresent(const PixelPopulation& pixels, const cv::Vec3f& color, double distance_threshold);

// true if isColorPresent() holds for at least one of the colors (logical OR, not AND)
bool anyColorPresent(const PixelPopulation& pixels, const std::vector<cv::Vec3f>& colors, double distance_threshold);

// Produces corpus item `index` into `pixels`. Returns false when the item could not be read;
// such items are skipped and do not count as processed.
typedef std::function<bool(int index, PixelPopulation& pixels)> CorpusSource;

// Measures how often, across a collection of images, each pair of colors of a fixed list is observed.
//
// A pair (i, j) is credited for an image when AT LEAST ONE of the two colors is present in it,
// not only when both are. The matrix therefore holds presence-agreement frequencies rather than
// strict joint occurrence.
class CooccurrenceEngine {
public:
	explicit CooccurrenceEngine(double distance_threshold = 1.0);

	// Compute the presence-agreement matrix of `colors` over in-memory pixel populations
	//
	// Args:
	//   corpora: one pixel population per image
	//   colors: the color list indexing the matrix
	//   progress: optional, called with (index, total) before each item
	//
	// Returns:
	//   colors.size() x colors.size() CV_64F matrix, symmetric, zero diagonal, each cell the number of
	//   crediting items divided by the number of processed items (all zero if nothing was processed)
	cv::Mat analyze(
		const std::vector<PixelPopulation>& corpora,
		const std::vector<cv::Vec3f>& colors,
		const ProgressCallback& progress = ProgressCallback()) const;

	// Same as above, with corpus items produced lazily by `source`. Items for which the source
	// fails are skipped and excluded from the divisor.
	cv::Mat analyze(
		const CorpusSource& source,
		int count,
		const std::vector<cv::Vec3f>& colors,
		const ProgressCallback& progress = ProgressCallback()) const;

	double distanceThreshold() const { return distance_threshold; }

private:
	void creditPairs(const PixelPopulation& pixels, const std::vector<cv::Vec3f>& colors, cv::Mat& counts) const;

	double distance_threshold;
};

// Render a matrix as fixed-precision rows:
// [
//     [0.00, 1.00],
//     [1.00, 0.00],
// ]
std::string formatMatrix(const cv::Mat& matrix, int precision = 2);
