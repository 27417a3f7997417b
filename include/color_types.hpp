#pragma once
#include <opencv2/core.hpp>
#include <functional>
#include <string>
#include <vector>

// A single pixel as an RGB triplet. Channel 0 is red, 1 is green, 2 is blue
// (note: this is NOT the BGR order OpenCV uses for decoded images).
typedef cv::Vec3b PixelSample;

// All the pixels of one image (or of several images pooled together), in no particular order.
typedef std::vector<PixelSample> PixelPopulation;

// One representative color found by clustering.
// - `color`: the cluster mean in RGB space (may be fractional)
// - `weight`: fraction of the input pixels assigned to this cluster, in [0, 1]
struct ColorCluster {
	cv::Vec3f color;
	double weight = 0.0;
};

// An ordered list of representative colors. Presentation order is descending weight.
typedef std::vector<ColorCluster> Palette;

// One candidate recoloring: position i holds the color substituted for cluster label i
typedef std::vector<cv::Vec3b> Scheme;

// Progress hook for operations iterating over many items: (current_index, total_count)
typedef std::function<void(int, int)> ProgressCallback;

// Progress hook for operations iterating over files: (current_index, total_count, filename)
typedef std::function<void(int, int, const std::string&)> FileProgressCallback;
