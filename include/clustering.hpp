#pragma once
#include "color_types.hpp"
#include "config.hpp"
#include <vector>

// Reduces a pixel population to K representative colors with relative weights
// using k-means in RGB space (see clustering.cpp)
class ColorClusterer {
public:
	// Args:
	//   cfg: k, restart count, seed and termination criteria
	//
	// Throws:
	//   std::invalid_argument if k, restarts or max_iterations is below 1, or epsilon is negative
	explicit ColorClusterer(const ClusterConfig& cfg = ClusterConfig());

	// Cluster the pixels into k colors. Runs `restarts` independent k-means and keeps the one
	// with the lowest inertia. With a non-negative seed the result is fully reproducible.
	//
	// Args:
	//   pixels: RGB pixel population (not modified)
	//   labels: optional output, receives the cluster index of every pixel
	//
	// Returns:
	//   k clusters in cluster-index order, weights = assigned pixels / total pixels.
	//   An empty population gives an empty palette.
	//
	// Throws:
	//   std::invalid_argument if the population has fewer than k pixels
	Palette fit(const PixelPopulation& pixels, std::vector<int>* labels = nullptr) const;

	// Same as fit(), but sorted by descending weight (ties keep cluster-index order)
	Palette fitSorted(const PixelPopulation& pixels) const;

	const ClusterConfig& config() const { return cfg; }

private:
	ClusterConfig cfg;
};

// Stable sort by descending weight. Sorting an already sorted palette changes nothing.
void sortPaletteByWeight(Palette& palette);

// Sum of the weights of a palette (1 for a palette produced by a single clustering)
double paletteWeightSum(const Palette& palette);

// Pool several pixel populations into one and cluster them together, to find the palette
// shared by an image collection
//
// Args:
//   populations: pixel populations, concatenated in order
//   clusterer: the clusterer to run on the pooled pixels
//
// Returns:
//   The sorted palette of the pooled pixels (empty if every population is empty)
Palette clusterCombined(const std::vector<PixelPopulation>& populations, const ColorClusterer& clusterer);
