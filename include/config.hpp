#pragma once
#include "color_types.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

// K-means settings for palette extraction
// - `k`: number of representative colors
// - `restarts`: independent k-means runs; the lowest-inertia one wins
// - `seed`: base seed for the restarts (restart i uses seed + i). Negative means nondeterministic.
// - `max_iterations`, `epsilon`: termination criteria of a single k-means run
struct ClusterConfig {
	int k = 18;
	int restarts = 10;
	int seed = -1;
	int max_iterations = 300;
	double epsilon = 1e-4;
};

// How pixels are pulled out of decoded images
// - `filter_gray`: drop gray and near-gray pixels before clustering
// - `gray_threshold`: pixels whose max-min channel spread is below this are considered gray
struct ExtractorConfig {
	bool filter_gray = true;
	int gray_threshold = 1;
};

// Presence-agreement analysis settings
// - `distance_threshold`: Euclidean RGB distance under which a pixel matches a color
// - `colors`: the colors to analyze. Empty means "use the palette of the analyzed collection".
struct CooccurrenceConfig {
	double distance_threshold = 1.0;
	std::vector<cv::Vec3f> colors;
};

// Interactive genetic optimizer settings
// - `n_colors`: number of segments of the target image, which is also the scheme length
// - `population_size`: schemes per generation
// - `mutation_rate`: fraction of the offspring that gets mutated
// - `max_mutation_change`: maximum relative change of a channel during mutation
// - `elite_threshold`: schemes scored at or above this survive unchanged
// - `candidate_colors`: pool the initial schemes are drawn from. Empty means the built-in palette.
// - `cluster_restarts`, `cluster_seed`: k-means settings used to segment the target image
// - `seed`: seed of the evolutionary random generator. Negative means nondeterministic.
struct GeneticConfig {
	int n_colors = 5;
	int population_size = 16;
	double mutation_rate = 0.3;
	double max_mutation_change = 0.3;
	double elite_threshold = 7.5;
	std::vector<cv::Vec3b> candidate_colors;
	int cluster_restarts = 10;
	int cluster_seed = 42;
	int seed = -1;
};

// Everything the tools can be configured with
struct AnalyzerConfig {
	ClusterConfig cluster;
	ExtractorConfig extractor;
	CooccurrenceConfig cooccurrence;
	GeneticConfig genetic;
};

// Load a configuration file (YAML, JSON or XML, anything cv::FileStorage reads)
// Keys that are absent keep their default value
//
// Args:
//   path: configuration file
//
// Returns:
//   The loaded configuration, already validated
//
// Throws:
//   cv::Exception if the file cannot be opened, std::invalid_argument if a value is out of range
AnalyzerConfig loadConfig(const std::string& path);

// Write every setting of `config` to `path`. The format follows the file extension.
void saveConfig(const std::string& path, const AnalyzerConfig& config);

// Reject out-of-range settings with std::invalid_argument
void validateConfig(const AnalyzerConfig& config);
