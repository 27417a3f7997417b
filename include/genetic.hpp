#pragma once
#include "color_types.hpp"
#include "config.hpp"
#include <opencv2/core.hpp>
#include <random>
#include <utility>
#include <vector>

// Score every scheme starts a generation with
const double NEUTRAL_SCORE = 5.0;

// The built-in candidate pool used when no candidate colors are configured (9 colors)
std::vector<cv::Vec3b> defaultCandidateColors();

// One member of the population: a scheme together with its current score
struct Individual {
	Scheme scheme;
	double score = NEUTRAL_SCORE;
};

// (average score, best score) of one generation, recorded when it is evolved
struct GenerationRecord {
	double average = 0.0;
	double best = 0.0;
};

// Human-in-the-loop genetic search over color schemes for one target image.
//
// The target image is segmented once into n_colors clusters; a scheme assigns one color to each
// cluster label. Fitness is never computed here: the caller renders schemes with applyScheme(),
// rates them (a person, or any scoring function), hands the ratings over with setScores() and then
// calls evolve(). One evolve() must complete before the next setScores()/evolve() pair, the class
// is not meant to be shared between threads.
class GeneticColorOptimizer {
public:
	// Segment the target image and build the initial population
	//
	// Args:
	//   image: target image, CV_8UC3 in RGB order
	//   cfg: population size, mutation and elitism settings, candidate pool, clustering and random seeds
	//
	// Throws:
	//   cv::Exception if the image is empty or not 8-bit 3-channel
	//   std::invalid_argument if a setting is out of range or the candidate pool has fewer than n_colors colors
	GeneticColorOptimizer(const cv::Mat& image, const GeneticConfig& cfg);

	// Render a scheme: every pixel gets the color of its cluster label
	//
	// Returns:
	//   CV_8UC3 image (RGB) of the size of the target image
	//
	// Throws:
	//   std::invalid_argument if the scheme does not have exactly n_colors colors
	cv::Mat applyScheme(const Scheme& scheme) const;

	// Replace the scores of the current population, in population order
	//
	// Throws:
	//   std::invalid_argument if scores.size() != population size (nothing is updated)
	void setScores(const std::vector<double>& scores);

	// Move to the next generation: record the history, keep the elites, breed and mutate the rest,
	// reset every score to NEUTRAL_SCORE
	//
	// Throws:
	//   std::invalid_argument if any current score is negative, NaN or infinite
	void evolve();

	// The highest scored individual (first one on ties)
	const Individual& bestScheme() const;

	const std::vector<Individual>& population() const { return individuals; }
	std::vector<double> scores() const;
	const std::vector<GenerationRecord>& history() const { return records; }
	int generation() const { return generationCount; }
	int nColors() const { return cfg.n_colors; }
	int populationSize() const { return cfg.population_size; }
	const std::vector<int>& labels() const { return segmentLabels; }
	const GeneticConfig& config() const { return cfg; }

private:
	void generateInitialPopulation();
	std::pair<int, int> rouletteSelection();
	Scheme crossover(const Scheme& parent1, const Scheme& parent2);
	void mutate(std::vector<Individual>& offspring);

	GeneticConfig cfg;
	cv::Size imageSize;
	std::vector<int> segmentLabels;        // One cluster label per pixel, row-major, fixed for the lifetime
	std::vector<Individual> individuals;   // Always exactly population_size entries
	std::vector<GenerationRecord> records;
	int generationCount = 0;
	std::mt19937 rng;
};
