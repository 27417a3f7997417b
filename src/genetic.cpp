#include "genetic.hpp"
#include "clustering.hpp"
#include <opencv2/core/utils/logger.hpp>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>

std::vector<cv::Vec3b> defaultCandidateColors()
{
	return {
		cv::Vec3b(171, 162, 157),
		cv::Vec3b(175, 186, 196),
		cv::Vec3b(211, 196, 182),
		cv::Vec3b(84, 33, 35),
		cv::Vec3b(216, 160, 80),
		cv::Vec3b(86, 86, 69),
		cv::Vec3b(229, 170, 72),
		cv::Vec3b(0, 0, 0),
		cv::Vec3b(255, 255, 255),
	};
}

GeneticColorOptimizer::GeneticColorOptimizer(const cv::Mat& image, const GeneticConfig& config) : cfg(config)
{
	CV_Assert(!image.empty() && image.type() == CV_8UC3); // Target must be an 8-bit, 3-channel RGB image

	if (cfg.n_colors < 1)
		throw std::invalid_argument("GeneticColorOptimizer: n_colors must be at least 1");
	if (cfg.population_size < 1)
		throw std::invalid_argument("GeneticColorOptimizer: population_size must be at least 1");
	if (cfg.mutation_rate < 0.0 || cfg.mutation_rate > 1.0)
		throw std::invalid_argument("GeneticColorOptimizer: mutation_rate must be in [0, 1]");
	if (cfg.max_mutation_change < 0.0)
		throw std::invalid_argument("GeneticColorOptimizer: max_mutation_change must not be negative");

	if (cfg.candidate_colors.empty())
		cfg.candidate_colors = defaultCandidateColors();
	if ((int)cfg.candidate_colors.size() < cfg.n_colors)
		throw std::invalid_argument("GeneticColorOptimizer: " + std::to_string(cfg.candidate_colors.size()) +
			" candidate colors cannot fill schemes of " + std::to_string(cfg.n_colors) + " colors");

	rng.seed(cfg.seed >= 0 ? (std::mt19937::result_type)cfg.seed : std::random_device{}());
	imageSize = image.size();

	// Flatten the image row by row; labels come back in the same order
	PixelPopulation pixels;
	pixels.reserve(image.total());
	for (int r = 0; r < image.rows; ++r) {
		const cv::Vec3b* row = image.ptr<cv::Vec3b>(r);
		pixels.insert(pixels.end(), row, row + image.cols);
	}

	// Segment once; the labels stay fixed for every generation
	ClusterConfig clusterCfg;
	clusterCfg.k = cfg.n_colors;
	clusterCfg.restarts = cfg.cluster_restarts;
	clusterCfg.seed = cfg.cluster_seed;
	ColorClusterer(clusterCfg).fit(pixels, &segmentLabels);

	generateInitialPopulation();

	CV_LOG_INFO(NULL, "GeneticColorOptimizer: segmented " << imageSize.width << "x" << imageSize.height
		<< " image into " << cfg.n_colors << " labels, population of " << cfg.population_size);
}

// Every initial scheme is a random permutation of the first n_colors candidate colors
void GeneticColorOptimizer::generateInitialPopulation()
{
	Scheme selected(cfg.candidate_colors.begin(), cfg.candidate_colors.begin() + cfg.n_colors);

	individuals.clear();
	individuals.reserve(cfg.population_size);
	for (int i = 0; i < cfg.population_size; ++i) {
		Individual ind;
		ind.scheme = selected;
		std::shuffle(ind.scheme.begin(), ind.scheme.end(), rng);
		individuals.push_back(ind);
	}
}

cv::Mat GeneticColorOptimizer::applyScheme(const Scheme& scheme) const
{
	if ((int)scheme.size() != cfg.n_colors)
		throw std::invalid_argument("applyScheme: scheme has " + std::to_string(scheme.size()) +
			" colors, expected " + std::to_string(cfg.n_colors));

	cv::Mat out(imageSize, CV_8UC3);
	int rows = out.rows;
	int cols = out.cols;

	// Rows are independent, each one only writes its own output row
#pragma omp parallel for schedule(static)
	for (int r = 0; r < rows; ++r) {
		cv::Vec3b* outRow = out.ptr<cv::Vec3b>(r);
		const int* labelRow = segmentLabels.data() + (size_t)r * cols;
		for (int c = 0; c < cols; ++c)
			outRow[c] = scheme[labelRow[c]];
	}

	return out;
}

void GeneticColorOptimizer::setScores(const std::vector<double>& scores)
{
	if ((int)scores.size() != cfg.population_size)
		throw std::invalid_argument("setScores: expected " + std::to_string(cfg.population_size) +
			" scores, got " + std::to_string(scores.size()));

	for (size_t i = 0; i < scores.size(); ++i)
		individuals[i].score = scores[i];
}

std::vector<double> GeneticColorOptimizer::scores() const
{
	std::vector<double> result;
	result.reserve(individuals.size());
	for (const Individual& ind : individuals) result.push_back(ind.score);
	return result;
}

void GeneticColorOptimizer::evolve()
{
	// Only a sanity check: the neutral score passes it too. NaN and infinity fail it,
	// the roulette needs finite weights.
	for (const Individual& ind : individuals) {
		if (!std::isfinite(ind.score) || ind.score < 0.0)
			throw std::invalid_argument("evolve: all schemes must have a finite, non-negative score before evolution");
	}

	GenerationRecord record;
	double sum = 0.0;
	record.best = individuals.front().score;
	for (const Individual& ind : individuals) {
		sum += ind.score;
		record.best = std::max(record.best, ind.score);
	}
	record.average = sum / individuals.size();
	records.push_back(record);

	// Elites go to the next generation untouched
	std::vector<Individual> elite;
	for (const Individual& ind : individuals) {
		if (ind.score >= cfg.elite_threshold)
			elite.push_back(ind);
	}

	// Breed the remaining slots
	size_t offspringCount = individuals.size() - elite.size();
	std::vector<Individual> offspring;
	offspring.reserve(individuals.size());
	while (offspring.size() < offspringCount) {
		std::pair<int, int> parents = rouletteSelection();
		Individual child;
		child.scheme = crossover(individuals[parents.first].scheme, individuals[parents.second].scheme);
		offspring.push_back(child);
	}

	mutate(offspring);

	// Next generation: mutated offspring followed by the elites, all back to the neutral score
	offspring.insert(offspring.end(), elite.begin(), elite.end());
	for (Individual& ind : offspring) ind.score = NEUTRAL_SCORE;
	individuals.swap(offspring);
	++generationCount;

	CV_LOG_INFO(NULL, "GeneticColorOptimizer: generation " << generationCount << " (previous avg "
		<< record.average << ", best " << record.best << ", " << elite.size() << " elites kept)");
}

// Pick two parents (indices into the population), each with probability proportional to its score
// Falls back to a uniform choice when every score is zero
std::pair<int, int> GeneticColorOptimizer::rouletteSelection()
{
	std::vector<double> weights = scores();
	double total = std::accumulate(weights.begin(), weights.end(), 0.0);

	if (total == 0.0) {
		std::uniform_int_distribution<int> uniform(0, (int)individuals.size() - 1);
		int first = uniform(rng);
		int second = uniform(rng);
		return std::make_pair(first, second);
	}

	std::discrete_distribution<int> roulette(weights.begin(), weights.end());
	int first = roulette(rng);
	int second = roulette(rng);
	return std::make_pair(first, second);
}

// Two-point crossover: parent1[0:p1] + parent2[p1:p2] + parent1[p2:N] with 1 <= p1 < p2 <= N-1
// Schemes shorter than 3 colors have no two distinct cut points, the child is then a copy of parent1
Scheme GeneticColorOptimizer::crossover(const Scheme& parent1, const Scheme& parent2)
{
	int n = (int)parent1.size();
	if (n < 3) return parent1;

	// Two distinct points of [1, n-1]: draw the second one among the n-2 remaining values
	int p1 = std::uniform_int_distribution<int>(1, n - 1)(rng);
	int p2 = std::uniform_int_distribution<int>(1, n - 2)(rng);
	if (p2 >= p1) ++p2;
	if (p1 > p2) std::swap(p1, p2);

	Scheme child;
	child.reserve(n);
	child.insert(child.end(), parent1.begin(), parent1.begin() + p1);
	child.insert(child.end(), parent2.begin() + p1, parent2.begin() + p2);
	child.insert(child.end(), parent1.begin() + p2, parent1.end());
	return child;
}

// Scale every channel of floor(mutation_rate * offspring) distinct schemes by (1 + u),
// u uniform in [-max_mutation_change, max_mutation_change], then clamp to [0, 255]
void GeneticColorOptimizer::mutate(std::vector<Individual>& offspring)
{
	int count = (int)(cfg.mutation_rate * offspring.size());
	count = std::min(count, (int)offspring.size());
	if (count <= 0) return;

	std::vector<int> order(offspring.size());
	std::iota(order.begin(), order.end(), 0);
	std::shuffle(order.begin(), order.end(), rng);

	std::uniform_real_distribution<double> change(-cfg.max_mutation_change, cfg.max_mutation_change);
	for (int i = 0; i < count; ++i) {
		Scheme& scheme = offspring[order[i]].scheme;
		for (cv::Vec3b& color : scheme) {
			for (int ch = 0; ch < 3; ++ch) {
				double u = cfg.max_mutation_change > 0.0 ? change(rng) : 0.0;
				// Clamp before truncating, the scaled value may not fit in an int
				double value = std::max(0.0, std::min(255.0, color[ch] * (1.0 + u)));
				color[ch] = (uchar)(int)value;
			}
		}
	}
}

const Individual& GeneticColorOptimizer::bestScheme() const
{
	// max_element returns the first of equal maxima
	return *std::max_element(individuals.begin(), individuals.end(),
		[](const Individual& a, const Individual& b) { return a.score < b.score; });
}
