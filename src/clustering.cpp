#include "clustering.hpp"
#include "threadpool.hpp"
#include <opencv2/core.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <algorithm>
#include <exception>
#include <future>
#include <random>
#include <stdexcept>
#include <string>

// Outcome of one k-means restart
struct RestartResult {
	double compactness = 0.0; // Sum of squared distances of every pixel to its center (inertia)
	cv::Mat labels;           // N x 1, CV_32S
	cv::Mat centers;          // k x 3, CV_32F
};

// Run a single k-means restart with its own seed
// cv::kmeans draws its k-means++ seeds from cv::theRNG(), which is thread-local,
// so reseeding it here only affects this restart
static RestartResult runRestart(const cv::Mat& samples, int k, const cv::TermCriteria& criteria, uint64 seed)
{
	cv::theRNG() = cv::RNG(seed);

	RestartResult result;
	result.compactness = cv::kmeans(samples, k, result.labels, criteria,
		1, cv::KMEANS_PP_CENTERS, result.centers);
	return result;
}

ColorClusterer::ColorClusterer(const ClusterConfig& cfg) : cfg(cfg)
{
	if (cfg.k < 1)
		throw std::invalid_argument("ColorClusterer: k must be at least 1");
	if (cfg.restarts < 1)
		throw std::invalid_argument("ColorClusterer: restarts must be at least 1");
	if (cfg.max_iterations < 1)
		throw std::invalid_argument("ColorClusterer: max_iterations must be at least 1");
	if (cfg.epsilon < 0.0)
		throw std::invalid_argument("ColorClusterer: epsilon must not be negative");
}

// Cluster a pixel population into k weighted colors
Palette ColorClusterer::fit(const PixelPopulation& pixels, std::vector<int>* labels) const
{
	if (labels) labels->clear();

	// Nothing to analyze: the caller gets an empty palette, not an error
	if (pixels.empty()) {
		CV_LOG_DEBUG(NULL, "ColorClusterer::fit: empty pixel population");
		return Palette();
	}
	if ((int)pixels.size() < cfg.k)
		throw std::invalid_argument("ColorClusterer::fit: population has " + std::to_string(pixels.size()) +
			" pixels, fewer than k = " + std::to_string(cfg.k));

	// View the population as an N x 3 matrix and convert it to float for cv::kmeans
	cv::Mat samples;
	cv::Mat(pixels).reshape(1).convertTo(samples, CV_32F);

	cv::TermCriteria criteria(cv::TermCriteria::EPS + cv::TermCriteria::MAX_ITER, cfg.max_iterations, cfg.epsilon);
	uint64 baseSeed = cfg.seed >= 0 ? (uint64)cfg.seed : (uint64)std::random_device{}();

	// Restarts are independent, so run them on the pool
	std::vector<std::future<RestartResult>> futures;
	futures.reserve(cfg.restarts);
	for (int r = 0; r < cfg.restarts; ++r) {
		uint64 restartSeed = baseSeed + (uint64)r;
		int k = cfg.k;
		futures.push_back(getThreadPool().submit([&samples, &criteria, k, restartSeed]() {
			return runRestart(samples, k, criteria, restartSeed);
			}));
	}

	// Every task references `samples`, so all of them must be finished before anything can throw
	for (auto& f : futures) f.wait();

	RestartResult best;
	int bestRestart = -1;
	std::exception_ptr failure;
	for (int r = 0; r < (int)futures.size(); ++r) {
		try {
			RestartResult result = futures[r].get();
			// Strictly lower wins, so ties go to the lowest restart index whatever the scheduling was
			if (bestRestart < 0 || result.compactness < best.compactness) {
				best = result;
				bestRestart = r;
			}
		}
		catch (...) {
			if (!failure) failure = std::current_exception();
		}
	}
	if (failure) std::rethrow_exception(failure);

	CV_LOG_DEBUG(NULL, "ColorClusterer::fit: " << pixels.size() << " pixels, k=" << cfg.k
		<< ", restart " << bestRestart << "/" << cfg.restarts << " won with inertia " << best.compactness);

	// Count the pixels assigned to each cluster
	std::vector<int> counts(cfg.k, 0);
	for (int i = 0; i < best.labels.rows; ++i)
		++counts[best.labels.at<int>(i)];

	Palette palette(cfg.k);
	double total = (double)pixels.size();
	for (int c = 0; c < cfg.k; ++c) {
		const float* center = best.centers.ptr<float>(c);
		palette[c].color = cv::Vec3f(center[0], center[1], center[2]);
		palette[c].weight = counts[c] / total;
	}

	if (labels) labels->assign(best.labels.begin<int>(), best.labels.end<int>());

	return palette;
}

Palette ColorClusterer::fitSorted(const PixelPopulation& pixels) const
{
	Palette palette = fit(pixels);
	sortPaletteByWeight(palette);
	return palette;
}

void sortPaletteByWeight(Palette& palette)
{
	std::stable_sort(palette.begin(), palette.end(),
		[](const ColorCluster& a, const ColorCluster& b) { return a.weight > b.weight; });
}

double paletteWeightSum(const Palette& palette)
{
	double sum = 0.0;
	for (const ColorCluster& c : palette) sum += c.weight;
	return sum;
}

// Find the palette shared by several pixel populations
Palette clusterCombined(const std::vector<PixelPopulation>& populations, const ColorClusterer& clusterer)
{
	size_t total = 0;
	for (const PixelPopulation& p : populations) total += p.size();

	PixelPopulation pooled;
	pooled.reserve(total);
	for (const PixelPopulation& p : populations)
		pooled.insert(pooled.end(), p.begin(), p.end());

	CV_LOG_DEBUG(NULL, "clusterCombined: pooled " << populations.size() << " populations, " << total << " pixels");
	return clusterer.fitSorted(pooled);
}
