#include "config.hpp"
#include <opencv2/core/utils/logger.hpp>
#include <stdexcept>

// Overwrite `value` only when the key exists in the file
template<typename T>
static void readIfPresent(const cv::FileNode& node, T& value)
{
	if (!node.empty()) node >> value;
}

static void readBool(const cv::FileNode& node, bool& value)
{
	if (node.empty()) return;
	int flag = 0;
	node >> flag;
	value = flag != 0;
}

AnalyzerConfig loadConfig(const std::string& path)
{
	cv::FileStorage fs(path, cv::FileStorage::READ);
	if (!fs.isOpened())
		CV_Error(cv::Error::StsError, "Cannot open configuration file: " + path);

	AnalyzerConfig config;

	cv::FileNode cluster = fs["cluster"];
	readIfPresent(cluster["k"], config.cluster.k);
	readIfPresent(cluster["restarts"], config.cluster.restarts);
	readIfPresent(cluster["seed"], config.cluster.seed);
	readIfPresent(cluster["max_iterations"], config.cluster.max_iterations);
	readIfPresent(cluster["epsilon"], config.cluster.epsilon);

	cv::FileNode extractor = fs["extractor"];
	readBool(extractor["filter_gray"], config.extractor.filter_gray);
	readIfPresent(extractor["gray_threshold"], config.extractor.gray_threshold);

	cv::FileNode cooccurrence = fs["cooccurrence"];
	readIfPresent(cooccurrence["distance_threshold"], config.cooccurrence.distance_threshold);
	cv::FileNode colors = cooccurrence["colors"];
	if (colors.isSeq()) {
		for (cv::FileNodeIterator it = colors.begin(); it != colors.end(); ++it) {
			cv::Vec3f color;
			(*it) >> color;
			config.cooccurrence.colors.push_back(color);
		}
	}

	cv::FileNode genetic = fs["genetic"];
	readIfPresent(genetic["n_colors"], config.genetic.n_colors);
	readIfPresent(genetic["population_size"], config.genetic.population_size);
	readIfPresent(genetic["mutation_rate"], config.genetic.mutation_rate);
	readIfPresent(genetic["max_mutation_change"], config.genetic.max_mutation_change);
	readIfPresent(genetic["elite_threshold"], config.genetic.elite_threshold);
	readIfPresent(genetic["cluster_restarts"], config.genetic.cluster_restarts);
	readIfPresent(genetic["cluster_seed"], config.genetic.cluster_seed);
	readIfPresent(genetic["seed"], config.genetic.seed);
	cv::FileNode candidates = genetic["candidate_colors"];
	if (candidates.isSeq()) {
		for (cv::FileNodeIterator it = candidates.begin(); it != candidates.end(); ++it) {
			cv::Vec3i color;
			(*it) >> color;
			for (int ch = 0; ch < 3; ++ch) {
				if (color[ch] < 0 || color[ch] > 255)
					throw std::invalid_argument("loadConfig: candidate color channel out of [0, 255] in " + path);
			}
			config.genetic.candidate_colors.push_back(cv::Vec3b((uchar)color[0], (uchar)color[1], (uchar)color[2]));
		}
	}

	validateConfig(config);
	CV_LOG_DEBUG(NULL, "Loaded configuration from " << path);
	return config;
}

void saveConfig(const std::string& path, const AnalyzerConfig& config)
{
	cv::FileStorage fs(path, cv::FileStorage::WRITE);
	if (!fs.isOpened())
		CV_Error(cv::Error::StsError, "Cannot write configuration file: " + path);

	fs << "cluster" << "{"
		<< "k" << config.cluster.k
		<< "restarts" << config.cluster.restarts
		<< "seed" << config.cluster.seed
		<< "max_iterations" << config.cluster.max_iterations
		<< "epsilon" << config.cluster.epsilon
		<< "}";

	fs << "extractor" << "{"
		<< "filter_gray" << (int)config.extractor.filter_gray
		<< "gray_threshold" << config.extractor.gray_threshold
		<< "}";

	fs << "cooccurrence" << "{"
		<< "distance_threshold" << config.cooccurrence.distance_threshold
		<< "colors" << "[";
	for (const cv::Vec3f& color : config.cooccurrence.colors)
		fs << color;
	fs << "]" << "}";

	fs << "genetic" << "{"
		<< "n_colors" << config.genetic.n_colors
		<< "population_size" << config.genetic.population_size
		<< "mutation_rate" << config.genetic.mutation_rate
		<< "max_mutation_change" << config.genetic.max_mutation_change
		<< "elite_threshold" << config.genetic.elite_threshold
		<< "cluster_restarts" << config.genetic.cluster_restarts
		<< "cluster_seed" << config.genetic.cluster_seed
		<< "seed" << config.genetic.seed
		<< "candidate_colors" << "[";
	for (const cv::Vec3b& color : config.genetic.candidate_colors)
		fs << cv::Vec3i(color[0], color[1], color[2]);
	fs << "]" << "}";

	fs.release();
}

void validateConfig(const AnalyzerConfig& config)
{
	if (config.cluster.k < 1)
		throw std::invalid_argument("config: cluster.k must be at least 1");
	if (config.cluster.restarts < 1)
		throw std::invalid_argument("config: cluster.restarts must be at least 1");
	if (config.cluster.max_iterations < 1)
		throw std::invalid_argument("config: cluster.max_iterations must be at least 1");
	if (config.cluster.epsilon < 0.0)
		throw std::invalid_argument("config: cluster.epsilon must not be negative");

	if (config.extractor.gray_threshold < 0)
		throw std::invalid_argument("config: extractor.gray_threshold must not be negative");

	if (config.cooccurrence.distance_threshold < 0.0)
		throw std::invalid_argument("config: cooccurrence.distance_threshold must not be negative");

	if (config.genetic.n_colors < 1)
		throw std::invalid_argument("config: genetic.n_colors must be at least 1");
	if (config.genetic.population_size < 1)
		throw std::invalid_argument("config: genetic.population_size must be at least 1");
	if (config.genetic.mutation_rate < 0.0 || config.genetic.mutation_rate > 1.0)
		throw std::invalid_argument("config: genetic.mutation_rate must be in [0, 1]");
	if (config.genetic.max_mutation_change < 0.0)
		throw std::invalid_argument("config: genetic.max_mutation_change must not be negative");
	if (config.genetic.cluster_restarts < 1)
		throw std::invalid_argument("config: genetic.cluster_restarts must be at least 1");
}
