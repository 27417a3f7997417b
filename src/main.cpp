#include "clustering.hpp"
#include "config.hpp"
#include "cooccurrence.hpp"
#include "genetic.hpp"
#include "image_collection.hpp"
#include "pixel_corpus.hpp"
#include <opencv2/core.hpp>
#include <opencv2/core/utils/filesystem.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

static const char* keys =
	"{help h usage ? |         | print this message }"
	"{@command       |         | extract, per-image, cooccur or evolve }"
	"{@input         |         | image file or folder }"
	"{config c       |         | configuration file (YAML, JSON or XML) }"
	"{k              | 0       | number of colors, overrides the configuration when > 0 }"
	"{out o          | .       | folder receiving the rendered schemes (evolve) }"
	"{log            | warning | log level: silent, fatal, error, warning, info, debug, verbose }";

static cv::utils::logging::LogLevel parseLogLevel(const std::string& name)
{
	using namespace cv::utils::logging;
	if (name == "silent") return LOG_LEVEL_SILENT;
	if (name == "fatal") return LOG_LEVEL_FATAL;
	if (name == "error") return LOG_LEVEL_ERROR;
	if (name == "info") return LOG_LEVEL_INFO;
	if (name == "debug") return LOG_LEVEL_DEBUG;
	if (name == "verbose") return LOG_LEVEL_VERBOSE;
	return LOG_LEVEL_WARNING;
}

static void printPalette(const Palette& palette)
{
	for (const ColorCluster& c : palette) {
		int r = cv::saturate_cast<uchar>(c.color[0]);
		int g = cv::saturate_cast<uchar>(c.color[1]);
		int b = cv::saturate_cast<uchar>(c.color[2]);
		std::cout << cv::format("  #%02x%02x%02x  (%3d, %3d, %3d)  %6.2f%%", r, g, b, r, g, b, c.weight * 100.0) << std::endl;
	}
}

// Progress on stderr so stdout stays clean for results
static void printFileProgress(int current, int total, const std::string& filename)
{
	std::cerr << "[" << (current + 1) << "/" << total << "] " << filename << std::endl;
}

static int runExtract(const std::string& input, const AnalyzerConfig& config)
{
	ColorClusterer clusterer(config.cluster);
	Palette palette;
	if (cv::utils::fs::isDirectory(input))
		palette = extractPaletteFromFolder(input, clusterer, config.extractor, printFileProgress);
	else
		palette = extractPaletteFromImage(input, clusterer, config.extractor);

	if (palette.empty()) {
		std::cout << "No colors found in " << input << std::endl;
		return 1;
	}
	printPalette(palette);
	return 0;
}

static int runPerImage(const std::string& folder, const AnalyzerConfig& config)
{
	ColorClusterer clusterer(config.cluster);
	std::vector<ImagePalette> palettes = extractPalettesPerImage(folder, clusterer, config.extractor, printFileProgress);
	for (const ImagePalette& entry : palettes) {
		std::cout << entry.filename << std::endl;
		printPalette(entry.palette);
	}
	return palettes.empty() ? 1 : 0;
}

static int runCooccurrence(const std::string& folder, const AnalyzerConfig& config)
{
	std::vector<cv::Vec3f> colors = config.cooccurrence.colors;

	// Without an explicit color list, analyze the folder's own palette
	if (colors.empty()) {
		Palette palette = extractPaletteFromFolder(folder, ColorClusterer(config.cluster), config.extractor, printFileProgress);
		for (const ColorCluster& c : palette) colors.push_back(c.color);
		std::cout << "Palette:" << std::endl;
		printPalette(palette);
	}
	if (colors.empty()) {
		std::cout << "No colors to analyze" << std::endl;
		return 1;
	}

	CooccurrenceEngine engine(config.cooccurrence.distance_threshold);
	cv::Mat matrix = analyzeFolderCooccurrence(folder, colors, engine, printFileProgress);
	std::cout << "Co-occurrence frequency matrix:" << std::endl << formatMatrix(matrix) << std::endl;
	return 0;
}

static void writeRgb(const std::string& path, const cv::Mat& rgb)
{
	cv::Mat bgr;
	cv::cvtColor(rgb, bgr, cv::COLOR_RGB2BGR); // imwrite expects BGR
	if (!cv::imwrite(path, bgr))
		CV_Error(cv::Error::StsError, "Failed to write " + path);
}

// Interactive session: render, read the scores from stdin, evolve, repeat
static int runEvolve(const std::string& imagePath, const std::string& outDir, const AnalyzerConfig& config)
{
	cv::Mat image = loadImageRGB(imagePath);
	GeneticColorOptimizer optimizer(image, config.genetic);
	cv::utils::fs::createDirectories(outDir);

	std::string line;
	while (true) {
		int gen = optimizer.generation();
		const std::vector<Individual>& population = optimizer.population();
		for (size_t i = 0; i < population.size(); ++i) {
			std::string path = cv::utils::fs::join(outDir, cv::format("gen%03d_scheme%02d.png", gen, (int)i));
			writeRgb(path, optimizer.applyScheme(population[i].scheme));
		}

		std::cout << "Generation " << gen << ": rendered " << population.size() << " schemes to " << outDir << std::endl;
		std::cout << "Enter " << optimizer.populationSize() << " scores (0-10), or q to stop: " << std::flush;
		if (!std::getline(std::cin, line) || line == "q") break;

		std::istringstream in(line);
		std::vector<double> scores;
		double score;
		while (in >> score) scores.push_back(score);

		try {
			optimizer.setScores(scores);
			optimizer.evolve();
		}
		catch (const std::invalid_argument& e) {
			std::cout << e.what() << std::endl; // Ask again for the same generation
		}
	}

	const Individual& best = optimizer.bestScheme();
	std::string bestPath = cv::utils::fs::join(outDir, "best.png");
	writeRgb(bestPath, optimizer.applyScheme(best.scheme));
	std::cout << "Best scheme (score " << best.score << ") written to " << bestPath << std::endl;

	for (size_t g = 0; g < optimizer.history().size(); ++g) {
		const GenerationRecord& rec = optimizer.history()[g];
		std::cout << cv::format("  generation %zu: average %.2f, best %.2f", g, rec.average, rec.best) << std::endl;
	}
	return 0;
}

// Entry point
int main(int argc, char** argv)
{
	cv::CommandLineParser parser(argc, argv, keys);
	parser.about("chromapath: dominant colors, color co-occurrence and interactive color scheme evolution");
	if (parser.has("help") || !parser.has("@command") || !parser.has("@input")) {
		parser.printMessage();
		return 0;
	}

	std::string command = parser.get<std::string>("@command");
	std::string input = parser.get<std::string>("@input");
	std::string configPath = parser.get<std::string>("config");
	std::string outDir = parser.get<std::string>("out");
	int k = parser.get<int>("k");
	cv::utils::logging::setLogLevel(parseLogLevel(parser.get<std::string>("log")));
	if (!parser.check()) {
		parser.printErrors();
		return 2;
	}

	try {
		AnalyzerConfig config;
		if (!configPath.empty())
			config = loadConfig(configPath);
		if (k > 0) {
			config.cluster.k = k;
			config.genetic.n_colors = k;
		}

		if (command == "extract") return runExtract(input, config);
		if (command == "per-image") return runPerImage(input, config);
		if (command == "cooccur") return runCooccurrence(input, config);
		if (command == "evolve") return runEvolve(input, outDir, config);

		std::cerr << "Unknown command: " << command << std::endl;
		parser.printMessage();
		return 2;
	}
	catch (const cv::Exception& e) {
		CV_LOG_ERROR(NULL, e.what());
	}
	catch (const std::exception& e) {
		CV_LOG_ERROR(NULL, e.what());
	}
	return 1;
}
