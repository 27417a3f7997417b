#include "image_collection.hpp"
#include "pixel_corpus.hpp"
#include <opencv2/core/utils/logger.hpp>
#include <stdexcept>
#include <utility>

Palette extractPaletteFromImage(const std::string& path, const ColorClusterer& clusterer, const ExtractorConfig& extractor)
{
	PixelPopulation pixels = loadAndExtractPixels(path, extractor.filter_gray, extractor.gray_threshold);
	if (pixels.empty()) {
		CV_LOG_DEBUG(NULL, "extractPaletteFromImage: no usable pixels in " << path);
		return Palette();
	}
	return clusterer.fitSorted(pixels);
}

// Pool the pixels of every readable image of the folder, then cluster once
Palette extractPaletteFromFolder(
	const std::string& folder,
	const ColorClusterer& clusterer,
	const ExtractorConfig& extractor,
	const FileProgressCallback& progress)
{
	std::vector<std::string> files = listImageFiles(folder);
	if (files.empty()) {
		CV_LOG_WARNING(NULL, "extractPaletteFromFolder: no images in " << folder);
		return Palette();
	}

	std::vector<PixelPopulation> populations;
	int total = (int)files.size();
	for (int i = 0; i < total; ++i) {
		if (progress) progress(i, total, baseName(files[i]));

		try {
			PixelPopulation pixels = loadAndExtractPixels(files[i], extractor.filter_gray, extractor.gray_threshold);
			if (!pixels.empty())
				populations.push_back(std::move(pixels));
		}
		catch (const cv::Exception& e) {
			CV_LOG_WARNING(NULL, "Skipping " << files[i] << ": " << e.what());
		}
	}

	if (populations.empty()) {
		CV_LOG_WARNING(NULL, "extractPaletteFromFolder: no usable pixels in " << folder);
		return Palette();
	}

	CV_LOG_INFO(NULL, "extractPaletteFromFolder: " << populations.size() << "/" << total << " images pooled");
	try {
		return clusterCombined(populations, clusterer);
	}
	catch (const std::invalid_argument& e) {
		// Fewer pooled pixels than k, same outcome as a folder without usable pixels
		CV_LOG_WARNING(NULL, "extractPaletteFromFolder: " << e.what());
		return Palette();
	}
}

std::vector<ImagePalette> extractPalettesPerImage(
	const std::string& folder,
	const ColorClusterer& clusterer,
	const ExtractorConfig& extractor,
	const FileProgressCallback& progress)
{
	std::vector<std::string> files = listImageFiles(folder);
	std::vector<ImagePalette> results;

	int total = (int)files.size();
	for (int i = 0; i < total; ++i) {
		std::string filename = baseName(files[i]);
		if (progress) progress(i, total, filename);

		try {
			ImagePalette entry;
			entry.filename = filename;
			entry.palette = extractPaletteFromImage(files[i], clusterer, extractor);
			if (!entry.palette.empty())
				results.push_back(entry);
		}
		catch (const cv::Exception& e) {
			CV_LOG_WARNING(NULL, "Skipping " << files[i] << ": " << e.what());
		}
		catch (const std::invalid_argument& e) {
			// Fewer usable pixels than k
			CV_LOG_WARNING(NULL, "Skipping " << files[i] << ": " << e.what());
		}
	}
	return results;
}

cv::Mat analyzeFolderCooccurrence(
	const std::string& folder,
	const std::vector<cv::Vec3f>& colors,
	const CooccurrenceEngine& engine,
	const FileProgressCallback& progress)
{
	std::vector<std::string> files = listImageFiles(folder);

	// Decode lazily, one image in memory at a time
	CorpusSource source = [&files](int index, PixelPopulation& pixels) {
		try {
			pixels = loadAndExtractPixels(files[index], false);
			return true;
		}
		catch (const cv::Exception& e) {
			CV_LOG_WARNING(NULL, "Skipping " << files[index] << ": " << e.what());
			return false;
		}
	};

	ProgressCallback fileProgress;
	if (progress) {
		fileProgress = [&files, &progress](int index, int total) {
			progress(index, total, baseName(files[index]));
		};
	}

	return engine.analyze(source, (int)files.size(), colors, fileProgress);
}
