#include "cooccurrence.hpp"
#include <opencv2/core/utils/logger.hpp>
#include <sstream>
#include <stdexcept>
#include <iomanip>
#include <algorithm>

bool isColorPresent(const PixelPopulation& pixels, const cv::Vec3f& color, double distance_threshold)
{
	if (distance_threshold < 0.0) return false;
	// Compare squared distances to avoid a sqrt per pixel
	double maxDist2 = distance_threshold * distance_threshold;

	for (const PixelSample& p : pixels) {
		double dr = p[0] - color[0];
		double dg = p[1] - color[1];
		double db = p[2] - color[2];
		if (dr * dr + dg * dg + db * db <= maxDist2)
			return true;
	}
	return false;
}

bool anyColorPresent(const PixelPopulation& pixels, const std::vector<cv::Vec3f>& colors, double distance_threshold)
{
	for (const cv::Vec3f& color : colors) {
		if (isColorPresent(pixels, color, distance_threshold))
			return true;
	}
	return false;
}

CooccurrenceEngine::CooccurrenceEngine(double distance_threshold) : distance_threshold(distance_threshold)
{
	if (distance_threshold < 0.0)
		throw std::invalid_argument("CooccurrenceEngine: distance threshold must not be negative");
}

// Credit every pair of `colors` for which at least one color is present in `pixels`
void CooccurrenceEngine::creditPairs(const PixelPopulation& pixels, const std::vector<cv::Vec3f>& colors, cv::Mat& counts) const
{
	int n = (int)colors.size();

	// No color of the list in this item means no pair can be credited
	if (!anyColorPresent(pixels, colors, distance_threshold)) return;

	// Presence of every color once, instead of rescanning the pixels for each pair
	std::vector<bool> present(n);
	for (int i = 0; i < n; ++i)
		present[i] = isColorPresent(pixels, colors[i], distance_threshold);

	// A pair counts when either of its colors is present. Every increment is mirrored.
	for (int i = 0; i < n; ++i) {
		for (int j = i + 1; j < n; ++j) {
			if (present[i] || present[j]) {
				counts.at<double>(i, j) += 1.0;
				counts.at<double>(j, i) += 1.0;
			}
		}
	}
}

cv::Mat CooccurrenceEngine::analyze(
	const std::vector<PixelPopulation>& corpora,
	const std::vector<cv::Vec3f>& colors,
	const ProgressCallback& progress) const
{
	int n = (int)colors.size();
	int total = (int)corpora.size();
	cv::Mat counts(n, n, CV_64F, cv::Scalar(0));

	for (int idx = 0; idx < total; ++idx) {
		if (progress) progress(idx, total);
		creditPairs(corpora[idx], colors, counts);
	}

	CV_LOG_INFO(NULL, "CooccurrenceEngine: " << total << " items processed, " << n << " colors");

	if (total > 0 && n > 0)
		counts /= (double)total;
	return counts;
}

cv::Mat CooccurrenceEngine::analyze(
	const CorpusSource& source,
	int count,
	const std::vector<cv::Vec3f>& colors,
	const ProgressCallback& progress) const
{
	int n = (int)colors.size();
	cv::Mat counts(n, n, CV_64F, cv::Scalar(0));
	int processed = 0;

	for (int idx = 0; idx < count; ++idx) {
		if (progress) progress(idx, count);

		PixelPopulation pixels;
		if (!source(idx, pixels)) {
			CV_LOG_WARNING(NULL, "CooccurrenceEngine: skipping corpus item " << idx);
			continue; // Not counted in the divisor
		}
		++processed;
		creditPairs(pixels, colors, counts);
	}

	CV_LOG_INFO(NULL, "CooccurrenceEngine: " << processed << "/" << count << " items processed, " << n << " colors");

	if (processed > 0 && n > 0)
		counts /= (double)processed;
	return counts;
}

std::string formatMatrix(const cv::Mat& matrix, int precision)
{
	CV_Assert(matrix.empty() || matrix.channels() == 1);

	cv::Mat values;
	matrix.convertTo(values, CV_64F);

	std::ostringstream out;
	out << std::fixed << std::setprecision(std::max(0, precision));
	out << "[\n";
	for (int r = 0; r < values.rows; ++r) {
		out << "    [";
		for (int c = 0; c < values.cols; ++c) {
			if (c > 0) out << ", ";
			out << values.at<double>(r, c);
		}
		out << "],\n";
	}
	out << "]";
	return out.str();
}
