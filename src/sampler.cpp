#include "sampler.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

cv::Mat toSampleSet(const cv::Mat& image)
{
	if (image.empty())
		return cv::Mat(0, 1, CV_8UC3);
	if (image.type() != CV_8UC3)
		throw std::invalid_argument("toSampleSet: expected a CV_8UC3 image");

	cv::Mat contiguous = image.isContinuous() ? image : image.clone();
	return contiguous.reshape(3, static_cast<int>(contiguous.total())).clone();
}

// Randomly sample a fraction of the pixels. Only the first numSamples positions of the index
// permutation are shuffled (partial Fisher-Yates), which is enough to take a uniform prefix.
cv::Mat samplePixels(const cv::Mat& image, double sample_fraction, RandomSource& rng)
{
	if (!(sample_fraction > 0.0 && sample_fraction <= 1.0))
		throw InvalidConfigurationError("sample fraction must be in (0, 1]");

	cv::Mat pixels = toSampleSet(image);
	const int numPixels = pixels.rows;
	if (numPixels == 0)
		return pixels;

	int numSamples = static_cast<int>(std::floor(numPixels * sample_fraction));
	numSamples = std::min(numPixels, std::max(1, numSamples));

	std::vector<int> idx(numPixels);
	std::iota(idx.begin(), idx.end(), 0);
	for (int i = 0; i < numSamples; ++i) {
		int j = i + static_cast<int>(rng.nextIndex(static_cast<size_t>(numPixels - i)));
		std::swap(idx[i], idx[j]);
	}

	cv::Mat samples(numSamples, 1, CV_8UC3);
	for (int i = 0; i < numSamples; ++i)
		samples.at<cv::Vec3b>(i) = pixels.at<cv::Vec3b>(idx[i]);

	return samples;
}

cv::Mat rebalanceSamples(const std::vector<cv::Mat>& sets)
{
	size_t totalPixels = 0;
	for (const cv::Mat& s : sets) {
		if (!s.empty() && s.type() != CV_8UC3)
			throw std::invalid_argument("rebalanceSamples: expected CV_8UC3 sample sets");
		totalPixels += s.total();
	}
	if (sets.empty() || totalPixels == 0)
		return cv::Mat(0, 1, CV_8UC3);

	// Every image gets the same budget, whatever its resolution
	const size_t target = std::max<size_t>(1, static_cast<size_t>(
		std::llround(static_cast<double>(totalPixels) / static_cast<double>(sets.size()))));

	std::vector<cv::Vec3b> merged;
	merged.reserve(target * sets.size());

	for (const cv::Mat& s : sets) {
		if (s.empty()) continue;

		cv::Mat flat = toSampleSet(s);
		const size_t n = flat.total();
		const size_t step = std::max<size_t>(1, n / target);

		size_t taken = 0;
		for (size_t i = 0; i < n && taken < target; i += step, ++taken)
			merged.push_back(flat.at<cv::Vec3b>(static_cast<int>(i)));
	}

	cv::Mat out(static_cast<int>(merged.size()), 1, CV_8UC3);
	for (int i = 0; i < out.rows; ++i)
		out.at<cv::Vec3b>(i) = merged[i];
	return out;
}
