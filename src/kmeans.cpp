#include "kmeans.hpp"
#include "errors.hpp"
#include <limits>
#include <stdexcept>

static float squaredDistance(const cv::Vec3f& a, const cv::Vec3f& b)
{
	float d2 = 0.0f;
	for (int d = 0; d < 3; ++d) {
		float diff = a[d] - b[d];
		d2 += diff * diff;
	}
	return d2;
}

static std::vector<cv::Vec3f> toPoints(const cv::Mat& samples)
{
	std::vector<cv::Vec3f> points;
	points.reserve(samples.total());
	for (int r = 0; r < samples.rows; ++r) {
		const cv::Vec3b* row = samples.ptr<cv::Vec3b>(r);
		for (int c = 0; c < samples.cols; ++c)
			points.emplace_back(row[c][0], row[c][1], row[c][2]);
	}
	return points;
}

int nearestCenter(const cv::Vec3f& point, const std::vector<cv::Vec3f>& centers)
{
	int bestIdx = 0;
	float bestDist2 = std::numeric_limits<float>::max();
	for (int ci = 0; ci < (int)centers.size(); ++ci) {
		float d2 = squaredDistance(point, centers[ci]);
		if (d2 < bestDist2) { bestDist2 = d2; bestIdx = ci; } // Strict: lowest index wins ties
	}
	return bestIdx;
}

static std::vector<cv::Vec3f> seedCenters(const std::vector<cv::Vec3f>& points, int k, RandomSource& rng)
{
	const size_t n = points.size();
	std::vector<cv::Vec3f> centers;
	centers.reserve(k);

	// First center: uniformly at random
	centers.push_back(points[rng.nextIndex(n)]);

	// Squared distance of every point to its nearest chosen center, updated as centers are added
	std::vector<double> dist2(n);
	for (size_t j = 0; j < n; ++j)
		dist2[j] = squaredDistance(points[j], centers[0]);

	for (int i = 1; i < k; ++i) {
		double sum = 0.0;
		for (double d : dist2) sum += d;

		// Walk the points subtracting their weight until the draw is used up
		double u = rng.nextUniform(sum);
		size_t selected = n;
		size_t lastWeighted = 0;
		for (size_t j = 0; j < n; ++j) {
			if (dist2[j] > 0.0) lastWeighted = j;
			u -= dist2[j];
			if (u <= 0.0) { selected = j; break; }
		}
		if (selected == n) selected = lastWeighted; // Rounding left the draw positive

		centers.push_back(points[selected]);

		for (size_t j = 0; j < n; ++j) {
			double d = squaredDistance(points[j], centers.back());
			if (d < dist2[j]) dist2[j] = d;
		}
	}

	return centers;
}

std::vector<cv::Vec3f> initCentersPlusPlus(const cv::Mat& points, int k, RandomSource& rng)
{
	if (k < 1)
		throw std::invalid_argument("initCentersPlusPlus: k must be >= 1");
	if (!points.empty() && points.type() != CV_8UC3)
		throw std::invalid_argument("initCentersPlusPlus: expected CV_8UC3 samples");

	std::vector<cv::Vec3f> pts = toPoints(points);
	if ((int)pts.size() < k)
		throw InsufficientSamplesError((int)pts.size(), k);

	return seedCenters(pts, k, rng);
}

// Recompute each center as the mean of its points. Empty clusters keep their previous center.
static void updateCenters(
	const std::vector<cv::Vec3f>& points,
	const std::vector<int>& labels,
	std::vector<cv::Vec3f>& centers)
{
	const size_t k = centers.size();
	std::vector<cv::Vec3d> sums(k, cv::Vec3d(0, 0, 0));
	std::vector<int> counts(k, 0);

	for (size_t i = 0; i < points.size(); ++i) {
		const int l = labels[i];
		++counts[l];
		for (int d = 0; d < 3; ++d) sums[l][d] += points[i][d];
	}

	for (size_t ci = 0; ci < k; ++ci) {
		if (counts[ci] == 0) continue;
		for (int d = 0; d < 3; ++d)
			centers[ci][d] = static_cast<float>(sums[ci][d] / counts[ci]);
	}
}

ClusterResult kmeansPlusPlus(const cv::Mat& points, int k, int max_iter, RandomSource& rng)
{
	if (k < 1)
		throw std::invalid_argument("kmeansPlusPlus: k must be >= 1");
	if (max_iter < 1)
		throw std::invalid_argument("kmeansPlusPlus: max_iter must be >= 1");
	if (!points.empty() && points.type() != CV_8UC3)
		throw std::invalid_argument("kmeansPlusPlus: expected CV_8UC3 samples");

	std::vector<cv::Vec3f> pts = toPoints(points);
	const int n = (int)pts.size();
	if (n < k)
		throw InsufficientSamplesError(n, k);

	std::vector<cv::Vec3f> centers = seedCenters(pts, k, rng);

	ClusterResult result;
	std::vector<int> labels(n, 0);
	std::vector<int> previous(n, 0);

	for (int iter = 0; iter < max_iter; ++iter) {
		for (int i = 0; i < n; ++i)
			labels[i] = nearestCenter(pts[i], centers);
		result.iterations = iter + 1;

		// The first pass has nothing meaningful to compare against
		if (iter > 0 && labels == previous)
			break;

		previous = labels;
		updateCenters(pts, labels, centers);
	}

	result.centers.reserve(k);
	for (const cv::Vec3f& c : centers)
		result.centers.emplace_back(
			cv::saturate_cast<uchar>(c[0]),
			cv::saturate_cast<uchar>(c[1]),
			cv::saturate_cast<uchar>(c[2]));
	result.labels = std::move(labels);
	return result;
}
