#pragma once
#include <opencv2/core.hpp>
#include <vector>
#include "random_source.hpp"

// Output of a k-means run over a sample set
// - `centers`: the k centroids, rounded and clamped to 8-bit channels, in discovery order
// - `labels`: for every input point, the index of its centroid after the last assignment step
// - `iterations`: number of assignment steps actually run
struct ClusterResult {
	std::vector<cv::Vec3b> centers;
	std::vector<int> labels;
	int iterations = 0;
};

// Pick k initial centroids with the k-means++ rule: the first uniformly at random, every next one
// with probability proportional to the squared distance to the nearest centroid chosen so far.
//
// Args:
//   points: sample set (cv::Mat, N x 1, CV_8UC3)
//   k: number of centroids, 1 <= k <= N
//   rng: random source
//
// Returns:
//   k centroids in float RGB space
std::vector<cv::Vec3f> initCentersPlusPlus(const cv::Mat& points, int k, RandomSource& rng);

// Index of the nearest center by Euclidean distance, lowest index on ties
int nearestCenter(const cv::Vec3f& point, const std::vector<cv::Vec3f>& centers);

// Partition a sample set into k color clusters (Lloyd iterations after k-means++ seeding).
// Iterates until the labels stop changing (never before the second pass) or max_iter passes ran.
// A centroid with no assigned points keeps its previous position.
//
// Args:
//   points: sample set (cv::Mat, N x 1, CV_8UC3)
//   k: number of clusters (>= 1)
//   max_iter: maximum number of assignment passes (>= 1)
//   rng: random source for the seeding
//
// Returns:
//   ClusterResult with exactly k centers
//
// Throws:
//   InsufficientSamplesError when N < k
ClusterResult kmeansPlusPlus(const cv::Mat& points, int k, int max_iter, RandomSource& rng);
