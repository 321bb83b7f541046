#pragma once
#include <stdexcept>
#include <string>

// Raised before any processing starts when an option is out of range
// (thresholds outside [0, 1], numColors outside [1, 256], ...)
class InvalidConfigurationError : public std::invalid_argument {
public:
	explicit InvalidConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

// Raised by the clusterer when there are fewer foreground samples than requested clusters.
// Not retried: the caller has to raise the sample fraction or lower the number of colors.
class InsufficientSamplesError : public std::runtime_error {
public:
	InsufficientSamplesError(int numPoints, int k)
		: std::runtime_error("number of samples (" + std::to_string(numPoints) +
			") is smaller than the number of clusters (" + std::to_string(k) + ")"),
		  num_points(numPoints), num_clusters(k) {}

	int numPoints() const { return num_points; }
	int numClusters() const { return num_clusters; }

private:
	int num_points;
	int num_clusters;
};
