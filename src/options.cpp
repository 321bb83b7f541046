#include "options.hpp"
#include "errors.hpp"
#include <string>

static bool inUnitRange(float v) { return v >= 0.0f && v <= 1.0f; }

void validateOptions(const ShrinkOptions& options)
{
	if (options.num_colors < 1 || options.num_colors > kMaxPaletteColors)
		throw InvalidConfigurationError("num_colors must be in [1, " + std::to_string(kMaxPaletteColors) +
			"], got " + std::to_string(options.num_colors));
	if (!inUnitRange(options.value_threshold))
		throw InvalidConfigurationError("value_threshold must be in [0, 1], got " + std::to_string(options.value_threshold));
	if (!inUnitRange(options.sat_threshold))
		throw InvalidConfigurationError("sat_threshold must be in [0, 1], got " + std::to_string(options.sat_threshold));
	if (!(options.sample_fraction > 0.0 && options.sample_fraction <= 1.0))
		throw InvalidConfigurationError("sample_fraction must be in (0, 1], got " + std::to_string(options.sample_fraction));
	if (options.kmeans_iter < 1)
		throw InvalidConfigurationError("kmeans_iter must be >= 1, got " + std::to_string(options.kmeans_iter));
}
