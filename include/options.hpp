#pragma once

// Options recognized by the shrinking pipeline, with their defaults
// - `num_colors`: palette size including the background slot, in [1, 256]
// - `value_threshold`, `sat_threshold`: foreground thresholds, in [0, 1]
// - `sample_fraction`: fraction of pixels sampled for palette estimation, in (0, 1]
// - `saturate`: stretch the palette to the full 0..255 range
// - `white_bg`: overwrite the background slot with pure white
// - `global_palette`: build one palette shared by every image of a batch
// - `kmeans_iter`: maximum number of k-means passes (>= 1)
struct ShrinkOptions {
	int num_colors = 8;
	float value_threshold = 0.25f;
	float sat_threshold = 0.20f;
	double sample_fraction = 0.05;
	bool saturate = true;
	bool white_bg = false;
	bool global_palette = false;
	int kmeans_iter = 40;
};

// Largest palette an index buffer (CV_8UC1) can address
constexpr int kMaxPaletteColors = 256;

// Throws InvalidConfigurationError naming the first offending option
void validateOptions(const ShrinkOptions& options);
