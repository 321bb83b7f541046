#pragma once
#include <opencv2/core.hpp>

// HSV-style saturation and value of a pixel, both in [0, 1]
struct SatVal {
	float saturation;
	float value;
};

SatVal rgbToSatVal(const cv::Vec3b& rgb);

// Classify each pixel as foreground (ink) or background (paper).
// A pixel is foreground when its value differs from the background's by at least
// value_threshold OR its saturation differs by at least sat_threshold.
//
// Args:
//   bg_color: reference background color (RGB)
//   pixels: image or sample set (cv::Mat, CV_8UC3, RGB)
//   value_threshold, sat_threshold: thresholds in [0, 1]
//
// Returns:
//   CV_8UC1 mask with the shape of `pixels`, 1 for foreground and 0 for background
cv::Mat computeForegroundMask(
	const cv::Vec3b& bg_color,
	const cv::Mat& pixels,
	float value_threshold = 0.25f,
	float sat_threshold = 0.20f
);

// Collect the pixels whose mask entry is non-zero into a sample set (N x 1, CV_8UC3), keeping their order
cv::Mat extractForeground(const cv::Mat& pixels, const cv::Mat& mask);
