#pragma once
#include <opencv2/core.hpp>
#include <cstdint>

// Round a channel value to the center of its bin when only `bits_per_channel` significant bits are kept
// (shift down, shift up, add half a bin)
uchar quantizeChannel(uchar value, int bits_per_channel);

// Apply quantizeChannel to every channel of every pixel. Same shape and type as the input
cv::Mat quantizeColors(const cv::Mat& pixels, int bits_per_channel = 6);

// Pack an RGB triple into a 24-bit key (0xRRGGBB) and back
uint32_t packRgb(const cv::Vec3b& rgb);
cv::Vec3b unpackRgb(uint32_t packed);

// Estimate the background (paper) color as the most frequent quantized color.
//
// Args:
//   pixels: image or sample set (cv::Mat, CV_8UC3, RGB), must not be empty
//   bits_per_channel: significant bits kept per channel before counting, in [1, 8]
//
// Returns:
//   The quantized RGB color with the highest count. On a tie the color that entered the
//   histogram first wins, so the result depends on the input order.
cv::Vec3b estimateBackgroundColor(const cv::Mat& pixels, int bits_per_channel = 6);
