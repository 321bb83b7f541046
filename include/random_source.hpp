#pragma once
#include <cstddef>
#include <cstdint>
#include <random>

// Source of randomness used by the sampler and the k-means++ initialization.
// Kept behind an interface so tests can feed a seeded or fully scripted sequence.
class RandomSource {
public:
	virtual ~RandomSource() = default;

	// Uniform integer in [0, n). n must be > 0
	virtual size_t nextIndex(size_t n) = 0;

	// Uniform real in [0, upper)
	virtual double nextUniform(double upper) = 0;
};

// Default source: Mersenne Twister engine
class MersenneRandomSource : public RandomSource {
public:
	// Seeded from std::random_device (non-reproducible runs)
	MersenneRandomSource();

	// Seeded explicitly (reproducible runs)
	explicit MersenneRandomSource(uint32_t seed);

	size_t nextIndex(size_t n) override;
	double nextUniform(double upper) override;

private:
	std::mt19937 gen;
};
