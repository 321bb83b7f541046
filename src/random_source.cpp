#include "random_source.hpp"

MersenneRandomSource::MersenneRandomSource()
	: gen(std::random_device{}()) // Non-deterministic seed, as for an interactive run
{
}

MersenneRandomSource::MersenneRandomSource(uint32_t seed)
	: gen(seed)
{
}

size_t MersenneRandomSource::nextIndex(size_t n)
{
	if (n <= 1) return 0;
	std::uniform_int_distribution<size_t> dist(0, n - 1);
	return dist(gen);
}

double MersenneRandomSource::nextUniform(double upper)
{
	if (upper <= 0.0) return 0.0;
	std::uniform_real_distribution<double> dist(0.0, upper);
	return dist(gen);
}
