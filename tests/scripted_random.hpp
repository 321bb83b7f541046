#pragma once
#include "../include/random_source.hpp"
#include <deque>

// Random source replaying fixed values, so tests can predict every pick.
// nextIndex returns the queued values (reduced modulo n), nextUniform the queued values
// clamped below `upper`. Once a queue runs dry it returns 0.
class ScriptedRandomSource : public RandomSource {
public:
	std::deque<size_t> indices;
	std::deque<double> uniforms;

	size_t nextIndex(size_t n) override {
		if (indices.empty() || n == 0) return 0;
		size_t v = indices.front();
		indices.pop_front();
		return v % n;
	}

	double nextUniform(double upper) override {
		if (uniforms.empty()) return 0.0;
		double v = uniforms.front();
		uniforms.pop_front();
		return v < upper ? v : upper;
	}
};
