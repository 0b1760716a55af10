#include "perfshift/utils/random_source.hpp"

#include <utility>

namespace perfshift::utils {

MersenneTwisterSource MersenneTwisterSource::fromEntropy() {
	std::random_device device;
	const std::uint64_t seed = (static_cast<std::uint64_t>(device()) << 32) | device();
	return MersenneTwisterSource(seed);
}

std::uint64_t MersenneTwisterSource::deriveSeed(std::uint64_t base, std::uint64_t stream) {
	// splitmix64 finaliser over the combined value
	std::uint64_t z = base + 0x9e3779b97f4a7c15ULL * (stream + 1);
	z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
	z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
	return z ^ (z >> 31);
}

void MersenneTwisterSource::shuffle(std::vector<double> &values) {
	for (std::size_t i = values.size(); i > 1; --i) {
		const auto j = static_cast<std::size_t>(engine_() % i);
		std::swap(values[i - 1], values[j]);
	}
}

} // namespace perfshift::utils
