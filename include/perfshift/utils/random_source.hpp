#pragma once

#include <cstdint>
#include <random>
#include <vector>

namespace perfshift::utils {

/**
 * @class RandomSource
 * @brief The randomness a permutation test needs: uniform reordering of values.
 *
 * Injected into the change-point detector so tests can pin the permutations
 * and assert exact probabilities.
 */
class RandomSource {
public:
	virtual ~RandomSource() = default;

	/**
	 * @brief Reorders the values into a uniformly random permutation.
	 */
	virtual void shuffle(std::vector<double> &values) = 0;
};

/**
 * @class MersenneTwisterSource
 * @brief Seedable RandomSource backed by std::mt19937_64.
 *
 * The shuffle is a Fisher-Yates pass that maps engine output to positions
 * itself, so a given seed produces the same permutations with every standard
 * library (std::shuffle and std::uniform_int_distribution do not guarantee
 * that).
 */
class MersenneTwisterSource final : public RandomSource {
public:
	static constexpr std::uint64_t kDefaultSeed = 1234;

	explicit MersenneTwisterSource(std::uint64_t seed = kDefaultSeed) : engine_(seed) {}

	/// Seeds a source from std::random_device for production runs.
	static MersenneTwisterSource fromEntropy();

	/// Mixes a base seed with a stream number so parallel tasks get independent sources.
	static std::uint64_t deriveSeed(std::uint64_t base, std::uint64_t stream);

	void shuffle(std::vector<double> &values) override;

private:
	std::mt19937_64 engine_;
};

} // namespace perfshift::utils
