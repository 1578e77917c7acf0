#pragma once

#include <vector>

namespace cred {

// ==========================================
// Descriptive statistics over score sequences
// ==========================================

/**
 * @brief Arithmetic mean
 * @return 0 for an empty sequence
 */
double mean(const std::vector<double>& values);

/**
 * @brief Sample variance (Bessel's correction, divides by n - 1)
 * @return 0 when fewer than two values are given
 */
double variance(const std::vector<double>& values);

/**
 * @brief Square root of the sample variance
 */
double standard_deviation(const std::vector<double>& values);

/**
 * @brief Median of a sorted copy; the input is left untouched
 * @return 0 for an empty sequence, average of the two middles for even n
 */
double median(const std::vector<double>& values);

/**
 * @brief Linear-interpolation percentile
 *
 * index = p / 100 * (n - 1) on a sorted copy, interpolated between the
 * floor and ceil ranks. p is clamped to [0, 100].
 *
 * @return 0 for an empty sequence, the element itself for n == 1
 */
double percentile(const std::vector<double>& values, double p);

// Round half away from zero to a fixed number of decimals
double round_to(double value, int decimals);

// Clamp into [lo, hi]
double clamp_range(double value, double lo, double hi);

} // namespace cred
