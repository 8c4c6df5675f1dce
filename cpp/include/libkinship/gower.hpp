#pragma once

#include <Eigen/Dense>

#include <cstddef>
#include <vector>

namespace libkinship {

/**
 * Gower rescaling factor c = (n - 1) / (trace(K) - sum_j mean_i K(i, j)).
 *
 * The denominator is (n - 1) times the expected sample variance of a draw from
 * N(0, K), so c * K has unit expected sample variance. A zero denominator is
 * not checked and yields Inf or NaN.
 *
 * @throws ShapeMismatchError if K is not square
 */
[[nodiscard]] double gower_scale(const Eigen::MatrixXd& K);

// Returns c * K; K is left untouched.
[[nodiscard]] Eigen::MatrixXd gower_norm(const Eigen::MatrixXd& K);

// Writes c * K into out, which must already have K's shape. out may be K.
void gower_norm(const Eigen::MatrixXd& K, Eigen::MatrixXd& out);

[[nodiscard]] std::vector<double> gower_norm(const std::vector<double>& matrix, std::size_t dimension);

void gower_norm(const std::vector<double>& matrix, std::size_t dimension, std::vector<double>& out);

}  // namespace libkinship
