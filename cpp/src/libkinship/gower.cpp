#include "libkinship/gower.hpp"

#include "libkinship/errors.hpp"

#include <string>

namespace libkinship {

namespace {

void require_square(const Eigen::MatrixXd& K) {
    if (K.rows() != K.cols()) {
        throw ShapeMismatchError("gower_norm requires a square matrix, got " + std::to_string(K.rows()) + "x" +
                                 std::to_string(K.cols()));
    }
}

[[nodiscard]] Eigen::Map<const Eigen::MatrixXd> map_square(const std::vector<double>& matrix,
                                                           std::size_t dimension) {
    if (matrix.size() != dimension * dimension) {
        throw ShapeMismatchError("matrix size mismatch for gower_norm: " + std::to_string(matrix.size()) +
                                 " values for dimension " + std::to_string(dimension));
    }
    const auto n = static_cast<Eigen::Index>(dimension);
    return Eigen::Map<const Eigen::MatrixXd>(matrix.data(), n, n);
}

}  // namespace

double gower_scale(const Eigen::MatrixXd& K) {
    require_square(K);
    const auto n = static_cast<double>(K.rows());
    return (n - 1.0) / (K.trace() - K.colwise().mean().sum());
}

Eigen::MatrixXd gower_norm(const Eigen::MatrixXd& K) {
    return gower_scale(K) * K;
}

void gower_norm(const Eigen::MatrixXd& K, Eigen::MatrixXd& out) {
    require_square(K);
    if (out.rows() != K.rows() || out.cols() != K.cols()) {
        throw ShapeMismatchError("gower_norm output buffer must be " + std::to_string(K.rows()) + "x" +
                                 std::to_string(K.cols()) + ", got " + std::to_string(out.rows()) + "x" +
                                 std::to_string(out.cols()));
    }
    const double c = gower_scale(K);
    if (&out != &K) {
        out = K;
    }
    out *= c;
}

// The flat overloads map the buffer as column-major. The scale factor only
// depends on the trace and the grand sum, which are the same for K and K^T,
// so the storage order of the caller does not matter.
std::vector<double> gower_norm(const std::vector<double>& matrix, std::size_t dimension) {
    std::vector<double> out(matrix.size());
    gower_norm(matrix, dimension, out);
    return out;
}

void gower_norm(const std::vector<double>& matrix, std::size_t dimension, std::vector<double>& out) {
    const Eigen::MatrixXd K = map_square(matrix, dimension);
    if (out.size() != matrix.size()) {
        throw ShapeMismatchError("gower_norm output buffer holds " + std::to_string(out.size()) +
                                 " values, expected " + std::to_string(matrix.size()));
    }
    const double c = gower_scale(K);
    for (std::size_t i = 0; i < matrix.size(); ++i) {
        out[i] = c * matrix[i];
    }
}

}  // namespace libkinship
