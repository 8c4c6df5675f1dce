#include "libkinship/linear_kinship.hpp"

#include "libkinship/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace libkinship {

namespace {

void validate_features(const Eigen::MatrixXd& G) {
    if (G.rows() == 0 || G.cols() == 0) {
        throw ShapeMismatchError("linear_kinship requires at least one sample and one feature, got " +
                                 std::to_string(G.rows()) + "x" + std::to_string(G.cols()));
    }
}

void validate_output(const Eigen::MatrixXd& out, Eigen::Index n) {
    if (out.rows() != n || out.cols() != n) {
        throw ShapeMismatchError("kinship output buffer must be " + std::to_string(n) + "x" + std::to_string(n) +
                                 ", got " + std::to_string(out.rows()) + "x" + std::to_string(out.cols()));
    }
}

void add_gram(const Eigen::Ref<const Eigen::MatrixXd>& block, std::size_t total_features, Eigen::MatrixXd& out) {
    const Eigen::MatrixXd X = standardize_features(block, total_features);
    out.noalias() += X * X.transpose();
}

}  // namespace

std::vector<FeatureChunk> chunk_layout(std::size_t n_features, std::size_t max_chunks) {
    if (max_chunks == 0) {
        throw std::invalid_argument("max_chunks must be positive");
    }
    std::vector<FeatureChunk> chunks;
    if (n_features == 0) {
        return chunks;
    }

    const std::size_t nsteps = std::min(max_chunks, n_features);
    const std::size_t width = n_features / nsteps;
    chunks.reserve(nsteps);
    for (std::size_t i = 0; i < nsteps; ++i) {
        const std::size_t start = i * width;
        const std::size_t stop = (i + 1 == nsteps) ? n_features : start + width;
        chunks.push_back({start, stop});
    }
    return chunks;
}

Eigen::MatrixXd standardize_features(const Eigen::Ref<const Eigen::MatrixXd>& block, std::size_t total_features) {
    Eigen::MatrixXd X = block.rowwise() - block.colwise().mean();
    const Eigen::RowVectorXd stddev = (X.colwise().squaredNorm() / static_cast<double>(X.rows())).cwiseSqrt();
    X.array().rowwise() /= stddev.array();
    X /= std::sqrt(static_cast<double>(total_features));
    return X;
}

Eigen::MatrixXd& linear_kinship(const Eigen::MatrixXd& G,
                                Eigen::MatrixXd& out,
                                ProgressReporter& progress,
                                const KinshipOptions& options) {
    validate_features(G);
    validate_output(out, G.rows());

    const auto p = static_cast<std::size_t>(G.cols());
    const auto chunks = chunk_layout(p, options.max_chunks);

    if (options.verbose) {
        std::cout << "linear_kinship: " << G.rows() << " samples, " << p << " features in " << chunks.size()
                  << " chunks" << std::endl;
    }

    progress.start(chunks.size());
    for (const auto& chunk : chunks) {
        if (options.verbose) {
            std::cout << "  chunk [" << chunk.start << ", " << chunk.stop << ")" << std::endl;
        }
        add_gram(G.middleCols(static_cast<Eigen::Index>(chunk.start), static_cast<Eigen::Index>(chunk.width())), p,
                 out);
        progress.advance();
    }
    progress.finish();

    return out;
}

Eigen::MatrixXd& linear_kinship(const Eigen::MatrixXd& G, Eigen::MatrixXd& out, const KinshipOptions& options) {
    auto progress = make_progress(options.progress);
    return linear_kinship(G, out, *progress, options);
}

Eigen::MatrixXd linear_kinship(const Eigen::MatrixXd& G, const KinshipOptions& options) {
    Eigen::MatrixXd out = Eigen::MatrixXd::Zero(G.rows(), G.rows());
    linear_kinship(G, out, options);
    return out;
}

std::vector<double> linear_kinship(const std::vector<double>& features,
                                   std::size_t n_samples,
                                   std::size_t n_features,
                                   const KinshipOptions& options) {
    if (features.size() != n_samples * n_features) {
        throw ShapeMismatchError("feature buffer holds " + std::to_string(features.size()) +
                                 " values, expected " + std::to_string(n_samples) + "x" +
                                 std::to_string(n_features));
    }

    using RowMajorMatrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
    const Eigen::MatrixXd G = Eigen::Map<const RowMajorMatrix>(
        features.data(), static_cast<Eigen::Index>(n_samples), static_cast<Eigen::Index>(n_features));
    const Eigen::MatrixXd kernel = linear_kinship(G, options);

    std::vector<double> result(n_samples * n_samples);
    Eigen::Map<RowMajorMatrix>(result.data(), static_cast<Eigen::Index>(n_samples),
                               static_cast<Eigen::Index>(n_samples)) = kernel;
    return result;
}

KinshipAccumulator::KinshipAccumulator(std::size_t n_samples, std::size_t n_features)
    : n_samples_(n_samples), n_features_(n_features) {
    if (n_samples_ == 0 || n_features_ == 0) {
        throw ShapeMismatchError("KinshipAccumulator requires at least one sample and one feature");
    }
    const auto n = static_cast<Eigen::Index>(n_samples_);
    kernel_ = Eigen::MatrixXd::Zero(n, n);
}

void KinshipAccumulator::add(const Eigen::Ref<const Eigen::MatrixXd>& block) {
    if (static_cast<std::size_t>(block.rows()) != n_samples_) {
        throw ShapeMismatchError("feature block has " + std::to_string(block.rows()) + " rows, expected " +
                                 std::to_string(n_samples_));
    }
    const auto width = static_cast<std::size_t>(block.cols());
    if (width > n_features_ - features_seen_) {
        throw ShapeMismatchError("feature block of width " + std::to_string(width) + " exceeds the " +
                                 std::to_string(n_features_ - features_seen_) + " remaining features");
    }
    if (width == 0) {
        return;
    }
    add_gram(block, n_features_, kernel_);
    features_seen_ += width;
}

}  // namespace libkinship
