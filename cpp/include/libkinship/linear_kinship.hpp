#pragma once

#include "libkinship/progress.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <vector>

namespace libkinship {

struct KinshipOptions {
    std::size_t max_chunks = 30;  // upper bound on feature blocks
    bool progress = true;         // report per-chunk progress on stderr
    bool verbose = false;         // print the chunk layout on stdout
};

// Half-open column range [start, stop) of the feature matrix.
struct FeatureChunk {
    std::size_t start;
    std::size_t stop;

    [[nodiscard]] std::size_t width() const noexcept { return stop - start; }
};

/**
 * Splits n_features columns into min(max_chunks, n_features) contiguous chunks
 * of n_features / nsteps columns each. The last chunk also takes the
 * remainder, so every column belongs to exactly one chunk.
 */
[[nodiscard]] std::vector<FeatureChunk> chunk_layout(std::size_t n_features, std::size_t max_chunks);

/**
 * Centres each column of block, divides it by its population standard
 * deviation and scales the result by 1 / sqrt(total_features).
 *
 * A constant column has zero deviation and yields NaN entries; no check is
 * made for it.
 */
[[nodiscard]] Eigen::MatrixXd standardize_features(const Eigen::Ref<const Eigen::MatrixXd>& block,
                                                   std::size_t total_features);

/**
 * Estimates the kinship matrix of G (n samples x p features) through a linear
 * kernel, adding the result into out.
 *
 * The feature columns are processed in chunks (see chunk_layout); each chunk
 * is standardized with standardize_features(chunk, p) and its Gram matrix
 * X * X^T is added to out. The sum over chunks equals the kernel of the fully
 * standardized matrix divided by p.
 *
 * @param G Feature matrix (n x p), n >= 1 and p >= 1
 * @param out Accumulator (n x n); modified in place and returned
 * @param progress Receives start/advance/finish notifications
 * @param options Chunking and logging options (options.progress is ignored)
 * @throws ShapeMismatchError if G is empty or out is not n x n
 */
Eigen::MatrixXd& linear_kinship(const Eigen::MatrixXd& G,
                                Eigen::MatrixXd& out,
                                ProgressReporter& progress,
                                const KinshipOptions& options = {});

Eigen::MatrixXd& linear_kinship(const Eigen::MatrixXd& G,
                                Eigen::MatrixXd& out,
                                const KinshipOptions& options = {});

[[nodiscard]] Eigen::MatrixXd linear_kinship(const Eigen::MatrixXd& G, const KinshipOptions& options = {});

// Row-major flattened variant; the result is n_samples x n_samples, row-major.
[[nodiscard]] std::vector<double> linear_kinship(const std::vector<double>& features,
                                                 std::size_t n_samples,
                                                 std::size_t n_features,
                                                 const KinshipOptions& options = {});

/**
 * Builds the same kernel as linear_kinship from feature blocks supplied one
 * at a time, for callers that cannot hold all of G in memory.
 */
class KinshipAccumulator {
public:
    KinshipAccumulator(std::size_t n_samples, std::size_t n_features);

    // Adds an n_samples x w block holding the next w feature columns.
    void add(const Eigen::Ref<const Eigen::MatrixXd>& block);

    [[nodiscard]] std::size_t n_samples() const noexcept { return n_samples_; }

    [[nodiscard]] std::size_t n_features() const noexcept { return n_features_; }

    [[nodiscard]] std::size_t features_seen() const noexcept { return features_seen_; }

    [[nodiscard]] bool complete() const noexcept { return features_seen_ == n_features_; }

    [[nodiscard]] const Eigen::MatrixXd& matrix() const noexcept { return kernel_; }

private:
    std::size_t n_samples_;
    std::size_t n_features_;
    std::size_t features_seen_ = 0;
    Eigen::MatrixXd kernel_;
};

}  // namespace libkinship
