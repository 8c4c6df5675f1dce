#pragma once

#include <cstddef>
#include <iostream>
#include <memory>
#include <string>

namespace libkinship {

/**
 * Observer notified while a chunked computation advances.
 *
 * Implementations must not influence the computation they observe: the
 * estimator calls start() once with the number of steps, advance() after every
 * step and finish() when the loop is done.
 */
class ProgressReporter {
public:
    virtual ~ProgressReporter() = default;

    virtual void start(std::size_t total_steps) = 0;

    virtual void advance() = 0;

    virtual void finish() = 0;
};

class NullProgress final : public ProgressReporter {
public:
    void start(std::size_t) override {}

    void advance() override {}

    void finish() override {}
};

// Single-line "label: done/total" counter rewritten in place with '\r'.
class ConsoleProgress final : public ProgressReporter {
public:
    explicit ConsoleProgress(std::string label = "linear_kinship", std::ostream& stream = std::cerr);

    void start(std::size_t total_steps) override;

    void advance() override;

    void finish() override;

    [[nodiscard]] std::size_t completed() const noexcept { return completed_; }

    [[nodiscard]] std::size_t total() const noexcept { return total_; }

private:
    void render();

    std::string label_;
    std::ostream& stream_;
    std::size_t total_ = 0;
    std::size_t completed_ = 0;
    bool active_ = false;
};

[[nodiscard]] std::unique_ptr<ProgressReporter> make_progress(bool enabled);

}  // namespace libkinship
