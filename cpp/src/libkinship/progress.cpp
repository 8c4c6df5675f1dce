#include "libkinship/progress.hpp"

#include <utility>

namespace libkinship {

ConsoleProgress::ConsoleProgress(std::string label, std::ostream& stream)
    : label_(std::move(label)), stream_(stream) {}

void ConsoleProgress::start(std::size_t total_steps) {
    total_ = total_steps;
    completed_ = 0;
    active_ = true;
    render();
}

void ConsoleProgress::advance() {
    if (!active_) {
        return;
    }
    if (completed_ < total_) {
        ++completed_;
    }
    render();
}

void ConsoleProgress::finish() {
    if (!active_) {
        return;
    }
    stream_ << std::endl;
    active_ = false;
}

void ConsoleProgress::render() {
    stream_ << '\r' << label_ << ": " << completed_ << "/" << total_ << std::flush;
}

std::unique_ptr<ProgressReporter> make_progress(bool enabled) {
    if (enabled) {
        return std::make_unique<ConsoleProgress>();
    }
    return std::make_unique<NullProgress>();
}

}  // namespace libkinship
