#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace superagent::agent {

/// Counts how many consecutive times the agent has reported the same
/// high-level state. A different state starts a new run.
///
/// With a threshold of 3, the sequence A, A, A trips the detector on the
/// third A; A, A, B, A, A never does.
class StuckDetector {
public:
    explicit StuckDetector(int threshold) : threshold_(threshold) {}

    /// Record the next observed state.
    void observe(std::string_view state);

    /// True once the current run has reached the threshold.
    [[nodiscard]] auto should_abort() const noexcept -> bool {
        return threshold_ > 0 && count_ >= threshold_;
    }

    /// Length of the current run of identical states.
    [[nodiscard]] auto count() const noexcept -> int { return count_; }

    [[nodiscard]] auto threshold() const noexcept -> int { return threshold_; }

    void reset();

private:
    int threshold_;
    int count_ = 0;
    std::optional<std::string> last_state_;
};

} // namespace superagent::agent
