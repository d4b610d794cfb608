#include "superagent/agent/stuck_detector.hpp"

namespace superagent::agent {

void StuckDetector::observe(std::string_view state) {
    if (last_state_ && *last_state_ == state) {
        ++count_;
        return;
    }
    last_state_ = std::string(state);
    count_ = 1;
}

void StuckDetector::reset() {
    last_state_.reset();
    count_ = 0;
}

} // namespace superagent::agent
