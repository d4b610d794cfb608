#pragma once

#include <string_view>

namespace superagent::agent {

/// Default system prompt when the configuration does not supply one.
extern const std::string_view kDefaultSystemPrompt;

/// Default per-step guidance appended after the conversation on every
/// reasoning step.
extern const std::string_view kDefaultNextStepPrompt;

} // namespace superagent::agent
