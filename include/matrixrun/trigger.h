#pragma once

#include <optional>
#include <string_view>

namespace matrixrun {

enum class TriggerEvent {
    Push,
    PullRequest,
};

// Events a job reacts to. Both by default, one full matrix run per event.
struct TriggerSet {
    bool push         = true;
    bool pull_request = true;

    [[nodiscard]] bool accepts(TriggerEvent event) const noexcept;
    [[nodiscard]] bool empty() const noexcept { return !push && !pull_request; }
};

// Accepts "push", "pull_request" and "pull-request".
std::optional<TriggerEvent> parse_trigger_event(std::string_view name);
std::string_view            to_string(TriggerEvent event);

// Parses a comma separated list such as "push,pull_request".
std::optional<TriggerSet> parse_trigger_set(std::string_view list);

} // namespace matrixrun
