#include "matrixrun/trigger.h"

namespace matrixrun {

bool TriggerSet::accepts(TriggerEvent event) const noexcept {
    switch (event) {
    case TriggerEvent::Push: return push;
    case TriggerEvent::PullRequest: return pull_request;
    }
    return false;
}

std::optional<TriggerEvent> parse_trigger_event(std::string_view name) {
    if (name == "push")
        return TriggerEvent::Push;
    if (name == "pull_request" || name == "pull-request")
        return TriggerEvent::PullRequest;
    return std::nullopt;
}

std::string_view to_string(TriggerEvent event) {
    switch (event) {
    case TriggerEvent::Push: return "push";
    case TriggerEvent::PullRequest: return "pull_request";
    }
    return "unknown";
}

std::optional<TriggerSet> parse_trigger_set(std::string_view list) {
    TriggerSet set{false, false};
    while (!list.empty()) {
        const std::size_t comma = list.find(',');
        const auto        item  = list.substr(0, comma);
        const auto        event = parse_trigger_event(item);
        if (!event)
            return std::nullopt;
        if (*event == TriggerEvent::Push)
            set.push = true;
        else
            set.pull_request = true;
        if (comma == std::string_view::npos)
            break;
        list.remove_prefix(comma + 1);
    }
    if (set.empty())
        return std::nullopt;
    return set;
}

} // namespace matrixrun
