#include "poppk/v1/dosing.hpp"

#include <algorithm>
#include <utility>

namespace poppk::v1 {

DosingRegimen::DosingRegimen(std::vector<DoseEvent> events)
    : events_(std::move(events)) {
    std::stable_sort(events_.begin(), events_.end(),
                     [](const DoseEvent& a, const DoseEvent& b) { return a.time < b.time; });
}

DosingRegimen DosingRegimen::from_config(const DosingConfig& config) {
    std::vector<DoseEvent> events;
    events.reserve(config.times.size());

    for (Real time : config.times) {
        DoseEvent event;
        event.time = time;
        event.amount = config.amount;
        event.route = config.route;
        if (config.route == DoseRoute::IvInfusion) {
            event.duration = config.duration();
        }
        if (config.route == DoseRoute::Oral) {
            event.bioavailability = config.bioavailability();
        }
        events.push_back(event);
    }

    return DosingRegimen(std::move(events));
}

std::span<const DoseEvent> DosingRegimen::events_before(Real t) const {
    // Sorted by time, so the causal history is a prefix
    auto end = std::upper_bound(events_.begin(), events_.end(), t,
                                [](Real value, const DoseEvent& e) { return value < e.time; });
    return {events_.data(), static_cast<std::size_t>(end - events_.begin())};
}

}  // namespace poppk::v1
