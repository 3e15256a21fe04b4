#pragma once

#include "poppk/v1/config.hpp"
#include "poppk/v1/types.hpp"

#include <optional>
#include <span>
#include <vector>

namespace poppk::v1 {

/// Single administration
struct DoseEvent {
    Real time = 0.0;
    Real amount = 0.0;
    DoseRoute route = DoseRoute::IvBolus;
    std::optional<Real> duration;   // Infusions only
    Real bioavailability = 1.0;     // Applied to oral doses
};

/// Time-sorted list of dose events built from the dosing configuration
class DosingRegimen {
public:
    DosingRegimen() = default;
    explicit DosingRegimen(std::vector<DoseEvent> events);

    /// One event per administration time; route and amount copied, duration
    /// attached for infusions only.
    [[nodiscard]] static DosingRegimen from_config(const DosingConfig& config);

    /// Events with time <= t, in time order
    [[nodiscard]] std::span<const DoseEvent> events_before(Real t) const;

    [[nodiscard]] const std::vector<DoseEvent>& events() const { return events_; }
    [[nodiscard]] std::size_t size() const { return events_.size(); }
    [[nodiscard]] bool empty() const { return events_.empty(); }

private:
    std::vector<DoseEvent> events_;
};

}  // namespace poppk::v1
