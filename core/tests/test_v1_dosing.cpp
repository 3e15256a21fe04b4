#include <catch2/catch_test_macros.hpp>

#include "poppk/v1/dosing.hpp"

#include <utility>
#include <vector>

using namespace poppk::v1;

namespace {

DosingConfig make_dosing(DoseRoute route, std::vector<Real> times) {
    DosingConfig dosing;
    dosing.route = route;
    dosing.amount = 250.0;
    dosing.times = std::move(times);
    return dosing;
}

}  // namespace

TEST_CASE("v1 regimen has one event per administration time", "[v1][dosing]") {
    const auto regimen =
        DosingRegimen::from_config(make_dosing(DoseRoute::IvBolus, {0.0, 12.0, 24.0}));

    REQUIRE(regimen.size() == 3);
    for (const auto& event : regimen.events()) {
        CHECK(event.amount == 250.0);
        CHECK(event.route == DoseRoute::IvBolus);
        CHECK_FALSE(event.duration.has_value());
        CHECK(event.bioavailability == 1.0);
    }
}

TEST_CASE("v1 regimen sorts events by time", "[v1][dosing]") {
    const auto regimen =
        DosingRegimen::from_config(make_dosing(DoseRoute::IvBolus, {24.0, 0.0, 12.0}));

    REQUIRE(regimen.size() == 3);
    CHECK(regimen.events()[0].time == 0.0);
    CHECK(regimen.events()[1].time == 12.0);
    CHECK(regimen.events()[2].time == 24.0);
}

TEST_CASE("v1 regimen attaches duration to infusions only", "[v1][dosing]") {
    SECTION("infusion") {
        auto dosing = make_dosing(DoseRoute::IvInfusion, {0.0});
        dosing.additional = AdditionalDosingParams{1.5, std::nullopt, std::nullopt};
        const auto regimen = DosingRegimen::from_config(dosing);
        REQUIRE(regimen.size() == 1);
        REQUIRE(regimen.events()[0].duration.has_value());
        CHECK(*regimen.events()[0].duration == 1.5);
    }

    SECTION("bolus ignores a configured duration") {
        auto dosing = make_dosing(DoseRoute::IvBolus, {0.0});
        dosing.additional = AdditionalDosingParams{1.5, std::nullopt, std::nullopt};
        const auto regimen = DosingRegimen::from_config(dosing);
        CHECK_FALSE(regimen.events()[0].duration.has_value());
    }
}

TEST_CASE("v1 regimen carries oral bioavailability", "[v1][dosing]") {
    auto dosing = make_dosing(DoseRoute::Oral, {0.0, 8.0});
    dosing.additional = AdditionalDosingParams{std::nullopt, std::nullopt, 0.6};
    const auto regimen = DosingRegimen::from_config(dosing);

    for (const auto& event : regimen.events()) {
        CHECK(event.bioavailability == 0.6);
    }

    auto iv = make_dosing(DoseRoute::IvBolus, {0.0});
    iv.additional = AdditionalDosingParams{std::nullopt, std::nullopt, 0.6};
    CHECK(DosingRegimen::from_config(iv).events()[0].bioavailability == 1.0);
}

TEST_CASE("v1 events_before returns the causal prefix", "[v1][dosing]") {
    const auto regimen =
        DosingRegimen::from_config(make_dosing(DoseRoute::IvBolus, {0.0, 12.0, 24.0}));

    CHECK(regimen.events_before(-1.0).empty());
    CHECK(regimen.events_before(0.0).size() == 1);
    CHECK(regimen.events_before(11.999).size() == 1);
    CHECK(regimen.events_before(12.0).size() == 2);
    CHECK(regimen.events_before(100.0).size() == 3);

    for (Real t : {0.0, 5.0, 12.0, 30.0}) {
        for (const auto& event : regimen.events_before(t)) {
            CHECK(event.time <= t);
        }
    }
}

TEST_CASE("v1 empty regimen", "[v1][dosing]") {
    const DosingRegimen regimen;
    CHECK(regimen.empty());
    CHECK(regimen.events_before(10.0).empty());
}
