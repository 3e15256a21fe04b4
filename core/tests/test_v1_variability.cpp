#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "poppk/v1/random.hpp"
#include "poppk/v1/variability.hpp"

#include <algorithm>
#include <cmath>

using namespace poppk::v1;
using Catch::Approx;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

TEST_CASE("v1 random stream is reproducible for a fixed seed", "[v1][random]") {
    RandomStream a(42);
    RandomStream b(42);
    for (int i = 0; i < 16; ++i) {
        CHECK(a.standard_normal() == b.standard_normal());
    }

    RandomStream c(43);
    RandomStream d(42);
    bool any_different = false;
    for (int i = 0; i < 16; ++i) {
        any_different = any_different || (c.standard_normal() != d.standard_normal());
    }
    CHECK(any_different);
}

TEST_CASE("v1 random stream reseed restarts the sequence", "[v1][random]") {
    RandomStream rng(7);
    const Real first = rng.standard_normal();
    (void)rng.standard_normal();
    rng.reseed(7);
    CHECK(rng.standard_normal() == first);
    CHECK(rng.seed() == 7);
}

TEST_CASE("v1 derived patient seeds differ per patient", "[v1][random]") {
    const auto s1 = derive_patient_seed(123, 1);
    const auto s2 = derive_patient_seed(123, 2);
    CHECK(s1 != s2);
    CHECK(derive_patient_seed(123, 1) == s1);
    CHECK(derive_patient_seed(124, 1) != s1);
}

TEST_CASE("v1 log-normal IIV with zero CV returns theta without drawing", "[v1][variability]") {
    RandomStream rng(1);
    RandomStream reference(1);

    auto value = apply_log_normal_iiv(5.0, 0.0, rng);
    REQUIRE(value.has_value());
    CHECK(*value == 5.0);
    // Stream untouched
    CHECK(rng.standard_normal() == reference.standard_normal());
}

TEST_CASE("v1 sampled IIV always consumes one draw", "[v1][variability]") {
    RandomStream rng(1);
    RandomStream reference(1);

    auto value = sample_log_normal_iiv(5.0, 0.0, rng);
    REQUIRE(value.has_value());
    CHECK(*value == 5.0);
    (void)reference.standard_normal();
    CHECK(rng.standard_normal() == reference.standard_normal());
}

TEST_CASE("v1 log-normal IIV is theta times exp(eta)", "[v1][variability]") {
    RandomStream rng(99);
    RandomStream mirror(99);

    auto value = apply_log_normal_iiv(2.0, 30.0, rng);
    REQUIRE(value.has_value());
    const Real eta = mirror.normal(0.0, 0.3);
    CHECK_THAT(*value, WithinRel(2.0 * std::exp(eta), 1e-14));
}

TEST_CASE("v1 log-normal IIV geometric mean approaches theta", "[v1][variability]") {
    RandomStream rng(2024);
    constexpr int n = 10000;
    Real log_sum = 0.0;
    for (int i = 0; i < n; ++i) {
        auto value = apply_log_normal_iiv(4.0, 30.0, rng);
        REQUIRE(value.has_value());
        log_sum += std::log(*value);
    }
    const Real geometric_mean = std::exp(log_sum / n);
    CHECK_THAT(geometric_mean, WithinRel(4.0, 0.01));
}

TEST_CASE("v1 log-normal IIV rejects a negative CV", "[v1][variability]") {
    RandomStream rng(1);
    auto value = apply_log_normal_iiv(2.0, -10.0, rng);
    REQUIRE_FALSE(value.has_value());
    CHECK(value.error().kind == ErrorKind::Random);
}

TEST_CASE("v1 residual error with zero sigma reproduces the prediction", "[v1][variability]") {
    RandomStream rng(42);

    auto prop = apply_proportional_error(3.5, 0.0, rng);
    REQUIRE(prop.has_value());
    CHECK(*prop == 3.5);

    auto add = apply_additive_error(3.5, 0.0, rng);
    REQUIRE(add.has_value());
    CHECK(*add == 3.5);

    auto combined = apply_combined_error(3.5, 0.0, 0.0, rng);
    REQUIRE(combined.has_value());
    CHECK(*combined == 3.5);
}

TEST_CASE("v1 residual error consumes a fixed number of draws", "[v1][variability]") {
    SECTION("proportional and additive draw once") {
        RandomStream rng(5);
        RandomStream mirror(5);
        (void)apply_proportional_error(1.0, 0.1, rng);
        (void)mirror.standard_normal();
        CHECK(rng.standard_normal() == mirror.standard_normal());

        (void)apply_additive_error(1.0, 0.1, rng);
        (void)mirror.standard_normal();
        CHECK(rng.standard_normal() == mirror.standard_normal());
    }

    SECTION("combined draws additive then proportional") {
        RandomStream rng(5);
        RandomStream mirror(5);
        auto y = apply_combined_error(10.0, 0.5, 0.2, rng);
        REQUIRE(y.has_value());
        const Real eps_add = mirror.normal(0.0, 0.5);
        const Real eps_prop = mirror.normal(0.0, 0.2);
        const Real expected = std::max(10.0 * (1.0 + eps_prop) + eps_add, 0.0);
        CHECK_THAT(*y, WithinRel(expected, 1e-14));
        CHECK(rng.standard_normal() == mirror.standard_normal());
    }

    SECTION("a non-positive prediction still draws") {
        RandomStream rng(5);
        RandomStream mirror(5);
        auto y = apply_proportional_error(0.0, 0.3, rng);
        REQUIRE(y.has_value());
        CHECK(*y == 0.0);
        (void)mirror.standard_normal();
        CHECK(rng.standard_normal() == mirror.standard_normal());
    }
}

TEST_CASE("v1 residual error never goes negative", "[v1][variability]") {
    RandomStream rng(11);
    for (int i = 0; i < 2000; ++i) {
        auto add = apply_additive_error(0.05, 5.0, rng);
        REQUIRE(add.has_value());
        CHECK(*add >= 0.0);

        auto prop = apply_proportional_error(1.0, 3.0, rng);
        REQUIRE(prop.has_value());
        CHECK(*prop >= 0.0);

        auto combined = apply_combined_error(0.5, 2.0, 2.0, rng);
        REQUIRE(combined.has_value());
        CHECK(*combined >= 0.0);
    }
}

TEST_CASE("v1 residual error dispatch follows the configured model", "[v1][variability]") {
    RandomStream rng(8);
    RandomStream mirror(8);

    auto y = apply_residual_error(4.0, ErrorModelConfig::additive(0.25), rng);
    REQUIRE(y.has_value());
    const Real expected = std::max(4.0 + mirror.normal(0.0, 0.25), 0.0);
    CHECK_THAT(*y, WithinRel(expected, 1e-14));

    auto bad = apply_residual_error(4.0, ErrorModelConfig::proportional(-1.0), rng);
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error().kind == ErrorKind::Random);
}

TEST_CASE("v1 covariate factors degenerate to one", "[v1][variability][covariates]") {
    SECTION("power") {
        CHECK(covariate_factor(70.0, 70.0, 0.75, CovariateModel::Power) == Approx(1.0));
        CHECK(covariate_factor(95.0, 70.0, 0.0, CovariateModel::Power) == Approx(1.0));
    }
    SECTION("exponential") {
        CHECK(covariate_factor(40.0, 40.0, 0.02, CovariateModel::Exponential) == Approx(1.0));
        CHECK(covariate_factor(60.0, 40.0, 0.0, CovariateModel::Exponential) == Approx(1.0));
    }
    SECTION("linear") {
        CHECK(covariate_factor(40.0, 40.0, 0.02, CovariateModel::Linear) == Approx(1.0));
        CHECK(covariate_factor(60.0, 40.0, 0.0, CovariateModel::Linear) == Approx(1.0));
    }
}

TEST_CASE("v1 covariate factor forms", "[v1][variability][covariates]") {
    CHECK_THAT(covariate_factor(140.0, 70.0, 0.75, CovariateModel::Power),
               WithinRel(std::pow(2.0, 0.75), 1e-14));
    CHECK_THAT(covariate_factor(50.0, 40.0, 0.1, CovariateModel::Exponential),
               WithinRel(std::exp(1.0), 1e-14));
    CHECK_THAT(covariate_factor(50.0, 40.0, -0.01, CovariateModel::Linear),
               WithinAbs(0.9, 1e-14));
}
