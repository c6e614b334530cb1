/**
 * @file test_qc_score.cpp
 * @brief Юнит-тесты оценки качества кривой
 */

#include <doctest/doctest.h>
#include "core/qc_score.hpp"
#include <cmath>

using namespace logmerge::core;
using namespace logmerge::model;

namespace {

ValueList ramp(size_t n, double start, double step) {
    ValueList values;
    for (size_t i = 0; i < n; ++i) {
        values.push_back(start + step * static_cast<double>(i));
    }
    return values;
}

} // namespace

TEST_CASE("QC score of an empty or all-missing curve is exactly zero") {
    CHECK(curveQcScore({}) == 0.0);
    CHECK(curveQcScore({missingValue(), missingValue()}, std::string_view{"GR"}) == 0.0);
}

TEST_CASE("QC score of a clean ramp is full") {
    auto score = scoreCurveQuality(ramp(50, 10.0, 1.0), std::string_view{"GR"});
    CHECK(score.coverage == doctest::Approx(40.0));
    CHECK(score.flatline == doctest::Approx(20.0));
    CHECK(score.spike == doctest::Approx(20.0));
    CHECK(score.range == doctest::Approx(20.0));
    CHECK(score.total() == doctest::Approx(100.0));
}

TEST_CASE("QC coverage component uses valid over total points") {
    ValueList values = ramp(10, 1.0, 1.0);
    values.push_back(missingValue());
    values.push_back(missingValue());
    values.push_back(missingValue());
    values.push_back(missingValue());
    values.push_back(missingValue());
    values.push_back(missingValue());
    values.push_back(missingValue());
    values.push_back(missingValue());
    values.push_back(missingValue());
    values.push_back(missingValue());

    auto score = scoreCurveQuality(values);
    CHECK(score.valid_points == 10);
    CHECK(score.total_points == 20);
    CHECK(score.coverage == doctest::Approx(20.0));
}

TEST_CASE("QC flatline component penalizes near-zero differences") {
    // 5 точек, 4 разности, 2 из них нулевые
    ValueList values = {1.0, 1.0, 2.0, 2.0, 3.0};
    auto score = scoreCurveQuality(values);
    CHECK(score.flatline == doctest::Approx(10.0));

    ValueList single = {5.0};
    CHECK(scoreCurveQuality(single).flatline == doctest::Approx(20.0));

    ValueList constant(20, 7.0);
    CHECK(scoreCurveQuality(constant).flatline == doctest::Approx(0.0));
}

TEST_CASE("QC spike component needs more than ten valid points") {
    ValueList short_curve = {0.0, 1.0, 0.0, 1.0, 100.0, 0.0, 1.0, 0.0, 1.0, 0.0};
    CHECK(scoreCurveQuality(short_curve).spike == doctest::Approx(20.0));
}

TEST_CASE("QC spike component counts differences above three times p99") {
    // 200 разностей по 1.0 и одна огромная: p99 ≈ 1, порог ≈ 3
    ValueList values = ramp(201, 0.0, 1.0);
    values.push_back(10000.0);

    auto score = scoreCurveQuality(values);
    double expected = (1.0 - 1.0 / 201.0) * 20.0;
    CHECK(score.spike == doctest::Approx(expected));
}

TEST_CASE("QC range component uses the known curve type table") {
    ValueList values = {1.5, 2.0, 2.5, 3.5};  // один выше 3.0 для RHOB
    CHECK(scoreCurveQuality(values, std::string_view{"rhob"}).range == doctest::Approx(15.0));
    CHECK(scoreCurveQuality(values, std::string_view{"UNKNOWN"}).range == doctest::Approx(20.0));
    CHECK(scoreCurveQuality(values).range == doctest::Approx(20.0));

    REQUIRE(expectedRange("NPHI").has_value());
    CHECK(expectedRange("NPHI")->min == doctest::Approx(-0.15));
    CHECK(!expectedRange("LITH").has_value());
}

TEST_CASE("QC total stays within [0, 100]") {
    ValueList noisy = {1000.0, -5.0, missingValue(), 400.0, 400.0, 400.0, -300.0,
                       missingValue(), 1e6, 0.0, 0.0, 0.0, 5.0, 5.0};
    double total = curveQcScore(noisy, std::string_view{"GR"});
    CHECK(total >= 0.0);
    CHECK(total <= 100.0);
}
