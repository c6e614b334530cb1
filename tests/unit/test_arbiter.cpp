/**
 * @file test_arbiter.cpp
 * @brief Юнит-тесты ранжирования источников и заполнения пропусков
 */

#include <doctest/doctest.h>
#include "core/arbiter.hpp"

using namespace logmerge::core;
using namespace logmerge::model;

namespace {

const double NaN = missingValue();

ProjectedSource makeSource(const std::string& id, const ValueList& depths,
                           const std::string& curve, const ValueList& values) {
    CurveTable table;
    table.addColumn(kDepthColumn, depths);
    table.addColumn(curve, values);
    return makeProjectedSource(id, std::move(table));
}

} // namespace

TEST_CASE("Ranking puts the fuller source first") {
    ValueList depths = {100.0, 100.5, 101.0, 101.5};
    std::vector<ProjectedSource> sources = {
        makeSource("A", depths, "GR", {50.0, 60.0, NaN, NaN}),
        makeSource("B", depths, "GR", {50.0, 60.0, 70.0, 80.0}),
    };

    auto ranking = rankSources("GR", sources);
    REQUIRE(ranking.size() == 2);
    CHECK(ranking[0].source_id == "B");
    CHECK(ranking[0].coverage == doctest::Approx(1.0));
    CHECK(ranking[1].source_id == "A");
    CHECK(ranking[1].coverage == doctest::Approx(0.5));
    CHECK(ranking[1].input_index == 0);
}

TEST_CASE("Ranking puts a fuller but noisier source first") {
    ValueList depths = {100.0, 100.5, 101.0, 101.5, 102.0, 102.5, 103.0, 103.5, 104.0, 104.5};
    // A: 90% покрытия, ровная «полка»; B: 60% покрытия, чистый рост
    std::vector<ProjectedSource> sources = {
        makeSource("A", depths, "GR", {50.0, 50.0, 50.0, 50.0, 50.0, 50.0, 50.0, 50.0, 50.0, NaN}),
        makeSource("B", depths, "GR", {NaN, NaN, NaN, NaN, 60.0, 61.0, 62.0, 63.0, 64.0, 65.0}),
    };

    auto ranking = rankSources("GR", sources);
    REQUIRE(ranking.size() == 2);
    CHECK(ranking[0].source_id == "A");
    CHECK(ranking[0].qc_score == doctest::Approx(76.0));
    CHECK(ranking[1].qc_score == doctest::Approx(84.0));

    ValueList merged;
    auto provenance = arbitrateCurve("GR", sources, merged);
    CHECK(provenance.source_file == "A");
    CHECK(provenance.gaps_count == 1);
    REQUIRE(provenance.gaps_filled_from.has_value());
    CHECK(*provenance.gaps_filled_from == "B");
    CHECK(merged[4] == doctest::Approx(50.0));
    CHECK(merged[9] == doctest::Approx(65.0));
}

TEST_CASE("Ranking breaks coverage ties by QC score") {
    ValueList depths = {100.0, 100.5, 101.0, 101.5};
    std::vector<ProjectedSource> sources = {
        makeSource("FLAT", depths, "GR", {50.0, 50.0, 50.0, 50.0}),
        makeSource("GOOD", depths, "GR", {50.0, 60.0, 70.0, 80.0}),
    };

    auto ranking = rankSources("GR", sources);
    REQUIRE(ranking.size() == 2);
    CHECK(ranking[0].source_id == "GOOD");
    CHECK(ranking[0].qc_score > ranking[1].qc_score);
}

TEST_CASE("Ranking keeps input order for full ties") {
    ValueList depths = {100.0, 100.5, 101.0};
    ValueList values = {1.0, 2.0, 3.0};
    std::vector<ProjectedSource> sources = {
        makeSource("first", depths, "GR", values),
        makeSource("second", depths, "GR", values),
        makeSource("third", depths, "GR", values),
    };

    auto ranking = rankSources("GR", sources);
    REQUIRE(ranking.size() == 3);
    CHECK(ranking[0].source_id == "first");
    CHECK(ranking[1].source_id == "second");
    CHECK(ranking[2].source_id == "third");
}

TEST_CASE("Ranking skips sources without the curve") {
    ValueList depths = {100.0, 100.5};
    std::vector<ProjectedSource> sources = {
        makeSource("A", depths, "RHOB", {2.3, 2.4}),
        makeSource("B", depths, "GR", {40.0, 45.0}),
    };

    auto ranking = rankSources("GR", sources);
    REQUIRE(ranking.size() == 1);
    CHECK(ranking[0].source_id == "B");
    CHECK(ranking[0].input_index == 1);
    CHECK(rankSources("NPHI", sources).empty());
}

TEST_CASE("Gap filling never overwrites existing values") {
    ValueList target = {1.0, NaN, 3.0, NaN};
    ValueList secondary = {10.0, 20.0, NaN, 40.0};

    CHECK(fillGaps(target, secondary) == 2);
    CHECK(target[0] == doctest::Approx(1.0));
    CHECK(target[1] == doctest::Approx(20.0));
    CHECK(target[2] == doctest::Approx(3.0));
    CHECK(target[3] == doctest::Approx(40.0));

    CHECK(fillGaps(target, secondary) == 0);
}

TEST_CASE("Curve arbitration copies the primary and fills from secondaries") {
    ValueList depths = {100.0, 100.5, 101.0, 101.5, 102.0};
    std::vector<ProjectedSource> sources = {
        makeSource("A", depths, "GR", {10.0, 20.0, 30.0, NaN, NaN}),
        makeSource("B", depths, "GR", {99.0, 99.0, NaN, 40.0, NaN}),
        makeSource("C", depths, "GR", {NaN, NaN, NaN, NaN, 50.0}),
    };

    ValueList merged;
    auto provenance = arbitrateCurve("GR", sources, merged);

    CHECK(provenance.source_file == "A");
    CHECK(provenance.kind == CurveKind::Continuous);
    REQUIRE(provenance.gaps_filled_from.has_value());
    CHECK(*provenance.gaps_filled_from == "B");
    CHECK(provenance.gaps_count == 2);
    CHECK(provenance.coverage == doctest::Approx(1.0));

    REQUIRE(merged.size() == 5);
    CHECK(merged[0] == doctest::Approx(10.0));
    CHECK(merged[1] == doctest::Approx(20.0));
    CHECK(merged[2] == doctest::Approx(30.0));
    CHECK(merged[3] == doctest::Approx(40.0));
    CHECK(merged[4] == doctest::Approx(50.0));
}

TEST_CASE("Curve arbitration stops filling once the curve is complete") {
    ValueList depths = {100.0, 100.5, 101.0};
    std::vector<ProjectedSource> sources = {
        makeSource("A", depths, "GR", {10.0, 20.0, 30.0}),
        makeSource("B", depths, "GR", {11.0, 21.0, 31.0}),
    };

    ValueList merged;
    auto provenance = arbitrateCurve("GR", sources, merged);
    CHECK(provenance.source_file == "A");
    CHECK(!provenance.gaps_filled_from.has_value());
    CHECK(provenance.gaps_count == 0);
    CHECK(provenance.ranking.size() == 2);
}

TEST_CASE("Arbitration keeps curves in first-appearance order") {
    ValueList depths = {100.0, 100.5};

    CurveTable first;
    first.addColumn(kDepthColumn, depths);
    first.addColumn("RHOB", {2.3, 2.4});
    first.addColumn("GR", {40.0, 45.0});

    CurveTable second;
    second.addColumn(kDepthColumn, depths);
    second.addColumn("GR", {41.0, 46.0});
    second.addColumn("LITH", {1.0, 2.0});

    std::vector<ProjectedSource> sources = {
        makeProjectedSource("A", std::move(first)),
        makeProjectedSource("B", std::move(second)),
    };

    MasterDepthGrid grid;
    grid.depths = depths;
    grid.step = Feet{0.5};

    auto result = arbitrateCurves(grid, sources);
    REQUIRE(result.merged.columns.size() == 4);
    CHECK(result.merged.columns[0].name == kDepthColumn);
    CHECK(result.merged.columns[1].name == "RHOB");
    CHECK(result.merged.columns[2].name == "GR");
    CHECK(result.merged.columns[3].name == "LITH");

    REQUIRE(result.curves.size() == 3);
    CHECK(result.curves[2].kind == CurveKind::Discrete);
    CHECK(result.curves[2].source_file == "B");
}
