/**
 * @file test_merge.cpp
 * @brief Юнит-тесты сведения прогонов
 */

#include <doctest/doctest.h>
#include "core/errors.hpp"
#include "core/merge.hpp"

using namespace logmerge::core;
using namespace logmerge::model;

namespace {

const double NaN = missingValue();

SourceData makeRun(const std::string& well, double start, double stop, double step,
                   const std::string& curve = "GR") {
    SourceData source;
    source.metadata.well_name = well;
    ValueList depths;
    ValueList values;
    for (double d = start; d <= stop + 1e-9; d += step) {
        depths.push_back(d);
        values.push_back(d - 900.0);
    }
    source.table.addColumn("DEPT", depths);
    source.table.addColumn(curve, values);
    return source;
}

MergeErrorKind mergeErrorKind(const std::vector<SourceData>& sources, const MergeOptions& options = {}) {
    try {
        (void)mergeSources(sources, {}, options);
    } catch (const MergeError& e) {
        return e.kind();
    }
    FAIL("mergeSources did not throw");
    return MergeErrorKind::InvalidOptions;
}

} // namespace

TEST_CASE("Merge of zero sources fails") {
    CHECK(mergeErrorKind({}) == MergeErrorKind::NoSources);
}

TEST_CASE("Merge rejects a non-positive grid step") {
    MergeOptions options;
    options.step = Feet{0.0};
    CHECK(mergeErrorKind({makeRun("W", 1000, 1010, 1), makeRun("W", 1000, 1010, 1)}, options)
          == MergeErrorKind::InvalidOptions);

    MergeOptions negative_gap;
    negative_gap.gap_limit = Feet{-1.0};
    CHECK(mergeErrorKind({makeRun("W", 1000, 1010, 1), makeRun("W", 1000, 1010, 1)}, negative_gap)
          == MergeErrorKind::InvalidOptions);
}

TEST_CASE("Single source is returned unchanged") {
    auto source = makeRun("WELL-1", 1000.0, 1010.0, 1.0);

    auto result = mergeSources({source}, {"run1.las"});

    REQUIRE(result.table.columns.size() == 2);
    CHECK(result.table.columns[0].name == "DEPT");
    CHECK(result.table.rowCount() == source.table.rowCount());
    CHECK(!result.effective_gap_limit.has_value());

    const auto& report = result.report;
    CHECK(!report.merge_performed);
    CHECK(report.well_name == "WELL-1");
    REQUIRE(report.files_processed.size() == 1);
    CHECK(report.files_processed[0] == "run1.las");
    REQUIRE(report.warnings.size() == 1);
    CHECK(report.warnings[0] == "Single file provided, no merge needed");
    CHECK(report.master_depth.points == 0);
    CHECK(report.master_depth.step == doctest::Approx(0.5));
    CHECK(report.curves.empty());
}

TEST_CASE("Single source without an id is named after its well") {
    auto result = mergeSources({makeRun("WELL-7", 1000.0, 1002.0, 1.0)});
    REQUIRE(result.report.files_processed.size() == 1);
    CHECK(result.report.files_processed[0] == "WELL-7");
}

TEST_CASE("Secondary run fills the primary's interior gap") {
    // A: 1000-1100 с провалом 1041-1059, B: 1030-1070 без провалов
    auto a = makeRun("WELL-1", 1000.0, 1100.0, 1.0);
    auto& a_values = a.table.columns[1].values;
    const auto& a_depths = a.table.columns[0].values;
    for (size_t i = 0; i < a_values.size(); ++i) {
        if (a_depths[i] > 1040.5 && a_depths[i] < 1059.5) {
            a_values[i] = NaN;
        }
    }
    auto b = makeRun("WELL-1", 1030.0, 1070.0, 0.5);

    MergeOptions options;
    options.gap_limit = Feet{1.0};

    std::vector<double> progress;
    auto result = mergeSources({a, b}, {"A", "B"}, options,
        [&progress](double value, std::string_view) { progress.push_back(value); });

    REQUIRE(result.effective_gap_limit.has_value());
    CHECK(result.effective_gap_limit->value == doctest::Approx(1.0));

    const auto& report = result.report;
    CHECK(report.merge_performed);
    CHECK(report.well_name == "WELL-1");
    CHECK(report.warnings.empty());
    CHECK(report.master_depth.min == doctest::Approx(1000.0));
    CHECK(report.master_depth.max == doctest::Approx(1100.0));
    CHECK(report.master_depth.points == 201);
    REQUIRE(report.files_processed.size() == 2);

    const auto* gr = report.findCurve("GR");
    REQUIRE(gr != nullptr);
    CHECK(gr->source_file == "A");
    REQUIRE(gr->gaps_filled_from.has_value());
    CHECK(*gr->gaps_filled_from == "B");
    // 1040.5-1059.5 и 1060 (замыкает широкий интервал A)
    CHECK(gr->gaps_count == 40);
    REQUIRE(gr->ranking.size() == 2);
    CHECK(gr->ranking[0].coverage == doctest::Approx(161.0 / 201.0));

    // Покрытие после заполнения, качество основного источника до заполнения
    CHECK(gr->coverage == doctest::Approx(1.0));
    CHECK(gr->qc_score == doctest::Approx(gr->ranking[0].qc_score));

    REQUIRE(result.table.columns.size() == 2);
    CHECK(result.table.columns[0].name == "DEPTH");
    const auto& merged = result.table.columns[1].values;
    REQUIRE(merged.size() == 201);
    CHECK(countPresent(merged) == 201);
    CHECK(merged[100] == doctest::Approx(150.0));   // 1050 ft из B
    CHECK(merged[0] == doctest::Approx(100.0));

    REQUIRE(!progress.empty());
    CHECK(progress.back() == doctest::Approx(1.0));
    for (size_t i = 1; i < progress.size(); ++i) {
        CHECK(progress[i] >= progress[i - 1]);
    }
}

TEST_CASE("Higher coverage wins over higher QC and the other run fills the tail") {
    // A: ровная «полка» 1000-1017 (качество ниже, покрытие выше),
    // B: чистый рост 1008-1019 (качество выше, покрытие ниже)
    auto a = makeRun("WELL-1", 1000.0, 1017.0, 1.0);
    for (auto& v : a.table.columns[1].values) {
        v = 50.0;
    }
    auto b = makeRun("WELL-1", 1008.0, 1019.0, 1.0);

    MergeOptions options;
    options.step = Feet{1.0};
    options.gap_limit = Feet{1.0};

    auto result = mergeSources({a, b}, {"A", "B"}, options);
    const auto& report = result.report;
    CHECK(report.master_depth.points == 20);

    const auto* gr = report.findCurve("GR");
    REQUIRE(gr != nullptr);
    REQUIRE(gr->ranking.size() == 2);

    CHECK(gr->ranking[0].source_id == "A");
    CHECK(gr->ranking[0].coverage == doctest::Approx(19.0 / 20.0));
    CHECK(gr->ranking[1].coverage == doctest::Approx(13.0 / 20.0));
    CHECK(gr->ranking[1].qc_score > gr->ranking[0].qc_score);

    CHECK(gr->source_file == "A");
    REQUIRE(gr->gaps_filled_from.has_value());
    CHECK(*gr->gaps_filled_from == "B");
    CHECK(gr->gaps_count == 1);
    CHECK(gr->coverage == doctest::Approx(1.0));
    CHECK(gr->qc_score == doctest::Approx(gr->ranking[0].qc_score));

    const auto& merged = result.table.find("GR")->values;
    REQUIRE(merged.size() == 20);
    CHECK(merged[10] == doctest::Approx(50.0));    // перекрытие: значение A
    CHECK(merged[18] == doctest::Approx(50.0));    // край A в пределах разрыва
    CHECK(merged[19] == doctest::Approx(119.0));   // 1019 ft только у B
}

TEST_CASE("Different well names produce a warning but still merge") {
    auto result = mergeSources({makeRun("W1", 1000, 1010, 1), makeRun("W2", 1005, 1020, 1)});

    REQUIRE(!result.report.warnings.empty());
    CHECK(result.report.warnings[0] == "Multiple wells detected: W1, W2");
    CHECK(result.report.well_name == "W1");
    CHECK(result.report.merge_performed);

    auto check = validateSameWell({makeRun("W1", 1000, 1010, 1), makeRun("W2", 1005, 1020, 1)});
    CHECK(!check.same_well);
    REQUIRE(check.well_names.size() == 2);
    CHECK(check.well_names[1] == "W2");
}

TEST_CASE("Source without depth is rejected with a warning") {
    SourceData broken;
    broken.metadata.well_name = "W";
    broken.table.addColumn("GR", {1.0, 2.0});

    auto result = mergeSources({makeRun("W", 1000, 1010, 1), makeRun("W", 1000, 1020, 1), broken});

    const auto& report = result.report;
    REQUIRE(report.files_processed.size() == 2);
    CHECK(report.files_processed[0] == "File_1");
    CHECK(report.files_processed[1] == "File_2");

    REQUIRE(report.rejected_sources.size() == 1);
    CHECK(report.rejected_sources[0].source_id == "File_3");
    REQUIRE(report.warnings.size() == 1);
    CHECK(report.warnings[0].rfind("Error normalizing File_3: ", 0) == 0);
}

TEST_CASE("Merge fails when no source can be normalized") {
    SourceData broken;
    broken.table.addColumn("GR", {1.0, 2.0});
    CHECK(mergeErrorKind({broken, broken}) == MergeErrorKind::NoUsableSources);
}

TEST_CASE("Merge fails when normalized sources carry no depths") {
    SourceData empty_depths;
    empty_depths.table.addColumn("DEPT", {NaN, NaN});
    empty_depths.table.addColumn("GR", {1.0, 2.0});
    CHECK(mergeErrorKind({empty_depths, empty_depths}) == MergeErrorKind::NoDepthData);
}

TEST_CASE("Source identifiers fall back to File_n") {
    CHECK(sourceIdentifier({"a.las"}, 0) == "a.las");
    CHECK(sourceIdentifier({"a.las"}, 1) == "File_2");
    CHECK(sourceIdentifier({}, 0) == "File_1");
}
