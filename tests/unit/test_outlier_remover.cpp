#include <gtest/gtest.h>
#include "cleaning_engine.hpp"
#include "outlier_remover.hpp"
#include "test_helpers.hpp"

namespace scrub {

using namespace scrub::test;

class OutlierRemoverTest : public ::testing::Test {
protected:
    CleaningEngine engine;

    OperationOutcome run(const Dataset& data, OutlierMethod method, Scope scope = {}) {
        return engine.apply(data, OperationDescriptor{RemoveOutliersParams{method}, std::move(scope)});
    }

    static std::vector<CellValue> values(std::initializer_list<double> xs) {
        std::vector<CellValue> cells;
        for (double x : xs) {
            cells.push_back(num(x));
        }
        return cells;
    }
};

TEST_F(OutlierRemoverTest, QuantileInterpolatesBetweenRanks) {
    std::vector<double> sorted{1, 2, 3, 4, 5, 100};
    EXPECT_DOUBLE_EQ(OutlierRemover::quantile(sorted, 0.25), 2.25);
    EXPECT_DOUBLE_EQ(OutlierRemover::quantile(sorted, 0.75), 4.75);
    EXPECT_DOUBLE_EQ(OutlierRemover::quantile(sorted, 1.0), 100.0);
    EXPECT_DOUBLE_EQ(OutlierRemover::quantile({7}, 0.5), 7.0);
}

TEST_F(OutlierRemoverTest, IqrRemovesOnlyTheExtremeValue) {
    Dataset data({numbers("x", values({1, 2, 3, 4, 5, 100}))});

    auto outcome = run(data, OutlierMethod::IQR);

    EXPECT_EQ(render(outcome.dataset, "x"),
              (std::vector<std::string>{"1", "2", "3", "4", "5"}));
    EXPECT_EQ(outcome.affected, 1u);
    EXPECT_EQ(outcome.summary, "1 outlier rows removed (iqr)");
}

TEST_F(OutlierRemoverTest, IqrBoundsMatchFormula) {
    Dataset data({numbers("x", values({1, 2, 3, 4, 5, 100}))});
    OutlierRemover remover(RemoveOutliersParams{OutlierMethod::IQR}, EngineConfig{});

    auto bounds = remover.boundsFor(data, 0);

    ASSERT_TRUE(bounds.has_value());
    EXPECT_DOUBLE_EQ(bounds->lower, 2.25 - 1.5 * 2.5);
    EXPECT_DOUBLE_EQ(bounds->upper, 8.5);
}

TEST_F(OutlierRemoverTest, ResultIndependentOfColumnOrder) {
    auto a = numbers("a", values({1, 2, 3, 4, 5, 100}));
    auto b = numbers("b", values({-50, 10, 11, 12, 13, 14}));

    auto first = run(Dataset({a, b}), OutlierMethod::IQR);
    auto second = run(Dataset({b, a}), OutlierMethod::IQR);

    EXPECT_EQ(first.dataset.rowIds(), (RowIdList{1, 2, 3, 4}));
    EXPECT_EQ(second.dataset.rowIds(), first.dataset.rowIds());
}

TEST_F(OutlierRemoverTest, ThresholdsComputedBeforeRemoval) {
    // Recomputing b's bounds after dropping row 5 would flag the 16 as well
    auto a = numbers("a", values({1, 2, 3, 4, 5, 100}));
    auto b = numbers("b", values({10, 10, 10, 10, 16, 20}));

    auto outcome = run(Dataset({a, b}), OutlierMethod::IQR);

    EXPECT_EQ(outcome.dataset.rowIds(), (RowIdList{0, 1, 2, 3, 4}));
}

TEST_F(OutlierRemoverTest, ZScoreUsesPopulationStatistics) {
    std::vector<double> xs(20, 10.0);
    xs.push_back(1000.0);
    std::vector<CellValue> cells;
    for (double x : xs) {
        cells.push_back(num(x));
    }
    Dataset data({numbers("x", cells)});

    auto outcome = run(data, OutlierMethod::ZSCORE);

    EXPECT_EQ(outcome.dataset.rowCount(), 20u);
    EXPECT_EQ(outcome.summary, "1 outlier rows removed (zscore)");
}

TEST_F(OutlierRemoverTest, ZeroStandardDeviationFlagsNothing) {
    Dataset data({numbers("x", values({4, 4, 4, 4}))});

    auto outcome = run(data, OutlierMethod::ZSCORE);

    EXPECT_EQ(outcome.dataset.rowCount(), 4u);
}

TEST_F(OutlierRemoverTest, MissingCellsAreNeverOutliers) {
    auto cells = values({1, 2, 3, 4, 5, 100});
    cells.push_back(missing());
    Dataset data({numbers("x", cells)});

    auto outcome = run(data, OutlierMethod::IQR);

    EXPECT_EQ(outcome.dataset.rowIds(), (RowIdList{0, 1, 2, 3, 4, 6}));
}

TEST_F(OutlierRemoverTest, ExplicitNonNumericColumnsAreSkipped) {
    Dataset data({numbers("x", values({1, 2, 3, 4, 5, 100})),
                  texts("label", {"a", "b", "c", "d", "e", "f"})});

    auto outcome = run(data, OutlierMethod::IQR, {ColumnScope::of({"label"}), RowScope::all()});

    EXPECT_EQ(outcome.dataset.rowCount(), 6u);
    ASSERT_EQ(outcome.notes.size(), 1u);
}

TEST_F(OutlierRemoverTest, StatisticsUseInScopeRowsOnly) {
    Dataset data({numbers("x", values({1, 2, 3, 4, 5, 100, 1000}))});

    // Row 6 (1000) is outside the scope and must survive
    auto outcome = run(data, OutlierMethod::IQR,
                       {ColumnScope::all(), RowScope::of({0, 1, 2, 3, 4, 5})});

    EXPECT_EQ(outcome.dataset.rowIds(), (RowIdList{0, 1, 2, 3, 4, 6}));
}

TEST_F(OutlierRemoverTest, InfinityTextDoesNotWipeTheColumn) {
    Dataset data({texts("v", {"1", "2", "3", "inf"})});
    ConvertTypesParams convert;
    convert.targets = {{"v", ConversionTarget::NUMERIC}};

    auto result = engine.run(data, {OperationDescriptor{convert, {}},
                                    OperationDescriptor{RemoveOutliersParams{OutlierMethod::ZSCORE}, {}}});

    EXPECT_EQ(result.dataset.rowCount(), 4u);
    EXPECT_EQ(render(result.dataset, "v"),
              (std::vector<std::string>{"1", "2", "3", "<missing>"}));
}

TEST_F(OutlierRemoverTest, OverflowingStatisticsFlagNothing) {
    Dataset data({numbers("x", values({1e308, 1e308, -1e308, 1}))});

    for (auto method : {OutlierMethod::ZSCORE, OutlierMethod::IQR}) {
        auto outcome = run(data, method);
        EXPECT_EQ(outcome.dataset.rowCount(), 4u);
        EXPECT_EQ(outcome.affected, 0u);
    }
}

} // namespace scrub
