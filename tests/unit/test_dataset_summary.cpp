#include <gtest/gtest.h>
#include "dataset_summary.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

namespace scrub {

using namespace scrub::test;

class DatasetTest : public ::testing::Test {};

TEST_F(DatasetTest, DefaultRowIdsAreSequential) {
    Dataset data({texts("a", {"x", "y", "z"})});

    EXPECT_EQ(data.rowIds(), (RowIdList{0, 1, 2}));
    EXPECT_EQ(data.findRow(2), std::optional<RowPosition>{2});
    EXPECT_FALSE(data.findRow(9).has_value());
    EXPECT_FALSE(data.findColumn("b").has_value());
}

TEST_F(DatasetTest, ShapeViolationsAreRejected) {
    EXPECT_THROW(Dataset({texts("a", {"x"}), texts("b", {"x", "y"})}), ValidationException);
    EXPECT_THROW(Dataset({texts("a", {"x"}), texts("a", {"y"})}), ValidationException);
    EXPECT_THROW(Dataset({texts("a", {"x", "y"})}, {4, 4}), ValidationException);
    EXPECT_THROW(Dataset({texts("a", {"x", "y"})}, {1}), ValidationException);
}

TEST_F(DatasetTest, SelectRowsKeepsIdentifiers) {
    Dataset data({texts("a", {"x", "y", "z"})}, {7, 8, 9});

    Dataset picked = data.selectRows({2, 0});

    EXPECT_EQ(picked.rowIds(), (RowIdList{9, 7}));
    EXPECT_EQ(render(picked, "a"), (std::vector<std::string>{"z", "x"}));
    EXPECT_EQ(data.rowCount(), 3u);
}

TEST_F(DatasetTest, CountsMissingCellsAndEmptyRows) {
    Dataset data({column("a", ColumnType::NUMERIC, {num(1), missing(), missing()}),
                  column("b", ColumnType::TEXT, {missing(), txt(""), missing()})});

    EXPECT_EQ(data.missingCount(), 4u);
    EXPECT_EQ(data.missingCount(1), 2u);
    EXPECT_FALSE(data.rowIsEmpty(1));
    EXPECT_TRUE(data.rowIsEmpty(2));
}

class DatasetSummaryTest : public ::testing::Test {};

TEST_F(DatasetSummaryTest, SummarizesColumns) {
    Dataset data({numbers("n", {num(1), num(1), missing()}),
                  texts("t", {"a", "b", "c"})});

    auto summary = DatasetSummary::of(data);

    EXPECT_EQ(summary.rows, 3u);
    EXPECT_EQ(summary.columns, 2u);
    EXPECT_EQ(summary.missingCells, 1u);
    ASSERT_EQ(summary.columnSummaries.size(), 2u);
    EXPECT_EQ(summary.columnSummaries[0].missing, 1u);
    EXPECT_EQ(summary.columnSummaries[0].distinct, 1u);
    EXPECT_EQ(summary.columnSummaries[1].distinct, 3u);

    auto json = summary.toJson();
    EXPECT_EQ(json["missing_cells"].get<size_t>(), 1u);
    EXPECT_EQ(json["column_summaries"][1]["type"].get<std::string>(), "text");
}

TEST_F(DatasetSummaryTest, DiffReportsRemovedRowsAndTypeChanges) {
    Dataset before({column("v", ColumnType::TEXT, {txt("1"), missing(), txt("3")})});
    Dataset after({numbers("v", {num(1), num(3)})});

    auto diff = SummaryDiff::between(DatasetSummary::of(before), DatasetSummary::of(after));

    EXPECT_EQ(diff.rowsRemoved, 1);
    EXPECT_EQ(diff.missingResolved, 1);
    EXPECT_EQ(diff.typeChanges, (std::vector<std::string>{"v: text -> numeric"}));
}

TEST_F(DatasetSummaryTest, IntroducedMissingValuesShowAsNegative) {
    Dataset before({texts("v", {"a", "b"})});
    Dataset after({column("v", ColumnType::TEXT, {missing(), missing()})});

    auto diff = SummaryDiff::between(DatasetSummary::of(before), DatasetSummary::of(after));

    EXPECT_EQ(diff.rowsRemoved, 0);
    EXPECT_EQ(diff.missingResolved, -2);
    EXPECT_TRUE(diff.typeChanges.empty());
    EXPECT_EQ(diff.toJson()["missing_resolved"].get<long long>(), -2);
}

} // namespace scrub
