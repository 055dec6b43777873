#include <gtest/gtest.h>
#include "basic_cleaners.hpp"
#include "cleaning_engine.hpp"
#include "test_helpers.hpp"

namespace scrub {

using namespace scrub::test;

class WhitespaceTrimmerTest : public ::testing::Test {
protected:
    CleaningEngine engine;

    OperationOutcome trim(const Dataset& data, Scope scope = {}) {
        return engine.apply(data, OperationDescriptor{TrimWhitespaceParams{}, std::move(scope)});
    }
};

TEST_F(WhitespaceTrimmerTest, TrimsTextCellsOnly) {
    Dataset data({texts("name", {"  ann ", "bob", "\tcid\n"}),
                  numbers("age", {num(1), num(2), missing()})});

    auto outcome = trim(data);

    EXPECT_EQ(render(outcome.dataset, "name"), (std::vector<std::string>{"ann", "bob", "cid"}));
    EXPECT_EQ(render(outcome.dataset, "age"), (std::vector<std::string>{"1", "2", "<missing>"}));
    EXPECT_EQ(outcome.affected, 2u);
    EXPECT_EQ(outcome.summary, "2 cells trimmed");
}

TEST_F(WhitespaceTrimmerTest, IsIdempotent) {
    Dataset data({texts("name", {" a ", "b  "})});

    auto once = trim(data);
    auto twice = trim(once.dataset);

    EXPECT_EQ(once.dataset, twice.dataset);
    EXPECT_EQ(twice.affected, 0u);
}

TEST_F(WhitespaceTrimmerTest, RespectsColumnAndRowScope) {
    Dataset data({texts("a", {" x ", " y "}), texts("b", {" x ", " y "})}, {10, 11});

    auto outcome = trim(data, {ColumnScope::of({"a"}), RowScope::of({11})});

    EXPECT_EQ(render(outcome.dataset, "a"), (std::vector<std::string>{" x ", "y"}));
    EXPECT_EQ(render(outcome.dataset, "b"), (std::vector<std::string>{" x ", " y "}));
}

class EmptyRowRemoverTest : public ::testing::Test {
protected:
    CleaningEngine engine;

    OperationOutcome removeEmpty(const Dataset& data, Scope scope = {}) {
        return engine.apply(data, OperationDescriptor{RemoveEmptyRowsParams{}, std::move(scope)});
    }
};

TEST_F(EmptyRowRemoverTest, DropsRowsWhereEveryCellIsMissing) {
    Dataset data({column("a", ColumnType::NUMERIC, {num(1), missing(), missing()}),
                  column("b", ColumnType::TEXT, {missing(), missing(), txt("")})});

    auto outcome = removeEmpty(data);

    // An empty string is a value, so row 2 stays
    EXPECT_EQ(outcome.dataset.rowIds(), (RowIdList{0, 2}));
    EXPECT_EQ(outcome.affected, 1u);
    EXPECT_EQ(outcome.summary, "1 empty rows removed");
}

TEST_F(EmptyRowRemoverTest, ColumnScopeDoesNotNarrowTheCheck) {
    Dataset data({column("a", ColumnType::NUMERIC, {missing(), missing()}),
                  column("b", ColumnType::NUMERIC, {num(5), missing()})});

    auto outcome = removeEmpty(data, {ColumnScope::of({"a"}), RowScope::all()});

    EXPECT_EQ(outcome.dataset.rowIds(), (RowIdList{0}));
}

TEST_F(EmptyRowRemoverTest, RowScopeLimitsCandidates) {
    Dataset data({column("a", ColumnType::NUMERIC, {missing(), missing(), num(1)})});

    auto outcome = removeEmpty(data, {ColumnScope::all(), RowScope::of({1, 2})});

    EXPECT_EQ(outcome.dataset.rowIds(), (RowIdList{0, 2}));
}

TEST_F(EmptyRowRemoverTest, DirectTransformReportsAllColumnsTouched) {
    Dataset data({column("a", ColumnType::NUMERIC, {missing()}),
                  column("b", ColumnType::TEXT, {missing()})});

    auto outcome = EmptyRowRemover().transform(data);

    EXPECT_EQ(outcome.dataset.rowCount(), 0u);
    EXPECT_EQ(outcome.touchedColumns, (std::vector<ColumnIndex>{0, 1}));
}

} // namespace scrub
