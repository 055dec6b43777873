#include <gtest/gtest.h>
#include "cleaning_engine.hpp"
#include "exceptions.hpp"
#include "scope_resolver.hpp"
#include "test_helpers.hpp"

namespace scrub {

using namespace scrub::test;

class ScopeResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        dataset = Dataset({texts("name", {" ann ", " bob ", " cy "}),
                           texts("city", {" x ", " y ", " z "}),
                           numbers("age", {num(30), num(40), num(50)})},
                          {10, 11, 12});
    }

    Dataset dataset;
    ScopeResolver resolver;
};

TEST_F(ScopeResolverTest, DefaultScopeSelectsEverything) {
    auto scope = resolver.resolve(dataset, Scope{});

    EXPECT_FALSE(scope.columns.explicitScope);
    EXPECT_EQ(scope.columns.indices, (std::vector<ColumnIndex>{0, 1, 2}));
    EXPECT_TRUE(scope.allRows);
    EXPECT_EQ(scope.rows, (std::vector<RowPosition>{0, 1, 2}));
    EXPECT_TRUE(scope.ignoredColumns.empty());
    EXPECT_TRUE(scope.ignoredRowIds.empty());
}

TEST_F(ScopeResolverTest, PermissivePolicyIgnoresUnknownColumns) {
    Scope requested{ColumnScope::of({"age", "nope", "name"}), RowScope::all()};
    auto scope = resolver.resolve(dataset, requested);

    EXPECT_TRUE(scope.columns.explicitScope);
    EXPECT_EQ(scope.columns.indices, (std::vector<ColumnIndex>{0, 2}));
    ASSERT_EQ(scope.ignoredColumns.size(), 1u);
    EXPECT_EQ(scope.ignoredColumns[0], "nope");
}

TEST_F(ScopeResolverTest, StrictPolicyRejectsUnknownColumns) {
    ScopeResolver strict(ScopePolicy::STRICT);
    Scope requested{ColumnScope::of({"nope"}), RowScope::all()};

    try {
        strict.resolve(dataset, requested);
        FAIL() << "Expected ValidationException";
    } catch (const ValidationException& e) {
        EXPECT_EQ(e.getCode(), ErrorCode::UNKNOWN_COLUMN);
        EXPECT_EQ(e.getValue(), "nope");
    }
}

TEST_F(ScopeResolverTest, StaleRowIdentifiersAreIgnored) {
    Scope requested{ColumnScope::all(), RowScope::of({11, 99})};
    auto scope = resolver.resolve(dataset, requested);

    EXPECT_FALSE(scope.allRows);
    EXPECT_EQ(scope.rows, (std::vector<RowPosition>{1}));
    EXPECT_EQ(scope.ignoredRowIds, (RowIdList{99}));
}

TEST_F(ScopeResolverTest, SplitAndMergeRestoreOriginalOrder) {
    for (const RowIdSet& rows : {RowIdSet{}, RowIdSet{10, 12}, RowIdSet{10, 11, 12}}) {
        Scope requested{ColumnScope::all(), RowScope::of(rows)};
        auto scope = resolver.resolve(dataset, requested);
        auto partition = resolver.split(dataset, scope);

        EXPECT_EQ(partition.inScope.rowCount(), rows.size());
        EXPECT_EQ(partition.outOfScope.rowCount(), 3 - rows.size());

        Dataset merged = resolver.merge(dataset, partition, partition.inScope, {});
        EXPECT_EQ(merged, dataset);
    }
}

TEST_F(ScopeResolverTest, MergeDropsRowsMissingFromTransformedSubset) {
    Scope requested{ColumnScope::all(), RowScope::of({10, 11})};
    auto scope = resolver.resolve(dataset, requested);
    auto partition = resolver.split(dataset, scope);

    Dataset transformed = partition.inScope.selectRows({1});
    Dataset merged = resolver.merge(dataset, partition, transformed, {});

    EXPECT_EQ(merged.rowIds(), (RowIdList{11, 12}));
    EXPECT_EQ(render(merged, "age"), (std::vector<std::string>{"40", "50"}));
}

TEST_F(ScopeResolverTest, MergeRejectsRowsThatWereNotInScope) {
    Scope requested{ColumnScope::all(), RowScope::of({10})};
    auto scope = resolver.resolve(dataset, requested);
    auto partition = resolver.split(dataset, scope);

    try {
        resolver.merge(dataset, partition, dataset, {});
        FAIL() << "Expected OperationException";
    } catch (const OperationException& e) {
        EXPECT_EQ(e.getCode(), ErrorCode::DATA_INTEGRITY_ERROR);
    }
}

TEST_F(ScopeResolverTest, MergeRecomputesTypesOfTouchedColumnsOnly) {
    auto scope = resolver.resolve(dataset, Scope{});
    auto partition = resolver.split(dataset, scope);

    Dataset transformed = partition.inScope;
    transformed.setCell(0, 2, txt("thirty"));
    transformed.setCell(0, 1, num(1));

    Dataset merged = resolver.merge(dataset, partition, transformed, {2});
    EXPECT_EQ(merged.column(2).type, ColumnType::MIXED);
    EXPECT_EQ(merged.column(1).type, ColumnType::TEXT);
}

TEST_F(ScopeResolverTest, OperationLeavesCellsOutsideScopeUntouched) {
    CleaningEngine engine;
    OperationDescriptor trim{TrimWhitespaceParams{},
                             Scope{ColumnScope::of({"name"}), RowScope::of({11})}};

    auto outcome = engine.apply(dataset, trim);

    EXPECT_EQ(render(outcome.dataset, "name"),
              (std::vector<std::string>{" ann ", "bob", " cy "}));
    EXPECT_EQ(render(outcome.dataset, "city"),
              (std::vector<std::string>{" x ", " y ", " z "}));
    EXPECT_EQ(outcome.dataset.rowIds(), dataset.rowIds());
    EXPECT_EQ(outcome.affected, 1u);
}

} // namespace scrub
