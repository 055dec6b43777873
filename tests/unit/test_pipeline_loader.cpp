#include <gtest/gtest.h>
#include "cleaning_engine.hpp"
#include "exceptions.hpp"
#include "pipeline_loader.hpp"
#include "test_helpers.hpp"
#include <cstdio>
#include <fstream>

namespace scrub {

using namespace scrub::test;

class PipelineLoaderTest : public ::testing::Test {
protected:
    static ErrorCode codeOf(const std::string& text) {
        try {
            PipelineLoader::parseString(text);
        } catch (const ScrubException& e) {
            return e.getCode();
        }
        ADD_FAILURE() << "Expected a ScrubException for: " << text;
        return ErrorCode::OPERATION_FAILED;
    }
};

TEST_F(PipelineLoaderTest, ParsesDatasetAndOperations) {
    auto job = PipelineLoader::parseString(R"({
        "dataset": {
            "columns": [
                {"name": "age", "type": "numeric", "values": [31, null, 40]},
                {"name": "name", "values": ["ann", "bob", null]}
            ],
            "row_ids": [10, 11, 12]
        },
        "operations": [
            {"kind": "handle_missing", "method": "fill_mean", "columns": ["age"], "rows": [11]},
            {"kind": "standardize_text", "steps": ["uppercase", "strip_special_characters"]},
            {"kind": "remove_duplicates"}
        ]
    })");

    EXPECT_EQ(job.dataset.rowIds(), (RowIdList{10, 11, 12}));
    EXPECT_EQ(job.dataset.column(0).type, ColumnType::NUMERIC);
    EXPECT_EQ(job.dataset.column(1).type, ColumnType::TEXT);
    EXPECT_EQ(render(job.dataset, "age"), (std::vector<std::string>{"31", "<missing>", "40"}));

    ASSERT_EQ(job.operations.size(), 3u);
    const auto& fill = job.operations[0];
    EXPECT_EQ(fill.kind(), OperationKind::HANDLE_MISSING);
    EXPECT_EQ(std::get<HandleMissingParams>(fill.params).method, MissingValueMethod::FILL_MEAN);
    ASSERT_FALSE(fill.scope.columns.isAll());
    EXPECT_EQ(*fill.scope.columns.names, (std::vector<std::string>{"age"}));
    ASSERT_FALSE(fill.scope.rows.isAll());
    EXPECT_EQ(fill.scope.rows.ids->count(11), 1u);

    const auto& text = std::get<StandardizeTextParams>(job.operations[1].params);
    EXPECT_EQ(text.steps, (std::vector<TextStep>{TextStep::UPPERCASE, TextStep::STRIP_SPECIAL}));
    EXPECT_TRUE(job.operations[2].scope.columns.isAll());
    EXPECT_TRUE(job.operations[2].scope.rows.isAll());
}

TEST_F(PipelineLoaderTest, AppliesParameterDefaults) {
    auto job = PipelineLoader::parseString(R"({
        "dataset": {"columns": [{"name": "x", "values": [1]}]},
        "operations": [
            {"kind": "handle_missing"},
            {"kind": "standardize_text"},
            {"kind": "remove_outliers"},
            {"kind": "normalize_dates"}
        ]
    })");

    EXPECT_EQ(std::get<HandleMissingParams>(job.operations[0].params).method, MissingValueMethod::DROP);
    EXPECT_EQ(std::get<StandardizeTextParams>(job.operations[1].params).steps,
              (std::vector<TextStep>{TextStep::LOWERCASE, TextStep::TRIM}));
    EXPECT_EQ(std::get<RemoveOutliersParams>(job.operations[2].params).method, OutlierMethod::IQR);
    EXPECT_TRUE(std::get<NormalizeDatesParams>(job.operations[3].params).format.empty());
    EXPECT_EQ(job.dataset.rowIds(), (RowIdList{0}));
}

TEST_F(PipelineLoaderTest, AutoTypeInfersFromValues) {
    auto job = PipelineLoader::parseString(R"({
        "dataset": {"columns": [
            {"name": "flag", "values": [true, null]},
            {"name": "mix", "values": [1, "a"]},
            {"name": "empty", "values": [null, null]},
            {"name": "when", "type": "date", "values": ["2024-01-05", "junk"]}
        ]}
    })");

    EXPECT_EQ(job.dataset.column(0).type, ColumnType::BOOLEAN);
    EXPECT_EQ(job.dataset.column(1).type, ColumnType::MIXED);
    EXPECT_EQ(job.dataset.column(2).type, ColumnType::TEXT);
    EXPECT_EQ(job.dataset.column(3).type, ColumnType::DATE);
    EXPECT_TRUE(std::holds_alternative<Date>(job.dataset.cell(0, 3)));
    EXPECT_TRUE(isMissing(job.dataset.cell(1, 3)));
}

TEST_F(PipelineLoaderTest, ConvertTypesTargetsKeepColumnNames) {
    auto job = PipelineLoader::parseString(R"({
        "dataset": {"columns": [{"name": "x", "values": ["1"]}]},
        "operations": [{"kind": "convert_types", "targets": {"x": "numeric", "y": "boolean"}}]
    })");

    const auto& params = std::get<ConvertTypesParams>(job.operations[0].params);
    ASSERT_EQ(params.targets.size(), 2u);
    EXPECT_EQ(params.targets[0].first, "x");
    EXPECT_EQ(params.targets[0].second, ConversionTarget::NUMERIC);
    EXPECT_EQ(params.targets[1].second, ConversionTarget::BOOLEAN);
}

TEST_F(PipelineLoaderTest, MalformedDocumentsAreRejected) {
    EXPECT_EQ(codeOf("{oops"), ErrorCode::INVALID_INPUT);
    EXPECT_EQ(codeOf("[]"), ErrorCode::INVALID_INPUT);
    EXPECT_EQ(codeOf(R"({"operations": []})"), ErrorCode::INVALID_INPUT);
    EXPECT_EQ(codeOf(R"({"dataset": {"columns": [{"name": "x", "values": [[1]]}]}})"),
              ErrorCode::INVALID_INPUT);
    EXPECT_EQ(codeOf(R"({"dataset": {"columns": [{"name": "x", "values": [1, 2]},
                                                   {"name": "y", "values": [1]}]}})"),
              ErrorCode::SHAPE_MISMATCH);
}

TEST_F(PipelineLoaderTest, InvalidParametersAreRejected) {
    const std::string dataset = R"("dataset": {"columns": [{"name": "x", "values": [1]}]})";

    EXPECT_EQ(codeOf("{" + dataset + R"(, "operations": [{"kind": "explode"}]})"),
              ErrorCode::INVALID_PARAMETER);
    EXPECT_EQ(codeOf("{" + dataset + R"(, "operations": [{"kind": "handle_missing", "method": "guess"}]})"),
              ErrorCode::INVALID_PARAMETER);
    EXPECT_EQ(codeOf("{" + dataset + R"(, "operations": [{"kind": "handle_missing", "method": "fill_constant"}]})"),
              ErrorCode::INVALID_PARAMETER);
    EXPECT_EQ(codeOf("{" + dataset + R"(, "operations": [{"kind": "standardize_text", "steps": []}]})"),
              ErrorCode::INVALID_PARAMETER);
    EXPECT_EQ(codeOf("{" + dataset + R"(, "operations": [{"kind": "convert_types", "targets": {}}]})"),
              ErrorCode::INVALID_PARAMETER);
    EXPECT_EQ(codeOf("{" + dataset + R"(, "operations": [{"kind": "trim_whitespace", "columns": "x"}]})"),
              ErrorCode::INVALID_INPUT);
}

TEST_F(PipelineLoaderTest, MissingFileIsAFileError) {
    try {
        PipelineLoader::loadFile("/nonexistent/job.json");
        FAIL() << "Expected ScrubException";
    } catch (const ScrubException& e) {
        EXPECT_EQ(e.getCode(), ErrorCode::FILE_ERROR);
    }
}

TEST_F(PipelineLoaderTest, LoadsJobFromFile) {
    const std::string path = ::testing::TempDir() + "scrub_job_test.json";
    {
        std::ofstream out(path);
        out << R"({"dataset": {"columns": [{"name": "x", "values": [" a "]}]},
                   "operations": [{"kind": "trim_whitespace"}]})";
    }

    auto job = PipelineLoader::loadFile(path);
    std::remove(path.c_str());

    EXPECT_EQ(job.dataset.rowCount(), 1u);
    ASSERT_EQ(job.operations.size(), 1u);
    EXPECT_EQ(job.operations[0].kind(), OperationKind::TRIM_WHITESPACE);
}

TEST_F(PipelineLoaderTest, ResultDocumentCarriesDatasetLogAndSummaries) {
    auto job = PipelineLoader::parseString(R"({
        "dataset": {"columns": [{"name": "x", "values": [1, null, 1]}], "row_ids": [5, 6, 7]},
        "operations": [{"kind": "handle_missing"}, {"kind": "remove_duplicates"}]
    })");
    CleaningEngine engine;
    auto result = engine.run(job.dataset, job.operations);

    auto json = PipelineLoader::resultToJson(result.dataset, result.changeLog,
                                             DatasetSummary::of(job.dataset),
                                             DatasetSummary::of(result.dataset));

    EXPECT_EQ(json["dataset"]["row_ids"].get<RowIdList>(), (RowIdList{5}));
    EXPECT_EQ(json["dataset"]["columns"][0]["values"][0].get<double>(), 1.0);
    EXPECT_EQ(json["change_log"].size(), 2u);
    EXPECT_EQ(json["before"]["rows"].get<size_t>(), 3u);
    EXPECT_EQ(json["after"]["rows"].get<size_t>(), 1u);
    EXPECT_EQ(json["diff"]["rows_removed"].get<long long>(), 2);
    EXPECT_EQ(json["diff"]["missing_resolved"].get<long long>(), 1);
}

TEST_F(PipelineLoaderTest, CellsSerializeByKind) {
    EXPECT_TRUE(PipelineLoader::cellToJson(missing()).is_null());
    EXPECT_EQ(PipelineLoader::cellToJson(CellValue{true}).get<bool>(), true);
    EXPECT_EQ(PipelineLoader::cellToJson(CellValue{Date{2024, 2, 9}}).get<std::string>(), "2024-02-09");
    EXPECT_EQ(PipelineLoader::cellToJson(txt("hi")).get<std::string>(), "hi");
}

TEST_F(PipelineLoaderTest, DeclaredTypesCoerceTextValues) {
    auto job = PipelineLoader::parseString(R"({
        "dataset": {"columns": [
            {"name": "v", "type": "numeric", "values": ["10", null, "30", "n/a"]},
            {"name": "ok", "type": "boolean", "values": ["yes", "maybe", true, "0"]}
        ]},
        "operations": [{"kind": "handle_missing", "method": "fill_mean", "columns": ["v"]},
                       {"kind": "remove_empty_rows"}]
    })");

    EXPECT_EQ(job.dataset.column(0).type, ColumnType::NUMERIC);
    EXPECT_TRUE(std::holds_alternative<double>(job.dataset.cell(0, 0)));
    EXPECT_TRUE(isMissing(job.dataset.cell(3, 0)));
    EXPECT_EQ(render(job.dataset, "ok"),
              (std::vector<std::string>{"true", "<missing>", "true", "false"}));

    CleaningEngine engine;
    auto result = engine.run(job.dataset, job.operations);

    EXPECT_EQ(render(result.dataset, "v"),
              (std::vector<std::string>{"10", "20", "30", "20"}));
    EXPECT_EQ(result.dataset.column(0).type, ColumnType::NUMERIC);
    EXPECT_EQ(DatasetSummary::of(result.dataset).toJson()["column_summaries"][0]["type"]
                  .get<std::string>(), "numeric");
}

} // namespace scrub
