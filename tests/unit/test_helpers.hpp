#pragma once

#include "dataset.hpp"
#include <string>
#include <vector>

namespace scrub::test {

inline CellValue num(double value) { return CellValue{value}; }
inline CellValue txt(const std::string &value) { return CellValue{value}; }
inline CellValue missing() { return CellValue{Missing{}}; }

inline Column column(const std::string &name, ColumnType type,
                     std::vector<CellValue> cells) {
    return Column{name, type, std::move(cells)};
}

inline Column numbers(const std::string &name, std::vector<CellValue> cells) {
    return column(name, ColumnType::NUMERIC, std::move(cells));
}

inline Column texts(const std::string &name,
                    const std::vector<std::string> &values) {
    std::vector<CellValue> cells;
    for (const auto &value : values) {
        cells.push_back(txt(value));
    }
    return column(name, ColumnType::TEXT, std::move(cells));
}

// Display form of every cell of a column, "<missing>" for missing cells
inline std::vector<std::string> render(const Dataset &dataset,
                                       const std::string &name) {
    std::vector<std::string> out;
    const Column &col = dataset.column(*dataset.findColumn(name));
    for (const auto &cell : col.cells) {
        out.push_back(isMissing(cell) ? "<missing>" : cellToString(cell));
    }
    return out;
}

} // namespace scrub::test
