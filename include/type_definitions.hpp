#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// Custom transparent hasher for string types
struct TransparentStringHash {
  using is_transparent = void; // Enables heterogeneous lookup

  template <typename StringType>
  std::size_t operator()(const StringType &str) const {
    return std::hash<std::string_view>{}(str);
  }
};

namespace scrub {

// String handling type aliases for performance and consistency
using StringMap = std::unordered_map<std::string, std::string,
                                     TransparentStringHash, std::equal_to<>>;
using StringSet =
    std::unordered_set<std::string, TransparentStringHash, std::equal_to<>>;

// Stable row identifier, survives filtering
using RowId = std::uint64_t;
using RowIdList = std::vector<RowId>;
using RowIdSet = std::unordered_set<RowId>;

// Positional index into a dataset snapshot
using RowPosition = std::size_t;
using ColumnIndex = std::size_t;

} // namespace scrub
