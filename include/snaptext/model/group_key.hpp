#pragma once

#include <string>

namespace snaptext::model {

/**
 * @brief 分组键（catalog + schema 二元组），按值比较。
 */
struct GroupKey final {
  std::string catalog;
  std::string schema;

  friend bool operator==(const GroupKey&, const GroupKey&) = default;

  /**
   * @brief 分组标签。
   *
   * two_level=true 时为 "<catalog> / <schema>"，否则只有 "<catalog>"。
   * 是否支持两级命名空间由快照提供方决定，这里不做推断。
   */
  [[nodiscard]] std::string label(bool two_level) const;
};

}  // namespace snaptext::model
