#pragma once

#include <cstdint>
#include <string>

namespace snaptext::model {

/**
 * @brief 实体类型在快照中的角色。
 *
 * - object：普通数据库对象（表、视图、索引、外键……），按分组逐一列出；
 * - schema：分组类型本身（分组键即由它构成）；
 * - catalog：分组的容器类型；
 * - column：叶子类型，粒度过细，只在所属对象内部展开，不在分组下单独列出。
 */
enum class TypeRole : std::uint8_t {
  object = 0,
  schema = 1,
  catalog = 2,
  column = 3,
};

/**
 * @brief 实体类型标签：全限定名 + 角色。
 *
 * 相等性按 full_name 与 role 一起比较；排序只看 full_name。
 */
struct TypeTag final {
  std::string full_name;
  TypeRole role{TypeRole::object};

  friend bool operator==(const TypeTag&, const TypeTag&) = default;
};

}  // namespace snaptext::model
