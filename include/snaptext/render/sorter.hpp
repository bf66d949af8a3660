#pragma once

#include "snaptext/model/entity.hpp"
#include "snaptext/model/group_key.hpp"
#include "snaptext/model/type_tag.hpp"

#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <vector>

namespace snaptext::render {

/**
 * @brief 类型/实例/属性名的确定性排序。
 *
 * 所有函数都返回新序列，不修改输入。
 */

// 类型按全限定名字典序（逐字节）升序。
[[nodiscard]] bool type_name_less(const model::TypeTag &lhs,
                                  const model::TypeTag &rhs) noexcept;

/**
 * @brief 实体比较：有自然序的实体调用 Entity::compare_to，
 * 否则退化为比较类型全限定名。
 *
 * 返回 std::nullopt 表示两者不可比较。
 */
[[nodiscard]] std::optional<int> compare_entities(const model::Entity &lhs,
                                                  const model::Entity &rhs);

[[nodiscard]] std::vector<model::TypeTag>
sort_types(std::span<const model::TypeTag> types);

// 属性名按字典序升序并去重（属性名集合语义）。
[[nodiscard]] std::vector<std::string>
sort_attribute_names(std::span<const std::string> names);

// 分组按渲染后的标签升序并去重。
[[nodiscard]] std::vector<model::GroupKey>
sort_groups(std::span<const model::GroupKey> groups, bool two_level);

/**
 * @brief 实体按自然序稳定排序。
 *
 * 失败：
 * - 存在互相不可比较的元素：errc::unsupported_comparison；
 * - 输入含空指针或比较过程中抛出异常：errc::unexpected_state。
 * 失败时 out 为空。
 */
std::error_code sort_entities(std::span<const model::Entity *const> entities,
                              std::vector<const model::Entity *> &out) noexcept;

} // namespace snaptext::render
