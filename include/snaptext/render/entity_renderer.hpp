#pragma once

#include "snaptext/model/entity.hpp"
#include "snaptext/render/options.hpp"

#include <array>
#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <system_error>

namespace snaptext::render {

// 当前递归路径上已出现的实体名（祖先集合）。
using NameSet = std::set<std::string, std::less<>>;

// 结构性属性：总是不输出。
inline constexpr std::array<std::string_view, 3> kStructuralAttributes{
    "name", "schema", "catalog"};

[[nodiscard]] bool is_structural_attribute(std::string_view name) noexcept;

/**
 * @brief 渲染单个实体的属性块（不含实体名标题行）。
 *
 * 规则：
 * - path = visited_names ∪ {owner_name}；|path| <= expand_depth 时展开引用；
 * - 引用目标的名字已在 path 中：该属性视为不存在（断开循环）；
 * - 引用目标是分组实体（TypeRole::schema）：不输出，分组已作为标题出现；
 * - 实体集合逐项套用同样的规则，每一项都以同一个 path 递归，兄弟之间互不影响；
 * - 空集合、空的原始表示都不输出；
 * - 属性行按属性名字典序排列，格式 "<name>: <value>"，最后一行不带换行。
 *
 * visited_names 只读；每层递归复制一份再扩展。
 * 失败（畸形属性值或协作方抛出异常）返回 errc::unexpected_state，out 为空。
 */
std::error_code render_entity(const model::Entity &entity,
                              const NameSet &visited_names,
                              std::string_view owner_name,
                              const SerializerOptions &options,
                              std::string &out) noexcept;

} // namespace snaptext::render
