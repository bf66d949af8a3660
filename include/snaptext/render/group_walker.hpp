#pragma once

#include "snaptext/model/group_key.hpp"
#include "snaptext/model/snapshot.hpp"
#include "snaptext/model/type_tag.hpp"
#include "snaptext/render/options.hpp"

#include <span>
#include <string>
#include <system_error>

namespace snaptext::render {

// 只有普通对象类型会在分组下列出；分组类型、其容器类型与列类型除外。
[[nodiscard]] bool is_listed_type(const model::TypeTag &type) noexcept;

/**
 * @brief 分组标题行（不含换行）。
 *
 * - 两级："Catalog & Schema: <catalog> / <schema>"
 * - 一级："Catalog: <catalog>"
 */
[[nodiscard]] std::string group_header(const model::GroupKey &group,
                                       bool two_level);

/**
 * @brief 渲染一个分组下的全部对象（不含分组标题，不整体缩进）。
 *
 * 对 sorted_types 中每个可列出的类型：筛出 group() 与 group 相等的实体，
 * 按自然序排序；为空则整段跳过，否则输出：
 *
 *   <type-full-name>:
 *       <entity-name>
 *           <attribute block>
 *   （空行）
 *
 * 排序或渲染失败时返回对应错误码，out 为空。
 */
std::error_code render_group(const model::Snapshot &snapshot,
                             const model::GroupKey &group,
                             std::span<const model::TypeTag> sorted_types,
                             const SerializerOptions &options,
                             std::string &out) noexcept;

} // namespace snaptext::render
