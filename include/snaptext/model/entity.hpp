#pragma once

#include "snaptext/model/attribute_value.hpp"
#include "snaptext/model/group_key.hpp"
#include "snaptext/model/type_tag.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace snaptext::model {

/**
 * @brief 快照中的一个结构化对象（表、列、索引……）。
 *
 * 由快照提供方实现，序列化期间只读。
 *
 * 约定：
 * - name() 既是展示名，也是循环检测的身份（仅在当前递归路径内有效）；
 * - group() 为空表示不属于任何分组，此时不会出现在分组列表里；
 * - attribute()/raw_representation() 允许抛出异常，序列化入口会将其
 *   统一转换为 errc::unexpected_state。
 */
class Entity {
 public:
  virtual ~Entity() = default;

  [[nodiscard]] virtual const std::string& name() const noexcept = 0;
  [[nodiscard]] virtual const GroupKey* group() const noexcept = 0;
  [[nodiscard]] virtual const TypeTag& type() const noexcept = 0;

  [[nodiscard]] virtual std::vector<std::string> attribute_names() const = 0;
  [[nodiscard]] virtual AttributeValue attribute(std::string_view name) const = 0;

  /**
   * @brief 属性的原始（不展开）文本表示。
   *
   * 默认实现由 attribute() 推导：
   * - Scalar：原文；
   * - EntityRef：目标实体名；
   * - EntityCollection/ScalarCollection：逐项以 ", " 连接；
   * - Null：无表示（std::nullopt）。
   */
  [[nodiscard]] virtual std::optional<std::string> raw_representation(std::string_view name) const;

  // false 表示该实体没有自然序，排序时退化为比较类型全限定名。
  [[nodiscard]] virtual bool has_natural_order() const noexcept { return true; }

  /**
   * @brief 自然序比较：<0 / 0 / >0。
   *
   * 默认实现依次比较 name、分组标签（无分组排在前面）、类型全限定名。
   * 返回 std::nullopt 表示两者不可比较（排序会以 errc::unsupported_comparison 失败）。
   */
  [[nodiscard]] virtual std::optional<int> compare_to(const Entity& other) const;

 protected:
  Entity() = default;
  Entity(const Entity&) = default;
  Entity& operator=(const Entity&) = default;
};

}  // namespace snaptext::model
