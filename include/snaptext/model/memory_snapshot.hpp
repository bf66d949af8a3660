#pragma once

#include "snaptext/model/entity.hpp"
#include "snaptext/model/snapshot.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace snaptext::model {

/**
 * @brief 基于内存属性表的实体实现（测试、示例与手工构造快照时使用）。
 *
 * 属性名集合包含结构性属性：
 * - "name" 总是存在；
 * - 有分组时额外提供 "catalog"/"schema"。
 * 这些属性在渲染时会被过滤，但仍可通过 attribute() 读取。
 */
class MemoryEntity final : public Entity {
 public:
  MemoryEntity(std::string name, TypeTag type, std::optional<GroupKey> group = std::nullopt);

  // 设置属性值（已存在则覆盖）。
  void set(std::string attribute, AttributeValue value);
  void erase(std::string_view attribute) noexcept;

  // 为属性指定原始表示，覆盖由属性值推导的默认表示。
  void set_raw(std::string attribute, std::string raw);

  [[nodiscard]] const std::string& name() const noexcept override { return name_; }
  [[nodiscard]] const GroupKey* group() const noexcept override;
  [[nodiscard]] const TypeTag& type() const noexcept override { return type_; }

  [[nodiscard]] std::vector<std::string> attribute_names() const override;
  [[nodiscard]] AttributeValue attribute(std::string_view name) const override;
  [[nodiscard]] std::optional<std::string> raw_representation(std::string_view name) const override;

 private:
  std::string name_;
  TypeTag type_;
  std::optional<GroupKey> group_;

  std::map<std::string, AttributeValue, std::less<>> attributes_{};
  std::map<std::string, std::string, std::less<>> raw_overrides_{};
};

/**
 * @brief 内存快照：拥有全部实体，登记分组与包含的类型。
 *
 * 说明：
 * - 实体以 unique_ptr 存放，add_entity 返回的引用在快照生命周期内稳定；
 * - 分组与类型按登记顺序保存（重复登记会被忽略），排序由序列化器负责。
 */
class MemorySnapshot final : public Snapshot {
 public:
  explicit MemorySnapshot(SourceInfo source, bool two_level_grouping = true);

  void add_group(GroupKey group);
  void include_type(TypeTag type);

  MemoryEntity& add_entity(std::string name,
                           TypeTag type,
                           std::optional<GroupKey> group = std::nullopt);

  [[nodiscard]] MemoryEntity* find(std::string_view type_name, std::string_view name) noexcept;

  [[nodiscard]] const SourceInfo& source() const noexcept override { return source_; }
  [[nodiscard]] std::vector<GroupKey> grouping_keys() const override { return groups_; }
  [[nodiscard]] std::vector<TypeTag> included_types() const override { return types_; }
  [[nodiscard]] std::vector<const Entity*> entities_of(const TypeTag& type) const override;
  [[nodiscard]] bool supports_two_level_grouping() const noexcept override { return two_level_; }

 private:
  SourceInfo source_;
  bool two_level_{true};
  std::vector<GroupKey> groups_{};
  std::vector<TypeTag> types_{};
  std::vector<std::unique_ptr<MemoryEntity>> entities_{};
};

}  // namespace snaptext::model
