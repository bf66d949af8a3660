#include "snaptext/model/memory_snapshot.hpp"

#include <algorithm>
#include <utility>

namespace snaptext::model {

MemoryEntity::MemoryEntity(std::string name, TypeTag type, std::optional<GroupKey> group)
  : name_(std::move(name)), type_(std::move(type)), group_(std::move(group)) {}

void MemoryEntity::set(std::string attribute, AttributeValue value) {
  attributes_.insert_or_assign(std::move(attribute), std::move(value));
}

void MemoryEntity::erase(std::string_view attribute) noexcept {
  if (const auto it = attributes_.find(attribute); it != attributes_.end()) {
    attributes_.erase(it);
  }
  if (const auto it = raw_overrides_.find(attribute); it != raw_overrides_.end()) {
    raw_overrides_.erase(it);
  }
}

void MemoryEntity::set_raw(std::string attribute, std::string raw) {
  raw_overrides_.insert_or_assign(std::move(attribute), std::move(raw));
}

const GroupKey* MemoryEntity::group() const noexcept {
  return group_ ? &*group_ : nullptr;
}

std::vector<std::string> MemoryEntity::attribute_names() const {
  std::vector<std::string> names;
  names.reserve(attributes_.size() + 3);
  names.emplace_back("name");
  if (group_) {
    names.emplace_back("catalog");
    names.emplace_back("schema");
  }
  for (const auto& entry : attributes_) {
    names.push_back(entry.first);
  }
  return names;
}

AttributeValue MemoryEntity::attribute(std::string_view name) const {
  if (const auto it = attributes_.find(name); it != attributes_.end()) {
    return it->second;
  }
  // 结构性属性：未显式设置时由实体自身字段提供。
  if (name == "name") {
    return AttributeValue::scalar(name_);
  }
  if (group_ && name == "catalog") {
    return AttributeValue::scalar(group_->catalog);
  }
  if (group_ && name == "schema") {
    return AttributeValue::scalar(group_->schema);
  }
  return AttributeValue::null();
}

std::optional<std::string> MemoryEntity::raw_representation(std::string_view name) const {
  if (const auto it = raw_overrides_.find(name); it != raw_overrides_.end()) {
    return it->second;
  }
  return Entity::raw_representation(name);
}

MemorySnapshot::MemorySnapshot(SourceInfo source, bool two_level_grouping)
  : source_(std::move(source)), two_level_(two_level_grouping) {}

void MemorySnapshot::add_group(GroupKey group) {
  if (std::find(groups_.begin(), groups_.end(), group) != groups_.end()) {
    return;
  }
  groups_.push_back(std::move(group));
}

void MemorySnapshot::include_type(TypeTag type) {
  const auto it = std::find_if(types_.begin(), types_.end(), [&](const TypeTag& t) {
    return t.full_name == type.full_name;
  });
  if (it != types_.end()) {
    return;
  }
  types_.push_back(std::move(type));
}

MemoryEntity& MemorySnapshot::add_entity(std::string name,
                                         TypeTag type,
                                         std::optional<GroupKey> group) {
  entities_.push_back(
    std::make_unique<MemoryEntity>(std::move(name), std::move(type), std::move(group)));
  return *entities_.back();
}

MemoryEntity* MemorySnapshot::find(std::string_view type_name, std::string_view name) noexcept {
  for (const auto& entity : entities_) {
    if (entity->type().full_name == type_name && entity->name() == name) {
      return entity.get();
    }
  }
  return nullptr;
}

std::vector<const Entity*> MemorySnapshot::entities_of(const TypeTag& type) const {
  std::vector<const Entity*> out;
  for (const auto& entity : entities_) {
    if (entity->type().full_name == type.full_name) {
      out.push_back(entity.get());
    }
  }
  return out;
}

}  // namespace snaptext::model
