#pragma once

#include <string>
#include <variant>
#include <vector>

namespace snaptext::model {

class Entity;

struct Null final {
  friend bool operator==(const Null&, const Null&) = default;
};

struct Scalar final {
  std::string text;
  friend bool operator==(const Scalar&, const Scalar&) = default;
};

// 引用另一个实体；target 由快照持有，生命周期覆盖整个序列化调用。
struct EntityRef final {
  const Entity* target{nullptr};
  friend bool operator==(const EntityRef&, const EntityRef&) = default;
};

struct EntityCollection final {
  std::vector<const Entity*> items;
  friend bool operator==(const EntityCollection&, const EntityCollection&) = default;
};

struct ScalarCollection final {
  std::vector<std::string> values;
  friend bool operator==(const ScalarCollection&, const ScalarCollection&) = default;
};

/**
 * @brief 实体属性值（强类型判别联合）。
 *
 * 约定：
 * - 默认构造为 Null；
 * - 引用类值（EntityRef/EntityCollection）只保存裸指针，不拥有目标实体；
 * - 指针为空属于协作方的契约违例，渲染时报告 errc::unexpected_state。
 */
class AttributeValue final {
 public:
  using storage_type = std::variant<Null, Scalar, EntityRef, EntityCollection, ScalarCollection>;

  AttributeValue() = default;

  explicit AttributeValue(Null v);
  explicit AttributeValue(Scalar v);
  explicit AttributeValue(EntityRef v);
  explicit AttributeValue(EntityCollection v);
  explicit AttributeValue(ScalarCollection v);

  [[nodiscard]] const storage_type& storage() const noexcept { return storage_; }

  template <class T>
  [[nodiscard]] const T* get_if() const noexcept {
    return std::get_if<T>(&storage_);
  }

  [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<Null>(storage_); }

  static AttributeValue null();
  static AttributeValue scalar(std::string text);
  static AttributeValue ref(const Entity& target);
  static AttributeValue entities(std::vector<const Entity*> items);
  static AttributeValue scalars(std::vector<std::string> values);

  friend bool operator==(const AttributeValue&, const AttributeValue&) = default;

 private:
  storage_type storage_{};
};

}  // namespace snaptext::model
