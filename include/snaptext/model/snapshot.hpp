#pragma once

#include "snaptext/model/entity.hpp"
#include "snaptext/model/group_key.hpp"
#include "snaptext/model/type_tag.hpp"

#include <string>
#include <vector>

namespace snaptext::model {

/**
 * @brief 快照来源的描述信息（仅用于文档头部，原样输出，不做解释）。
 */
struct SourceInfo final {
  std::string url;
  std::string product_name;
  std::string product_version;
  std::string user;
};

/**
 * @brief 已物化的只读快照（序列化的输入）。
 *
 * 由外部的快照提供方构造；序列化期间不得修改。
 * entities_of() 返回的指针由快照持有，至少在一次序列化调用内有效。
 */
class Snapshot {
 public:
  virtual ~Snapshot() = default;

  [[nodiscard]] virtual const SourceInfo& source() const noexcept = 0;

  [[nodiscard]] virtual std::vector<GroupKey> grouping_keys() const = 0;
  [[nodiscard]] virtual std::vector<TypeTag> included_types() const = 0;
  [[nodiscard]] virtual std::vector<const Entity*> entities_of(const TypeTag& type) const = 0;

  // 是否支持 catalog/schema 两级命名空间（决定分组标题格式）。
  [[nodiscard]] virtual bool supports_two_level_grouping() const noexcept = 0;

 protected:
  Snapshot() = default;
  Snapshot(const Snapshot&) = default;
  Snapshot& operator=(const Snapshot&) = default;
};

}  // namespace snaptext::model
