#include "snaptext/model/entity.hpp"

#include <type_traits>

namespace snaptext::model {
namespace {

[[nodiscard]] int sign_of(int v) noexcept { return (v > 0) - (v < 0); }

}  // namespace

std::optional<std::string> Entity::raw_representation(std::string_view name) const {
  const auto value = attribute(name);
  return std::visit(
    [](const auto& v) -> std::optional<std::string> {
      using T = std::decay_t<decltype(v)>;

      if constexpr (std::is_same_v<T, Null>) {
        return std::nullopt;
      } else if constexpr (std::is_same_v<T, Scalar>) {
        return v.text;
      } else if constexpr (std::is_same_v<T, EntityRef>) {
        if (v.target == nullptr) {
          return std::nullopt;
        }
        return v.target->name();
      } else if constexpr (std::is_same_v<T, EntityCollection>) {
        std::string out;
        for (const auto* item : v.items) {
          if (item == nullptr) {
            continue;
          }
          if (!out.empty()) {
            out += ", ";
          }
          out += item->name();
        }
        return out;
      } else {
        std::string out;
        for (std::size_t i = 0; i < v.values.size(); ++i) {
          if (i != 0) {
            out += ", ";
          }
          out += v.values[i];
        }
        return out;
      }
    },
    value.storage());
}

std::optional<int> Entity::compare_to(const Entity& other) const {
  if (const int c = name().compare(other.name()); c != 0) {
    return sign_of(c);
  }

  const auto* lhs_group = group();
  const auto* rhs_group = other.group();
  if (lhs_group == nullptr || rhs_group == nullptr) {
    if (lhs_group != rhs_group) {
      return lhs_group == nullptr ? -1 : 1;
    }
  } else if (const int c = lhs_group->label(true).compare(rhs_group->label(true)); c != 0) {
    return sign_of(c);
  }

  return sign_of(type().full_name.compare(other.type().full_name));
}

}  // namespace snaptext::model
