#include "snaptext/model/group_key.hpp"

namespace snaptext::model {

std::string GroupKey::label(bool two_level) const {
  if (!two_level) {
    return catalog;
  }
  std::string out;
  out.reserve(catalog.size() + schema.size() + 3);
  out += catalog;
  out += " / ";
  out += schema;
  return out;
}

}  // namespace snaptext::model
