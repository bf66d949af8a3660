#include "snaptext/model/attribute_value.hpp"

#include <utility>

namespace snaptext::model {

AttributeValue::AttributeValue(Null v) : storage_(v) {}
AttributeValue::AttributeValue(Scalar v) : storage_(std::move(v)) {}
AttributeValue::AttributeValue(EntityRef v) : storage_(v) {}
AttributeValue::AttributeValue(EntityCollection v) : storage_(std::move(v)) {}
AttributeValue::AttributeValue(ScalarCollection v) : storage_(std::move(v)) {}

AttributeValue AttributeValue::null() { return AttributeValue(Null{}); }

AttributeValue AttributeValue::scalar(std::string text) {
  return AttributeValue(Scalar{std::move(text)});
}

AttributeValue AttributeValue::ref(const Entity& target) {
  return AttributeValue(EntityRef{&target});
}

AttributeValue AttributeValue::entities(std::vector<const Entity*> items) {
  return AttributeValue(EntityCollection{std::move(items)});
}

AttributeValue AttributeValue::scalars(std::vector<std::string> values) {
  return AttributeValue(ScalarCollection{std::move(values)});
}

}  // namespace snaptext::model
