#include "snaptext/core/error.hpp"
#include "snaptext/model/memory_snapshot.hpp"
#include "snaptext/render/sorter.hpp"

#include "test_main.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

using namespace snaptext;
using model::GroupKey;
using model::MemoryEntity;
using model::TypeRole;
using model::TypeTag;

const TypeTag kTable{"snaptext.structure.Table", TypeRole::object};
const TypeTag kView{"snaptext.structure.View", TypeRole::object};

// 没有自然序的实体：排序时退化为比较类型名。
class UnorderedEntity final : public model::Entity {
 public:
  UnorderedEntity(std::string name, TypeTag type)
    : name_(std::move(name)), type_(std::move(type)) {}

  const std::string& name() const noexcept override { return name_; }
  const GroupKey* group() const noexcept override { return nullptr; }
  const TypeTag& type() const noexcept override { return type_; }
  std::vector<std::string> attribute_names() const override { return {}; }
  model::AttributeValue attribute(std::string_view) const override { return {}; }
  bool has_natural_order() const noexcept override { return false; }

 private:
  std::string name_;
  TypeTag type_;
};

// 与任何实体都不可比较。
class IncomparableEntity final : public model::Entity {
 public:
  explicit IncomparableEntity(std::string name) : name_(std::move(name)) {}

  const std::string& name() const noexcept override { return name_; }
  const GroupKey* group() const noexcept override { return nullptr; }
  const TypeTag& type() const noexcept override { return type_; }
  std::vector<std::string> attribute_names() const override { return {}; }
  model::AttributeValue attribute(std::string_view) const override { return {}; }
  std::optional<int> compare_to(const model::Entity&) const override { return std::nullopt; }

 private:
  std::string name_;
  TypeTag type_{"test.Incomparable", TypeRole::object};
};

void test_sort_types_by_full_name() {
  const std::vector<TypeTag> types{
    {"snaptext.structure.View", TypeRole::object},
    {"snaptext.structure.Column", TypeRole::column},
    {"snaptext.structure.Table", TypeRole::object},
    {"snaptext.structure.Index", TypeRole::object},
  };
  const auto sorted = render::sort_types(types);
  TEST_EXPECT_EQ(sorted.size(), static_cast<std::size_t>(4));
  TEST_EXPECT_EQ(sorted[0].full_name, "snaptext.structure.Column");
  TEST_EXPECT_EQ(sorted[1].full_name, "snaptext.structure.Index");
  TEST_EXPECT_EQ(sorted[2].full_name, "snaptext.structure.Table");
  TEST_EXPECT_EQ(sorted[3].full_name, "snaptext.structure.View");

  // 输入不被修改。
  TEST_EXPECT_EQ(types[0].full_name, "snaptext.structure.View");
}

void test_sort_types_is_byte_order() {
  const std::vector<TypeTag> types{{"b"}, {"B"}, {"a"}, {"A"}};
  const auto sorted = render::sort_types(types);
  TEST_EXPECT_EQ(sorted[0].full_name, "A");
  TEST_EXPECT_EQ(sorted[1].full_name, "B");
  TEST_EXPECT_EQ(sorted[2].full_name, "a");
  TEST_EXPECT_EQ(sorted[3].full_name, "b");
}

void test_sort_attribute_names() {
  const std::vector<std::string> names{"type", "columns", "remarks", "columns", "Z"};
  const auto sorted = render::sort_attribute_names(names);
  const std::vector<std::string> expected{"Z", "columns", "remarks", "type"};
  TEST_EXPECT(sorted == expected);
}

void test_sort_groups_by_label() {
  const std::vector<GroupKey> groups{
    {"db", "public"},
    {"db", "audit"},
    {"archive", "public"},
    {"db", "audit"},
  };

  const auto two_level = render::sort_groups(groups, true);
  TEST_EXPECT_EQ(two_level.size(), static_cast<std::size_t>(3));
  TEST_EXPECT_EQ(two_level[0], (GroupKey{"archive", "public"}));
  TEST_EXPECT_EQ(two_level[1], (GroupKey{"db", "audit"}));
  TEST_EXPECT_EQ(two_level[2], (GroupKey{"db", "public"}));

  // 一级标签只看 catalog；标签相同时按 catalog/schema 排序，与输入顺序无关。
  const auto one_level = render::sort_groups(groups, false);
  TEST_EXPECT_EQ(one_level.size(), static_cast<std::size_t>(3));
  TEST_EXPECT_EQ(one_level[0], (GroupKey{"archive", "public"}));
  TEST_EXPECT_EQ(one_level[1], (GroupKey{"db", "audit"}));
  TEST_EXPECT_EQ(one_level[2], (GroupKey{"db", "public"}));
}

void test_sort_groups_dedupes_across_equal_labels() {
  const std::vector<GroupKey> groups{
    {"db", "x"},
    {"db", "y"},
    {"db", "x"},
  };
  const auto sorted = render::sort_groups(groups, false);
  TEST_EXPECT_EQ(sorted.size(), static_cast<std::size_t>(2));
  TEST_EXPECT_EQ(sorted[0], (GroupKey{"db", "x"}));
  TEST_EXPECT_EQ(sorted[1], (GroupKey{"db", "y"}));

  const std::vector<GroupKey> reversed{groups.rbegin(), groups.rend()};
  TEST_EXPECT(render::sort_groups(reversed, false) == sorted);
}

void test_sort_entities_natural_order() {
  const GroupKey public_schema{"db", "public"};
  MemoryEntity orders{"orders", kTable, public_schema};
  MemoryEntity accounts{"accounts", kTable, public_schema};
  MemoryEntity users{"users", kTable, public_schema};
  MemoryEntity users_ungrouped{"users", kTable};

  const std::vector<const model::Entity*> input{&users, &orders, &users_ungrouped, &accounts};
  std::vector<const model::Entity*> sorted;
  TEST_EXPECT_OK(render::sort_entities(input, sorted));
  TEST_EXPECT_EQ(sorted.size(), static_cast<std::size_t>(4));
  TEST_EXPECT(sorted[0] == &accounts);
  TEST_EXPECT(sorted[1] == &orders);
  // 同名时无分组的排在前面。
  TEST_EXPECT(sorted[2] == &users_ungrouped);
  TEST_EXPECT(sorted[3] == &users);

  TEST_EXPECT(input[0] == &users);
}

void test_sort_entities_falls_back_to_type_name() {
  UnorderedEntity view{"a_view", kView};
  UnorderedEntity table{"z_table", kTable};

  const std::vector<const model::Entity*> input{&view, &table};
  std::vector<const model::Entity*> sorted;
  TEST_EXPECT_OK(render::sort_entities(input, sorted));
  TEST_EXPECT(sorted[0] == &table);
  TEST_EXPECT(sorted[1] == &view);
}

void test_sort_entities_incomparable_fails() {
  IncomparableEntity a{"a"};
  IncomparableEntity b{"b"};

  const std::vector<const model::Entity*> input{&b, &a};
  std::vector<const model::Entity*> sorted{&a};
  const auto ec = render::sort_entities(input, sorted);
  TEST_EXPECT(ec == core::errc::unsupported_comparison);
  TEST_EXPECT(sorted.empty());

  // 单个元素无需比较。
  const std::vector<const model::Entity*> single{&a};
  TEST_EXPECT_OK(render::sort_entities(single, sorted));
  TEST_EXPECT_EQ(sorted.size(), static_cast<std::size_t>(1));
}

void test_sort_entities_null_input() {
  MemoryEntity users{"users", kTable};
  const std::vector<const model::Entity*> input{&users, nullptr};
  std::vector<const model::Entity*> sorted;
  const auto ec = render::sort_entities(input, sorted);
  TEST_EXPECT(ec == core::errc::unexpected_state);
  TEST_EXPECT(sorted.empty());
}

}  // namespace

int main() {
  test_sort_types_by_full_name();
  test_sort_types_is_byte_order();
  test_sort_attribute_names();
  test_sort_groups_by_label();
  test_sort_groups_dedupes_across_equal_labels();
  test_sort_entities_natural_order();
  test_sort_entities_falls_back_to_type_name();
  test_sort_entities_incomparable_fails();
  test_sort_entities_null_input();
  return snaptext::tests::run_and_report();
}
