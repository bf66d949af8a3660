#include "snaptext/render/entity_renderer.hpp"

#include "snaptext/core/error.hpp"
#include "snaptext/render/sorter.hpp"
#include "snaptext/render/text.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace snaptext::render {
namespace {

[[nodiscard]] std::error_code unexpected_state_(const model::Entity &entity,
                                                std::string_view attribute,
                                                std::string_view what) {
    spdlog::error("snaptext: {} '{}' attribute '{}': {}",
                  entity.type().full_name,
                  entity.name(),
                  attribute,
                  what);
    return core::make_error_code(core::errc::unexpected_state);
}

[[nodiscard]] bool is_group_entity_(const model::Entity &entity) noexcept {
    return entity.type().role == model::TypeRole::schema;
}

[[nodiscard]] std::optional<std::string>
raw_value_(const model::Entity &entity, const std::string &attribute) {
    auto raw = entity.raw_representation(attribute);
    if (!raw || raw->empty()) {
        return std::nullopt;
    }
    return raw;
}

std::error_code render_block_(const model::Entity &entity,
                              const NameSet &visited_names,
                              std::string_view owner_name,
                              const SerializerOptions &options,
                              std::string &out);

// "<name>" + 换行 + 缩进后的属性块；属性块为空时只有名字。
std::error_code render_nested_(const model::Entity &target,
                               const NameSet &path,
                               std::string_view owner_name,
                               const SerializerOptions &options,
                               std::string &out) {
    std::string block;
    if (auto ec = render_block_(target, path, owner_name, options, block)) {
        return ec;
    }
    out = target.name();
    if (!block.empty()) {
        out += '\n';
        out += indent(block);
    }
    return {};
}

// value 为空表示该属性不输出。
std::error_code render_attribute_(const model::Entity &entity,
                                  const std::string &attribute,
                                  const NameSet &path,
                                  bool expand,
                                  const SerializerOptions &options,
                                  std::optional<std::string> &value) {
    value.reset();
    const auto attr = entity.attribute(attribute);

    return std::visit(
        [&](const auto &v) -> std::error_code {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, model::Null>) {
                return {};
            } else if constexpr (std::is_same_v<T, model::EntityRef>) {
                if (v.target == nullptr) {
                    return unexpected_state_(entity, attribute, "null reference");
                }
                if (is_group_entity_(*v.target) ||
                    path.contains(v.target->name())) {
                    return {};
                }
                if (!expand) {
                    value = raw_value_(entity, attribute);
                    return {};
                }
                std::string nested;
                if (auto ec = render_nested_(
                        *v.target, path, entity.name(), options, nested)) {
                    return ec;
                }
                value = std::move(nested);
                return {};
            } else if constexpr (std::is_same_v<T, model::EntityCollection>) {
                if (v.items.empty()) {
                    return {};
                }
                if (std::find(v.items.begin(), v.items.end(), nullptr) !=
                    v.items.end()) {
                    return unexpected_state_(
                        entity, attribute, "null element in collection");
                }
                if (!expand) {
                    value = raw_value_(entity, attribute);
                    return {};
                }

                std::vector<std::string> parts;
                parts.reserve(v.items.size());
                for (const auto *item : v.items) {
                    if (path.contains(item->name())) {
                        continue;
                    }
                    std::string nested;
                    if (auto ec = render_nested_(
                            *item, path, entity.name(), options, nested)) {
                        return ec;
                    }
                    parts.push_back(std::move(nested));
                }
                if (parts.empty()) {
                    return {};
                }
                value = "\n" + indent(join(parts, "\n"));
                return {};
            } else if constexpr (std::is_same_v<T, model::ScalarCollection>) {
                if (v.values.empty()) {
                    return {};
                }
                value = raw_value_(entity, attribute);
                return {};
            } else {
                value = raw_value_(entity, attribute);
                return {};
            }
        },
        attr.storage());
}

std::error_code render_block_(const model::Entity &entity,
                              const NameSet &visited_names,
                              std::string_view owner_name,
                              const SerializerOptions &options,
                              std::string &out) {
    // 复制后扩展：兄弟分支拿到的是同一个只读 path，互不可见对方的子路径。
    NameSet path = visited_names;
    path.emplace(owner_name);

    const bool expand = path.size() <= options.expand_depth;

    std::vector<std::string> names = entity.attribute_names();
    names.erase(std::remove_if(names.begin(),
                               names.end(),
                               [](const std::string &n) {
                                   return is_structural_attribute(n);
                               }),
                names.end());

    std::string buffer;
    for (const auto &attribute : sort_attribute_names(names)) {
        std::optional<std::string> value;
        if (auto ec = render_attribute_(
                entity, attribute, path, expand, options, value)) {
            return ec;
        }
        if (!value) {
            continue;
        }

        buffer += attribute;
        // 嵌套块以换行开头：不在冒号后留空格，避免行尾空白。
        buffer += (!value->empty() && value->front() == '\n') ? ":" : ": ";
        buffer += *value;
        buffer += '\n';
    }

    out = trim_trailing_newline(std::move(buffer));
    return {};
}

} // namespace

bool is_structural_attribute(std::string_view name) noexcept {
    return std::find(kStructuralAttributes.begin(),
                     kStructuralAttributes.end(),
                     name) != kStructuralAttributes.end();
}

std::error_code render_entity(const model::Entity &entity,
                              const NameSet &visited_names,
                              std::string_view owner_name,
                              const SerializerOptions &options,
                              std::string &out) noexcept {
    out.clear();
    try {
        std::string block;
        if (auto ec =
                render_block_(entity, visited_names, owner_name, options, block)) {
            return ec;
        }
        out = std::move(block);
        return {};
    } catch (const std::exception &e) {
        spdlog::error("snaptext: rendering {} '{}' failed: {}",
                      entity.type().full_name,
                      entity.name(),
                      e.what());
        out.clear();
        return core::make_error_code(core::errc::unexpected_state);
    } catch (...) {
        spdlog::error("snaptext: rendering {} '{}' failed: unknown exception",
                      entity.type().full_name,
                      entity.name());
        out.clear();
        return core::make_error_code(core::errc::unexpected_state);
    }
}

} // namespace snaptext::render
