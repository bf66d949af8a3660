#include "snaptext/render/group_walker.hpp"

#include "snaptext/core/error.hpp"
#include "snaptext/render/entity_renderer.hpp"
#include "snaptext/render/sorter.hpp"
#include "snaptext/render/text.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <vector>

namespace snaptext::render {
namespace {

// 一个类型的子列表；entities 已排序且非空。
std::error_code render_type_listing_(const model::TypeTag &type,
                                     const std::vector<const model::Entity *> &entities,
                                     const SerializerOptions &options,
                                     std::string &out) {
    std::string type_buffer;
    for (const auto *entity : entities) {
        type_buffer += entity->name();
        type_buffer += '\n';

        std::string block;
        if (auto ec = render_entity(*entity, NameSet{}, entity->name(), options, block)) {
            return ec;
        }
        if (!block.empty()) {
            type_buffer += indent(block);
            type_buffer += '\n';
        }
    }

    out += type.full_name;
    out += ":\n";
    out += indent(type_buffer);
    out += '\n';
    return {};
}

} // namespace

bool is_listed_type(const model::TypeTag &type) noexcept {
    return type.role == model::TypeRole::object;
}

std::string group_header(const model::GroupKey &group, bool two_level) {
    if (two_level) {
        return "Catalog & Schema: " + group.label(true);
    }
    return "Catalog: " + group.label(false);
}

std::error_code render_group(const model::Snapshot &snapshot,
                             const model::GroupKey &group,
                             std::span<const model::TypeTag> sorted_types,
                             const SerializerOptions &options,
                             std::string &out) noexcept {
    out.clear();
    try {
        std::string buffer;
        for (const auto &type : sorted_types) {
            if (!is_listed_type(type)) {
                continue;
            }

            std::vector<const model::Entity *> members;
            for (const auto *entity : snapshot.entities_of(type)) {
                if (entity == nullptr) {
                    spdlog::error("snaptext: null entity listed for type {}",
                                  type.full_name);
                    return core::make_error_code(core::errc::unexpected_state);
                }
                const auto *owner = entity->group();
                if (owner != nullptr && *owner == group) {
                    members.push_back(entity);
                }
            }

            std::vector<const model::Entity *> sorted;
            if (auto ec = sort_entities(members, sorted)) {
                return ec;
            }
            if (sorted.empty()) {
                continue;
            }

            spdlog::trace("snaptext: group '{}' type {}: {} entities",
                          group.label(true),
                          type.full_name,
                          sorted.size());
            if (auto ec = render_type_listing_(type, sorted, options, buffer)) {
                return ec;
            }
        }
        out = std::move(buffer);
        return {};
    } catch (const std::exception &e) {
        spdlog::error("snaptext: walking group '{}' failed: {}",
                      group.label(true),
                      e.what());
        out.clear();
        return core::make_error_code(core::errc::unexpected_state);
    } catch (...) {
        spdlog::error("snaptext: walking group '{} / {}' failed: unknown exception",
                      group.catalog,
                      group.schema);
        out.clear();
        return core::make_error_code(core::errc::unexpected_state);
    }
}

} // namespace snaptext::render
