#include "snaptext/render/serializer.hpp"

#include "snaptext/core/error.hpp"
#include "snaptext/render/group_walker.hpp"
#include "snaptext/render/sorter.hpp"
#include "snaptext/render/text.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <exception>
#include <vector>

namespace snaptext::render {
namespace {

constexpr std::array<std::string_view, 1> kFileExtensions{"txt"};

void append_header_(const model::Snapshot &snapshot,
                    const std::vector<model::TypeTag> &types,
                    std::string &buffer) {
    const auto &source = snapshot.source();

    buffer += "Database snapshot for ";
    buffer += source.url;
    buffer += '\n';
    append_divider(buffer);
    buffer += "Database type: ";
    buffer += source.product_name;
    buffer += '\n';
    buffer += "Database version: ";
    buffer += source.product_version;
    buffer += '\n';
    buffer += "Database user: ";
    buffer += source.user;
    buffer += '\n';

    std::vector<std::string> names;
    names.reserve(types.size());
    for (const auto &type : types) {
        names.push_back(type.full_name);
    }
    buffer += "Included types:\n";
    buffer += indent(join(names, "\n"));
    buffer += '\n';
}

} // namespace

std::error_code serialize_snapshot(const model::Snapshot &snapshot,
                                   std::string &out,
                                   SerializerOptions options) noexcept {
    out.clear();
    try {
        const auto included = snapshot.included_types();
        const auto types = sort_types(included);

        std::string buffer;
        append_header_(snapshot, types, buffer);

        const bool two_level = snapshot.supports_two_level_grouping();
        const auto keys = snapshot.grouping_keys();
        const auto groups = sort_groups(keys, two_level);

        for (const auto &group : groups) {
            buffer += '\n';
            buffer += group_header(group, two_level);
            buffer += '\n';

            std::string body;
            if (auto ec = render_group(snapshot, group, types, options, body)) {
                spdlog::error("snaptext: serialize '{}' failed in group '{}': {}",
                              snapshot.source().url,
                              group.label(two_level),
                              ec.message());
                return ec;
            }
            buffer += indent(body);
        }

        out = normalize_newlines(buffer);
        spdlog::debug("snaptext: serialized '{}': {} groups, {} types, {} bytes, expand_depth={}",
                      snapshot.source().url,
                      groups.size(),
                      types.size(),
                      out.size(),
                      options.expand_depth);
        return {};
    } catch (const std::exception &e) {
        spdlog::error("snaptext: serialize failed: {}", e.what());
        out.clear();
        return core::make_error_code(core::errc::unexpected_state);
    } catch (...) {
        spdlog::error("snaptext: serialize failed: unknown exception");
        out.clear();
        return core::make_error_code(core::errc::unexpected_state);
    }
}

std::span<const std::string_view> valid_file_extensions() noexcept {
    return kFileExtensions;
}

} // namespace snaptext::render
