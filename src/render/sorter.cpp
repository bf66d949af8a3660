#include "snaptext/render/sorter.hpp"

#include "snaptext/core/error.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <tuple>

namespace snaptext::render {
namespace {

[[nodiscard]] int sign_of(int v) noexcept { return (v > 0) - (v < 0); }

} // namespace

bool type_name_less(const model::TypeTag &lhs,
                    const model::TypeTag &rhs) noexcept {
    return lhs.full_name < rhs.full_name;
}

std::optional<int> compare_entities(const model::Entity &lhs,
                                    const model::Entity &rhs) {
    if (lhs.has_natural_order()) {
        return lhs.compare_to(rhs);
    }
    return sign_of(lhs.type().full_name.compare(rhs.type().full_name));
}

std::vector<model::TypeTag> sort_types(std::span<const model::TypeTag> types) {
    std::vector<model::TypeTag> out(types.begin(), types.end());
    std::stable_sort(out.begin(), out.end(), type_name_less);
    return out;
}

std::vector<std::string>
sort_attribute_names(std::span<const std::string> names) {
    std::vector<std::string> out(names.begin(), names.end());
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

std::vector<model::GroupKey>
sort_groups(std::span<const model::GroupKey> groups, bool two_level) {
    std::vector<model::GroupKey> out(groups.begin(), groups.end());
    std::stable_sort(out.begin(),
                     out.end(),
                     [two_level](const model::GroupKey &lhs,
                                 const model::GroupKey &rhs) {
                         const auto l = lhs.label(two_level);
                         const auto r = rhs.label(two_level);
                         if (l != r) {
                             return l < r;
                         }
                         // 标签相同（一级分组下同一 catalog）时按完整键排序，
                         // 输出不依赖登记顺序，相等的键也总是相邻。
                         return std::tie(lhs.catalog, lhs.schema) <
                                std::tie(rhs.catalog, rhs.schema);
                     });
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

std::error_code sort_entities(std::span<const model::Entity *const> entities,
                              std::vector<const model::Entity *> &out) noexcept {
    out.clear();

    try {
        std::vector<const model::Entity *> sorted(entities.begin(),
                                                  entities.end());
        for (const auto *entity : sorted) {
            if (entity == nullptr) {
                spdlog::error("snaptext: null entity in sort input");
                return core::make_error_code(core::errc::unexpected_state);
            }
        }

        // 比较器无法直接返回错误：一旦发现不可比较的元素即记录下来，
        // 之后所有比较都视为相等，stable_sort 依然能安全结束。
        const model::Entity *bad_lhs = nullptr;
        const model::Entity *bad_rhs = nullptr;
        std::stable_sort(
            sorted.begin(),
            sorted.end(),
            [&](const model::Entity *lhs, const model::Entity *rhs) {
                if (bad_lhs != nullptr) {
                    return false;
                }
                const auto c = compare_entities(*lhs, *rhs);
                if (!c) {
                    bad_lhs = lhs;
                    bad_rhs = rhs;
                    return false;
                }
                return *c < 0;
            });

        if (bad_lhs != nullptr) {
            spdlog::error("snaptext: cannot compare {} '{}' with {} '{}'",
                          bad_lhs->type().full_name,
                          bad_lhs->name(),
                          bad_rhs->type().full_name,
                          bad_rhs->name());
            return core::make_error_code(core::errc::unsupported_comparison);
        }

        out = std::move(sorted);
        return {};
    } catch (const std::exception &e) {
        spdlog::error("snaptext: entity ordering failed: {}", e.what());
        out.clear();
        return core::make_error_code(core::errc::unexpected_state);
    } catch (...) {
        spdlog::error("snaptext: entity ordering failed: unknown exception");
        out.clear();
        return core::make_error_code(core::errc::unexpected_state);
    }
}

} // namespace snaptext::render
