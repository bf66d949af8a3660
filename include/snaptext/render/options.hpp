#pragma once

#include <cstddef>

namespace snaptext::render {

/**
 * @brief 序列化配置。
 *
 * 调用方按值传入顶层入口，递归过程中逐层透传，不保存为全局状态。
 */
struct SerializerOptions final {
    // 展开深度：当前递归路径上的实体名个数不超过该值时，引用的实体按完整属性块展开；
    // 否则退化为属性的原始表示。默认 1：根实体的直接子对象展开，孙对象只输出原始表示。
    std::size_t expand_depth{1};
};

} // namespace snaptext::render
