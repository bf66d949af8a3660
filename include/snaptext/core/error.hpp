#pragma once

#include <system_error>

namespace snaptext::core {

/**
 * @brief 本库通用错误码（跨模块复用）。
 *
 * 约定：
 * - 所有公开接口返回 std::error_code，结果通过出参返回，不走异常路径。
 * - unsupported_comparison：排序时遇到互相不可比较的元素（调用方契约违例）。
 * - unexpected_state：遍历快照时遇到畸形属性值，或协作方计算属性时抛出异常；
 *   序列化是“全有或全无”的，出错时不产生部分输出。
 */
enum class errc : int {
  ok = 0,
  unsupported_comparison = 1,
  unexpected_state = 2,
  invalid_argument = 3,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace snaptext::core

namespace std {
template <>
struct is_error_code_enum<snaptext::core::errc> : true_type {};
}  // namespace std
