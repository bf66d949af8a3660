#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace snaptext::render {

// 每级缩进空格数。
inline constexpr std::size_t kIndentWidth = 4;

inline constexpr std::string_view kDivider =
    "-----------------------------------------------------------------";

/**
 * @brief 对整个多行文本块做缩进（首行也缩进）。
 *
 * 空行保持为空，不会留下行尾空白；原有的末尾换行保持不变。
 * "\r\n" 与单独的 '\r' 同样按行结束处理。
 */
[[nodiscard]] std::string indent(std::string_view block, std::size_t levels = 1);

// 追加分隔线（含换行）。
void append_divider(std::string &out);

[[nodiscard]] std::string join(const std::vector<std::string> &parts,
                               std::string_view separator);

// 去掉最后一个 '\n'（只去一个，内部行不受影响）。
[[nodiscard]] std::string trim_trailing_newline(std::string text);

/**
 * @brief 换行符统一：先将 "\r\n" 替换为 "\n"，再将单独的 '\r' 替换为 "\n"。
 */
[[nodiscard]] std::string normalize_newlines(std::string_view text);

} // namespace snaptext::render
