#include "snaptext/render/text.hpp"

namespace snaptext::render {

std::string indent(std::string_view block, std::size_t levels) {
    const std::string prefix(levels * kIndentWidth, ' ');

    std::string out;
    out.reserve(block.size() + prefix.size() * 4);

    bool at_line_start = true;
    for (std::size_t i = 0; i < block.size(); ++i) {
        const char c = block[i];
        // '\r' 也视为行结束：最终换行统一后，来源字符串里的多行值仍然对齐。
        if (c == '\n' || c == '\r') {
            out += c;
            at_line_start = true;
            continue;
        }
        if (at_line_start) {
            out += prefix;
            at_line_start = false;
        }
        out += c;
    }
    return out;
}

void append_divider(std::string &out) {
    out += kDivider;
    out += '\n';
}

std::string join(const std::vector<std::string> &parts,
                 std::string_view separator) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i != 0) {
            out += separator;
        }
        out += parts[i];
    }
    return out;
}

std::string trim_trailing_newline(std::string text) {
    if (!text.empty() && text.back() == '\n') {
        text.pop_back();
    }
    return text;
}

std::string normalize_newlines(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c != '\r') {
            out += c;
            continue;
        }
        // "\r\n" 与单独的 '\r' 都输出为一个 '\n'。
        if (i + 1 < text.size() && text[i + 1] == '\n') {
            ++i;
        }
        out += '\n';
    }
    return out;
}

} // namespace snaptext::render
