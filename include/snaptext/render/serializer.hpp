#pragma once

#include "snaptext/model/snapshot.hpp"
#include "snaptext/render/options.hpp"

#include <span>
#include <string>
#include <string_view>
#include <system_error>

namespace snaptext::render {

/**
 * @brief 快照的可读文本序列化（只写格式，不保证可逆，不保证跨版本稳定）。
 *
 * 输出结构：
 *
 *   Database snapshot for <url>
 *   -----------------------------------------------------------------
 *   Database type: <product name>
 *   Database version: <product version>
 *   Database user: <user>
 *   Included types:
 *       <type-fqn>
 *       ...
 *
 *   Catalog & Schema: <catalog> / <schema>      （不支持两级时为 "Catalog: <catalog>"）
 *       <type-fqn>:
 *           <entity-name>
 *               <attr-name>: <value>
 *
 * 约定：
 * - 同一快照 + 同一 options 的输出逐字节一致；
 * - 输出只含 '\n' 换行（来源字符串中的 "\r\n"/'\r' 会被统一）；
 * - 全有或全无：失败时 out 为空，错误码为 core::errc。
 */
std::error_code serialize_snapshot(const model::Snapshot &snapshot,
                                   std::string &out,
                                   SerializerOptions options = {}) noexcept;

// 输出文件扩展名提示。
[[nodiscard]] std::span<const std::string_view> valid_file_extensions() noexcept;

} // namespace snaptext::render
