#pragma once

#include "snaptext/model/snapshot.hpp"
#include "snaptext/render/options.hpp"

#include <asio/posix/stream_descriptor.hpp>

#include <system_error>

namespace snaptext::io {

/**
 * @brief 序列化快照并把文本字节整体写入目标描述符（同步写）。
 *
 * 说明：
 * - 序列化失败时直接返回错误码，不写入任何字节；
 * - 目标未打开时返回 core::errc::invalid_argument；
 * - 写失败返回 asio 的 std::error_code（例如对端已关闭的管道）。
 */
std::error_code write_snapshot(asio::posix::stream_descriptor &out,
                               const model::Snapshot &snapshot,
                               render::SerializerOptions options = {}) noexcept;

} // namespace snaptext::io
