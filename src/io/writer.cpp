#include "snaptext/io/writer.hpp"

#include "snaptext/core/error.hpp"
#include "snaptext/render/serializer.hpp"

#include <asio/buffer.hpp>
#include <asio/write.hpp>

#include <spdlog/spdlog.h>

#include <string>

namespace snaptext::io {

std::error_code write_snapshot(asio::posix::stream_descriptor &out,
                               const model::Snapshot &snapshot,
                               render::SerializerOptions options) noexcept {
    if (!out.is_open()) {
        return core::make_error_code(core::errc::invalid_argument);
    }

    std::string text;
    if (auto ec = render::serialize_snapshot(snapshot, text, options)) {
        return ec;
    }

    std::error_code ec;
    const auto written = asio::write(out, asio::buffer(text), ec);
    if (ec) {
        spdlog::error("snaptext: write failed after {}/{} bytes: {}",
                      written,
                      text.size(),
                      ec.message());
        return ec;
    }
    spdlog::debug("snaptext: wrote {} bytes", written);
    return {};
}

} // namespace snaptext::io
