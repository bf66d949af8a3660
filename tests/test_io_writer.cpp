#include "snaptext/core/error.hpp"
#include "snaptext/io/writer.hpp"
#include "snaptext/model/memory_snapshot.hpp"
#include "snaptext/render/serializer.hpp"

#include "test_main.hpp"

#include <asio/io_context.hpp>
#include <asio/posix/stream_descriptor.hpp>

#include <signal.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>

namespace {

using namespace snaptext;
using model::AttributeValue;
using model::GroupKey;
using model::MemorySnapshot;
using model::TypeRole;
using model::TypeTag;

const TypeTag kTable{"snaptext.structure.Table", TypeRole::object};
const GroupKey kPublic{"shop", "public"};

struct Pipe final {
    int fds[2]{-1, -1};

    Pipe() {
        if (::pipe(fds) != 0) {
            fds[0] = -1;
            fds[1] = -1;
        }
    }
    Pipe(const Pipe &) = delete;
    Pipe &operator=(const Pipe &) = delete;
    ~Pipe() {
        close_read();
        // 写端通常已交给 stream_descriptor 管理。
        if (fds[1] >= 0) {
            (void)::close(fds[1]);
        }
    }

    [[nodiscard]] bool ok() const noexcept { return fds[0] >= 0 && fds[1] >= 0; }

    // 写端所有权转交给调用方。
    [[nodiscard]] int release_write() noexcept {
        const int fd = fds[1];
        fds[1] = -1;
        return fd;
    }

    void close_read() noexcept {
        if (fds[0] >= 0) {
            (void)::close(fds[0]);
        }
        fds[0] = -1;
    }

    [[nodiscard]] std::string read_all() const {
        std::string out;
        char buf[4096];
        for (;;) {
            const auto n = ::read(fds[0], buf, sizeof(buf));
            if (n > 0) {
                out.append(buf, static_cast<std::size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            break;
        }
        return out;
    }
};

[[nodiscard]] MemorySnapshot make_snapshot() {
    MemorySnapshot snapshot{{"mem://writer", "Mem", "1", "u"}};
    snapshot.include_type(kTable);
    snapshot.add_group(kPublic);
    auto &users = snapshot.add_entity("users", kTable, kPublic);
    users.set("remarks", AttributeValue::scalar("written"));
    return snapshot;
}

void test_writes_serialized_document() {
    Pipe pipe;
    TEST_EXPECT(pipe.ok());
    if (!pipe.ok()) {
        return;
    }

    const auto snapshot = make_snapshot();
    std::string expected;
    TEST_EXPECT_OK(render::serialize_snapshot(snapshot, expected));

    asio::io_context ctx;
    asio::posix::stream_descriptor out(ctx, pipe.release_write());
    TEST_EXPECT_OK(io::write_snapshot(out, snapshot));
    out.close();

    TEST_EXPECT_TEXT(pipe.read_all(), expected);
}

void test_closed_destination_is_invalid_argument() {
    asio::io_context ctx;
    asio::posix::stream_descriptor out(ctx);
    const auto snapshot = make_snapshot();
    const auto ec = io::write_snapshot(out, snapshot);
    TEST_EXPECT(ec == core::errc::invalid_argument);
}

void test_serialize_failure_writes_nothing() {
    Pipe pipe;
    TEST_EXPECT(pipe.ok());
    if (!pipe.ok()) {
        return;
    }

    auto snapshot = make_snapshot();
    auto *users = snapshot.find(kTable.full_name, "users");
    TEST_EXPECT(users != nullptr);
    if (users == nullptr) {
        return;
    }
    users->set("dangling", AttributeValue(model::EntityRef{nullptr}));

    asio::io_context ctx;
    asio::posix::stream_descriptor out(ctx, pipe.release_write());
    const auto ec = io::write_snapshot(out, snapshot);
    TEST_EXPECT(ec == core::errc::unexpected_state);
    out.close();

    TEST_EXPECT(pipe.read_all().empty());
}

void test_broken_pipe_reports_error() {
    Pipe pipe;
    TEST_EXPECT(pipe.ok());
    if (!pipe.ok()) {
        return;
    }
    pipe.close_read();

    asio::io_context ctx;
    asio::posix::stream_descriptor out(ctx, pipe.release_write());
    const auto ec = io::write_snapshot(out, make_snapshot());
    TEST_EXPECT(static_cast<bool>(ec));
    TEST_EXPECT(ec == std::errc::broken_pipe);
}

} // namespace

int main() {
    // 避免写入断管触发 SIGPIPE 终止进程。
    ::signal(SIGPIPE, SIG_IGN);

    test_writes_serialized_document();
    test_closed_destination_is_invalid_argument();
    test_serialize_failure_writes_nothing();
    test_broken_pipe_reports_error();
    return snaptext::tests::run_and_report();
}
