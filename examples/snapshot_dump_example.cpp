/**
 * @file snapshot_dump_example.cpp
 * @brief 演示 snaptext 的快照可读化输出
 *
 * 构造一个小型的内存数据库快照（两张表、若干列、一个外键、一个索引），
 * 并通过 snaptext::io::write_snapshot 将可读文本写到标准输出。
 *
 * 运行：
 * - ./build/examples/snapshot_dump_example
 * - ./build/examples/snapshot_dump_example --depth 2 --one-level --log-level debug
 */

#include <snaptext/core/log.hpp>
#include <snaptext/io/writer.hpp>
#include <snaptext/model/memory_snapshot.hpp>
#include <snaptext/render/options.hpp>

#include <asio/io_context.hpp>
#include <asio/posix/stream_descriptor.hpp>

#include <unistd.h>

#include <charconv>
#include <cstddef>
#include <iostream>
#include <string_view>
#include <system_error>

using namespace snaptext;

namespace {

struct CliOptions final {
    render::SerializerOptions serializer{};
    bool two_level{true};
    core::LogLevel log_level{core::LogLevel::warn};
};

void print_usage(const char *argv0) {
    std::cout << "用法:\n";
    std::cout << "  " << argv0
              << " [--depth <n>] [--one-level|--two-level] [--log-level <level>]\n";
    std::cout << "  level: trace|debug|info|warn|error|critical|off\n";
}

[[nodiscard]] bool parse_size(std::string_view text, std::size_t &out) {
    std::size_t v = 0;
    const auto *first = text.data();
    const auto *last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, v);
    if (ec != std::errc{} || ptr != last) {
        return false;
    }
    out = v;
    return true;
}

[[nodiscard]] bool parse_args(int argc, char **argv, CliOptions &opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--one-level") {
            opts.two_level = false;
            continue;
        }
        if (arg == "--two-level") {
            opts.two_level = true;
            continue;
        }
        if (arg == "--depth" && i + 1 < argc) {
            if (!parse_size(argv[++i], opts.serializer.expand_depth)) {
                std::cerr << "非法的 --depth: " << argv[i] << "\n";
                return false;
            }
            continue;
        }
        if (arg == "--log-level" && i + 1 < argc) {
            if (!core::parse_log_level(argv[++i], opts.log_level)) {
                std::cerr << "非法的 --log-level: " << argv[i] << "\n";
                return false;
            }
            continue;
        }
        return false;
    }
    return true;
}

void build_shop(model::MemorySnapshot &snapshot) {
    using model::AttributeValue;
    using model::GroupKey;
    using model::TypeRole;
    using model::TypeTag;

    const TypeTag catalog_type{"snaptext.structure.Catalog", TypeRole::catalog};
    const TypeTag schema_type{"snaptext.structure.Schema", TypeRole::schema};
    const TypeTag table_type{"snaptext.structure.Table", TypeRole::object};
    const TypeTag column_type{"snaptext.structure.Column", TypeRole::column};
    const TypeTag fk_type{"snaptext.structure.ForeignKey", TypeRole::object};
    const TypeTag index_type{"snaptext.structure.Index", TypeRole::object};

    for (const auto &type :
         {catalog_type, schema_type, table_type, column_type, fk_type, index_type}) {
        snapshot.include_type(type);
    }

    const GroupKey shop{"shop", "public"};
    snapshot.add_group(shop);
    auto &schema = snapshot.add_entity("public", schema_type);

    auto &users = snapshot.add_entity("users", table_type, shop);
    auto &orders = snapshot.add_entity("orders", table_type, shop);

    auto &user_id = snapshot.add_entity("id", column_type, shop);
    user_id.set("type", AttributeValue::scalar("int4"));
    user_id.set("nullable", AttributeValue::scalar("false"));
    user_id.set("relation", AttributeValue::ref(users));

    auto &email = snapshot.add_entity("email", column_type, shop);
    email.set("type", AttributeValue::scalar("varchar(255)"));
    email.set("relation", AttributeValue::ref(users));

    auto &order_id = snapshot.add_entity("order_id", column_type, shop);
    order_id.set("type", AttributeValue::scalar("int8"));
    order_id.set("relation", AttributeValue::ref(orders));

    auto &order_user = snapshot.add_entity("user_id", column_type, shop);
    order_user.set("type", AttributeValue::scalar("int4"));
    order_user.set("relation", AttributeValue::ref(orders));

    auto &fk = snapshot.add_entity("fk_orders_users", fk_type, shop);
    fk.set("foreignKeyTable", AttributeValue::ref(orders));
    fk.set("foreignKeyColumns", AttributeValue::entities({&order_user}));
    fk.set("primaryKeyTable", AttributeValue::ref(users));
    fk.set("primaryKeyColumns", AttributeValue::entities({&user_id}));
    fk.set("deleteRule", AttributeValue::scalar("CASCADE"));

    auto &index = snapshot.add_entity("idx_users_email", index_type, shop);
    index.set("table", AttributeValue::ref(users));
    index.set("columns", AttributeValue::entities({&email}));
    index.set("unique", AttributeValue::scalar("true"));

    users.set("columns", AttributeValue::entities({&user_id, &email}));
    users.set("indexes", AttributeValue::entities({&index}));
    users.set("outgoingForeignKeys", AttributeValue::entities({}));
    users.set("owningSchema", AttributeValue::ref(schema));
    users.set("remarks", AttributeValue::scalar("Registered customers"));

    orders.set("columns", AttributeValue::entities({&order_id, &order_user}));
    orders.set("outgoingForeignKeys", AttributeValue::entities({&fk}));
    orders.set("tags", AttributeValue::scalars({"billing", "hot"}));
}

} // namespace

int main(int argc, char **argv) {
    CliOptions opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage(argv[0]);
        return 2;
    }
    core::set_log_level(opts.log_level);

    model::MemorySnapshot snapshot{{"jdbc:postgresql://localhost:5432/shop",
                                    "PostgreSQL",
                                    "15.4",
                                    "shop_owner"},
                                   opts.two_level};
    build_shop(snapshot);

    asio::io_context ctx;
    const int fd = ::dup(STDOUT_FILENO);
    if (fd < 0) {
        std::cerr << "dup(stdout) 失败\n";
        return 1;
    }
    asio::posix::stream_descriptor out(ctx, fd);

    const auto ec = io::write_snapshot(out, snapshot, opts.serializer);
    if (ec) {
        std::cerr << "write_snapshot 失败: " << ec.message() << "\n";
        return 1;
    }
    return 0;
}
