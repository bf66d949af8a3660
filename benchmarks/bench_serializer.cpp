#include "bench_main.hpp"

#include "snaptext/model/memory_snapshot.hpp"
#include "snaptext/render/serializer.hpp"

#include <cstddef>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

using namespace snaptext;
using model::AttributeValue;

static void build_synthetic(model::MemorySnapshot &snapshot,
                            std::size_t schema_count,
                            std::size_t tables_per_schema,
                            std::size_t columns_per_table) {
    const model::TypeTag table_type{"snaptext.structure.Table",
                                    model::TypeRole::object};
    const model::TypeTag column_type{"snaptext.structure.Column",
                                     model::TypeRole::column};
    snapshot.include_type(table_type);
    snapshot.include_type(column_type);

    for (std::size_t s = 0; s < schema_count; ++s) {
        const model::GroupKey group{"bench", "schema_" + std::to_string(s)};
        snapshot.add_group(group);

        model::MemoryEntity *previous = nullptr;
        for (std::size_t t = 0; t < tables_per_schema; ++t) {
            auto &table =
                snapshot.add_entity("table_" + std::to_string(t), table_type, group);

            std::vector<const model::Entity *> columns;
            for (std::size_t c = 0; c < columns_per_table; ++c) {
                auto &column = snapshot.add_entity(
                    "col_" + std::to_string(c), column_type, group);
                column.set("type", AttributeValue::scalar("int4"));
                column.set("relation", AttributeValue::ref(table));
                columns.push_back(&column);
            }
            table.set("columns", AttributeValue::entities(std::move(columns)));
            table.set("remarks", AttributeValue::scalar("synthetic"));

            // 相邻表互相引用，形成长度为 2 的环。
            if (previous != nullptr) {
                table.set("peer", AttributeValue::ref(*previous));
                previous->set("peer", AttributeValue::ref(table));
            }
            previous = &table;
        }
    }
}

static void bench_serialize(std::size_t schema_count,
                            std::size_t tables_per_schema,
                            std::size_t columns_per_table,
                            std::size_t expand_depth) {
    model::MemorySnapshot snapshot{{"bench://synthetic", "Bench", "1", "bench"}};
    build_synthetic(snapshot, schema_count, tables_per_schema, columns_per_table);

    render::SerializerOptions options;
    options.expand_depth = expand_depth;

    std::string probe;
    if (auto ec = render::serialize_snapshot(snapshot, probe, options)) {
        std::cerr << "serialize failed: " << ec.message() << "\n";
        return;
    }

    const std::string label = "serialize " + std::to_string(schema_count) + "x" +
                              std::to_string(tables_per_schema) + "x" +
                              std::to_string(columns_per_table) + " depth=" +
                              std::to_string(expand_depth);
    BENCH_RUN(label, probe.size(), 5, {
        std::string out;
        auto ec = render::serialize_snapshot(snapshot, out, options);
        if (ec) {
            std::cerr << "serialize failed: " << ec.message() << "\n";
        }
    });
}

int main() {
    std::cout << "snaptext serializer benchmarks\n";

    bench_serialize(4, 50, 8, 1);
    bench_serialize(4, 50, 8, 3);
    bench_serialize(16, 200, 12, 1);

    snaptext::benchmarks::print_results();
    return 0;
}
