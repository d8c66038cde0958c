// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  cqlgen - Generator Benchmarks                                               ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <benchmark/benchmark.h>

#include "cqlgen/cql/data_type.hpp"
#include "cqlgen/cql/identifier.hpp"
#include "cqlgen/generator/generator.hpp"

#include <cstdint>
#include <string>

using namespace cqlgen;
using namespace cqlgen::keyspace;
using cql::DataType;

static CreateTableSpecification make_table(std::int64_t columns) {
    auto builder = CreateTableSpecification::builder("events");
    builder.partition_key_column("tenant", DataType::uuid())
           .clustered_key_column("ts", DataType::timeuuid(), Ordering::Desc);
    for (std::int64_t i = 0; i < columns; ++i) {
        builder.column("col_" + std::to_string(i), DataType::map_of(DataType::text(), DataType::cint()));
    }
    builder.with(cql::TableOption::Comment, std::string("benchmark table"))
           .with(cql::TableOption::GcGraceSeconds, std::int64_t{3600});
    return builder.build();
}

static void BM_IdentifierConstruction(benchmark::State& state) {
    for (auto _ : state) {
        cql::Identifier id("user_events");
        benchmark::DoNotOptimize(id);
    }
}
BENCHMARK(BM_IdentifierConstruction);

static void BM_IdentifierReservedKeyword(benchmark::State& state) {
    for (auto _ : state) {
        cql::Identifier id("select");
        benchmark::DoNotOptimize(id);
    }
}
BENCHMARK(BM_IdentifierReservedKeyword);

static void BM_DataTypeParse(benchmark::State& state) {
    for (auto _ : state) {
        auto type = DataType::parse("map<text, frozen<list<tuple<int, text>>>>");
        benchmark::DoNotOptimize(type);
    }
}
BENCHMARK(BM_DataTypeParse);

static void BM_CreateKeyspace(benchmark::State& state) {
    auto spec = CreateKeyspaceSpecification::builder("ks").build();

    for (auto _ : state) {
        auto cql = generator::generate(spec);
        benchmark::DoNotOptimize(cql);
    }
}
BENCHMARK(BM_CreateKeyspace);

static void BM_CreateTable(benchmark::State& state) {
    const Specification spec = make_table(state.range(0));

    for (auto _ : state) {
        auto cql = generator::to_cql(spec);
        benchmark::DoNotOptimize(cql);
    }

    state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_CreateTable)->Range(4, 256)->Complexity();

static void BM_AlterTypeRenames(benchmark::State& state) {
    auto builder = AlterUserTypeSpecification::builder("address");
    for (std::int64_t i = 0; i < state.range(0); ++i) {
        builder.rename("f" + std::to_string(i), "g" + std::to_string(i));
    }
    const auto spec = builder.build();

    for (auto _ : state) {
        auto cql = generator::generate(spec);
        benchmark::DoNotOptimize(cql);
    }
}
BENCHMARK(BM_AlterTypeRenames)->Range(2, 128);

BENCHMARK_MAIN();
