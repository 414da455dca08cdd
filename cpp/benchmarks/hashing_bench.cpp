#include <array>
#include <cstddef>
#include <vector>

#include <benchmark/benchmark.h>

#include "frameisa/storage/hashing.hpp"

static void BM_HashCompute(benchmark::State& state){
    const size_t n = static_cast<size_t>(state.range(0));

    std::array<frameisa::storage::u8, 4096> buf{};
    for (size_t i = 0; i < buf.size(); ++i){
        buf[i] = static_cast<frameisa::storage::u8>(i & 0xffu);
    }

    for (auto _ : state){
        frameisa::core::Hash256 out{};
        frameisa::core::Status s = frameisa::storage::hash_compute({buf.data(), static_cast<frameisa::core::u32>(n)}, &out);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}

BENCHMARK(BM_HashCompute)->Arg(0)->Arg(6)->Arg(64)->Arg(1024)->Arg(4096);

static void BM_ProgramDigest(benchmark::State& state){
    const size_t n = static_cast<size_t>(state.range(0));
    std::vector<frameisa::isa::Instruction> program(n,
        frameisa::isa::instruction_simple(frameisa::isa::actions::kExplain, frameisa::isa::subjects::kConcept));

    for (auto _ : state){
        frameisa::core::Hash256 out{};
        frameisa::core::Status s = frameisa::storage::program_digest(program, &out);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}

BENCHMARK(BM_ProgramDigest)->Arg(1)->Arg(16)->Arg(256);
