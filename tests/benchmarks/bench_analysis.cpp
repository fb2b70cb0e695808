// bench_analysis.cpp - analysis pipeline benchmarks
//
// Tracks model building, a full analyze() run and canonical report
// serialization so regressions show up per stage.

#include "stylint/analyzer.hpp"
#include "stylint/common.hpp"

#include <format>
#include <string>

#include <benchmark/benchmark.h>

namespace {

// ===========================================================================
// Fixtures
// ===========================================================================

// A Solidity vault with `functions` entry points mixing calls, loops and writes.
std::string create_contract(int functions)
{
    std::string source = "pragma solidity ^0.8.0;\ncontract Bench {\n"
                         "    mapping(address => uint256) balances;\n"
                         "    uint256[] rewards;\n"
                         "    uint256 total;\n"
                         "    address oracle;\n\n";
    for (int i = 0; i < functions; ++i) {
        source += std::format("    /// Entry point {}.\n"
                              "    function op{}(uint256 amount, uint256 n) external {{\n"
                              "        (bool ok, ) = msg.sender.call{{value: amount}}(\"\");\n"
                              "        require(ok);\n"
                              "        balances[msg.sender] -= amount;\n"
                              "        for (uint256 i = 0; i < n; i++) {{\n"
                              "            rewards[i] = total + i;\n"
                              "        }}\n"
                              "        total = total * 2 + amount;\n"
                              "    }}\n\n",
                              i,
                              i);
    }
    source += "}\n";
    return source;
}

stylint::ir::ContractModel build(const std::string& source)
{
    auto model = stylint::frontend::build_model(source, stylint::ir::Dialect::kSolidity, {.file_path = "Bench.sol"});
    return model ? *model : stylint::ir::ContractModel{};
}

// ===========================================================================
// Frontend
// ===========================================================================

static void BM_BuildModel(benchmark::State& state)
{
    const auto source = create_contract(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto model = stylint::frontend::build_model(source, stylint::ir::Dialect::kSolidity, {.file_path = "Bench.sol"});
        benchmark::DoNotOptimize(model);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(source.size()));
}
BENCHMARK(BM_BuildModel)->Arg(1)->Arg(16)->Arg(128);

// ===========================================================================
// Full analysis
// ===========================================================================

static void BM_Analyze(benchmark::State& state)
{
    const auto model = build(create_contract(static_cast<int>(state.range(0))));
    stylint::analyzer::AnalysisConfig config;
    config.parallel = state.range(1) != 0;
    const stylint::analyzer::Analyzer analyzer{config};
    for (auto _ : state) {
        auto report = analyzer.analyze(model);
        benchmark::DoNotOptimize(report);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Analyze)->Args({1, 0})->Args({16, 0})->Args({16, 1})->Args({128, 1});

// ===========================================================================
// Canonical report (serialize + SHA256)
// ===========================================================================

static void BM_CanonicalReport(benchmark::State& state)
{
    const auto model = build(create_contract(static_cast<int>(state.range(0))));
    const auto report = stylint::analyzer::Analyzer(stylint::analyzer::AnalysisConfig{}).analyze(model);
    if (!report) {
        state.SkipWithError(report.error().message.c_str());
        return;
    }
    for (auto _ : state) {
        auto canonical = stylint::report::canonical_report(*report);
        if (canonical) {
            auto hash = stylint::common::sha256(*canonical);
            benchmark::DoNotOptimize(hash);
        }
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_CanonicalReport)->Arg(1)->Arg(16);

}  // namespace
