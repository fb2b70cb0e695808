/**
 * @file cost_table.cpp
 * @brief Instruction cost table and static cost estimation
 */

#include "stylint/cost_table.hpp"

#include <algorithm>
#include <format>
#include <limits>
#include <ranges>
#include <set>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace stylint::costs {

namespace {

constexpr std::int64_t kMaxUnits = std::numeric_limits<std::int64_t>::max();

/// Saturating multiply for non-negative operands.
[[nodiscard]] std::int64_t mul_sat(std::int64_t a, std::int64_t b)
{
    if (a == 0 || b == 0) {
        return 0;
    }
    if (a > kMaxUnits / b) {
        return kMaxUnits;
    }
    return a * b;
}

[[nodiscard]] std::int64_t add_sat(std::int64_t a, std::int64_t b)
{
    return a > kMaxUnits - b ? kMaxUnits : a + b;
}

[[nodiscard]] CostKey arithmetic_key(ir::ArithmeticOp op)
{
    switch (op) {
        case ir::ArithmeticOp::kAdd:
        case ir::ArithmeticOp::kSub:
            return CostKey::kArithmeticAddSub;
        case ir::ArithmeticOp::kMul:
        case ir::ArithmeticOp::kDiv:
        case ir::ArithmeticOp::kMod:
            return CostKey::kArithmeticMulDivMod;
        case ir::ArithmeticOp::kPow:
            return CostKey::kArithmeticPow;
        case ir::ArithmeticOp::kShl:
            return CostKey::kArithmeticShl;
    }
    return CostKey::kArithmeticAddSub;
}

[[nodiscard]] std::array<CostEntry, kCostKeyCount> default_entries()
{
    std::array<CostEntry, kCostKeyCount> entries{};
    const auto set = [&entries](CostKey key, std::int64_t units) {
        entries[static_cast<std::size_t>(key)] = CostEntry{.units = units, .carbon_per_unit = kDefaultCarbonPerUnit};
    };
    set(CostKey::kArithmeticAddSub, 3);
    set(CostKey::kArithmeticMulDivMod, 5);
    set(CostKey::kArithmeticPow, 50);
    set(CostKey::kArithmeticShl, 3);
    set(CostKey::kCheckedSurcharge, 20);
    set(CostKey::kStorageReadCold, 2100);
    set(CostKey::kStorageReadWarm, 100);
    set(CostKey::kStorageWrite, 20000);
    set(CostKey::kExternalCall, 2600);
    set(CostKey::kValueTransfer, 9000);
    set(CostKey::kAllocationDynamic, 200);
    set(CostKey::kAllocationPreallocated, 50);
    set(CostKey::kLoopOverhead, 8);
    set(CostKey::kBranch, 10);
    set(CostKey::kInternalCall, 24);
    set(CostKey::kEnvironmentRead, 2);
    set(CostKey::kEventEmission, 750);
    return entries;
}

}  // namespace

CostTable::CostTable(const std::array<CostEntry, kCostKeyCount>& entries)
    : m_entries(entries)
{}

const CostTable& default_cost_table()
{
    static const CostTable kTable(default_entries());
    return kTable;
}

const FunctionCost* ContractCostEstimate::find(std::string_view function) const
{
    auto it = std::ranges::find(functions, function, &FunctionCost::function);
    return it == functions.end() ? nullptr : &*it;
}

const FunctionCost* ContractCostEstimate::at(std::size_t index) const
{
    return index < functions.size() ? &functions[index] : nullptr;
}

std::string_view to_string(CostKey key)
{
    switch (key) {
        case CostKey::kArithmeticAddSub:
            return "arithmetic.add_sub";
        case CostKey::kArithmeticMulDivMod:
            return "arithmetic.mul_div_mod";
        case CostKey::kArithmeticPow:
            return "arithmetic.pow";
        case CostKey::kArithmeticShl:
            return "arithmetic.shl";
        case CostKey::kCheckedSurcharge:
            return "arithmetic.checked_surcharge";
        case CostKey::kStorageReadCold:
            return "storage.read_cold";
        case CostKey::kStorageReadWarm:
            return "storage.read_warm";
        case CostKey::kStorageWrite:
            return "storage.write";
        case CostKey::kExternalCall:
            return "call.external";
        case CostKey::kValueTransfer:
            return "call.value_transfer";
        case CostKey::kAllocationDynamic:
            return "memory.dynamic";
        case CostKey::kAllocationPreallocated:
            return "memory.preallocated";
        case CostKey::kLoopOverhead:
            return "control.loop";
        case CostKey::kBranch:
            return "control.branch";
        case CostKey::kInternalCall:
            return "control.internal_call";
        case CostKey::kEnvironmentRead:
            return "environment.read";
        case CostKey::kEventEmission:
            return "event.emit";
    }
    return "unknown";
}

std::optional<CostKey> cost_key(const ir::Operation& op, bool warm_read)
{
    return std::visit(
        [warm_read](const auto& value) -> std::optional<CostKey> {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, ir::Arithmetic>) {
                return arithmetic_key(value.op);
            } else if constexpr (std::is_same_v<T, ir::StorageRead>) {
                return warm_read ? CostKey::kStorageReadWarm : CostKey::kStorageReadCold;
            } else if constexpr (std::is_same_v<T, ir::StorageWrite>) {
                return CostKey::kStorageWrite;
            } else if constexpr (std::is_same_v<T, ir::ExternalCall>) {
                return value.kind == ir::CallKind::kValueTransfer ? CostKey::kValueTransfer : CostKey::kExternalCall;
            } else if constexpr (std::is_same_v<T, ir::MemoryAllocation>) {
                return value.preallocated ? CostKey::kAllocationPreallocated : CostKey::kAllocationDynamic;
            } else if constexpr (std::is_same_v<T, ir::Loop>) {
                return CostKey::kLoopOverhead;
            } else if constexpr (std::is_same_v<T, ir::Branch>) {
                return CostKey::kBranch;
            } else if constexpr (std::is_same_v<T, ir::InternalCall>) {
                return CostKey::kInternalCall;
            } else if constexpr (std::is_same_v<T, ir::EnvironmentRead>) {
                return CostKey::kEnvironmentRead;
            } else if constexpr (std::is_same_v<T, ir::EventEmission>) {
                return CostKey::kEventEmission;
            } else {
                static_assert(std::is_same_v<T, ir::OpaqueOperation>, "unhandled operation kind");
                return std::nullopt;
            }
        },
        op.kind);
}

std::int64_t loop_multiplier(int loop_depth, const CostOptions& options)
{
    const int depth = std::clamp(loop_depth, 0, std::max(options.max_loop_depth, 0));
    std::int64_t multiplier = 1;
    for (int i = 0; i < depth; ++i) {
        multiplier = mul_sat(multiplier, options.loop_iteration_estimate);
    }
    return multiplier;
}

Result<FunctionCost>
estimate_function(const ir::Function& function, const CostTable& table, const CostOptions& options)
{
    if (options.loop_iteration_estimate < 1) {
        return std::unexpected(Error::make(std::string(error_code::kConfigurationError),
                                           std::format("loop iteration estimate must be positive, got {}",
                                                       options.loop_iteration_estimate)));
    }
    if (options.unestimated_operation_cost < 0) {
        return std::unexpected(Error::make(std::string(error_code::kConfigurationError),
                                           "unestimated operation cost must not be negative"));
    }

    FunctionCost cost{.function = function.name,
                      .units = 0,
                      .carbon_micrograms = 0,
                      .unestimated_operations = 0,
                      .operations = {}};
    cost.operations.reserve(function.operations.size());
    // Mapping entries are separate storage words: warmth is per (slot, key).
    std::set<std::pair<std::string, std::string>> read_words;
    for (const auto& [index, op] : std::views::enumerate(function.operations)) {
        bool warm = false;
        if (const auto* read = std::get_if<ir::StorageRead>(&op.kind)) {
            warm = !read_words.emplace(read->slot, read->key).second;
        }
        std::int64_t base = options.unestimated_operation_cost;
        std::int64_t carbon = options.carbon_per_unit.value_or(kDefaultCarbonPerUnit);
        const auto key = cost_key(op, warm);
        if (key) {
            base = table.units(*key);
            carbon = options.carbon_per_unit.value_or(table.entry(*key).carbon_per_unit);
            if (const auto* arithmetic = std::get_if<ir::Arithmetic>(&op.kind); arithmetic && arithmetic->checked) {
                base = add_sat(base, table.units(CostKey::kCheckedSurcharge));
            }
        } else {
            ++cost.unestimated_operations;
        }
        const std::int64_t units = mul_sat(base, loop_multiplier(op.loop_depth, options));
        cost.units = add_sat(cost.units, units);
        cost.carbon_micrograms = add_sat(cost.carbon_micrograms, mul_sat(units, carbon));
        cost.operations.push_back(OperationCost{.operation_index = static_cast<std::size_t>(index),
                                                .units = units,
                                                .estimated = key.has_value()});
    }
    return cost;
}

Result<ContractCostEstimate>
estimate(const ir::ContractModel& model, const CostTable& table, const CostOptions& options)
{
    ContractCostEstimate result;
    result.functions.reserve(model.functions.size());
    for (const auto& function : model.functions) {
        auto cost = estimate_function(function, table, options);
        if (!cost) {
            return std::unexpected(cost.error());
        }
        result.total_units = add_sat(result.total_units, cost->units);
        result.carbon_micrograms = add_sat(result.carbon_micrograms, cost->carbon_micrograms);
        result.unestimated_operations += cost->unestimated_operations;
        result.functions.push_back(std::move(*cost));
    }
    return result;
}

void to_json(nlohmann::json& j, const FunctionCost& cost)
{
    j = nlohmann::json{
        {                "function",               cost.function},
        {                   "units",                  cost.units},
        {       "carbon_micrograms",      cost.carbon_micrograms},
        {"unestimated_operations", cost.unestimated_operations},
    };
}

void to_json(nlohmann::json& j, const ContractCostEstimate& estimate)
{
    j = nlohmann::json{
        {           "total_units",            estimate.total_units},
        {     "carbon_micrograms",      estimate.carbon_micrograms},
        {"unestimated_operations", estimate.unestimated_operations},
        {             "functions",              estimate.functions},
    };
}

}  // namespace stylint::costs
