#pragma once

/**
 * @file cost_table.hpp
 * @brief Instruction cost table and static cost estimation
 */

#include "stylint/common.hpp"
#include "stylint/model.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace stylint::costs {

enum class CostKey : std::uint8_t {
    kArithmeticAddSub,
    kArithmeticMulDivMod,
    kArithmeticPow,
    kArithmeticShl,
    kCheckedSurcharge,
    kStorageReadCold,
    kStorageReadWarm,
    kStorageWrite,
    kExternalCall,
    kValueTransfer,
    kAllocationDynamic,
    kAllocationPreallocated,
    kLoopOverhead,
    kBranch,
    kInternalCall,
    kEnvironmentRead,
    kEventEmission,
};

inline constexpr std::size_t kCostKeyCount = static_cast<std::size_t>(CostKey::kEventEmission) + 1;

inline constexpr std::int64_t kDefaultCarbonPerUnit = 200;  ///< micrograms CO2e

struct CostEntry
{
    std::int64_t units = 0;
    std::int64_t carbon_per_unit = kDefaultCarbonPerUnit;
};

class CostTable
{
public:
    explicit CostTable(const std::array<CostEntry, kCostKeyCount>& entries);

    [[nodiscard]] const CostEntry& entry(CostKey key) const
    {
        return m_entries[static_cast<std::size_t>(key)];
    }
    [[nodiscard]] std::int64_t units(CostKey key) const { return entry(key).units; }

private:
    std::array<CostEntry, kCostKeyCount> m_entries;
};

/// Table built once on first use; safe to share across threads.
[[nodiscard]] const CostTable& default_cost_table();

struct CostOptions
{
    std::int64_t loop_iteration_estimate = 10;
    int max_loop_depth = 3;
    std::int64_t unestimated_operation_cost = 1000;
    std::optional<std::int64_t> carbon_per_unit;  ///< Overrides every entry's coefficient
};

struct OperationCost
{
    std::size_t operation_index = 0;
    std::int64_t units = 0;  ///< After the loop multiplier
    bool estimated = true;   ///< False for opaque operations priced with the default
};

struct FunctionCost
{
    std::string function;
    std::int64_t units = 0;
    std::int64_t carbon_micrograms = 0;
    std::int64_t unestimated_operations = 0;
    std::vector<OperationCost> operations;
};

struct ContractCostEstimate
{
    std::vector<FunctionCost> functions;
    std::int64_t total_units = 0;
    std::int64_t carbon_micrograms = 0;
    std::int64_t unestimated_operations = 0;

    /// First function named `function`; overloads share a name, so prefer at().
    [[nodiscard]] const FunctionCost* find(std::string_view function) const;
    /// Cost of the model's function at `index`; `functions` is parallel to the model's.
    [[nodiscard]] const FunctionCost* at(std::size_t index) const;
};

[[nodiscard]] std::string_view to_string(CostKey key);

/// Cost key for an operation; nullopt for opaque operations.
[[nodiscard]] std::optional<CostKey> cost_key(const ir::Operation& op, bool warm_read);

/// Loop multiplier for an operation at `loop_depth`: estimate^min(depth, max).
[[nodiscard]] std::int64_t loop_multiplier(int loop_depth, const CostOptions& options);

[[nodiscard]] Result<FunctionCost>
estimate_function(const ir::Function& function, const CostTable& table, const CostOptions& options);

/**
 * Estimate every function of a model.
 * Fails with ConfigurationError for a non-positive loop estimate or negative costs.
 */
[[nodiscard]] Result<ContractCostEstimate>
estimate(const ir::ContractModel& model, const CostTable& table, const CostOptions& options);

void to_json(nlohmann::json& j, const FunctionCost& cost);
void to_json(nlohmann::json& j, const ContractCostEstimate& estimate);

}  // namespace stylint::costs
