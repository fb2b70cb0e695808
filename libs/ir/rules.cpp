/**
 * @file rules.cpp
 * @brief Rule catalog
 */

#include "stylint/rules.hpp"

#include <algorithm>
#include <array>

namespace stylint::rules {

namespace {

// Kept sorted by id for find_rule.
constexpr std::array<RuleInfo, 23> kRules = {
    {
     {.id = kDynamicAllocation,
         .category = Category::kPerformance,
         .severity = Severity::kLow,
         .title = "Collection grown inside a loop",
         .remediation = "Preallocate the collection with its final capacity before the loop."},
     {.id = kFunctionCostThreshold,
         .category = Category::kPerformance,
         .severity = Severity::kMedium,
         .title = "Function cost above threshold",
         .remediation = "Split the function, cache storage values in locals and move work off-chain where possible."},
     {.id = kRedundantExternalCall,
         .category = Category::kPerformance,
         .severity = Severity::kMedium,
         .title = "Identical external call repeated",
         .remediation = "Call once and reuse the returned value."},
     {.id = kRepeatedStorageRead,
         .category = Category::kPerformance,
         .severity = Severity::kLow,
         .title = "Storage slot read repeatedly",
         .remediation = "Read the slot once into a local variable and reuse it."},
     {.id = kStoragePacking,
         .category = Category::kPerformance,
         .severity = Severity::kLow,
         .title = "Sub-word state variables split across storage words",
         .remediation = "Declare small state variables next to each other so they share a 32-byte storage word."},
     {.id = kStorageWriteInLoop,
         .category = Category::kPerformance,
         .severity = Severity::kMedium,
         .title = "Storage write inside a loop",
         .remediation = "Accumulate in memory and write the result to storage once after the loop."},
     {.id = kUnboundedLoop,
         .category = Category::kPerformance,
         .severity = Severity::kHigh,
         .title = "Loop bound depends on storage size",
         .remediation = "Bound the iteration count or paginate the work across calls."},
     {.id = kUnestimatedOperation,
         .category = Category::kPerformance,
         .severity = Severity::kLow,
         .title = "Operation cost could not be estimated",
         .remediation = "Review the operation manually; it was priced with the default cost."},
     {.id = kHighComplexity,
         .category = Category::kQuality,
         .severity = Severity::kLow,
         .title = "High cyclomatic complexity",
         .remediation = "Extract branches and loops into smaller helper functions."},
     {.id = kMissingDocumentation,
         .category = Category::kQuality,
         .severity = Severity::kInfo,
         .title = "Public function without documentation",
         .remediation = "Add a doc comment describing behaviour, parameters and failure modes."},
     {.id = kMissingEvent,
         .category = Category::kQuality,
         .severity = Severity::kLow,
         .title = "State change without event",
         .remediation = "Emit an event describing the state change so off-chain consumers can track it."},
     {.id = kNamingConvention,
         .category = Category::kQuality,
         .severity = Severity::kInfo,
         .title = "Name does not follow the dialect convention",
         .remediation = "Rename to snake_case (Rust) or mixedCase (Solidity); contracts use PascalCase."},
     {.id = kQualityUncheckedArithmetic,
         .category = Category::kQuality,
         .severity = Severity::kInfo,
         .title = "Unchecked arithmetic",
         .remediation = "Use checked or saturating arithmetic, or document why overflow cannot happen."},
     {.id = kUncheckedCallResult,
         .category = Category::kQuality,
         .severity = Severity::kMedium,
         .title = "External call result not handled",
         .remediation = "Propagate or check the result of the call."},
     {.id = kUnusedStorage,
         .category = Category::kQuality,
         .severity = Severity::kLow,
         .title = "Storage slot never accessed",
         .remediation = "Remove the slot or use it; unused slots still shape the storage layout."},
     {.id = kAccessControl,
         .category = Category::kSecurity,
         .severity = Severity::kHigh,
         .title = "State change reachable without access control",
         .remediation = "Check the caller against an owner or role before changing privileged state."},
     {.id = kReentrancy,
         .category = Category::kSecurity,
         .severity = Severity::kCritical,
         .title = "Storage write after external call",
         .remediation = "Apply checks-effects-interactions: update storage before the external call, or add a reentrancy guard."},
     {.id = kTimestampDependence,
         .category = Category::kSecurity,
         .severity = Severity::kMedium,
         .title = "State change depends on block time",
         .remediation = "Do not rely on L2 block timestamps or numbers for precise timing or randomness."},
     {.id = kTrustBoundary,
         .category = Category::kSecurity,
         .severity = Severity::kHigh,
         .title = "Call to an unvalidated address",
         .remediation = "Validate the target against an allow-list or a trusted constant before calling."},
     {.id = kTxOriginAuth,
         .category = Category::kSecurity,
         .severity = Severity::kHigh,
         .title = "Authorization through tx.origin",
         .remediation = "Authorize with msg.sender instead of tx.origin."},
     {.id = kUncheckedArithmetic,
         .category = Category::kSecurity,
         .severity = Severity::kHigh,
         .title = "Unchecked arithmetic on stored or indexing value",
         .remediation = "Use checked arithmetic (checked_add, SafeMath, Solidity >=0.8 outside unchecked blocks)."},
     {.id = kUnsafeCode,
         .category = Category::kSecurity,
         .severity = Severity::kHigh,
         .title = "Unsafe code region",
         .remediation = "Remove the unsafe block or inline assembly, or audit it and keep it minimal."},
     {.id = kUnvalidatedDelegatecall,
         .category = Category::kSecurity,
         .severity = Severity::kCritical,
         .title = "Delegate call to an unvalidated address",
         .remediation = "Only delegate to a fixed, trusted implementation address."},
     }
};

}  // namespace

std::span<const RuleInfo> rule_catalog()
{
    return kRules;
}

const RuleInfo* find_rule(std::string_view id)
{
    auto it = std::ranges::lower_bound(kRules, id, {}, &RuleInfo::id);
    if (it == kRules.end() || it->id != id) {
        return nullptr;
    }
    return &*it;
}

}  // namespace stylint::rules
