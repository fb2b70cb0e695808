#pragma once

/**
 * @file rules.hpp
 * @brief Rule catalog: fixed category, severity and remediation per rule id
 */

#include "stylint/finding.hpp"

#include <span>
#include <string_view>

namespace stylint::rules {

inline constexpr std::string_view kReentrancy = "security.reentrancy";
inline constexpr std::string_view kAccessControl = "security.access-control";
inline constexpr std::string_view kUncheckedArithmetic = "security.unchecked-arithmetic";
inline constexpr std::string_view kTrustBoundary = "security.trust-boundary";
inline constexpr std::string_view kUnvalidatedDelegatecall = "security.unvalidated-delegatecall";
inline constexpr std::string_view kTxOriginAuth = "security.tx-origin-auth";
inline constexpr std::string_view kTimestampDependence = "security.timestamp-dependence";
inline constexpr std::string_view kUnsafeCode = "security.unsafe-code";

inline constexpr std::string_view kFunctionCostThreshold = "gas.function-cost-threshold";
inline constexpr std::string_view kRepeatedStorageRead = "gas.repeated-storage-read";
inline constexpr std::string_view kRedundantExternalCall = "gas.redundant-external-call";
inline constexpr std::string_view kUnboundedLoop = "gas.unbounded-loop";
inline constexpr std::string_view kStorageWriteInLoop = "gas.storage-write-in-loop";
inline constexpr std::string_view kDynamicAllocation = "gas.dynamic-allocation";
inline constexpr std::string_view kUnestimatedOperation = "gas.unestimated-operation";
inline constexpr std::string_view kStoragePacking = "gas.storage-packing";

inline constexpr std::string_view kMissingDocumentation = "quality.missing-documentation";
inline constexpr std::string_view kHighComplexity = "quality.high-complexity";
inline constexpr std::string_view kUncheckedCallResult = "quality.unchecked-call-result";
inline constexpr std::string_view kQualityUncheckedArithmetic = "quality.unchecked-arithmetic";
inline constexpr std::string_view kNamingConvention = "quality.naming-convention";
inline constexpr std::string_view kMissingEvent = "quality.missing-event";
inline constexpr std::string_view kUnusedStorage = "quality.unused-storage";

struct RuleInfo
{
    std::string_view id;
    Category category;
    Severity severity;
    std::string_view title;
    std::string_view remediation;
};

/// Every rule, sorted by id.
[[nodiscard]] std::span<const RuleInfo> rule_catalog();

[[nodiscard]] const RuleInfo* find_rule(std::string_view id);

}  // namespace stylint::rules
