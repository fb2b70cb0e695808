#pragma once

/**
 * @file detector_support.hpp
 * @brief Shared helpers for the built-in detectors
 */

#include "stylint/detector.hpp"
#include "stylint/model.hpp"

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <string_view>

namespace stylint::detectors {

/// Finding with category, severity and remediation taken from the rule catalog.
[[nodiscard]] Finding make_finding(std::string_view rule_id,
                                   const SourceLocation& location,
                                   std::string function,
                                   std::string description);

/**
 * @brief Transitive per-function facts over the internal call graph.
 *
 * A function "writes storage" when it or any function it calls writes a slot;
 * the same closure applies to events. Internal calls name their callee
 * without a signature, so facts are kept per name: writes and events pool
 * every overload, and a name is a guard only when all of its overloads guard.
 */
class CallGraphFacts
{
public:
    explicit CallGraphFacts(const ir::ContractModel& model);

    [[nodiscard]] bool writes_storage(std::string_view function) const;
    [[nodiscard]] bool emits_event(std::string_view function) const;
    /// Reverts unless the caller is authorized (owner check, role check, origin check).
    [[nodiscard]] bool is_access_guard(std::string_view function) const;
    /// Reverts unless a value is on an allow-list.
    [[nodiscard]] bool is_allow_list_guard(std::string_view function) const;
    /// Slots written by the function or its callees.
    [[nodiscard]] const std::set<std::string>& written_slots(std::string_view function) const;

private:
    std::set<std::string, std::less<>> m_writers;
    std::set<std::string, std::less<>> m_emitters;
    std::set<std::string, std::less<>> m_access_guards;
    std::set<std::string, std::less<>> m_allow_list_guards;
    std::map<std::string, std::set<std::string>, std::less<>> m_written_slots;
};

/// Access-control modifier, or an access-control branch/guard call before `limit`.
[[nodiscard]] bool guarded_before(const ir::Function& function, std::size_t limit, const CallGraphFacts& facts);

[[nodiscard]] bool guarded(const ir::Function& function, const CallGraphFacts& facts);

/// Cyclomatic complexity: 1 + branches + loops.
[[nodiscard]] int complexity(const ir::Function& function);

}  // namespace stylint::detectors
