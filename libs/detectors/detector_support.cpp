/**
 * @file detector_support.cpp
 * @brief Shared helpers for the built-in detectors
 */

#include "detector_support.hpp"

#include "stylint/rules.hpp"

#include <algorithm>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace stylint::detectors {

namespace {

using NameSet = std::set<std::string, std::less<>>;

[[nodiscard]] std::vector<std::string> callees_of(const ir::Function& function)
{
    std::vector<std::string> callees;
    for (const auto& op : function.operations) {
        if (const auto* call = std::get_if<ir::InternalCall>(&op.kind)) {
            callees.push_back(call->callee);
        }
    }
    return callees;
}

[[nodiscard]] bool has_reverting_guard(const ir::Function& function, ir::GuardKind a, ir::GuardKind b)
{
    return std::ranges::any_of(function.operations, [a, b](const ir::Operation& op) {
        const auto* branch = std::get_if<ir::Branch>(&op.kind);
        return branch != nullptr && branch->reverts && (branch->guard == a || branch->guard == b);
    });
}

/// Grow `seeds` with every function that calls a member, until nothing changes.
void close_over_callers(const ir::ContractModel& model, NameSet& seeds)
{
    bool changed = true;
    while (changed) {
        changed = false;
        for (const auto& function : model.functions) {
            if (seeds.contains(function.name)) {
                continue;
            }
            const auto callees = callees_of(function);
            if (std::ranges::any_of(callees, [&seeds](const std::string& callee) { return seeds.contains(callee); })) {
                seeds.insert(function.name);
                changed = true;
            }
        }
    }
}

const std::set<std::string> kNoSlots;

}  // namespace

Finding make_finding(std::string_view rule_id,
                     const SourceLocation& location,
                     std::string function,
                     std::string description)
{
    Finding finding{.category = Category::kSecurity,
                    .rule_id = std::string(rule_id),
                    .severity = Severity::kInfo,
                    .location = location,
                    .function = std::move(function),
                    .description = std::move(description),
                    .remediation = {},
                    .impact = std::nullopt,
                    .partial = false,
                    .stable_id = {},
                    .related = {}};
    if (const auto* rule = rules::find_rule(rule_id)) {
        finding.category = rule->category;
        finding.severity = rule->severity;
        finding.remediation = std::string(rule->remediation);
    }
    return finding;
}

CallGraphFacts::CallGraphFacts(const ir::ContractModel& model)
    : m_writers()
    , m_emitters()
    , m_access_guards()
    , m_allow_list_guards()
    , m_written_slots()
{
    std::set<std::string> unguarded_access;
    std::set<std::string> unguarded_allow_list;
    for (const auto& function : model.functions) {
        auto& slots = m_written_slots[function.name];
        for (const auto& op : function.operations) {
            if (const auto* write = std::get_if<ir::StorageWrite>(&op.kind)) {
                m_writers.insert(function.name);
                slots.insert(write->slot);
            } else if (std::holds_alternative<ir::EventEmission>(op.kind)) {
                m_emitters.insert(function.name);
            }
        }
        if (has_reverting_guard(function, ir::GuardKind::kAccessControl, ir::GuardKind::kTxOrigin)
            || function.has_modifier(ir::ModifierKind::kAccessControl)) {
            m_access_guards.insert(function.name);
        } else {
            unguarded_access.insert(function.name);
        }
        if (has_reverting_guard(function, ir::GuardKind::kAllowList, ir::GuardKind::kAllowList)) {
            m_allow_list_guards.insert(function.name);
        } else {
            unguarded_allow_list.insert(function.name);
        }
    }
    // A guard call resolves to any overload of the name, so every overload must guard.
    for (const auto& name : unguarded_access) {
        m_access_guards.erase(name);
    }
    for (const auto& name : unguarded_allow_list) {
        m_allow_list_guards.erase(name);
    }
    close_over_callers(model, m_writers);
    close_over_callers(model, m_emitters);

    // Written-slot sets follow the same closure.
    bool changed = true;
    while (changed) {
        changed = false;
        for (const auto& function : model.functions) {
            auto& slots = m_written_slots[function.name];
            for (const auto& callee : callees_of(function)) {
                auto it = m_written_slots.find(callee);
                if (it == m_written_slots.end() || it->first == function.name) {
                    continue;
                }
                for (const auto& slot : it->second) {
                    changed = slots.insert(slot).second || changed;
                }
            }
        }
    }
}

bool CallGraphFacts::writes_storage(std::string_view function) const
{
    return m_writers.contains(function);
}

bool CallGraphFacts::emits_event(std::string_view function) const
{
    return m_emitters.contains(function);
}

bool CallGraphFacts::is_access_guard(std::string_view function) const
{
    return m_access_guards.contains(function);
}

bool CallGraphFacts::is_allow_list_guard(std::string_view function) const
{
    return m_allow_list_guards.contains(function);
}

const std::set<std::string>& CallGraphFacts::written_slots(std::string_view function) const
{
    auto it = m_written_slots.find(function);
    return it == m_written_slots.end() ? kNoSlots : it->second;
}

bool guarded_before(const ir::Function& function, std::size_t limit, const CallGraphFacts& facts)
{
    if (function.has_modifier(ir::ModifierKind::kAccessControl)) {
        return true;
    }
    limit = std::min(limit, function.operations.size());
    for (std::size_t i = 0; i < limit; ++i) {
        const auto& kind = function.operations[i].kind;
        if (const auto* branch = std::get_if<ir::Branch>(&kind)) {
            if (branch->guard == ir::GuardKind::kAccessControl || branch->guard == ir::GuardKind::kTxOrigin) {
                return true;
            }
        } else if (const auto* call = std::get_if<ir::InternalCall>(&kind)) {
            if (facts.is_access_guard(call->callee)) {
                return true;
            }
        }
    }
    return false;
}

bool guarded(const ir::Function& function, const CallGraphFacts& facts)
{
    return guarded_before(function, function.operations.size(), facts);
}

int complexity(const ir::Function& function)
{
    int result = 1;
    for (const auto& op : function.operations) {
        if (std::holds_alternative<ir::Branch>(op.kind) || std::holds_alternative<ir::Loop>(op.kind)) {
            ++result;
        }
    }
    return result;
}

}  // namespace stylint::detectors
