/**
 * @file security_detectors.cpp
 * @brief Security detectors: reentrancy, access control, arithmetic, trust boundary
 */

#include "detector_registry.hpp"
#include "detector_support.hpp"

#include "stylint/rules.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <ranges>
#include <variant>

namespace stylint::detectors {

namespace {

constexpr std::array<std::string_view, 14> kPrivilegedSlotWords = {
    "owner",    "admin",     "role",     "paused",  "fee",       "oracle",   "treasury",
    "implementation", "operator", "minter", "governance", "upgrade", "blacklist", "whitelist",
};

constexpr std::array<std::string_view, 7> kPrivilegedExactNames = {
    "mint", "burn", "pause", "unpause", "initialize", "init", "destroy",
};

constexpr std::array<std::string_view, 8> kPrivilegedPrefixes = {
    "upgrade", "mint", "grant", "revoke", "transferownership", "renounceownership", "kill", "withdrawall",
};

/// Lower-case with underscores removed: "setFee" and "set_fee" fold alike.
[[nodiscard]] std::string fold(std::string_view name)
{
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (c != '_') {
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    return out;
}

[[nodiscard]] bool is_privileged_slot(std::string_view slot)
{
    const std::string folded = fold(slot);
    return std::ranges::any_of(kPrivilegedSlotWords, [&folded](std::string_view word) {
        return folded.find(word) != std::string::npos;
    });
}

/// set_fee, setFee, mint, upgradeTo... but not "settle" or "settings".
[[nodiscard]] bool is_privileged_name(std::string_view name)
{
    const std::string folded = fold(name);
    if (std::ranges::find(kPrivilegedExactNames, folded) != kPrivilegedExactNames.end()) {
        return true;
    }
    if (name.starts_with("set_")
        || (name.size() > 3 && name.starts_with("set") && std::isupper(static_cast<unsigned char>(name[3])) != 0)) {
        return true;
    }
    return std::ranges::any_of(kPrivilegedPrefixes, [&folded](std::string_view prefix) {
        return folded.starts_with(prefix);
    });
}

[[nodiscard]] bool touches_sender(const ir::Function& function)
{
    return std::ranges::any_of(function.operations, [](const ir::Operation& op) {
        if (const auto* env = std::get_if<ir::EnvironmentRead>(&op.kind)) {
            return env->kind == ir::EnvironmentKind::kSender;
        }
        if (const auto* read = std::get_if<ir::StorageRead>(&op.kind)) {
            return read->key_source == ir::ValueSource::kSender;
        }
        if (const auto* write = std::get_if<ir::StorageWrite>(&op.kind)) {
            return write->key_source == ir::ValueSource::kSender;
        }
        return false;
    });
}

/// Allow-list branch or allow-list helper call before `limit` that inspects `target`.
[[nodiscard]] bool allow_listed_before(const ir::Function& function,
                                       std::size_t limit,
                                       std::string_view target,
                                       const CallGraphFacts& facts)
{
    for (std::size_t i = 0; i < limit && i < function.operations.size(); ++i) {
        const auto& kind = function.operations[i].kind;
        if (const auto* branch = std::get_if<ir::Branch>(&kind)) {
            if (branch->guard != ir::GuardKind::kAllowList) {
                continue;
            }
            if (branch->subjects.empty()
                || std::ranges::any_of(branch->subjects, [target](const std::string& subject) {
                       return !subject.empty() && target.find(subject) != std::string_view::npos;
                   })) {
                return true;
            }
        } else if (const auto* call = std::get_if<ir::InternalCall>(&kind)) {
            if (facts.is_allow_list_guard(call->callee)) {
                return true;
            }
        }
    }
    return false;
}

class ReentrancyDetector final : public Detector
{
public:
    [[nodiscard]] const DetectorDescriptor& descriptor() const override
    {
        static const DetectorDescriptor kDescriptor{.id = "reentrancy",
                                                    .category = Category::kSecurity,
                                                    .rules = {rules::kReentrancy}};
        return kDescriptor;
    }

    [[nodiscard]] Result<std::vector<Finding>> inspect(const ir::ContractModel& model,
                                                       const DetectorContext& context) const override
    {
        const CallGraphFacts facts(model);
        std::vector<Finding> findings;
        for (const auto& function : model.functions) {
            if (auto budget_ok = context.budget.check(descriptor().id); !budget_ok) {
                return std::unexpected(budget_ok.error());
            }
            if (!function.is_state_changing() || function.has_modifier(ir::ModifierKind::kReentrancyGuard)) {
                continue;
            }
            for (const auto& [index, op] : std::views::enumerate(function.operations)) {
                const auto* call = std::get_if<ir::ExternalCall>(&op.kind);
                if (call == nullptr || call->kind == ir::CallKind::kStaticCall) {
                    continue;
                }
                const auto at = static_cast<std::size_t>(index);
                if (guarded_before(function, at, facts)) {
                    continue;
                }
                std::optional<std::string> direct;
                std::optional<std::string> via;
                for (const auto& later : function.operations | std::views::drop(at + 1)) {
                    if (const auto* write = std::get_if<ir::StorageWrite>(&later.kind)) {
                        direct = write->slot;
                        break;
                    }
                    if (const auto* inner = std::get_if<ir::InternalCall>(&later.kind);
                        inner != nullptr && !via && facts.writes_storage(inner->callee)) {
                        via = inner->callee;
                    }
                }
                if (!direct && !via) {
                    continue;
                }
                Finding finding = make_finding(
                    rules::kReentrancy,
                    op.location,
                    function.name,
                    direct ? std::format("{} to `{}` is followed by a write to storage slot `{}`",
                                         ir::to_string(call->kind),
                                         call->target,
                                         *direct)
                           : std::format("{} to `{}` is followed by a call to `{}`, which writes storage",
                                         ir::to_string(call->kind),
                                         call->target,
                                         *via));
                finding.partial = !direct.has_value();
                findings.push_back(std::move(finding));
            }
        }
        return findings;
    }
};

class AccessControlDetector final : public Detector
{
public:
    [[nodiscard]] const DetectorDescriptor& descriptor() const override
    {
        static const DetectorDescriptor kDescriptor{.id = "access-control",
                                                    .category = Category::kSecurity,
                                                    .rules = {rules::kAccessControl}};
        return kDescriptor;
    }

    [[nodiscard]] Result<std::vector<Finding>> inspect(const ir::ContractModel& model,
                                                       const DetectorContext& context) const override
    {
        const CallGraphFacts facts(model);
        std::vector<Finding> findings;
        for (const auto& function : model.functions) {
            if (auto budget_ok = context.budget.check(descriptor().id); !budget_ok) {
                return std::unexpected(budget_ok.error());
            }
            if (!function.is_entry_point() || !function.is_state_changing() || guarded(function, facts)) {
                continue;
            }

            std::optional<std::string> reason;
            bool writes_directly = false;
            const bool sender_bound = touches_sender(function);
            for (const auto& op : function.operations) {
                const auto* write = std::get_if<ir::StorageWrite>(&op.kind);
                if (write == nullptr) {
                    continue;
                }
                writes_directly = true;
                if (reason) {
                    continue;
                }
                if (is_privileged_slot(write->slot)) {
                    reason = std::format("writes privileged slot `{}` without an access-control check", write->slot);
                } else if (write->key_source == ir::ValueSource::kParameter && !sender_bound) {
                    const auto* slot = model.find_slot(write->slot);
                    if (slot == nullptr || slot->kind == ir::SlotKind::kMapping) {
                        reason = std::format("writes `{}[{}]` keyed by a caller-supplied parameter", write->slot, write->key);
                    }
                }
            }
            if (!reason && writes_directly && is_privileged_name(function.name)) {
                reason = std::format("privileged operation `{}` changes storage without an access-control check",
                                     function.name);
            }
            if (reason) {
                findings.push_back(make_finding(rules::kAccessControl, function.location, function.name, *reason));
                continue;
            }

            // Only through internal calls: partial.
            const auto& slots = facts.written_slots(function.name);
            auto privileged = std::ranges::find_if(slots, [](const std::string& slot) { return is_privileged_slot(slot); });
            if (privileged != slots.end()) {
                reason = std::format("reaches a write to privileged slot `{}` through internal calls", *privileged);
            } else if (facts.writes_storage(function.name) && is_privileged_name(function.name)) {
                reason = std::format("privileged operation `{}` changes storage through internal calls", function.name);
            }
            if (reason) {
                Finding finding = make_finding(rules::kAccessControl, function.location, function.name, *reason);
                finding.partial = true;
                findings.push_back(std::move(finding));
            }
        }
        return findings;
    }
};

class ArithmeticOverflowDetector final : public Detector
{
public:
    [[nodiscard]] const DetectorDescriptor& descriptor() const override
    {
        static const DetectorDescriptor kDescriptor{.id = "arithmetic-overflow",
                                                    .category = Category::kSecurity,
                                                    .rules = {rules::kUncheckedArithmetic}};
        return kDescriptor;
    }

    [[nodiscard]] Result<std::vector<Finding>> inspect(const ir::ContractModel& model,
                                                       const DetectorContext& context) const override
    {
        std::vector<Finding> findings;
        for (const auto& function : model.functions) {
            if (auto budget_ok = context.budget.check(descriptor().id); !budget_ok) {
                return std::unexpected(budget_ok.error());
            }
            for (const auto& op : function.operations) {
                const auto* arithmetic = std::get_if<ir::Arithmetic>(&op.kind);
                if (arithmetic == nullptr || arithmetic->checked || arithmetic->op == ir::ArithmeticOp::kDiv
                    || arithmetic->op == ir::ArithmeticOp::kMod) {
                    continue;
                }
                if (arithmetic->sink != ir::ArithmeticSink::kNone) {
                    findings.push_back(make_finding(rules::kUncheckedArithmetic,
                                                    op.location,
                                                    function.name,
                                                    std::format("unchecked {} result is used as {}",
                                                                ir::to_string(arithmetic->op),
                                                                arithmetic->sink == ir::ArithmeticSink::kStorage
                                                                    ? "a stored value"
                                                                    : "an index")));
                } else if (arithmetic->operand_reads_storage) {
                    Finding finding = make_finding(rules::kUncheckedArithmetic,
                                                   op.location,
                                                   function.name,
                                                   std::format("unchecked {} on a value read from storage",
                                                               ir::to_string(arithmetic->op)));
                    finding.partial = true;
                    findings.push_back(std::move(finding));
                }
            }
        }
        return findings;
    }
};

/// Call and static call targets, plus delegate calls under their own rule.
class TrustBoundaryDetector final : public Detector
{
public:
    [[nodiscard]] const DetectorDescriptor& descriptor() const override
    {
        static const DetectorDescriptor kDescriptor{.id = "trust-boundary",
                                                    .category = Category::kSecurity,
                                                    .rules = {rules::kTrustBoundary, rules::kUnvalidatedDelegatecall}};
        return kDescriptor;
    }

    [[nodiscard]] Result<std::vector<Finding>> inspect(const ir::ContractModel& model,
                                                       const DetectorContext& context) const override
    {
        const CallGraphFacts facts(model);
        const auto& trusted = context.options.trusted_targets;
        std::vector<Finding> findings;
        for (const auto& function : model.functions) {
            if (auto budget_ok = context.budget.check(descriptor().id); !budget_ok) {
                return std::unexpected(budget_ok.error());
            }
            for (const auto& [index, op] : std::views::enumerate(function.operations)) {
                const auto* call = std::get_if<ir::ExternalCall>(&op.kind);
                if (call == nullptr || call->kind == ir::CallKind::kValueTransfer) {
                    continue;
                }
                switch (call->target_source) {
                    case ir::ValueSource::kParameter:
                    case ir::ValueSource::kStorage:
                    case ir::ValueSource::kLocal:
                        break;
                    case ir::ValueSource::kNone:
                    case ir::ValueSource::kSender:
                    case ir::ValueSource::kConstant:
                        continue;
                }
                if (std::ranges::find(trusted, call->target) != trusted.end()
                    || allow_listed_before(function, static_cast<std::size_t>(index), call->target, facts)) {
                    continue;
                }
                const bool delegate = call->kind == ir::CallKind::kDelegateCall;
                Finding finding = make_finding(delegate ? rules::kUnvalidatedDelegatecall : rules::kTrustBoundary,
                                               op.location,
                                               function.name,
                                               std::format("{} to `{}` ({}) is not validated against an allow-list",
                                                           ir::to_string(call->kind),
                                                           call->target,
                                                           ir::to_string(call->target_source)));
                finding.partial = call->kind == ir::CallKind::kStaticCall;
                findings.push_back(std::move(finding));
            }
        }
        return findings;
    }
};

class TxOriginDetector final : public Detector
{
public:
    [[nodiscard]] const DetectorDescriptor& descriptor() const override
    {
        static const DetectorDescriptor kDescriptor{.id = "tx-origin",
                                                    .category = Category::kSecurity,
                                                    .rules = {rules::kTxOriginAuth}};
        return kDescriptor;
    }

    [[nodiscard]] Result<std::vector<Finding>> inspect(const ir::ContractModel& model,
                                                       const DetectorContext& context) const override
    {
        std::vector<Finding> findings;
        for (const auto& function : model.functions) {
            if (auto budget_ok = context.budget.check(descriptor().id); !budget_ok) {
                return std::unexpected(budget_ok.error());
            }
            for (const auto& op : function.operations) {
                const auto* branch = std::get_if<ir::Branch>(&op.kind);
                if (branch != nullptr && branch->guard == ir::GuardKind::kTxOrigin) {
                    findings.push_back(make_finding(rules::kTxOriginAuth,
                                                    op.location,
                                                    function.name,
                                                    std::format("authorization compares tx.origin: `{}`", branch->condition)));
                }
            }
        }
        return findings;
    }
};

class TimestampDetector final : public Detector
{
public:
    [[nodiscard]] const DetectorDescriptor& descriptor() const override
    {
        static const DetectorDescriptor kDescriptor{.id = "timestamp-dependence",
                                                    .category = Category::kSecurity,
                                                    .rules = {rules::kTimestampDependence}};
        return kDescriptor;
    }

    [[nodiscard]] Result<std::vector<Finding>> inspect(const ir::ContractModel& model,
                                                       const DetectorContext& context) const override
    {
        std::vector<Finding> findings;
        for (const auto& function : model.functions) {
            if (auto budget_ok = context.budget.check(descriptor().id); !budget_ok) {
                return std::unexpected(budget_ok.error());
            }
            if (!function.is_state_changing()) {
                continue;
            }
            auto first = std::ranges::find_if(function.operations, [](const ir::Operation& op) {
                const auto* env = std::get_if<ir::EnvironmentRead>(&op.kind);
                return env != nullptr
                       && (env->kind == ir::EnvironmentKind::kTimestamp || env->kind == ir::EnvironmentKind::kBlockNumber);
            });
            if (first == function.operations.end()) {
                continue;
            }
            const auto kind = std::get<ir::EnvironmentRead>(first->kind).kind;
            findings.push_back(make_finding(rules::kTimestampDependence,
                                            first->location,
                                            function.name,
                                            std::format("state-changing function reads the block {}",
                                                        ir::to_string(kind))));
        }
        return findings;
    }
};

class UnsafeCodeDetector final : public Detector
{
public:
    [[nodiscard]] const DetectorDescriptor& descriptor() const override
    {
        static const DetectorDescriptor kDescriptor{.id = "unsafe-code",
                                                    .category = Category::kSecurity,
                                                    .rules = {rules::kUnsafeCode}};
        return kDescriptor;
    }

    [[nodiscard]] Result<std::vector<Finding>> inspect(const ir::ContractModel& model,
                                                       const DetectorContext& context) const override
    {
        const std::string_view what = model.dialect == ir::Dialect::kSolidity ? "inline assembly" : "unsafe block";
        std::vector<Finding> findings;
        for (const auto& function : model.functions) {
            if (auto budget_ok = context.budget.check(descriptor().id); !budget_ok) {
                return std::unexpected(budget_ok.error());
            }
            for (const auto& region : function.unsafe_regions) {
                findings.push_back(make_finding(rules::kUnsafeCode,
                                                region,
                                                function.name,
                                                std::format("{} bypasses compiler safety checks", what)));
            }
        }
        return findings;
    }
};

}  // namespace

void add_security_detectors(DetectorSet& set)
{
    set.push_back(std::make_shared<const ReentrancyDetector>());
    set.push_back(std::make_shared<const AccessControlDetector>());
    set.push_back(std::make_shared<const ArithmeticOverflowDetector>());
    set.push_back(std::make_shared<const TrustBoundaryDetector>());
    set.push_back(std::make_shared<const TxOriginDetector>());
    set.push_back(std::make_shared<const TimestampDetector>());
    set.push_back(std::make_shared<const UnsafeCodeDetector>());
}

}  // namespace stylint::detectors
