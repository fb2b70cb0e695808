/**
 * @file quality_detectors.cpp
 * @brief Code-quality detectors
 */

#include "detector_registry.hpp"
#include "detector_support.hpp"

#include "stylint/rules.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <variant>

namespace stylint::detectors {

namespace {

[[nodiscard]] bool is_lower_or_digit(char c)
{
    return std::islower(static_cast<unsigned char>(c)) != 0 || std::isdigit(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] bool is_alnum(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

/// balance_of, _internal
[[nodiscard]] bool is_snake_case(std::string_view name)
{
    return !name.empty() && std::ranges::all_of(name, [](char c) { return c == '_' || is_lower_or_digit(c); });
}

/// balanceOf, _balances
[[nodiscard]] bool is_mixed_case(std::string_view name)
{
    while (name.starts_with('_')) {
        name.remove_prefix(1);
    }
    return !name.empty() && std::islower(static_cast<unsigned char>(name.front())) != 0
           && std::ranges::all_of(name, is_alnum);
}

/// MAX_SUPPLY
[[nodiscard]] bool is_upper_case(std::string_view name)
{
    return !name.empty() && std::isupper(static_cast<unsigned char>(name.front())) != 0
           && std::ranges::all_of(name, [](char c) {
                  return c == '_' || std::isupper(static_cast<unsigned char>(c)) != 0
                         || std::isdigit(static_cast<unsigned char>(c)) != 0;
              });
}

[[nodiscard]] bool is_pascal_case(std::string_view name)
{
    return !name.empty() && std::isupper(static_cast<unsigned char>(name.front())) != 0
           && std::ranges::all_of(name, is_alnum);
}

[[nodiscard]] bool is_blank(std::string_view text)
{
    return std::ranges::all_of(text, [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

class DocumentationDetector final : public Detector
{
public:
    [[nodiscard]] const DetectorDescriptor& descriptor() const override
    {
        static const DetectorDescriptor kDescriptor{.id = "documentation",
                                                    .category = Category::kQuality,
                                                    .rules = {rules::kMissingDocumentation}};
        return kDescriptor;
    }

    [[nodiscard]] Result<std::vector<Finding>> inspect(const ir::ContractModel& model,
                                                       const DetectorContext& context) const override
    {
        std::vector<Finding> findings;
        // Bytecode carries no doc comments.
        if (model.dialect == ir::Dialect::kWasm) {
            return findings;
        }
        for (const auto& function : model.functions) {
            if (auto budget_ok = context.budget.check(descriptor().id); !budget_ok) {
                return std::unexpected(budget_ok.error());
            }
            if (function.is_entry_point() && is_blank(function.doc)) {
                findings.push_back(make_finding(rules::kMissingDocumentation,
                                                function.location,
                                                function.name,
                                                std::format("{} function `{}` has no doc comment",
                                                            ir::to_string(function.visibility),
                                                            function.name)));
            }
        }
        return findings;
    }
};

class ComplexityDetector final : public Detector
{
public:
    [[nodiscard]] const DetectorDescriptor& descriptor() const override
    {
        static const DetectorDescriptor kDescriptor{.id = "complexity",
                                                    .category = Category::kQuality,
                                                    .rules = {rules::kHighComplexity}};
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
            const int value = complexity(function);
            if (value > context.options.complexity_threshold) {
                findings.push_back(make_finding(rules::kHighComplexity,
                                                function.location,
                                                function.name,
                                                std::format("cyclomatic complexity {} exceeds {}",
                                                            value,
                                                            context.options.complexity_threshold)));
            }
        }
        return findings;
    }
};

/// Unhandled call results and unchecked arithmetic without a risky sink.
class ErrorHandlingDetector final : public Detector
{
public:
    [[nodiscard]] const DetectorDescriptor& descriptor() const override
    {
        static const DetectorDescriptor kDescriptor{
            .id = "error-handling",
            .category = Category::kQuality,
            .rules = {rules::kUncheckedCallResult, rules::kQualityUncheckedArithmetic}};
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
            const ir::Operation* first_arithmetic = nullptr;
            int unchecked = 0;
            for (const auto& op : function.operations) {
                if (const auto* call = std::get_if<ir::ExternalCall>(&op.kind)) {
                    if (!call->result_checked) {
                        findings.push_back(make_finding(rules::kUncheckedCallResult,
                                                        op.location,
                                                        function.name,
                                                        std::format("result of {} to `{}` is ignored",
                                                                    ir::to_string(call->kind),
                                                                    call->target)));
                    }
                } else if (const auto* arithmetic = std::get_if<ir::Arithmetic>(&op.kind)) {
                    const bool can_wrap = arithmetic->op != ir::ArithmeticOp::kDiv
                                          && arithmetic->op != ir::ArithmeticOp::kMod;
                    if (!arithmetic->checked && can_wrap && arithmetic->sink == ir::ArithmeticSink::kNone
                        && !arithmetic->operand_reads_storage) {
                        if (first_arithmetic == nullptr) {
                            first_arithmetic = &op;
                        }
                        ++unchecked;
                    }
                }
            }
            if (first_arithmetic != nullptr) {
                findings.push_back(make_finding(rules::kQualityUncheckedArithmetic,
                                                first_arithmetic->location,
                                                function.name,
                                                std::format("{} unchecked arithmetic operation(s)", unchecked)));
            }
        }
        return findings;
    }
};

class NamingConventionDetector final : public Detector
{
public:
    [[nodiscard]] const DetectorDescriptor& descriptor() const override
    {
        static const DetectorDescriptor kDescriptor{.id = "naming-convention",
                                                    .category = Category::kQuality,
                                                    .rules = {rules::kNamingConvention}};
        return kDescriptor;
    }

    [[nodiscard]] Result<std::vector<Finding>> inspect(const ir::ContractModel& model,
                                                       const DetectorContext& context) const override
    {
        std::vector<Finding> findings;
        if (model.dialect == ir::Dialect::kWasm) {
            return findings;
        }
        const bool solidity = model.dialect == ir::Dialect::kSolidity;
        const std::string_view convention = solidity ? "mixedCase" : "snake_case";
        const auto follows = [solidity](std::string_view name) {
            return solidity ? is_mixed_case(name) : is_snake_case(name);
        };

        if (!is_pascal_case(model.name)) {
            findings.push_back(make_finding(rules::kNamingConvention,
                                            SourceLocation{.file = model.file, .line = 1, .col = 1},
                                            {},
                                            std::format("contract `{}` is not PascalCase", model.name)));
        }
        for (const auto& function : model.functions) {
            if (auto budget_ok = context.budget.check(descriptor().id); !budget_ok) {
                return std::unexpected(budget_ok.error());
            }
            if (!follows(function.name)) {
                findings.push_back(make_finding(rules::kNamingConvention,
                                                function.location,
                                                function.name,
                                                std::format("function `{}` is not {}", function.name, convention)));
            }
        }
        for (const auto& slot : model.slots) {
            if (!follows(slot.name) && !(solidity && is_upper_case(slot.name))) {
                findings.push_back(make_finding(rules::kNamingConvention,
                                                slot.location,
                                                {},
                                                std::format("storage slot `{}` is not {}", slot.name, convention)));
            }
        }
        return findings;
    }
};

class MissingEventDetector final : public Detector
{
public:
    [[nodiscard]] const DetectorDescriptor& descriptor() const override
    {
        static const DetectorDescriptor kDescriptor{.id = "missing-event",
                                                    .category = Category::kQuality,
                                                    .rules = {rules::kMissingEvent}};
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
            if (!function.is_entry_point() || facts.emits_event(function.name)) {
                continue;
            }
            const bool writes = std::ranges::any_of(function.operations, [](const ir::Operation& op) {
                return std::holds_alternative<ir::StorageWrite>(op.kind);
            });
            if (writes) {
                findings.push_back(make_finding(rules::kMissingEvent,
                                                function.location,
                                                function.name,
                                                std::format("`{}` writes storage but emits no event", function.name)));
            }
        }
        return findings;
    }
};

class UnusedStorageDetector final : public Detector
{
public:
    [[nodiscard]] const DetectorDescriptor& descriptor() const override
    {
        static const DetectorDescriptor kDescriptor{.id = "unused-storage",
                                                    .category = Category::kQuality,
                                                    .rules = {rules::kUnusedStorage}};
        return kDescriptor;
    }

    [[nodiscard]] Result<std::vector<Finding>> inspect(const ir::ContractModel& model,
                                                       const DetectorContext& context) const override
    {
        if (auto budget_ok = context.budget.check(descriptor().id); !budget_ok) {
            return std::unexpected(budget_ok.error());
        }
        std::vector<Finding> findings;
        for (const auto& slot : model.slots) {
            if (slot.access == ir::AccessPattern::kUnused) {
                findings.push_back(make_finding(rules::kUnusedStorage,
                                                slot.location,
                                                {},
                                                std::format("storage slot `{}` is never read or written", slot.name)));
            }
        }
        return findings;
    }
};

}  // namespace

void add_quality_detectors(DetectorSet& set)
{
    set.push_back(std::make_shared<const DocumentationDetector>());
    set.push_back(std::make_shared<const ComplexityDetector>());
    set.push_back(std::make_shared<const ErrorHandlingDetector>());
    set.push_back(std::make_shared<const NamingConventionDetector>());
    set.push_back(std::make_shared<const MissingEventDetector>());
    set.push_back(std::make_shared<const UnusedStorageDetector>());
}

}  // namespace stylint::detectors
