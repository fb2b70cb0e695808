/**
 * @file gas_detectors.cpp
 * @brief Performance detectors driven by the cost estimate
 */

#include "detector_registry.hpp"
#include "detector_support.hpp"

#include "stylint/rules.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <map>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <tuple>
#include <variant>
#include <vector>

namespace stylint::detectors {

namespace {

[[nodiscard]] std::int64_t op_units(const costs::FunctionCost* cost, std::size_t index)
{
    if (cost == nullptr || index >= cost->operations.size()) {
        return 0;
    }
    return cost->operations[index].units;
}

constexpr int kWordBytes = 32;

/// Digits after `prefix` in `type`, e.g. 64 for ("uint64", "uint").
[[nodiscard]] std::optional<int> width_after(std::string_view type, std::string_view prefix)
{
    if (!type.starts_with(prefix) || type.size() == prefix.size()) {
        return std::nullopt;
    }
    int width = 0;
    const auto digits = type.substr(prefix.size());
    auto [end, error] = std::from_chars(digits.data(), digits.data() + digits.size(), width);
    if (error != std::errc() || end != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return width;
}

/// Bytes a value slot occupies when smaller than a storage word; nullopt for full words and unknown types.
[[nodiscard]] std::optional<int> packed_size(std::string_view type)
{
    if (type == "bool" || type == "StorageBool") {
        return 1;
    }
    if (type == "address" || type == "address payable" || type == "StorageAddress") {
        return 20;
    }
    for (const std::string_view prefix : {"uint", "int", "StorageU", "StorageI"}) {
        if (auto bits = width_after(type, prefix); bits && *bits % 8 == 0 && *bits > 0 && *bits < 256) {
            return *bits / 8;
        }
    }
    if (auto bytes = width_after(type, "bytes"); bytes && *bytes > 0 && *bytes < kWordBytes) {
        return *bytes;
    }
    return std::nullopt;
}

/// Words needed for `sizes` packed first-fit in decreasing order.
[[nodiscard]] int packed_words(std::vector<int> sizes)
{
    std::ranges::sort(sizes, std::greater<>());
    std::vector<int> rooms;
    for (const int size : sizes) {
        auto it = std::ranges::find_if(rooms, [size](int room) { return room >= size; });
        if (it == rooms.end()) {
            rooms.push_back(kWordBytes - size);
        } else {
            *it -= size;
        }
    }
    return static_cast<int>(rooms.size());
}

class FunctionCostDetector final : public Detector
{
public:
    [[nodiscard]] const DetectorDescriptor& descriptor() const override
    {
        static const DetectorDescriptor kDescriptor{
            .id = "function-cost",
            .category = Category::kPerformance,
            .rules = {rules::kFunctionCostThreshold, rules::kUnestimatedOperation}};
        return kDescriptor;
    }

    [[nodiscard]] Result<std::vector<Finding>> inspect(const ir::ContractModel& model,
                                                       const DetectorContext& context) const override
    {
        const std::int64_t threshold = context.options.gas_cost_threshold;
        std::vector<Finding> findings;
        for (std::size_t position = 0; position < model.functions.size(); ++position) {
            const auto& function = model.functions[position];
            if (auto budget_ok = context.budget.check(descriptor().id); !budget_ok) {
                return std::unexpected(budget_ok.error());
            }
            const auto* cost = context.costs.at(position);
            if (cost == nullptr) {
                continue;
            }
            if (cost->units > threshold) {
                Finding finding = make_finding(
                    rules::kFunctionCostThreshold,
                    function.location,
                    function.name,
                    std::format("estimated cost {} units exceeds the threshold of {}", cost->units, threshold));
                finding.impact = cost->units - threshold;
                findings.push_back(std::move(finding));
            }
            for (const auto& op_cost : cost->operations) {
                if (op_cost.estimated || op_cost.operation_index >= function.operations.size()) {
                    continue;
                }
                const auto& op = function.operations[op_cost.operation_index];
                const auto* opaque = std::get_if<ir::OpaqueOperation>(&op.kind);
                Finding finding = make_finding(
                    rules::kUnestimatedOperation,
                    op.location,
                    function.name,
                    std::format("{} `{}` priced with the default of {} units",
                                error_code::kUnestimatedOperation,
                                opaque != nullptr ? opaque->mnemonic : std::string("opaque"),
                                op_cost.units));
                finding.impact = op_cost.units;
                findings.push_back(std::move(finding));
            }
        }
        return findings;
    }
};

class StorageReadCachingDetector final : public Detector
{
public:
    [[nodiscard]] const DetectorDescriptor& descriptor() const override
    {
        static const DetectorDescriptor kDescriptor{.id = "storage-read-caching",
                                                    .category = Category::kPerformance,
                                                    .rules = {rules::kRepeatedStorageRead}};
        return kDescriptor;
    }

    [[nodiscard]] Result<std::vector<Finding>> inspect(const ir::ContractModel& model,
                                                       const DetectorContext& context) const override
    {
        const CallGraphFacts facts(model);
        std::vector<Finding> findings;
        for (std::size_t position = 0; position < model.functions.size(); ++position) {
            const auto& function = model.functions[position];
            if (auto budget_ok = context.budget.check(descriptor().id); !budget_ok) {
                return std::unexpected(budget_ok.error());
            }
            const auto* cost = context.costs.at(position);

            struct ReadRun
            {
                int count = 0;
                SourceLocation repeat;
                std::int64_t saving = 0;
            };
            std::map<std::pair<std::string, std::string>, ReadRun> runs;
            const auto flush = [&](const auto& should_flush) {
                for (auto it = runs.begin(); it != runs.end();) {
                    if (!should_flush(it->first.first)) {
                        ++it;
                        continue;
                    }
                    if (it->second.count > 1) {
                        const auto& [slot, key] = it->first;
                        Finding finding = make_finding(
                            rules::kRepeatedStorageRead,
                            it->second.repeat,
                            function.name,
                            std::format("storage slot `{}{}` is read {} times with no write in between",
                                        slot,
                                        key.empty() ? std::string() : std::format("[{}]", key),
                                        it->second.count));
                        finding.impact = it->second.saving;
                        findings.push_back(std::move(finding));
                    }
                    it = runs.erase(it);
                }
            };

            for (const auto& [index, op] : std::views::enumerate(function.operations)) {
                if (const auto* read = std::get_if<ir::StorageRead>(&op.kind)) {
                    auto& run = runs[{read->slot, read->key}];
                    if (++run.count == 2) {
                        run.repeat = op.location;
                    }
                    if (run.count > 1) {
                        run.saving += op_units(cost, static_cast<std::size_t>(index));
                    }
                } else if (const auto* write = std::get_if<ir::StorageWrite>(&op.kind)) {
                    flush([&write](const std::string& slot) { return slot == write->slot; });
                } else if (const auto* call = std::get_if<ir::InternalCall>(&op.kind)) {
                    if (facts.writes_storage(call->callee)) {
                        flush([](const std::string&) { return true; });
                    }
                }
            }
            flush([](const std::string&) { return true; });
        }
        return findings;
    }
};

class RedundantCallDetector final : public Detector
{
public:
    [[nodiscard]] const DetectorDescriptor& descriptor() const override
    {
        static const DetectorDescriptor kDescriptor{.id = "redundant-call",
                                                    .category = Category::kPerformance,
                                                    .rules = {rules::kRedundantExternalCall}};
        return kDescriptor;
    }

    [[nodiscard]] Result<std::vector<Finding>> inspect(const ir::ContractModel& model,
                                                       const DetectorContext& context) const override
    {
        std::vector<Finding> findings;
        for (std::size_t position = 0; position < model.functions.size(); ++position) {
            const auto& function = model.functions[position];
            if (auto budget_ok = context.budget.check(descriptor().id); !budget_ok) {
                return std::unexpected(budget_ok.error());
            }
            const auto* cost = context.costs.at(position);
            std::map<std::tuple<ir::CallKind, std::string, std::string, std::string>, SourceLocation> seen;
            for (const auto& [index, op] : std::views::enumerate(function.operations)) {
                const auto* call = std::get_if<ir::ExternalCall>(&op.kind);
                if (call == nullptr || call->kind == ir::CallKind::kValueTransfer) {
                    continue;
                }
                auto [it, inserted] = seen.try_emplace(std::tuple{call->kind, call->target, call->method, call->args},
                                                       op.location);
                if (inserted) {
                    continue;
                }
                Finding finding = make_finding(rules::kRedundantExternalCall,
                                               op.location,
                                               function.name,
                                               std::format("{} to `{}{}{}` repeats the call at line {}",
                                                           ir::to_string(call->kind),
                                                           call->target,
                                                           call->method.empty() ? "" : ".",
                                                           call->method,
                                                           it->second.line));
                finding.impact = op_units(cost, static_cast<std::size_t>(index));
                findings.push_back(std::move(finding));
            }
        }
        return findings;
    }
};

/// Unbounded loops, storage writes in loops and collection growth in loops.
class LoopCostDetector final : public Detector
{
public:
    [[nodiscard]] const DetectorDescriptor& descriptor() const override
    {
        static const DetectorDescriptor kDescriptor{
            .id = "loop-cost",
            .category = Category::kPerformance,
            .rules = {rules::kUnboundedLoop, rules::kStorageWriteInLoop, rules::kDynamicAllocation}};
        return kDescriptor;
    }

    [[nodiscard]] Result<std::vector<Finding>> inspect(const ir::ContractModel& model,
                                                       const DetectorContext& context) const override
    {
        const std::int64_t write_units = context.table.units(costs::CostKey::kStorageWrite);
        std::vector<Finding> findings;
        for (std::size_t position = 0; position < model.functions.size(); ++position) {
            const auto& function = model.functions[position];
            if (auto budget_ok = context.budget.check(descriptor().id); !budget_ok) {
                return std::unexpected(budget_ok.error());
            }
            const auto* cost = context.costs.at(position);
            for (const auto& [index, op] : std::views::enumerate(function.operations)) {
                if (const auto* loop = std::get_if<ir::Loop>(&op.kind)) {
                    if (loop->storage_bound) {
                        findings.push_back(make_finding(rules::kUnboundedLoop,
                                                        op.location,
                                                        function.name,
                                                        std::format("loop `{}` iterates over a storage-sized range",
                                                                    loop->header)));
                    }
                    continue;
                }
                if (op.loop_depth == 0) {
                    continue;
                }
                if (const auto* write = std::get_if<ir::StorageWrite>(&op.kind)) {
                    Finding finding = make_finding(rules::kStorageWriteInLoop,
                                                   op.location,
                                                   function.name,
                                                   std::format("storage slot `{}` is written inside a loop", write->slot));
                    finding.impact = std::max<std::int64_t>(op_units(cost, static_cast<std::size_t>(index)) - write_units, 0);
                    findings.push_back(std::move(finding));
                } else if (const auto* allocation = std::get_if<ir::MemoryAllocation>(&op.kind);
                           allocation != nullptr && !allocation->preallocated) {
                    findings.push_back(make_finding(rules::kDynamicAllocation,
                                                    op.location,
                                                    function.name,
                                                    std::format("`{}` grows a collection inside a loop",
                                                                allocation->description)));
                }
            }
        }
        return findings;
    }
};

/// Sub-word value slots laid out so that they take more words than they need.
class StoragePackingDetector final : public Detector
{
public:
    [[nodiscard]] const DetectorDescriptor& descriptor() const override
    {
        static const DetectorDescriptor kDescriptor{.id = "storage-packing",
                                                    .category = Category::kPerformance,
                                                    .rules = {rules::kStoragePacking}};
        return kDescriptor;
    }

    [[nodiscard]] Result<std::vector<Finding>> inspect(const ir::ContractModel& model,
                                                       const DetectorContext& context) const override
    {
        if (auto budget_ok = context.budget.check(descriptor().id); !budget_ok) {
            return std::unexpected(budget_ok.error());
        }

        // Declaration-order layout: a sub-word slot joins the open word when it
        // fits; anything else closes the word and takes words of its own.
        std::vector<const ir::StorageSlot*> packed;
        std::vector<int> sizes;
        std::vector<int> closed_room;  ///< Free bytes of each finished sub-word word
        const ir::StorageSlot* avoidable = nullptr;
        int words = 0;
        int room = 0;
        for (const auto& slot : model.slots) {
            const auto size = slot.kind == ir::SlotKind::kValue ? packed_size(slot.type) : std::nullopt;
            if (!size) {
                if (room > 0) {
                    closed_room.push_back(room);
                }
                room = 0;
                continue;
            }
            if (*size > room) {
                if (room > 0) {
                    closed_room.push_back(room);
                }
                if (avoidable == nullptr
                    && std::ranges::any_of(closed_room, [&size](int spare) { return spare >= *size; })) {
                    avoidable = &slot;
                }
                ++words;
                room = kWordBytes;
            }
            room -= *size;
            packed.push_back(&slot);
            sizes.push_back(*size);
        }

        const int needed = packed_words(sizes);
        if (words <= needed) {
            return std::vector<Finding>{};
        }
        std::string names;
        for (const auto* slot : packed) {
            names += std::format("{}`{}`", names.empty() ? "" : ", ", slot->name);
        }
        const auto* at = avoidable != nullptr ? avoidable : packed.front();
        Finding finding = make_finding(
            rules::kStoragePacking,
            at->location,
            {},
            std::format("sub-word state variables {} use {} storage words; declared together they fit in {}",
                        names,
                        words,
                        needed));
        finding.impact = static_cast<std::int64_t>(words - needed) * context.table.units(costs::CostKey::kStorageReadCold);
        return std::vector<Finding>{std::move(finding)};
    }
};

}  // namespace

void add_gas_detectors(DetectorSet& set)
{
    set.push_back(std::make_shared<const FunctionCostDetector>());
    set.push_back(std::make_shared<const StorageReadCachingDetector>());
    set.push_back(std::make_shared<const RedundantCallDetector>());
    set.push_back(std::make_shared<const LoopCostDetector>());
    set.push_back(std::make_shared<const StoragePackingDetector>());
}

}  // namespace stylint::detectors
