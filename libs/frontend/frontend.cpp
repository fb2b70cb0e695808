/**
 * @file frontend.cpp
 * @brief Dialect dispatch and model completion
 */

#include "stylint/frontend.hpp"

#include "frontends.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <map>
#include <ranges>
#include <set>
#include <variant>

namespace stylint::frontend {

namespace {

constexpr std::array<std::string_view, 6> kStylusMarkers = {
    "sol_storage!", "sol_interface!", "#[public]", "#[entrypoint]", "stylus_sdk", "#[storage]",
};

constexpr std::array<std::string_view, 5> kSolidityDeclarations = {
    "pragma solidity", "contract ", "abstract contract ", "library ", "interface ",
};

[[nodiscard]] std::string_view trim_left(std::string_view line)
{
    const auto first = line.find_first_not_of(" \t\r");
    return first == std::string_view::npos ? std::string_view{} : line.substr(first);
}

/// "src/lib.rs" -> "lib"
[[nodiscard]] std::string file_stem(std::string_view path)
{
    if (const auto slash = path.find_last_of('/'); slash != std::string_view::npos) {
        path.remove_prefix(slash + 1);
    }
    if (const auto dot = path.find_last_of('.'); dot != std::string_view::npos && dot > 0) {
        path = path.substr(0, dot);
    }
    return path.empty() ? std::string("contract") : std::string(path);
}

void summarize_slots(ir::ContractModel& model)
{
    std::map<std::string, std::set<std::string>, std::less<>> readers;
    std::map<std::string, std::set<std::string>, std::less<>> writers;
    for (const auto& function : model.functions) {
        for (const auto& op : function.operations) {
            if (const auto* read = std::get_if<ir::StorageRead>(&op.kind)) {
                readers[read->slot].insert(function.name);
            } else if (const auto* write = std::get_if<ir::StorageWrite>(&op.kind)) {
                writers[write->slot].insert(function.name);
            }
        }
    }
    for (auto& slot : model.slots) {
        const auto& read_by = readers[slot.name];
        const auto& written_by = writers[slot.name];
        slot.readers.assign(read_by.begin(), read_by.end());
        slot.writers.assign(written_by.begin(), written_by.end());
        if (read_by.empty() && written_by.empty()) {
            slot.access = ir::AccessPattern::kUnused;
        } else if (written_by.empty()) {
            slot.access = ir::AccessPattern::kReadOnly;
        } else if (read_by.empty()) {
            slot.access = ir::AccessPattern::kWriteOnly;
        } else {
            slot.access = ir::AccessPattern::kReadWrite;
        }
    }
}

void index_call_sites(ir::ContractModel& model)
{
    model.call_sites.clear();
    for (const auto& [position, function] : std::views::enumerate(model.functions)) {
        for (const auto& [index, op] : std::views::enumerate(function.operations)) {
            if (const auto* call = std::get_if<ir::ExternalCall>(&op.kind)) {
                model.call_sites.push_back(ir::ExternalCallSite{.function = function.name,
                                                                .function_index = static_cast<std::size_t>(position),
                                                                .operation_index = static_cast<std::size_t>(index),
                                                                .kind = call->kind,
                                                                .target = call->target,
                                                                .location = op.location});
            }
        }
    }
}

/// Unique names map as-is; every overload of a shared name is keyed "name@line".
void index_locations(ir::ContractModel& model)
{
    std::map<std::string, int> uses;
    for (const auto& function : model.functions) {
        ++uses[function.name];
    }
    model.locations.clear();
    for (const auto& function : model.functions) {
        if (uses[function.name] == 1) {
            model.locations.emplace(function.name, function.location);
        } else {
            model.locations.emplace(std::format("{}@{}", function.name, function.location.line), function.location);
        }
    }
}

}  // namespace

ir::Dialect detect_dialect(std::string_view source)
{
    if (source.size() >= 4 && source.substr(0, 4) == std::string_view("\0asm", 4)) {
        return ir::Dialect::kWasm;
    }
    for (auto marker : kStylusMarkers) {
        if (source.find(marker) != std::string_view::npos) {
            return ir::Dialect::kStylusRust;
        }
    }
    std::size_t begin = 0;
    while (begin < source.size()) {
        auto end = source.find('\n', begin);
        if (end == std::string_view::npos) {
            end = source.size();
        }
        const auto line = trim_left(source.substr(begin, end - begin));
        for (auto declaration : kSolidityDeclarations) {
            if (line.starts_with(declaration)) {
                return ir::Dialect::kSolidity;
            }
        }
        begin = end + 1;
    }
    return ir::Dialect::kStylusRust;
}

Result<ir::ContractModel> build_model(std::string_view source, ir::Dialect dialect, const BuildOptions& options)
{
    const std::string file = options.file_path.empty() ? std::string("<input>")
                                                        : common::normalize_path(options.file_path, options.repo_root);
    if (source.empty()) {
        return std::unexpected(Error::at(std::string(error_code::kParseError),
                                         "empty input",
                                         SourceLocation{.file = file, .line = 0, .col = 0}));
    }
    if (dialect == ir::Dialect::kAuto) {
        dialect = detect_dialect(source);
    }

    const ParseContext context{.file = file, .contract_name = options.contract_name};
    Result<ir::ContractModel> parsed = [&]() -> Result<ir::ContractModel> {
        switch (dialect) {
            case ir::Dialect::kWasm:
                return decode_wasm(source, context);
            case ir::Dialect::kSolidity:
                return parse_solidity(source, context);
            case ir::Dialect::kStylusRust:
            case ir::Dialect::kAuto:
                break;
        }
        return parse_stylus_rust(source, context);
    }();
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    ir::ContractModel model = std::move(*parsed);

    if (model.functions.empty() && model.slots.empty() && !model.diagnostics.empty()) {
        const auto& first = model.diagnostics.front();
        return std::unexpected(Error{
            .code = std::string(error_code::kParseError),
            .message = std::format("no function could be recovered ({} skipped region(s)); first: {}",
                                   model.diagnostics.size(),
                                   first.message),
            .location = first.location});
    }

    model.dialect = dialect;
    model.file = file;
    model.input_digest = common::sha256_prefixed(source);
    if (model.name.empty()) {
        model.name = file_stem(file);
    }
    summarize_slots(model);
    index_call_sites(model);
    index_locations(model);
    return model;
}

}  // namespace stylint::frontend
