/**
 * @file model.cpp
 * @brief Contract model lookups and JSON dump
 */

#include "stylint/model.hpp"

#include <algorithm>
#include <type_traits>

namespace stylint {

void to_json(nlohmann::json& j, const SourceLocation& loc)
{
    j = nlohmann::json{
        {"file", loc.file},
        {"line", loc.line},
        { "col",  loc.col}
    };
}

}  // namespace stylint

namespace stylint::ir {

bool Function::has_modifier(ModifierKind kind) const
{
    return std::ranges::any_of(modifiers,
                               [kind](const Modifier& modifier) { return modifier.kind == kind; });
}

const Function* ContractModel::find_function(std::string_view function_name) const
{
    auto it = std::ranges::find(functions, function_name, &Function::name);
    return it == functions.end() ? nullptr : &*it;
}

const StorageSlot* ContractModel::find_slot(std::string_view slot_name) const
{
    auto it = std::ranges::find(slots, slot_name, &StorageSlot::name);
    return it == slots.end() ? nullptr : &*it;
}

Diagnostic to_diagnostic(const Error& error)
{
    return Diagnostic{.code = error.code, .message = error.message, .location = error.location};
}

std::string_view to_string(Dialect dialect)
{
    switch (dialect) {
        case Dialect::kAuto:
            return "auto";
        case Dialect::kStylusRust:
            return "stylus-rust";
        case Dialect::kSolidity:
            return "solidity";
        case Dialect::kWasm:
            return "wasm";
    }
    return "auto";
}

std::string_view to_string(Visibility visibility)
{
    switch (visibility) {
        case Visibility::kPublic:
            return "public";
        case Visibility::kExternal:
            return "external";
        case Visibility::kInternal:
            return "internal";
        case Visibility::kPrivate:
            return "private";
    }
    return "internal";
}

std::string_view to_string(Mutability mutability)
{
    switch (mutability) {
        case Mutability::kNone:
            return "none";
        case Mutability::kView:
            return "view";
        case Mutability::kPure:
            return "pure";
        case Mutability::kPayable:
            return "payable";
    }
    return "none";
}

std::string_view to_string(ModifierKind kind)
{
    switch (kind) {
        case ModifierKind::kAccessControl:
            return "access-control";
        case ModifierKind::kReentrancyGuard:
            return "reentrancy-guard";
        case ModifierKind::kPayable:
            return "payable";
        case ModifierKind::kOther:
            return "other";
    }
    return "other";
}

std::string_view to_string(SlotKind kind)
{
    switch (kind) {
        case SlotKind::kValue:
            return "value";
        case SlotKind::kMapping:
            return "mapping";
        case SlotKind::kArray:
            return "array";
    }
    return "value";
}

std::string_view to_string(AccessPattern access)
{
    switch (access) {
        case AccessPattern::kUnused:
            return "unused";
        case AccessPattern::kReadOnly:
            return "read-only";
        case AccessPattern::kWriteOnly:
            return "write-only";
        case AccessPattern::kReadWrite:
            return "read-write";
    }
    return "unused";
}

std::string_view to_string(ValueSource source)
{
    switch (source) {
        case ValueSource::kNone:
            return "none";
        case ValueSource::kSender:
            return "sender";
        case ValueSource::kParameter:
            return "parameter";
        case ValueSource::kStorage:
            return "storage";
        case ValueSource::kConstant:
            return "constant";
        case ValueSource::kLocal:
            return "local";
    }
    return "none";
}

std::string_view to_string(ArithmeticOp op)
{
    switch (op) {
        case ArithmeticOp::kAdd:
            return "add";
        case ArithmeticOp::kSub:
            return "sub";
        case ArithmeticOp::kMul:
            return "mul";
        case ArithmeticOp::kDiv:
            return "div";
        case ArithmeticOp::kMod:
            return "mod";
        case ArithmeticOp::kPow:
            return "pow";
        case ArithmeticOp::kShl:
            return "shl";
    }
    return "add";
}

std::string_view to_string(ArithmeticSink sink)
{
    switch (sink) {
        case ArithmeticSink::kNone:
            return "none";
        case ArithmeticSink::kStorage:
            return "storage";
        case ArithmeticSink::kIndex:
            return "index";
    }
    return "none";
}

std::string_view to_string(CallKind kind)
{
    switch (kind) {
        case CallKind::kCall:
            return "call";
        case CallKind::kDelegateCall:
            return "delegate_call";
        case CallKind::kStaticCall:
            return "static_call";
        case CallKind::kValueTransfer:
            return "value_transfer";
    }
    return "call";
}

std::string_view to_string(GuardKind kind)
{
    switch (kind) {
        case GuardKind::kNone:
            return "none";
        case GuardKind::kAccessControl:
            return "access_control";
        case GuardKind::kTxOrigin:
            return "tx_origin";
        case GuardKind::kAllowList:
            return "allow_list";
        case GuardKind::kInputValidation:
            return "input_validation";
    }
    return "none";
}

std::string_view to_string(EnvironmentKind kind)
{
    switch (kind) {
        case EnvironmentKind::kSender:
            return "sender";
        case EnvironmentKind::kValue:
            return "value";
        case EnvironmentKind::kOrigin:
            return "origin";
        case EnvironmentKind::kTimestamp:
            return "timestamp";
        case EnvironmentKind::kBlockNumber:
            return "block_number";
    }
    return "sender";
}

std::string_view kind_name(const Operation& op)
{
    return std::visit(
        [](const auto& kind) -> std::string_view {
            using T = std::decay_t<decltype(kind)>;
            if constexpr (std::is_same_v<T, Arithmetic>) {
                return "arithmetic";
            } else if constexpr (std::is_same_v<T, StorageRead>) {
                return "storage_read";
            } else if constexpr (std::is_same_v<T, StorageWrite>) {
                return "storage_write";
            } else if constexpr (std::is_same_v<T, ExternalCall>) {
                return "external_call";
            } else if constexpr (std::is_same_v<T, MemoryAllocation>) {
                return "memory_allocation";
            } else if constexpr (std::is_same_v<T, Loop>) {
                return "loop";
            } else if constexpr (std::is_same_v<T, Branch>) {
                return "branch";
            } else if constexpr (std::is_same_v<T, InternalCall>) {
                return "internal_call";
            } else if constexpr (std::is_same_v<T, EnvironmentRead>) {
                return "environment_read";
            } else if constexpr (std::is_same_v<T, EventEmission>) {
                return "event_emission";
            } else {
                static_assert(std::is_same_v<T, OpaqueOperation>, "unhandled operation kind");
                return "opaque";
            }
        },
        op.kind);
}

namespace {

[[nodiscard]] nlohmann::json operation_payload(const OperationKind& kind)
{
    return std::visit(
        [](const auto& value) -> nlohmann::json {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, Arithmetic>) {
                return {
                    {                   "op",          to_string(value.op)},
                    {              "checked",                value.checked},
                    {                 "sink",        to_string(value.sink)},
                    {"operand_reads_storage", value.operand_reads_storage}
                };
            } else if constexpr (std::is_same_v<T, StorageRead> || std::is_same_v<T, StorageWrite>) {
                return {
                    {      "slot",                  value.slot},
                    {       "key",                   value.key},
                    {"key_source", to_string(value.key_source)}
                };
            } else if constexpr (std::is_same_v<T, ExternalCall>) {
                return {
                    {          "kind",             to_string(value.kind)},
                    {        "target",                      value.target},
                    { "target_source", to_string(value.target_source)},
                    {        "method",                      value.method},
                    {          "args",                        value.args},
                    {"result_checked",              value.result_checked}
                };
            } else if constexpr (std::is_same_v<T, MemoryAllocation>) {
                return {
                    { "description", value.description},
                    {"preallocated", value.preallocated}
                };
            } else if constexpr (std::is_same_v<T, Loop>) {
                return {
                    {       "header",        value.header},
                    {"storage_bound", value.storage_bound},
                    {   "body_begin",    value.body_begin},
                    {     "body_end",      value.body_end}
                };
            } else if constexpr (std::is_same_v<T, Branch>) {
                return {
                    {"condition",        value.condition},
                    {    "guard", to_string(value.guard)},
                    {  "reverts",          value.reverts},
                    { "subjects",         value.subjects}
                };
            } else if constexpr (std::is_same_v<T, InternalCall>) {
                return {
                    {"callee", value.callee}
                };
            } else if constexpr (std::is_same_v<T, EnvironmentRead>) {
                return {
                    {"kind", to_string(value.kind)}
                };
            } else if constexpr (std::is_same_v<T, EventEmission>) {
                return {
                    {"event", value.event}
                };
            } else {
                static_assert(std::is_same_v<T, OpaqueOperation>, "unhandled operation kind");
                return {
                    {"mnemonic", value.mnemonic}
                };
            }
        },
        kind);
}

}  // namespace

void to_json(nlohmann::json& j, const Operation& op)
{
    j = nlohmann::json{
        {    "kind",             kind_name(op)},
        {     "loc",               op.location},
        {   "depth",             op.loop_depth},
        { "details", operation_payload(op.kind)}
    };
}

void to_json(nlohmann::json& j, const Function& function)
{
    nlohmann::json modifiers = nlohmann::json::array();
    for (const auto& modifier : function.modifiers) {
        modifiers.push_back({
            {"name",           modifier.name},
            {"kind", to_string(modifier.kind)}
        });
    }
    j = nlohmann::json{
        {      "name",                      function.name},
        {"visibility", to_string(function.visibility)},
        {"mutability", to_string(function.mutability)},
        {       "doc",                       function.doc},
        {    "params",                    function.params},
        { "modifiers",                          modifiers},
        {       "loc",                  function.location},
        {"operations",                function.operations}
    };
    if (!function.unsafe_regions.empty()) {
        j["unsafe_regions"] = function.unsafe_regions;
    }
}

void to_json(nlohmann::json& j, const StorageSlot& slot)
{
    j = nlohmann::json{
        {   "name",             slot.name},
        {   "type",             slot.type},
        {   "kind", to_string(slot.kind)},
        {    "loc",         slot.location},
        { "access", to_string(slot.access)},
        {"readers",          slot.readers},
        {"writers",          slot.writers}
    };
}

void to_json(nlohmann::json& j, const ExternalCallSite& site)
{
    j = nlohmann::json{
        {      "function",       site.function},
        {"function_index", site.function_index},
        {         "index", site.operation_index},
        {    "kind", to_string(site.kind)},
        {  "target",          site.target},
        {     "loc",        site.location}
    };
}

void to_json(nlohmann::json& j, const Diagnostic& diagnostic)
{
    j = nlohmann::json{
        {   "code",    diagnostic.code},
        {"message", diagnostic.message}
    };
    if (diagnostic.location) {
        j["loc"] = *diagnostic.location;
    }
}

void to_json(nlohmann::json& j, const ContractModel& model)
{
    nlohmann::json locations = nlohmann::json::object();
    for (const auto& [name, loc] : model.locations) {
        locations[name] = loc;
    }
    j = nlohmann::json{
        {        "name",                model.name},
        {     "dialect", to_string(model.dialect)},
        {"input_digest",        model.input_digest},
        {        "file",                model.file},
        {   "functions",           model.functions},
        {       "slots",               model.slots},
        {  "call_sites",          model.call_sites},
        {   "locations",                 locations},
        { "diagnostics",         model.diagnostics}
    };
}

}  // namespace stylint::ir
