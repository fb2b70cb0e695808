#pragma once

/**
 * @file model.hpp
 * @brief Contract model: the immutable IR shared by every detector
 *
 * One ContractModel is built per input artifact (Stylus Rust source, Solidity
 * source or a WASM module). Operations are a closed std::variant so detectors
 * can match on them exhaustively.
 */

#include "stylint/common.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace stylint::ir {

enum class Dialect {
    kAuto,
    kStylusRust,
    kSolidity,
    kWasm,
};

enum class Visibility {
    kPublic,
    kExternal,
    kInternal,
    kPrivate,
};

enum class Mutability {
    kNone,
    kView,
    kPure,
    kPayable,
};

enum class ModifierKind {
    kAccessControl,
    kReentrancyGuard,
    kPayable,
    kOther,
};

enum class SlotKind {
    kValue,
    kMapping,
    kArray,
};

enum class AccessPattern {
    kUnused,
    kReadOnly,
    kWriteOnly,
    kReadWrite,
};

/// Where a call target or storage key comes from.
enum class ValueSource {
    kNone,
    kSender,
    kParameter,
    kStorage,
    kConstant,
    kLocal,
};

enum class ArithmeticOp {
    kAdd,
    kSub,
    kMul,
    kDiv,
    kMod,
    kPow,
    kShl,
};

/// Where the result of an arithmetic expression ends up.
enum class ArithmeticSink {
    kNone,
    kStorage,
    kIndex,
};

enum class CallKind {
    kCall,
    kDelegateCall,
    kStaticCall,
    kValueTransfer,
};

enum class GuardKind {
    kNone,
    kAccessControl,
    kTxOrigin,
    kAllowList,
    kInputValidation,
};

enum class EnvironmentKind {
    kSender,
    kValue,
    kOrigin,
    kTimestamp,
    kBlockNumber,
};

struct Arithmetic
{
    ArithmeticOp op = ArithmeticOp::kAdd;
    bool checked = false;
    ArithmeticSink sink = ArithmeticSink::kNone;
    bool operand_reads_storage = false;
};

struct StorageRead
{
    std::string slot;
    std::string key;
    ValueSource key_source = ValueSource::kNone;
};

struct StorageWrite
{
    std::string slot;
    std::string key;
    ValueSource key_source = ValueSource::kNone;
};

struct ExternalCall
{
    CallKind kind = CallKind::kCall;
    std::string target;
    ValueSource target_source = ValueSource::kLocal;
    std::string method;
    std::string args;
    bool result_checked = false;
};

struct MemoryAllocation
{
    std::string description;
    bool preallocated = false;
};

/// Loop construct. Body operations occupy [body_begin, body_end) of the
/// owning function's operation list.
struct Loop
{
    std::string header;
    bool storage_bound = false;
    std::size_t body_begin = 0;
    std::size_t body_end = 0;
};

struct Branch
{
    std::string condition;
    GuardKind guard = GuardKind::kNone;
    bool reverts = false;
    std::vector<std::string> subjects;  ///< Sorted names the condition inspects
};

struct InternalCall
{
    std::string callee;
};

struct EnvironmentRead
{
    EnvironmentKind kind = EnvironmentKind::kSender;
};

struct EventEmission
{
    std::string event;
};

/// Construct recognized but not modelled (unknown host call, inline assembly).
struct OpaqueOperation
{
    std::string mnemonic;
};

using OperationKind = std::variant<Arithmetic,
                                   StorageRead,
                                   StorageWrite,
                                   ExternalCall,
                                   MemoryAllocation,
                                   Loop,
                                   Branch,
                                   InternalCall,
                                   EnvironmentRead,
                                   EventEmission,
                                   OpaqueOperation>;

struct Operation
{
    SourceLocation location;
    int loop_depth = 0;
    OperationKind kind;
};

struct Modifier
{
    std::string name;
    ModifierKind kind = ModifierKind::kOther;
};

struct Function
{
    std::string name;
    Visibility visibility = Visibility::kInternal;
    Mutability mutability = Mutability::kNone;
    std::string doc;
    std::vector<Operation> operations;
    std::vector<Modifier> modifiers;
    std::vector<std::string> params;
    SourceLocation location;
    std::vector<SourceLocation> unsafe_regions;

    /// Callable from outside the contract.
    [[nodiscard]] bool is_entry_point() const
    {
        return visibility == Visibility::kPublic || visibility == Visibility::kExternal;
    }

    [[nodiscard]] bool is_state_changing() const
    {
        return mutability == Mutability::kNone || mutability == Mutability::kPayable;
    }

    [[nodiscard]] bool has_modifier(ModifierKind kind) const;
};

struct StorageSlot
{
    std::string name;
    std::string type;
    SlotKind kind = SlotKind::kValue;
    SourceLocation location;
    AccessPattern access = AccessPattern::kUnused;
    std::vector<std::string> readers;
    std::vector<std::string> writers;
};

struct ExternalCallSite
{
    std::string function;
    std::size_t function_index = 0;  ///< Position in ContractModel::functions; overloads share a name
    std::size_t operation_index = 0;
    CallKind kind = CallKind::kCall;
    std::string target;
    SourceLocation location;
};

/// Recoverable problem recorded while building or analyzing.
struct Diagnostic
{
    std::string code;
    std::string message;
    std::optional<SourceLocation> location;
};

struct ContractModel
{
    std::string name;
    Dialect dialect = Dialect::kStylusRust;
    std::string input_digest;
    std::string file;
    std::vector<Function> functions;
    std::vector<StorageSlot> slots;
    std::vector<ExternalCallSite> call_sites;
    std::map<std::string, SourceLocation> locations;  ///< By name; overloads by "name@line"
    std::vector<Diagnostic> diagnostics;

    [[nodiscard]] const Function* find_function(std::string_view function_name) const;
    [[nodiscard]] const StorageSlot* find_slot(std::string_view slot_name) const;
};

[[nodiscard]] Diagnostic to_diagnostic(const Error& error);

[[nodiscard]] std::string_view to_string(Dialect dialect);
[[nodiscard]] std::string_view to_string(Visibility visibility);
[[nodiscard]] std::string_view to_string(Mutability mutability);
[[nodiscard]] std::string_view to_string(ModifierKind kind);
[[nodiscard]] std::string_view to_string(SlotKind kind);
[[nodiscard]] std::string_view to_string(AccessPattern access);
[[nodiscard]] std::string_view to_string(ValueSource source);
[[nodiscard]] std::string_view to_string(ArithmeticOp op);
[[nodiscard]] std::string_view to_string(ArithmeticSink sink);
[[nodiscard]] std::string_view to_string(CallKind kind);
[[nodiscard]] std::string_view to_string(GuardKind kind);
[[nodiscard]] std::string_view to_string(EnvironmentKind kind);

/// Name of the active operation alternative ("storage_write", "loop", ...).
[[nodiscard]] std::string_view kind_name(const Operation& op);

void to_json(nlohmann::json& j, const Operation& op);
void to_json(nlohmann::json& j, const Function& function);
void to_json(nlohmann::json& j, const StorageSlot& slot);
void to_json(nlohmann::json& j, const ExternalCallSite& site);
void to_json(nlohmann::json& j, const Diagnostic& diagnostic);
void to_json(nlohmann::json& j, const ContractModel& model);

}  // namespace stylint::ir

namespace stylint {

void to_json(nlohmann::json& j, const SourceLocation& loc);

}  // namespace stylint
