#pragma once

/**
 * @file body_builder.hpp
 * @brief Operation emission and local data-flow facts for source front ends
 *
 * The Rust and Solidity walkers recognize syntax; BodyBuilder owns the
 * function's operation list, the loop stack and the per-function facts about
 * locals (where a value came from, which arithmetic produced it, whether a
 * call result bound to it was inspected).
 */

#include "lexer.hpp"

#include "stylint/model.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace stylint::frontend {

/// One `&&`/`||` separated part of a condition.
struct ClauseFacts
{
    bool compares = false;  ///< Contains == or !=
    bool mentions_sender = false;
    bool mentions_origin = false;
    std::vector<std::string> slots;   ///< Storage slots read
    std::vector<std::string> idents;  ///< Parameters and locals referenced
    std::vector<std::string> calls;   ///< Names of functions called
};

struct ConditionFacts
{
    std::string text;
    std::vector<ClauseFacts> clauses;
};

[[nodiscard]] ir::GuardKind classify_guard(const ConditionFacts& facts);

/// Access-control modifier/attribute name (onlyOwner, only_admin, auth...).
[[nodiscard]] bool is_access_control_name(std::string_view name);

/// Reentrancy-guard modifier/attribute name (nonReentrant, lock...).
[[nodiscard]] bool is_reentrancy_guard_name(std::string_view name);

class BodyBuilder
{
public:
    BodyBuilder(ir::Function& function, std::string file);

    std::size_t emit(const Token& at, ir::OperationKind kind);
    void emit_branch(const Token& at, const ConditionFacts& facts, bool reverts);

    void open_loop(const Token& at, std::string header, bool storage_bound);
    void close_loop();
    [[nodiscard]] int loop_depth() const { return static_cast<int>(m_open_loops.size()); }

    void mark_unsafe(const Token& at);

    [[nodiscard]] bool is_param(std::string_view name) const;
    [[nodiscard]] bool is_local(std::string_view name) const;

    void bind_local(const std::string& name, ir::ValueSource source);
    [[nodiscard]] std::optional<ir::ValueSource> local_source(std::string_view name) const;

    void bind_collection(const std::string& name, bool preallocated);
    [[nodiscard]] std::optional<bool> collection_preallocated(std::string_view name) const;

    /// Arithmetic whose result was stored in local `name`.
    void attach_arithmetic(const std::string& name, const std::vector<std::size_t>& ops);
    /// Propagate a sink to the arithmetic that produced local `name`.
    void sink_local(std::string_view name, ir::ArithmeticSink sink);

    void bind_call_result(const std::string& name, std::size_t op_index);
    void mark_result_handled(std::string_view name);
    void mark_handled(std::size_t op_index);

    /**
     * Classify where a value comes from.
     * @param tokens Token buffer
     * @param begin First token of the expression
     * @param end One past the last token
     * @param mentions_sender Expression reads the caller address
     * @param mentions_storage Expression reads a storage slot
     */
    [[nodiscard]] ir::ValueSource classify_source(const std::vector<Token>& tokens,
                                                  std::size_t begin,
                                                  std::size_t end,
                                                  bool mentions_sender,
                                                  bool mentions_storage) const;

    [[nodiscard]] std::size_t size() const { return m_function.operations.size(); }
    [[nodiscard]] ir::Operation& operation(std::size_t index)
    {
        return m_function.operations[index];
    }
    [[nodiscard]] const std::string& file() const { return m_file; }

private:
    ir::Function& m_function;
    std::string m_file;
    std::vector<std::size_t> m_open_loops;
    std::set<std::string, std::less<>> m_params;
    std::map<std::string, ir::ValueSource, std::less<>> m_locals;
    std::map<std::string, bool, std::less<>> m_collections;
    std::map<std::string, std::vector<std::size_t>, std::less<>> m_local_arithmetic;
    std::map<std::string, std::vector<std::size_t>, std::less<>> m_call_results;
};

}  // namespace stylint::frontend
