/**
 * @file rust_frontend.cpp
 * @brief Stylus Rust front end
 *
 * Recognizes the contract surface of the Stylus SDK: sol_storage! blocks and
 * #[storage]/#[entrypoint] structs for slots, impl blocks (with #[public] or
 * #[external]) for functions, and the SDK idioms used inside bodies.
 */

#include "body_builder.hpp"
#include "frontends.hpp"
#include "lexer.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <map>
#include <optional>
#include <ranges>
#include <set>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace stylint::frontend {

namespace {

using NameSet = std::set<std::string, std::less<>>;

constexpr std::array<std::string_view, 9> kReadAccessors = {
    "get", "getter", "len", "is_empty", "contains", "contains_key", "iter", "load", "get_raw",
};

constexpr std::array<std::string_view, 14> kWriteAccessors = {
    "set",   "insert", "setter", "push",  "pop",      "delete",      "erase",
    "remove", "clear", "store",  "grow",  "get_mut", "swap_remove", "truncate",
};

constexpr std::array<std::string_view, 4> kArithmeticPrefixes = {
    "checked_", "saturating_", "wrapping_", "overflowing_",
};

constexpr std::array<std::string_view, 13> kResultHandlers = {
    "is_ok",  "is_err",    "map_err",       "expect", "unwrap", "unwrap_or", "unwrap_or_else",
    "unwrap_or_default", "ok", "or_else", "and_then", "map", "err",
};

constexpr std::array<std::string_view, 24> kQuietMacros = {
    "panic",        "unreachable", "todo",       "unimplemented", "debug_assert",
    "debug_assert_eq", "debug_assert_ne", "println", "eprintln",   "print",
    "dbg",          "matches",     "write",      "writeln",        "concat",
    "stringify",    "include_bytes", "sol",      "selector",       "function_selector",
    "address",      "uint",        "fixed_bytes", "hex",
};

constexpr std::array<std::string_view, 6> kIgnoredAttributes = {
    "inline", "allow", "cfg", "must_use", "deprecated", "selector",
};

constexpr std::array<std::string_view, 5> kAllocatingTypes = {
    "Vec", "String", "HashMap", "BTreeMap", "VecDeque",
};

[[nodiscard]] bool contains(std::span<const std::string_view> names, std::string_view name)
{
    return std::ranges::contains(names, name);
}

[[nodiscard]] std::optional<ir::ArithmeticOp> binary_operator(const Token& token)
{
    if (token.kind != TokenKind::kPunct) {
        return std::nullopt;
    }
    static const std::map<std::string, ir::ArithmeticOp, std::less<>> kOperators = {
        { "+", ir::ArithmeticOp::kAdd},
        { "-", ir::ArithmeticOp::kSub},
        { "*", ir::ArithmeticOp::kMul},
        { "/", ir::ArithmeticOp::kDiv},
        { "%", ir::ArithmeticOp::kMod},
        {"<<", ir::ArithmeticOp::kShl},
    };
    if (auto it = kOperators.find(token.text); it != kOperators.end()) {
        return it->second;
    }
    return std::nullopt;
}

[[nodiscard]] std::optional<ir::ArithmeticOp> compound_operator(const Token& token)
{
    if (token.kind != TokenKind::kPunct || token.text.size() < 2 || !token.text.ends_with('=')
        || token.text == "==" || token.text == "!=" || token.text == "<=" || token.text == ">=") {
        return std::nullopt;
    }
    Token base = token;
    base.text.pop_back();
    return binary_operator(base);
}

/// "checked_add" -> kAdd; "pow" -> kPow.
[[nodiscard]] std::optional<std::pair<ir::ArithmeticOp, bool>> arithmetic_method(std::string_view name)
{
    bool checked = false;
    for (auto prefix : kArithmeticPrefixes) {
        if (name.starts_with(prefix)) {
            name.remove_prefix(prefix.size());
            checked = true;
            break;
        }
    }
    static const std::map<std::string, ir::ArithmeticOp, std::less<>> kMethods = {
        {"add", ir::ArithmeticOp::kAdd},
        {"sub", ir::ArithmeticOp::kSub},
        {"mul", ir::ArithmeticOp::kMul},
        {"div", ir::ArithmeticOp::kDiv},
        {"rem", ir::ArithmeticOp::kMod},
        {"pow", ir::ArithmeticOp::kPow},
        {"shl", ir::ArithmeticOp::kShl},
    };
    auto it = kMethods.find(name);
    if (it == kMethods.end()) {
        return std::nullopt;
    }
    // Plain add/sub/... are trait methods with operator semantics; only pow is common.
    if (!checked && it->second != ir::ArithmeticOp::kPow) {
        return std::nullopt;
    }
    return std::pair{it->second, checked};
}

[[nodiscard]] std::optional<ir::EnvironmentKind> environment_of(std::string_view module,
                                                                std::string_view name)
{
    if (module == "msg" && name == "sender") {
        return ir::EnvironmentKind::kSender;
    }
    if (module == "msg" && name == "value") {
        return ir::EnvironmentKind::kValue;
    }
    if (module == "tx" && name == "origin") {
        return ir::EnvironmentKind::kOrigin;
    }
    if (module == "block" && name == "timestamp") {
        return ir::EnvironmentKind::kTimestamp;
    }
    if (module == "block" && name == "number") {
        return ir::EnvironmentKind::kBlockNumber;
    }
    return std::nullopt;
}

/// self.vm().msg_sender() style accessors.
[[nodiscard]] std::optional<ir::EnvironmentKind> vm_environment_of(std::string_view name)
{
    if (name == "msg_sender") {
        return ir::EnvironmentKind::kSender;
    }
    if (name == "msg_value") {
        return ir::EnvironmentKind::kValue;
    }
    if (name == "tx_origin") {
        return ir::EnvironmentKind::kOrigin;
    }
    if (name == "block_timestamp") {
        return ir::EnvironmentKind::kTimestamp;
    }
    if (name == "block_number") {
        return ir::EnvironmentKind::kBlockNumber;
    }
    return std::nullopt;
}

[[nodiscard]] std::optional<ir::CallKind> call_function_kind(std::string_view name)
{
    if (name == "call") {
        return ir::CallKind::kCall;
    }
    if (name == "delegate_call") {
        return ir::CallKind::kDelegateCall;
    }
    if (name == "static_call") {
        return ir::CallKind::kStaticCall;
    }
    if (name == "transfer_eth") {
        return ir::CallKind::kValueTransfer;
    }
    return std::nullopt;
}

[[nodiscard]] bool is_interface_name(std::string_view name, const NameSet& interfaces)
{
    if (interfaces.contains(name)) {
        return true;
    }
    return name.size() > 1 && name[0] == 'I' && std::isupper(static_cast<unsigned char>(name[1])) != 0;
}

/// Symbols collected before bodies are walked.
struct RustSymbols
{
    NameSet slots;
    NameSet functions;
    NameSet interfaces;
};

class RustBodyWalker
{
public:
    RustBodyWalker(const std::vector<Token>& tokens, BodyBuilder& builder, const RustSymbols& symbols)
        : m_tokens(tokens)
        , m_builder(builder)
        , m_symbols(symbols)
    {}

    void walk_block(std::size_t begin, std::size_t end)
    {
        std::size_t i = begin;
        while (i < end) {
            i = walk_statement(i, end);
        }
    }

private:
    struct ExprContext
    {
        ir::ArithmeticSink sink = ir::ArithmeticSink::kNone;
        bool handled = false;  ///< Value is inspected (?, match, if, return)
    };

    [[nodiscard]] const Token& tok(std::size_t i) const
    {
        static const Token kEnd{};
        return i < m_tokens.size() ? m_tokens[i] : kEnd;
    }

    [[nodiscard]] std::size_t statement_end(std::size_t begin, std::size_t end) const
    {
        int depth = 0;
        for (std::size_t i = begin; i < end; ++i) {
            const Token& t = m_tokens[i];
            if (is_punct(t, "(") || is_punct(t, "[") || is_punct(t, "{")) {
                ++depth;
            } else if (is_punct(t, ")") || is_punct(t, "]") || is_punct(t, "}")) {
                --depth;
            } else if (depth == 0 && (is_punct(t, ";") || is_punct(t, ","))) {
                return i;
            }
        }
        return end;
    }

    /// The '{' opening the block of an if/for/while/match header.
    [[nodiscard]] std::optional<std::size_t> block_open(std::size_t begin, std::size_t end) const
    {
        int depth = 0;
        for (std::size_t i = begin; i < end; ++i) {
            const Token& t = m_tokens[i];
            if (depth == 0 && is_punct(t, "{")) {
                return i;
            }
            if (is_punct(t, "(") || is_punct(t, "[")) {
                ++depth;
            } else if (is_punct(t, ")") || is_punct(t, "]")) {
                --depth;
            } else if (depth == 0 && is_punct(t, ";")) {
                return std::nullopt;
            }
        }
        return std::nullopt;
    }

    std::size_t walk_statement(std::size_t i, std::size_t end)
    {
        const Token& t = m_tokens[i];
        if (t.kind == TokenKind::kDoc || is_punct(t, ";") || is_punct(t, ",")) {
            return i + 1;
        }
        if (is_punct(t, "#") && is_punct(tok(i + 1), "[")) {
            auto close = find_matching(m_tokens, i + 1, end);
            return close ? *close + 1 : end;
        }
        if (is_punct(t, "{")) {
            return walk_nested_block(i, end);
        }
        if (is_ident(t, "unsafe") && is_punct(tok(i + 1), "{")) {
            m_builder.mark_unsafe(t);
            return walk_nested_block(i + 1, end);
        }
        // Loop label: 'outer: loop { ... }
        if (t.kind == TokenKind::kIdent && is_punct(tok(i + 1), ":")
            && (is_ident(tok(i + 2), "loop") || is_ident(tok(i + 2), "for")
                || is_ident(tok(i + 2), "while"))) {
            return i + 2;
        }
        if (is_ident(t, "for") || is_ident(t, "while") || is_ident(t, "loop")) {
            return walk_loop(i, end);
        }
        if (is_ident(t, "if")) {
            return walk_if(i, end);
        }
        if (is_ident(t, "match")) {
            return walk_match(i, end);
        }
        if (is_ident(t, "let")) {
            return walk_let(i, end);
        }
        if (is_ident(t, "return")) {
            const std::size_t stop = statement_end(i + 1, end);
            process_expr(i + 1, stop, ExprContext{.handled = true});
            return stop + 1;
        }
        if (is_ident(t, "break") || is_ident(t, "continue")) {
            return statement_end(i, end) + 1;
        }

        const std::size_t stop = statement_end(i, end);
        // Match arm: `Pattern => expr` or `Pattern => { block }`.
        if (auto arrow = find_top_level(m_tokens, i, stop, "=>")) {
            const std::size_t arm = *arrow + 1;
            if (is_punct(tok(arm), "{")) {
                return walk_nested_block(arm, end);
            }
            process_expr(arm, stop, ExprContext{.handled = true});
            return stop + 1;
        }
        // A statement without ';' that ends the block is the tail expression.
        const bool tail = stop == end;
        process_expr(i, stop, ExprContext{.handled = tail});
        return stop + 1;
    }

    std::size_t walk_nested_block(std::size_t open, std::size_t end)
    {
        auto close = find_matching(m_tokens, open, end);
        const std::size_t stop = close.value_or(end);
        walk_block(open + 1, stop);
        return stop + 1;
    }

    std::size_t walk_loop(std::size_t i, std::size_t end)
    {
        const Token& keyword = m_tokens[i];
        auto open = block_open(i + 1, end);
        if (!open) {
            const std::size_t stop = statement_end(i, end);
            process_expr(i + 1, stop, ExprContext{});
            return stop + 1;
        }
        std::size_t header_begin = i + 1;
        if (is_ident(keyword, "for")) {
            if (auto in = find_ident(i + 1, *open, "in")) {
                header_begin = *in + 1;
                const ir::ValueSource source = source_of(header_begin, *open);
                for (std::size_t k = i + 1; k < *in; ++k) {
                    if (m_tokens[k].kind == TokenKind::kIdent && !is_ident(m_tokens[k], "mut")) {
                        m_builder.bind_local(m_tokens[k].text, source);
                    }
                }
            }
        } else if (is_ident(keyword, "while") && is_ident(tok(i + 1), "let")) {
            if (auto eq = find_top_level(m_tokens, i + 2, *open, "=")) {
                header_begin = *eq + 1;
            }
        }
        process_expr(header_begin, *open, ExprContext{.handled = true});
        const bool storage_bound = reads_storage(header_begin, *open);
        std::string header = is_ident(keyword, "loop") ? std::string("loop")
                                                        : join_tokens(m_tokens, i, *open);
        m_builder.open_loop(keyword, std::move(header), storage_bound);
        const std::size_t next = walk_nested_block(*open, end);
        m_builder.close_loop();
        return next;
    }

    std::size_t walk_if(std::size_t i, std::size_t end)
    {
        const Token& keyword = m_tokens[i];
        auto open = block_open(i + 1, end);
        if (!open) {
            const std::size_t stop = statement_end(i, end);
            process_expr(i + 1, stop, ExprContext{.handled = true});
            return stop + 1;
        }
        std::size_t cond_begin = i + 1;
        if (is_ident(tok(i + 1), "let")) {
            if (auto eq = find_top_level(m_tokens, i + 2, *open, "=")) {
                cond_begin = *eq + 1;
                const ir::ValueSource source = source_of(cond_begin, *open);
                for (std::size_t k = i + 2; k < *eq; ++k) {
                    const Token& t = m_tokens[k];
                    if (t.kind == TokenKind::kIdent
                        && std::islower(static_cast<unsigned char>(t.text.front())) != 0) {
                        m_builder.bind_local(t.text, source);
                    }
                }
            }
        }
        process_expr(cond_begin, *open, ExprContext{.handled = true});
        auto close = find_matching(m_tokens, *open, end);
        const std::size_t stop = close.value_or(end);
        m_builder.emit_branch(keyword, condition_facts(cond_begin, *open), block_reverts(*open + 1, stop));
        walk_block(*open + 1, stop);

        std::size_t next = stop + 1;
        if (is_ident(tok(next), "else")) {
            if (is_ident(tok(next + 1), "if")) {
                return walk_if(next + 1, end);
            }
            if (is_punct(tok(next + 1), "{")) {
                return walk_nested_block(next + 1, end);
            }
        }
        return next;
    }

    std::size_t walk_match(std::size_t i, std::size_t end)
    {
        auto open = block_open(i + 1, end);
        if (!open) {
            const std::size_t stop = statement_end(i, end);
            process_expr(i + 1, stop, ExprContext{.handled = true});
            return stop + 1;
        }
        process_expr(i + 1, *open, ExprContext{.handled = true});
        auto close = find_matching(m_tokens, *open, end);
        const std::size_t stop = close.value_or(end);
        m_builder.emit_branch(m_tokens[i], condition_facts(i + 1, *open), false);
        walk_block(*open + 1, stop);
        return stop + 1;
    }

    std::size_t walk_let(std::size_t i, std::size_t end)
    {
        const std::size_t stop = statement_end(i + 1, end);
        auto eq = find_top_level(m_tokens, i + 1, stop, "=");
        std::size_t name_at = i + 1;
        if (is_ident(tok(name_at), "mut")) {
            ++name_at;
        }
        const bool simple = tok(name_at).kind == TokenKind::kIdent
                            && (name_at + 1 == stop || is_punct(tok(name_at + 1), ":")
                                || is_punct(tok(name_at + 1), "="));
        const std::string name = simple ? tok(name_at).text : std::string();
        if (!eq) {
            if (!name.empty()) {
                m_builder.bind_local(name, ir::ValueSource::kNone);
            }
            return stop + 1;
        }

        const std::size_t rhs = *eq + 1;
        // let-else: the else block diverges.
        std::size_t rhs_end = stop;
        if (auto else_at = find_ident(rhs, stop, "else"); else_at && is_punct(tok(*else_at + 1), "{")) {
            rhs_end = *else_at;
        }
        const std::size_t first_op = m_builder.size();
        m_pending_origin = false;
        process_expr(rhs, rhs_end, ExprContext{});
        const bool origin = std::exchange(m_pending_origin, false);
        if (rhs_end != stop) {
            auto close = find_matching(m_tokens, rhs_end + 1, stop);
            m_builder.emit_branch(m_tokens[i], condition_facts(rhs, rhs_end), true);
            walk_block(rhs_end + 2, close.value_or(stop));
        }

        if (name.empty() || name == "_") {
            return stop + 1;
        }
        std::vector<std::size_t> arithmetic;
        for (std::size_t k = first_op; k < m_builder.size(); ++k) {
            const auto& op = m_builder.operation(k);
            if (const auto* value = std::get_if<ir::Arithmetic>(&op.kind);
                value != nullptr && value->sink == ir::ArithmeticSink::kNone) {
                arithmetic.push_back(k);
            }
            if (const auto* call = std::get_if<ir::ExternalCall>(&op.kind);
                call != nullptr && !call->result_checked && !name.starts_with('_')) {
                m_builder.bind_call_result(name, k);
            }
        }
        m_builder.attach_arithmetic(name, arithmetic);
        m_builder.bind_local(name, source_of(rhs, rhs_end));
        if (origin) {
            m_origin_locals.insert(name);
        }

        if (rhs + 2 < rhs_end && contains(kAllocatingTypes, tok(rhs).text) && is_punct(tok(rhs + 1), "::")) {
            m_builder.bind_collection(name, tok(rhs + 2).text == "with_capacity");
        } else if (is_ident(tok(rhs), "vec") && is_punct(tok(rhs + 1), "!")) {
            m_builder.bind_collection(name, true);
        }
        return stop + 1;
    }

    [[nodiscard]] std::optional<std::size_t>
    find_ident(std::size_t begin, std::size_t end, std::string_view text) const
    {
        int depth = 0;
        for (std::size_t k = begin; k < end; ++k) {
            const Token& t = m_tokens[k];
            if (depth == 0 && is_ident(t, text)) {
                return k;
            }
            if (is_punct(t, "(") || is_punct(t, "[") || is_punct(t, "{")) {
                ++depth;
            } else if (is_punct(t, ")") || is_punct(t, "]") || is_punct(t, "}")) {
                --depth;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] bool block_reverts(std::size_t begin, std::size_t end) const
    {
        for (std::size_t k = begin; k < end; ++k) {
            const Token& t = m_tokens[k];
            if (is_ident(t, "return") && is_ident(tok(k + 1), "Err")) {
                return true;
            }
            if ((is_ident(t, "panic") || is_ident(t, "revert") || is_ident(t, "unreachable"))
                && is_punct(tok(k + 1), "!")) {
                return true;
            }
            if (is_ident(t, "Err") && is_punct(tok(k + 1), "(")) {
                auto close = find_matching(m_tokens, k + 1, end);
                if (close && (is_punct(tok(*close + 1), "?") || *close + 1 == end)) {
                    return true;
                }
            }
        }
        return false;
    }

    // ------------------------------------------------------------------
    // Expression facts
    // ------------------------------------------------------------------

    [[nodiscard]] bool is_sender_at(std::size_t k) const
    {
        const Token& t = m_tokens[k];
        if (is_ident(t, "msg") && is_punct(tok(k + 1), "::") && is_ident(tok(k + 2), "sender")) {
            return true;
        }
        if (is_ident(t, "msg_sender") && is_punct(tok(k + 1), "(")) {
            return true;
        }
        if (t.kind == TokenKind::kIdent && (k == 0 || !is_punct(tok(k - 1), "."))
            && m_builder.local_source(t.text) == ir::ValueSource::kSender) {
            return !m_origin_locals.contains(t.text);
        }
        return false;
    }

    [[nodiscard]] bool is_origin_at(std::size_t k) const
    {
        const Token& t = m_tokens[k];
        if (is_ident(t, "tx") && is_punct(tok(k + 1), "::") && is_ident(tok(k + 2), "origin")) {
            return true;
        }
        if (is_ident(t, "tx_origin") && is_punct(tok(k + 1), "(")) {
            return true;
        }
        return t.kind == TokenKind::kIdent && m_origin_locals.contains(t.text);
    }

    [[nodiscard]] bool mentions_sender(std::size_t begin, std::size_t end) const
    {
        for (std::size_t k = begin; k < end; ++k) {
            if (is_sender_at(k)) {
                return true;
            }
        }
        return false;
    }

    /// Storage slot named at `self . name`, if any.
    [[nodiscard]] std::optional<std::string> slot_at(std::size_t k) const
    {
        if (!is_ident(m_tokens[k], "self") || !is_punct(tok(k + 1), ".")
            || tok(k + 2).kind != TokenKind::kIdent || is_punct(tok(k + 3), "(")) {
            return std::nullopt;
        }
        const std::string& name = tok(k + 2).text;
        if (name == "vm") {
            return std::nullopt;
        }
        return name;
    }

    [[nodiscard]] bool reads_storage(std::size_t begin, std::size_t end) const
    {
        for (std::size_t k = begin; k < end; ++k) {
            if (slot_at(k)) {
                return true;
            }
            const Token& t = m_tokens[k];
            if (t.kind == TokenKind::kIdent && (k == begin || !is_punct(tok(k - 1), "."))
                && m_builder.local_source(t.text) == ir::ValueSource::kStorage) {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] ir::ValueSource source_of(std::size_t begin, std::size_t end) const
    {
        // Strip leading borrows: &user, &mut x.
        while (begin < end && (is_punct(m_tokens[begin], "&") || is_ident(m_tokens[begin], "mut")
                               || is_punct(m_tokens[begin], "*"))) {
            ++begin;
        }
        if (begin < end && slot_at(begin)) {
            return ir::ValueSource::kStorage;
        }
        bool direct_storage = false;
        for (std::size_t k = begin; k < end; ++k) {
            direct_storage = direct_storage || slot_at(k).has_value();
        }
        return m_builder.classify_source(m_tokens, begin, end, mentions_sender(begin, end),
                                         direct_storage);
    }

    [[nodiscard]] ConditionFacts condition_facts(std::size_t begin, std::size_t end) const
    {
        ConditionFacts facts{.text = join_tokens(m_tokens, begin, end), .clauses = {}};
        std::vector<Span> clauses;
        for (const Span& part : split_top_level(m_tokens, begin, end, "&&")) {
            for (const Span& clause : split_top_level(m_tokens, part.begin, part.end, "||")) {
                clauses.push_back(clause);
            }
        }
        for (const Span& span : clauses) {
            ClauseFacts clause;
            for (std::size_t k = span.begin; k < span.end; ++k) {
                const Token& t = m_tokens[k];
                clause.compares = clause.compares || is_punct(t, "==") || is_punct(t, "!=");
                clause.mentions_sender = clause.mentions_sender || is_sender_at(k);
                clause.mentions_origin = clause.mentions_origin || is_origin_at(k);
                if (auto slot = slot_at(k)) {
                    clause.slots.push_back(*slot);
                }
                if (t.kind != TokenKind::kIdent) {
                    continue;
                }
                const bool member = k > span.begin
                                    && (is_punct(tok(k - 1), ".") || is_punct(tok(k - 1), "::"));
                if (is_punct(tok(k + 1), "(")) {
                    clause.calls.push_back(t.text);
                } else if (!member && (m_builder.is_param(t.text) || m_builder.is_local(t.text))) {
                    clause.idents.push_back(t.text);
                }
            }
            facts.clauses.push_back(std::move(clause));
        }
        return facts;
    }

    // ------------------------------------------------------------------
    // Expressions
    // ------------------------------------------------------------------

    void process_expr(std::size_t begin, std::size_t end, ExprContext ctx)
    {
        const bool storage_operands = reads_storage(begin, end);
        std::size_t k = begin;
        while (k < end) {
            const Token& t = m_tokens[k];
            if (is_ident(t, "self") && is_punct(tok(k + 1), ".")) {
                k = self_access(k, end, ctx);
                continue;
            }
            if (t.kind == TokenKind::kIdent && is_punct(tok(k + 1), "::")
                && (k == begin || !is_punct(tok(k - 1), "::"))) {
                k = path_expression(k, end, ctx);
                continue;
            }
            if (t.kind == TokenKind::kIdent && is_punct(tok(k + 1), "!")
                && (is_punct(tok(k + 2), "(") || is_punct(tok(k + 2), "[")
                    || is_punct(tok(k + 2), "{"))) {
                k = macro_call(k, end);
                continue;
            }
            if (t.kind == TokenKind::kIdent && is_punct(tok(k + 1), "(")
                && (k == begin || !is_punct(tok(k - 1), "."))) {
                k = free_call(k, end, ctx);
                continue;
            }
            if (is_punct(t, ".") && tok(k + 1).kind == TokenKind::kIdent && is_punct(tok(k + 2), "(")) {
                k = method_call(k, begin, end, ctx, storage_operands);
                continue;
            }
            if (is_punct(t, "[") && has_left_operand(m_tokens, k, begin)) {
                auto close = find_matching(m_tokens, k, end);
                const std::size_t stop = close.value_or(end);
                process_expr(k + 1, stop, ExprContext{.sink = ir::ArithmeticSink::kIndex});
                k = stop + 1;
                continue;
            }
            if (auto op = binary_operator(t); op && has_left_operand(m_tokens, k, begin)) {
                m_builder.emit(t,
                               ir::Arithmetic{.op = *op,
                                              .checked = false,
                                              .sink = ctx.sink,
                                              .operand_reads_storage = storage_operands});
                ++k;
                continue;
            }
            if (auto op = compound_operator(t)) {
                m_builder.emit(t,
                               ir::Arithmetic{.op = *op,
                                              .checked = false,
                                              .sink = ctx.sink,
                                              .operand_reads_storage = storage_operands});
                ++k;
                continue;
            }
            if (t.kind == TokenKind::kIdent && (k == begin || !is_punct(tok(k - 1), "."))) {
                note_local_use(k, ctx);
            }
            ++k;
        }
    }

    void note_local_use(std::size_t k, ExprContext ctx)
    {
        const std::string& name = m_tokens[k].text;
        if (ctx.sink != ir::ArithmeticSink::kNone) {
            m_builder.sink_local(name, ctx.sink);
        }
        const bool inspected = ctx.handled || is_punct(tok(k + 1), "?")
                               || (is_punct(tok(k + 1), ".")
                                   && contains(kResultHandlers, tok(k + 2).text));
        if (inspected) {
            m_builder.mark_result_handled(name);
        }
    }

    /// Marks the call at `index` handled when its result is consumed.
    void note_call_result(std::size_t index, std::size_t close, ExprContext ctx)
    {
        const bool handled = ctx.handled || is_punct(tok(close + 1), "?")
                             || (is_punct(tok(close + 1), ".")
                                 && contains(kResultHandlers, tok(close + 2).text));
        if (handled) {
            m_builder.mark_handled(index);
        }
    }

    [[nodiscard]] bool is_context_arg(const Span& arg) const
    {
        std::size_t k = arg.begin;
        while (k < arg.end && (is_punct(m_tokens[k], "&") || is_ident(m_tokens[k], "mut")
                               || is_punct(m_tokens[k], "*"))) {
            ++k;
        }
        if (k >= arg.end) {
            return false;
        }
        const std::string& text = m_tokens[k].text;
        return text == "self" || text == "Call" || text.find("ctx") != std::string::npos
               || text.find("context") != std::string::npos || text == "vm";
    }

    /// First argument of a call that is not an execution context.
    [[nodiscard]] std::optional<Span> target_arg(std::size_t open, std::size_t close) const
    {
        for (const Span& arg : split_top_level(m_tokens, open + 1, close, ",")) {
            if (!is_context_arg(arg)) {
                return arg;
            }
        }
        return std::nullopt;
    }

    std::size_t emit_external_call(const Token& at,
                                   ir::CallKind kind,
                                   std::optional<Span> target,
                                   std::string method,
                                   std::size_t open,
                                   std::size_t close,
                                   ExprContext ctx)
    {
        process_expr(open + 1, close, ExprContext{});
        std::string target_text;
        ir::ValueSource source = ir::ValueSource::kLocal;
        if (target) {
            std::size_t b = target->begin;
            while (b < target->end && (is_punct(m_tokens[b], "&") || is_punct(m_tokens[b], "*"))) {
                ++b;
            }
            target_text = join_tokens(m_tokens, b, target->end);
            source = source_of(target->begin, target->end);
            if (source == ir::ValueSource::kNone) {
                source = ir::ValueSource::kLocal;
            }
        }
        const std::size_t index = m_builder.emit(at,
                                                 ir::ExternalCall{.kind = kind,
                                                                  .target = std::move(target_text),
                                                                  .target_source = source,
                                                                  .method = std::move(method),
                                                                  .args = join_tokens(m_tokens, open + 1, close),
                                                                  .result_checked = false});
        note_call_result(index, close, ctx);
        return index;
    }

    std::size_t self_access(std::size_t k, std::size_t end, ExprContext ctx)
    {
        const Token& self_tok = m_tokens[k];
        const Token& member = tok(k + 2);
        if (member.kind != TokenKind::kIdent) {
            return k + 2;
        }

        // self.vm().accessor(...)
        if (member.text == "vm" && is_punct(tok(k + 3), "(") && is_punct(tok(k + 4), ")")) {
            if (!is_punct(tok(k + 5), ".") || tok(k + 6).kind != TokenKind::kIdent
                || !is_punct(tok(k + 7), "(")) {
                return k + 5;
            }
            const Token& method = tok(k + 6);
            auto close = find_matching(m_tokens, k + 7, end);
            const std::size_t stop = close.value_or(end);
            if (auto env = vm_environment_of(method.text)) {
                m_builder.emit(method, ir::EnvironmentRead{.kind = *env});
                if (*env == ir::EnvironmentKind::kOrigin) {
                    m_pending_origin = true;
                }
            } else if (auto kind = call_function_kind(method.text)) {
                emit_external_call(method, *kind, target_arg(k + 7, stop), method.text, k + 7, stop, ctx);
            } else if (method.text == "log" || method.text == "raw_log") {
                process_expr(k + 8, stop, ExprContext{});
                m_builder.emit(method, ir::EventEmission{.event = event_name(k + 8, stop)});
            } else {
                process_expr(k + 8, stop, ExprContext{});
            }
            return stop + 1;
        }

        // self.method(...) is an internal call.
        if (is_punct(tok(k + 3), "(")) {
            auto close = find_matching(m_tokens, k + 3, end);
            const std::size_t stop = close.value_or(end);
            process_expr(k + 4, stop, ExprContext{});
            m_builder.emit(member, ir::InternalCall{.callee = member.text});
            return stop + 1;
        }

        std::string slot = member.text;
        std::size_t j = k + 3;
        // Nested storage fields: self.erc20.balances.get(..)
        while (is_punct(tok(j), ".") && tok(j + 1).kind == TokenKind::kIdent
               && !is_punct(tok(j + 2), "(") && !m_symbols.slots.contains(slot)) {
            slot = tok(j + 1).text;
            j += 2;
        }

        if (is_punct(tok(j), ".") && tok(j + 1).kind == TokenKind::kIdent && is_punct(tok(j + 2), "(")) {
            return accessor_chain(self_tok, slot, j, end);
        }
        if (is_punct(tok(j), "=")) {
            process_expr(j + 1, end, ExprContext{.sink = ir::ArithmeticSink::kStorage});
            m_builder.emit(self_tok, ir::StorageWrite{.slot = slot, .key = "", .key_source = ir::ValueSource::kNone});
            return end;
        }
        if (auto op = compound_operator(tok(j))) {
            m_builder.emit(self_tok, ir::StorageRead{.slot = slot, .key = "", .key_source = ir::ValueSource::kNone});
            process_expr(j + 1, end, ExprContext{.sink = ir::ArithmeticSink::kStorage});
            m_builder.emit(tok(j),
                           ir::Arithmetic{.op = *op,
                                          .checked = false,
                                          .sink = ir::ArithmeticSink::kStorage,
                                          .operand_reads_storage = true});
            m_builder.emit(self_tok, ir::StorageWrite{.slot = slot, .key = "", .key_source = ir::ValueSource::kNone});
            return end;
        }
        if (is_punct(tok(j), "[")) {
            auto close = find_matching(m_tokens, j, end);
            const std::size_t stop = close.value_or(end);
            process_expr(j + 1, stop, ExprContext{.sink = ir::ArithmeticSink::kIndex});
            std::string key = join_tokens(m_tokens, j + 1, stop);
            const ir::ValueSource key_source = source_of(j + 1, stop);
            if (is_punct(tok(stop + 1), "=")) {
                process_expr(stop + 2, end, ExprContext{.sink = ir::ArithmeticSink::kStorage});
                m_builder.emit(self_tok, ir::StorageWrite{.slot = slot, .key = std::move(key), .key_source = key_source});
                return end;
            }
            m_builder.emit(self_tok, ir::StorageRead{.slot = slot, .key = std::move(key), .key_source = key_source});
            return stop + 1;
        }
        m_builder.emit(self_tok, ir::StorageRead{.slot = slot, .key = "", .key_source = ir::ValueSource::kNone});
        return j;
    }

    std::size_t accessor_chain(const Token& at, const std::string& slot, std::size_t dot, std::size_t end)
    {
        struct Accessor
        {
            std::string method;
            std::size_t open;
            std::size_t close;
        };
        std::vector<Accessor> chain;
        std::size_t j = dot;
        while (is_punct(tok(j), ".") && tok(j + 1).kind == TokenKind::kIdent && is_punct(tok(j + 2), "(")) {
            const std::string& method = tok(j + 1).text;
            if (!contains(kReadAccessors, method) && !contains(kWriteAccessors, method)) {
                break;
            }
            auto close = find_matching(m_tokens, j + 2, end);
            if (!close) {
                break;
            }
            chain.push_back(Accessor{.method = method, .open = j + 2, .close = *close});
            j = *close + 1;
        }

        if (chain.empty()) {
            // Method on a nested storage component: self.erc20.transfer(..)
            const Token& method = tok(dot + 1);
            auto close = find_matching(m_tokens, dot + 2, end);
            const std::size_t stop = close.value_or(end);
            process_expr(dot + 3, stop, ExprContext{});
            m_builder.emit(method, ir::InternalCall{.callee = method.text});
            return stop + 1;
        }

        const bool write = std::ranges::any_of(chain, [](const Accessor& accessor) {
            return contains(kWriteAccessors, accessor.method);
        });
        const ExprContext value_ctx{.sink = write ? ir::ArithmeticSink::kStorage : ir::ArithmeticSink::kNone};

        std::optional<Span> key;
        for (const auto& [i, accessor] : std::views::enumerate(chain)) {
            auto args = split_top_level(m_tokens, accessor.open + 1, accessor.close, ",");
            std::size_t first_value = 0;
            const bool keyless = accessor.method == "set" || accessor.method == "push";
            if (i == 0 && !keyless && !args.empty()) {
                key = args.front();
                process_expr(key->begin, key->end, ExprContext{.sink = ir::ArithmeticSink::kIndex});
                first_value = 1;
            }
            for (std::size_t a = first_value; a < args.size(); ++a) {
                process_expr(args[a].begin, args[a].end, value_ctx);
            }
        }

        std::string key_text;
        ir::ValueSource key_source = ir::ValueSource::kNone;
        if (key) {
            std::size_t b = key->begin;
            while (b < key->end && is_punct(m_tokens[b], "&")) {
                ++b;
            }
            key_text = join_tokens(m_tokens, b, key->end);
            key_source = source_of(key->begin, key->end);
        }
        if (write) {
            m_builder.emit(at, ir::StorageWrite{.slot = slot, .key = std::move(key_text), .key_source = key_source});
        } else {
            m_builder.emit(at, ir::StorageRead{.slot = slot, .key = std::move(key_text), .key_source = key_source});
        }
        return chain.back().close + 1;
    }

    std::size_t path_expression(std::size_t k, std::size_t end, ExprContext ctx)
    {
        std::vector<std::size_t> segments{k};
        std::size_t j = k + 1;
        while (is_punct(tok(j), "::")) {
            if (is_punct(tok(j + 1), "<")) {
                // Turbofish: skip generic arguments.
                int depth = 0;
                ++j;
                for (; j < end; ++j) {
                    if (is_punct(tok(j), "<")) {
                        ++depth;
                    } else if (is_punct(tok(j), ">")) {
                        if (--depth == 0) {
                            break;
                        }
                    } else if (is_punct(tok(j), ">>")) {
                        depth -= 2;
                        if (depth <= 0) {
                            break;
                        }
                    }
                }
                ++j;
                continue;
            }
            if (tok(j + 1).kind != TokenKind::kIdent) {
                break;
            }
            segments.push_back(j + 1);
            j += 2;
        }
        const Token& last = tok(segments.back());
        const std::string prev = segments.size() >= 2 ? tok(segments[segments.size() - 2]).text : "";
        const bool is_call = is_punct(tok(j), "(");
        if (!is_call) {
            return j;
        }
        auto close = find_matching(m_tokens, j, end);
        const std::size_t stop = close.value_or(end);
        const auto has_segment = [&](std::string_view name) {
            return std::ranges::any_of(segments, [&](std::size_t s) { return tok(s).text == name; });
        };

        if (auto env = environment_of(prev, last.text)) {
            m_builder.emit(last, ir::EnvironmentRead{.kind = *env});
            if (*env == ir::EnvironmentKind::kOrigin) {
                m_pending_origin = true;
            }
            return stop + 1;
        }
        if ((prev == "msg" && last.text == "send") || last.text == "transfer_eth") {
            emit_external_call(last, ir::CallKind::kValueTransfer, target_arg(j, stop), last.text, j, stop, ctx);
            return stop + 1;
        }
        if (prev == "call" && call_function_kind(last.text)) {
            emit_external_call(last, *call_function_kind(last.text), target_arg(j, stop), last.text, j, stop, ctx);
            return stop + 1;
        }
        if (prev == "RawCall") {
            return raw_call(last, j, stop, end, ctx);
        }
        if (last.text == "new" && is_interface_name(prev, m_symbols.interfaces) && is_punct(tok(stop + 1), ".")
            && tok(stop + 2).kind == TokenKind::kIdent && is_punct(tok(stop + 3), "(")) {
            const Token& method = tok(stop + 2);
            auto method_close = find_matching(m_tokens, stop + 3, end);
            const std::size_t method_stop = method_close.value_or(end);
            process_expr(j + 1, stop, ExprContext{});
            const ir::CallKind kind = static_context(stop + 4, method_stop) ? ir::CallKind::kStaticCall
                                                                            : ir::CallKind::kCall;
            emit_external_call(method, kind, Span{.begin = j + 1, .end = stop}, method.text, stop + 3,
                               method_stop, ctx);
            return method_stop + 1;
        }
        if (has_segment("hostio") || has_segment("vm_hooks")) {
            process_expr(j + 1, stop, ExprContext{});
            m_builder.emit(last, ir::OpaqueOperation{.mnemonic = "hostio::" + last.text});
            return stop + 1;
        }
        if ((prev == "evm" || prev == "stylus_sdk") && (last.text == "log" || last.text == "raw_log")) {
            process_expr(j + 1, stop, ExprContext{});
            m_builder.emit(last, ir::EventEmission{.event = event_name(j + 1, stop)});
            return stop + 1;
        }
        if (prev == "Self" && m_symbols.functions.contains(last.text)) {
            process_expr(j + 1, stop, ExprContext{});
            m_builder.emit(last, ir::InternalCall{.callee = last.text});
            return stop + 1;
        }
        if (contains(kAllocatingTypes, prev)
            && (last.text == "new" || last.text == "with_capacity" || last.text == "default")) {
            process_expr(j + 1, stop, ExprContext{});
            m_builder.emit(last,
                           ir::MemoryAllocation{.description = prev + "::" + last.text,
                                                .preallocated = last.text == "with_capacity"});
            return stop + 1;
        }
        process_expr(j + 1, stop, ExprContext{});
        return stop + 1;
    }

    /// Call::new() is the read-only call context.
    [[nodiscard]] bool static_context(std::size_t begin, std::size_t end) const
    {
        for (std::size_t k = begin; k + 3 < end; ++k) {
            if (is_ident(m_tokens[k], "Call") && is_punct(tok(k + 1), "::") && is_ident(tok(k + 2), "new")
                && is_punct(tok(k + 3), "(") && is_punct(tok(k + 4), ")")) {
                return true;
            }
        }
        return false;
    }

    std::size_t raw_call(const Token& constructor,
                         std::size_t open,
                         std::size_t stop,
                         std::size_t end,
                         ExprContext ctx)
    {
        ir::CallKind kind = ir::CallKind::kCall;
        if (constructor.text == "new_delegate") {
            kind = ir::CallKind::kDelegateCall;
        } else if (constructor.text == "new_static") {
            kind = ir::CallKind::kStaticCall;
        }
        process_expr(open + 1, stop, ExprContext{});
        // Builder methods follow until `.call(target, data)`.
        std::size_t j = stop + 1;
        while (is_punct(tok(j), ".") && tok(j + 1).kind == TokenKind::kIdent && is_punct(tok(j + 2), "(")) {
            auto close = find_matching(m_tokens, j + 2, end);
            if (!close) {
                break;
            }
            if (tok(j + 1).text == "call" || tok(j + 1).text == "call_raw") {
                auto args = split_top_level(m_tokens, j + 3, *close, ",");
                std::optional<Span> target;
                if (!args.empty()) {
                    target = args.front();
                }
                emit_external_call(tok(j + 1), kind, target, "raw", j + 2, *close, ctx);
                return *close + 1;
            }
            process_expr(j + 3, *close, ExprContext{});
            j = *close + 1;
        }
        return j;
    }

    std::size_t macro_call(std::size_t k, std::size_t end)
    {
        const Token& name = m_tokens[k];
        auto close = find_matching(m_tokens, k + 2, end);
        const std::size_t stop = close.value_or(end);
        const std::size_t args_begin = k + 3;

        if (name.text == "require" || name.text == "ensure" || name.text == "assert"
            || name.text == "assert_eq" || name.text == "assert_ne") {
            auto args = split_top_level(m_tokens, args_begin, stop, ",");
            process_expr(args_begin, stop, ExprContext{.handled = true});
            ConditionFacts facts;
            if (name.text == "assert_eq" || name.text == "assert_ne") {
                facts = condition_facts(args_begin, args.size() >= 2 ? args[1].end : stop);
                facts.text = args.size() >= 2
                                 ? std::format("{} {} {}",
                                               join_tokens(m_tokens, args[0].begin, args[0].end),
                                               name.text == "assert_eq" ? "==" : "!=",
                                               join_tokens(m_tokens, args[1].begin, args[1].end))
                                 : facts.text;
                for (auto& clause : facts.clauses) {
                    clause.compares = true;
                }
            } else if (!args.empty()) {
                facts = condition_facts(args.front().begin, args.front().end);
            }
            m_builder.emit_branch(name, facts, true);
            return stop + 1;
        }
        process_expr(args_begin, stop, ExprContext{});
        if (name.text == "vec") {
            m_builder.emit(name, ir::MemoryAllocation{.description = "vec!", .preallocated = true});
        } else if (name.text == "format") {
            m_builder.emit(name, ir::MemoryAllocation{.description = "format!", .preallocated = false});
        } else if (name.text == "emit") {
            m_builder.emit(name, ir::EventEmission{.event = event_name(args_begin, stop)});
        } else if (!contains(kQuietMacros, name.text) && !name.text.starts_with("assert")) {
            m_builder.emit(name, ir::OpaqueOperation{.mnemonic = name.text + "!"});
        }
        return stop + 1;
    }

    std::size_t free_call(std::size_t k, std::size_t end, ExprContext ctx)
    {
        const Token& name = m_tokens[k];
        auto close = find_matching(m_tokens, k + 1, end);
        const std::size_t stop = close.value_or(end);
        if (auto kind = call_function_kind(name.text)) {
            emit_external_call(name, *kind, target_arg(k + 1, stop), name.text, k + 1, stop, ctx);
            return stop + 1;
        }
        if (name.text == "log") {
            process_expr(k + 2, stop, ExprContext{});
            m_builder.emit(name, ir::EventEmission{.event = event_name(k + 2, stop)});
            return stop + 1;
        }
        if (m_symbols.functions.contains(name.text)) {
            process_expr(k + 2, stop, ExprContext{});
            m_builder.emit(name, ir::InternalCall{.callee = name.text});
            return stop + 1;
        }
        // Constructors and enum variants (Ok(..), Some(..)) pass their context through.
        process_expr(k + 2, stop, ctx);
        return stop + 1;
    }

    std::size_t method_call(std::size_t dot,
                            std::size_t floor,
                            std::size_t end,
                            ExprContext ctx,
                            bool storage_operands)
    {
        const Token& method = tok(dot + 1);
        auto close = find_matching(m_tokens, dot + 2, end);
        const std::size_t stop = close.value_or(end);

        if (auto arithmetic = arithmetic_method(method.text)) {
            process_expr(dot + 3, stop, ExprContext{});
            m_builder.emit(method,
                           ir::Arithmetic{.op = arithmetic->first,
                                          .checked = arithmetic->second,
                                          .sink = ctx.sink,
                                          .operand_reads_storage = storage_operands});
            return stop + 1;
        }

        auto args = split_top_level(m_tokens, dot + 3, stop, ",");
        const bool typed_call = !args.empty() && is_ident(tok(args.front().begin), "Call")
                                && is_punct(tok(args.front().begin + 1), "::");
        if (typed_call) {
            const std::size_t recv = receiver_begin(m_tokens, dot, floor);
            const ir::CallKind kind = static_context(dot + 3, stop) ? ir::CallKind::kStaticCall
                                                                    : ir::CallKind::kCall;
            emit_external_call(method, kind, Span{.begin = recv, .end = dot}, method.text, dot + 2, stop, ctx);
            return stop + 1;
        }

        const std::size_t recv = receiver_begin(m_tokens, dot, floor);
        if (recv + 1 == dot && m_tokens[recv].kind == TokenKind::kIdent
            && (method.text == "push" || method.text == "extend" || method.text == "extend_from_slice"
                || method.text == "push_str" || method.text == "insert")) {
            if (auto preallocated = m_builder.collection_preallocated(m_tokens[recv].text)) {
                process_expr(dot + 3, stop, ExprContext{});
                m_builder.emit(method,
                               ir::MemoryAllocation{.description = "grow " + m_tokens[recv].text,
                                                    .preallocated = *preallocated});
                return stop + 1;
            }
        }
        process_expr(dot + 3, stop, ExprContext{});
        return stop + 1;
    }

    [[nodiscard]] std::string event_name(std::size_t begin, std::size_t end) const
    {
        for (std::size_t k = begin; k < end; ++k) {
            const Token& t = m_tokens[k];
            if (t.kind == TokenKind::kIdent && std::isupper(static_cast<unsigned char>(t.text.front())) != 0
                && (is_punct(tok(k + 1), "{") || is_punct(tok(k + 1), "("))) {
                return t.text;
            }
        }
        return "log";
    }

    const std::vector<Token>& m_tokens;
    BodyBuilder& m_builder;
    const RustSymbols& m_symbols;
    NameSet m_origin_locals;  ///< Locals bound to tx.origin
    bool m_pending_origin = false;
};

// ----------------------------------------------------------------------
// Items
// ----------------------------------------------------------------------

struct PendingFunction
{
    ir::Function function;
    std::string owner;  ///< impl target type; empty for free functions
    std::size_t body_begin = 0;
    std::size_t body_end = 0;
};

struct ItemPrefix
{
    std::vector<std::string> attrs;
    std::vector<std::string> docs;
    bool is_pub = false;

    void clear()
    {
        attrs.clear();
        docs.clear();
        is_pub = false;
    }

    [[nodiscard]] bool has_attr(std::string_view name) const
    {
        return std::ranges::any_of(attrs, [name](const std::string& attr) {
            return attr == name || attr.starts_with(std::string(name) + " ")
                   || attr.starts_with(std::string(name) + "(") || attr.ends_with("::" + std::string(name));
        });
    }

    [[nodiscard]] std::string doc() const
    {
        std::string text;
        for (const auto& line : docs) {
            if (line.empty()) {
                continue;
            }
            if (!text.empty()) {
                text += ' ';
            }
            text += line;
        }
        return text;
    }
};

class RustParser
{
public:
    RustParser(std::vector<Token> tokens, const ParseContext& context)
        : m_tokens(std::move(tokens))
        , m_context(context)
    {}

    [[nodiscard]] Result<ir::ContractModel> run()
    {
        m_has_public_attr = scan_public_attributes();
        parse_items(0, m_tokens.size(), ImplScope{});

        ir::ContractModel model;
        model.name = contract_name();
        model.slots = std::move(m_slots);
        model.diagnostics = std::move(m_diagnostics);

        RustSymbols symbols;
        for (const auto& slot : model.slots) {
            symbols.slots.insert(slot.name);
        }
        symbols.interfaces = m_interfaces;
        const bool filter_owners = !m_storage_types.empty();
        std::vector<PendingFunction*> kept;
        for (auto& pending : m_pending) {
            if (filter_owners && !pending.owner.empty() && !m_storage_types.contains(pending.owner)) {
                continue;
            }
            symbols.functions.insert(pending.function.name);
            kept.push_back(&pending);
        }

        for (PendingFunction* pending : kept) {
            BodyBuilder builder(pending->function, m_context.file);
            RustBodyWalker walker(m_tokens, builder, symbols);
            walker.walk_block(pending->body_begin, pending->body_end);
            model.functions.push_back(std::move(pending->function));
        }
        return model;
    }

private:
    struct ImplScope
    {
        bool in_impl = false;
        bool exported = false;
        std::string owner;
    };

    [[nodiscard]] const Token& tok(std::size_t i) const
    {
        static const Token kEnd{};
        return i < m_tokens.size() ? m_tokens[i] : kEnd;
    }

    void diagnose(const Token& at, std::string message)
    {
        m_diagnostics.push_back(ir::Diagnostic{.code = std::string(error_code::kParseError),
                                               .message = std::move(message),
                                               .location = location_of(at, m_context.file)});
    }

    [[nodiscard]] bool scan_public_attributes() const
    {
        for (std::size_t i = 0; i + 2 < m_tokens.size(); ++i) {
            if (is_punct(m_tokens[i], "#") && is_punct(m_tokens[i + 1], "[")
                && (is_ident(m_tokens[i + 2], "public") || is_ident(m_tokens[i + 2], "external"))) {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] std::string contract_name() const
    {
        if (!m_context.contract_name.empty()) {
            return m_context.contract_name;
        }
        if (!m_entrypoint.empty()) {
            return m_entrypoint;
        }
        if (!m_storage_order.empty()) {
            return m_storage_order.front();
        }
        return {};
    }

    void parse_items(std::size_t begin, std::size_t end, const ImplScope& scope)
    {
        ItemPrefix prefix;
        std::size_t i = begin;
        while (i < end) {
            const Token& t = m_tokens[i];
            if (t.kind == TokenKind::kDoc) {
                prefix.docs.push_back(t.text);
                ++i;
                continue;
            }
            if (is_punct(t, "#")) {
                i = parse_attribute(i, end, prefix);
                continue;
            }
            if (is_ident(t, "pub")) {
                prefix.is_pub = true;
                ++i;
                if (is_punct(tok(i), "(")) {
                    auto close = find_matching(m_tokens, i, end);
                    i = close ? *close + 1 : i + 1;
                }
                continue;
            }
            if ((is_ident(t, "async") || is_ident(t, "default")
                 || (is_ident(t, "const") && is_ident(tok(i + 1), "fn"))
                 || (is_ident(t, "unsafe") && (is_ident(tok(i + 1), "fn") || is_ident(tok(i + 1), "impl"))))) {
                ++i;
                continue;
            }
            if (is_ident(t, "extern") && (is_ident(tok(i + 1), "fn") || tok(i + 1).kind == TokenKind::kString)) {
                i += tok(i + 1).kind == TokenKind::kString ? 2 : 1;
                continue;
            }
            if (is_ident(t, "fn")) {
                i = parse_function(i, end, prefix, scope);
                prefix.clear();
                continue;
            }
            if (is_ident(t, "sol_storage") && is_punct(tok(i + 1), "!")) {
                i = parse_sol_storage(i + 2, end);
                prefix.clear();
                continue;
            }
            if (is_ident(t, "sol_interface") && is_punct(tok(i + 1), "!")) {
                i = parse_sol_interface(i + 2, end);
                prefix.clear();
                continue;
            }
            if (is_ident(t, "struct") && !scope.in_impl) {
                i = parse_struct(i, end, prefix);
                prefix.clear();
                continue;
            }
            if (is_ident(t, "impl") && !scope.in_impl) {
                i = parse_impl(i, end, prefix);
                prefix.clear();
                continue;
            }
            if (is_ident(t, "mod") && tok(i + 1).kind == TokenKind::kIdent && is_punct(tok(i + 2), "{")) {
                auto close = find_matching(m_tokens, i + 2, end);
                const std::size_t stop = close.value_or(end);
                parse_items(i + 3, stop, scope);
                i = stop + 1;
                prefix.clear();
                continue;
            }
            i = skip_item(i, end);
            prefix.clear();
        }
    }

    std::size_t parse_attribute(std::size_t i, std::size_t end, ItemPrefix& prefix)
    {
        std::size_t open = i + 1;
        if (is_punct(tok(open), "!")) {
            ++open;
        }
        if (!is_punct(tok(open), "[")) {
            return i + 1;
        }
        auto close = find_matching(m_tokens, open, end);
        if (!close) {
            diagnose(m_tokens[i], "unterminated attribute");
            return end;
        }
        if (open == i + 1) {
            if (is_ident(tok(open + 1), "doc") && is_punct(tok(open + 2), "=")
                && tok(open + 3).kind == TokenKind::kString) {
                prefix.docs.push_back(tok(open + 3).text);
            } else {
                prefix.attrs.push_back(join_tokens(m_tokens, open + 1, *close));
            }
        }
        return *close + 1;
    }

    std::size_t skip_item(std::size_t i, std::size_t end)
    {
        for (std::size_t j = i; j < end; ++j) {
            const Token& t = m_tokens[j];
            if (is_punct(t, ";")) {
                return j + 1;
            }
            if (is_punct(t, "{") || is_punct(t, "(") || is_punct(t, "[")) {
                auto close = find_matching(m_tokens, j, end);
                if (!close) {
                    return end;
                }
                if (is_punct(t, "{")) {
                    return *close + 1;
                }
                j = *close;
                continue;
            }
            if (j > i && (is_ident(t, "fn") || is_ident(t, "impl") || is_ident(t, "struct"))) {
                return j;
            }
        }
        return end;
    }

    void add_slot(const Token& name, std::string type)
    {
        ir::SlotKind kind = ir::SlotKind::kValue;
        if (type.starts_with("mapping") || type.starts_with("StorageMap")) {
            kind = ir::SlotKind::kMapping;
        } else if (type.ends_with("[]") || type.starts_with("StorageVec") || type.starts_with("StorageArray")
                   || type.find("[ ]") != std::string::npos) {
            kind = ir::SlotKind::kArray;
        }
        m_slots.push_back(ir::StorageSlot{.name = name.text,
                                          .type = std::move(type),
                                          .kind = kind,
                                          .location = location_of(name, m_context.file),
                                          .access = ir::AccessPattern::kUnused,
                                          .readers = {},
                                          .writers = {}});
    }

    /// sol_storage! { #[entrypoint] pub struct Name { uint256 count; ... } }
    std::size_t parse_sol_storage(std::size_t open, std::size_t end)
    {
        if (!is_punct(tok(open), "{") && !is_punct(tok(open), "(")) {
            return open;
        }
        auto close = find_matching(m_tokens, open, end);
        if (!close) {
            diagnose(tok(open), "unterminated sol_storage! block");
            return end;
        }
        bool entrypoint = false;
        for (std::size_t i = open + 1; i < *close;) {
            if (is_punct(m_tokens[i], "#") && is_punct(tok(i + 1), "[")) {
                entrypoint = entrypoint || is_ident(tok(i + 2), "entrypoint");
                auto attr_close = find_matching(m_tokens, i + 1, *close);
                i = attr_close ? *attr_close + 1 : *close;
                continue;
            }
            if (is_ident(m_tokens[i], "struct") && tok(i + 1).kind == TokenKind::kIdent) {
                const std::string name = tok(i + 1).text;
                std::size_t body = i + 2;
                while (body < *close && !is_punct(m_tokens[body], "{")) {
                    ++body;
                }
                auto body_close = find_matching(m_tokens, body, *close);
                if (!body_close) {
                    diagnose(m_tokens[i], std::format("unterminated storage struct '{}'", name));
                    break;
                }
                register_storage_type(name, entrypoint);
                entrypoint = false;
                std::size_t field_begin = body + 1;
                for (std::size_t f = body + 1; f < *body_close; ++f) {
                    if (!is_punct(m_tokens[f], ";")) {
                        continue;
                    }
                    if (f - field_begin >= 2 && tok(f - 1).kind == TokenKind::kIdent) {
                        add_slot(tok(f - 1), join_tokens(m_tokens, field_begin, f - 1));
                    }
                    field_begin = f + 1;
                }
                i = *body_close + 1;
                continue;
            }
            ++i;
        }
        return *close + 1;
    }

    std::size_t parse_sol_interface(std::size_t open, std::size_t end)
    {
        auto close = find_matching(m_tokens, open, end);
        const std::size_t stop = close.value_or(end);
        for (std::size_t i = open + 1; i + 1 < stop; ++i) {
            if (is_ident(m_tokens[i], "interface") && tok(i + 1).kind == TokenKind::kIdent) {
                m_interfaces.insert(tok(i + 1).text);
            }
        }
        return stop + 1;
    }

    void register_storage_type(const std::string& name, bool entrypoint)
    {
        if (m_storage_types.insert(name).second) {
            m_storage_order.push_back(name);
        }
        if (entrypoint && m_entrypoint.empty()) {
            m_entrypoint = name;
        }
    }

    std::size_t parse_struct(std::size_t i, std::size_t end, const ItemPrefix& prefix)
    {
        const Token& name = tok(i + 1);
        if (name.kind != TokenKind::kIdent) {
            return skip_item(i, end);
        }
        std::size_t body = i + 2;
        if (is_punct(tok(body), "<")) {
            while (body < end && !is_punct(m_tokens[body], "{") && !is_punct(m_tokens[body], ";")
                   && !is_punct(m_tokens[body], "(")) {
                ++body;
            }
        }
        if (!is_punct(tok(body), "{")) {
            return skip_item(i, end);
        }
        auto close = find_matching(m_tokens, body, end);
        if (!close) {
            diagnose(name, std::format("unterminated struct '{}'", name.text));
            return end;
        }

        struct Field
        {
            std::size_t name;
            std::string type;
        };
        // Commas inside generic arguments (StorageMap<K, V>) do not separate fields.
        std::vector<Span> spans;
        int angle = 0;
        for (const Span& part : split_top_level(m_tokens, body + 1, *close, ",")) {
            if (angle > 0 && !spans.empty()) {
                spans.back().end = part.end;
            } else {
                spans.push_back(part);
            }
            for (std::size_t k = part.begin; k < part.end; ++k) {
                if (is_punct(m_tokens[k], "<")) {
                    ++angle;
                } else if (is_punct(m_tokens[k], ">")) {
                    --angle;
                } else if (is_punct(m_tokens[k], ">>")) {
                    angle -= 2;
                }
            }
            angle = std::max(angle, 0);
        }

        std::vector<Field> fields;
        for (const Span& field : spans) {
            std::size_t b = field.begin;
            while (b < field.end && (m_tokens[b].kind == TokenKind::kDoc || is_ident(m_tokens[b], "pub"))) {
                ++b;
            }
            // Field attributes such as #[borrow].
            while (b < field.end && is_punct(m_tokens[b], "#")) {
                auto attr_close = find_matching(m_tokens, b + 1, field.end);
                b = attr_close ? *attr_close + 1 : field.end;
            }
            if (b + 2 <= field.end && m_tokens[b].kind == TokenKind::kIdent && is_punct(tok(b + 1), ":")) {
                fields.push_back(Field{.name = b, .type = join_tokens(m_tokens, b + 2, field.end)});
            }
        }

        const bool marked = prefix.has_attr("storage") || prefix.has_attr("entrypoint")
                            || prefix.has_attr("solidity_storage") || prefix.has_attr("contract");
        const bool storage_fields = std::ranges::any_of(fields, [](const Field& field) {
            return field.type.starts_with("Storage");
        });
        if (marked || storage_fields) {
            register_storage_type(name.text, prefix.has_attr("entrypoint") || prefix.has_attr("contract"));
            for (const auto& field : fields) {
                add_slot(m_tokens[field.name], field.type);
            }
        }
        return *close + 1;
    }

    std::size_t parse_impl(std::size_t i, std::size_t end, const ItemPrefix& prefix)
    {
        std::size_t open = i + 1;
        std::string owner;
        bool after_for = false;
        int angle = 0;
        for (; open < end && !is_punct(m_tokens[open], "{"); ++open) {
            const Token& t = m_tokens[open];
            if (is_punct(t, "<")) {
                ++angle;
            } else if (is_punct(t, ">")) {
                --angle;
            } else if (is_punct(t, ">>")) {
                angle -= 2;
            } else if (is_ident(t, "for") && angle == 0) {
                after_for = true;
                owner.clear();
            } else if (is_ident(t, "where")) {
                break;
            } else if (t.kind == TokenKind::kIdent && angle == 0 && (owner.empty() || after_for)) {
                owner = t.text;
                after_for = false;
            }
        }
        while (open < end && !is_punct(m_tokens[open], "{")) {
            ++open;
        }
        if (open >= end) {
            diagnose(m_tokens[i], "impl block without a body");
            return end;
        }
        auto close = find_matching(m_tokens, open, end);
        const std::size_t stop = close.value_or(end);

        const bool exported = prefix.has_attr("public") || prefix.has_attr("external")
                              || (!m_has_public_attr && !owner.empty());
        parse_items(open + 1, stop, ImplScope{.in_impl = true, .exported = exported, .owner = owner});
        return stop + 1;
    }

    /// Resume point after a malformed function starting at `from`.
    [[nodiscard]] std::size_t recover(std::size_t from, std::size_t end) const
    {
        for (std::size_t j = from; j < end; ++j) {
            const Token& t = m_tokens[j];
            if (is_punct(t, ";")) {
                return j + 1;
            }
            if (is_punct(t, "{")) {
                auto close = find_matching(m_tokens, j, end);
                return close ? *close + 1 : next_item(j + 1, end);
            }
            if (j > from && is_ident(t, "fn")) {
                return item_start(j, from);
            }
        }
        return end;
    }

    /// Back up over `pub`, attributes and docs that precede an `fn` at j.
    [[nodiscard]] std::size_t item_start(std::size_t j, std::size_t floor) const
    {
        while (j > floor && is_ident(m_tokens[j - 1], "pub")) {
            --j;
        }
        return j;
    }

    [[nodiscard]] std::size_t next_item(std::size_t from, std::size_t end) const
    {
        for (std::size_t j = from; j < end; ++j) {
            if (is_ident(m_tokens[j], "fn") && j > 0 && is_ident(m_tokens[j - 1], "pub")) {
                return j - 1;
            }
        }
        return end;
    }

    /// Matching '}' for a function body. A `pub fn` inside the body means the
    /// body was never closed.
    [[nodiscard]] std::optional<std::size_t> body_close(std::size_t open, std::size_t end) const
    {
        int depth = 0;
        for (std::size_t j = open; j < end; ++j) {
            const Token& t = m_tokens[j];
            if (is_punct(t, "{")) {
                ++depth;
            } else if (is_punct(t, "}")) {
                if (--depth == 0) {
                    return j;
                }
            } else if (is_ident(t, "fn") && is_ident(m_tokens[j - 1], "pub")) {
                return std::nullopt;
            }
        }
        return std::nullopt;
    }

    std::size_t parse_function(std::size_t i, std::size_t end, const ItemPrefix& prefix, const ImplScope& scope)
    {
        const Token& keyword = m_tokens[i];
        const Token& name = tok(i + 1);
        if (name.kind != TokenKind::kIdent || i + 1 >= end) {
            diagnose(keyword, "expected function name after 'fn'");
            return recover(i + 1, end);
        }
        std::size_t j = i + 2;
        if (is_punct(tok(j), "<")) {
            int depth = 0;
            for (; j < end; ++j) {
                if (is_punct(m_tokens[j], "<")) {
                    ++depth;
                } else if (is_punct(m_tokens[j], ">")) {
                    --depth;
                } else if (is_punct(m_tokens[j], ">>")) {
                    depth -= 2;
                }
                if (depth <= 0) {
                    ++j;
                    break;
                }
            }
        }
        if (!is_punct(tok(j), "(")) {
            diagnose(name, std::format("expected parameter list for function '{}'", name.text));
            return recover(j, end);
        }

        // Parameter list: a '{' or ';' before the closing ')' means it never closed.
        std::optional<std::size_t> params_close;
        int depth = 0;
        for (std::size_t k = j; k < end; ++k) {
            const Token& t = m_tokens[k];
            if (is_punct(t, "{") || is_punct(t, ";")) {
                break;
            }
            if (is_punct(t, "(")) {
                ++depth;
            } else if (is_punct(t, ")") && --depth == 0) {
                params_close = k;
                break;
            }
        }
        if (!params_close) {
            diagnose(name, std::format("unterminated parameter list in function '{}'", name.text));
            return recover(j, end);
        }

        std::size_t open = *params_close + 1;
        while (open < end && !is_punct(m_tokens[open], "{") && !is_punct(m_tokens[open], ";")) {
            ++open;
        }
        if (open >= end) {
            diagnose(name, std::format("missing body for function '{}'", name.text));
            return end;
        }
        if (is_punct(m_tokens[open], ";")) {
            return open + 1;  // declaration only (trait item)
        }
        auto close = body_close(open, end);
        if (!close) {
            diagnose(name, std::format("unterminated body in function '{}'", name.text));
            return next_item(open + 1, end);
        }

        ir::Function function;
        function.name = name.text;
        function.doc = prefix.doc();
        function.location = location_of(name, m_context.file);
        if (scope.in_impl && scope.exported) {
            function.visibility = prefix.is_pub ? ir::Visibility::kPublic : ir::Visibility::kInternal;
        } else {
            function.visibility = prefix.is_pub ? ir::Visibility::kInternal : ir::Visibility::kPrivate;
        }
        function.mutability = ir::Mutability::kPure;
        for (const Span& param : split_top_level(m_tokens, j + 1, *params_close, ",")) {
            std::size_t b = param.begin;
            const bool borrowed = b < param.end && is_punct(m_tokens[b], "&");
            while (b < param.end && (is_punct(m_tokens[b], "&") || is_ident(m_tokens[b], "mut"))) {
                ++b;
            }
            if (b < param.end && is_ident(m_tokens[b], "self")) {
                const bool mutable_self = param.end - param.begin >= 3 || !borrowed;
                function.mutability = mutable_self ? ir::Mutability::kNone : ir::Mutability::kView;
                continue;
            }
            if (b < param.end && m_tokens[b].kind == TokenKind::kIdent) {
                function.params.push_back(m_tokens[b].text);
            }
        }
        for (const auto& attr : prefix.attrs) {
            const std::string modifier_name = attr.substr(0, attr.find_first_of(" ("));
            if (contains(kIgnoredAttributes, modifier_name)) {
                continue;
            }
            ir::ModifierKind kind = ir::ModifierKind::kOther;
            if (modifier_name == "payable") {
                kind = ir::ModifierKind::kPayable;
                function.mutability = ir::Mutability::kPayable;
            } else if (is_reentrancy_guard_name(modifier_name)) {
                kind = ir::ModifierKind::kReentrancyGuard;
            } else if (is_access_control_name(modifier_name)) {
                kind = ir::ModifierKind::kAccessControl;
            }
            function.modifiers.push_back(ir::Modifier{.name = modifier_name, .kind = kind});
        }

        m_pending.push_back(PendingFunction{.function = std::move(function),
                                            .owner = scope.in_impl ? scope.owner : std::string(),
                                            .body_begin = open + 1,
                                            .body_end = *close});
        return *close + 1;
    }

    std::vector<Token> m_tokens;
    const ParseContext& m_context;
    bool m_has_public_attr = false;
    std::vector<ir::StorageSlot> m_slots;
    std::vector<ir::Diagnostic> m_diagnostics;
    std::vector<PendingFunction> m_pending;
    NameSet m_storage_types;
    std::vector<std::string> m_storage_order;
    std::string m_entrypoint;
    NameSet m_interfaces;
};

}  // namespace

Result<ir::ContractModel> parse_stylus_rust(std::string_view source, const ParseContext& context)
{
    auto lexed = tokenize(source, context.file, rust_lex_options());
    auto model = RustParser(std::move(lexed.tokens), context).run();
    if (model && lexed.fault) {
        model->diagnostics.push_back(ir::to_diagnostic(*lexed.fault));
    }
    return model;
}

}  // namespace stylint::frontend
