/**
 * @file solidity_frontend.cpp
 * @brief Solidity front end
 *
 * Selects one contract from the file (the named one, otherwise the last
 * contract or library), merges state variables and modifier declarations of
 * parents defined in the same file, and walks function bodies into IR
 * operations.
 */

#include "body_builder.hpp"
#include "frontends.hpp"
#include "lexer.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <format>
#include <map>
#include <optional>
#include <ranges>
#include <set>
#include <span>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace stylint::frontend {

namespace {

using NameSet = std::set<std::string, std::less<>>;

constexpr std::array<std::string_view, 3> kDataLocations = {"memory", "storage", "calldata"};

constexpr std::array<std::string_view, 12> kFunctionKeywords = {
    "public", "external", "internal", "private", "view",     "pure",
    "payable", "virtual", "override", "returns", "constant", "nonpayable",
};

constexpr std::array<std::string_view, 6> kSkippedMembers = {
    "event", "error", "using", "struct", "enum", "type",
};

/// Interface methods that report failure through a bool result.
constexpr std::array<std::string_view, 4> kBoolReturningMethods = {
    "transfer", "transferFrom", "approve", "send",
};

constexpr std::array<std::string_view, 5> kSafeMathMethods = {"add", "sub", "mul", "div", "mod"};

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
        {"**", ir::ArithmeticOp::kPow},
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

/// "^0.8.19" -> true. Absent or unparsable pragmas assume a current compiler.
[[nodiscard]] bool checked_by_default(std::string_view version)
{
    while (!version.empty() && std::isdigit(static_cast<unsigned char>(version.front())) == 0) {
        version.remove_prefix(1);
    }
    int major = 0;
    int minor = 0;
    const char* end = version.data() + version.size();
    auto [ptr, ec] = std::from_chars(version.data(), end, major);
    if (ec != std::errc{} || ptr == end || *ptr != '.') {
        return true;
    }
    std::tie(ptr, ec) = std::from_chars(ptr + 1, end, minor);
    if (ec != std::errc{}) {
        return true;
    }
    return major > 0 || minor >= 8;
}

struct ContractDecl
{
    std::string name;
    std::size_t name_index = 0;
    std::vector<std::string> parents;
    std::size_t body_begin = 0;
    std::size_t body_end = 0;
};

/// Symbols visible inside function bodies of the selected contract.
struct SoliditySymbols
{
    NameSet state_vars;
    NameSet interface_vars;  ///< State variables of interface type
    NameSet functions;
    NameSet interfaces;
    bool checked_arithmetic = true;
};

class SolidityBodyWalker
{
public:
    SolidityBodyWalker(const std::vector<Token>& tokens, BodyBuilder& builder, const SoliditySymbols& symbols)
        : m_tokens(tokens)
        , m_builder(builder)
        , m_symbols(symbols)
    {}

    /// Parameters of interface type (`IERC20 token`).
    void add_interface_local(const std::string& name) { m_interface_locals.insert(name); }

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
        bool handled = false;
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
            } else if (depth == 0 && is_punct(t, ";")) {
                return i;
            }
        }
        return end;
    }

    /// One past the statement or block starting at `pos`.
    [[nodiscard]] std::size_t body_end(std::size_t pos, std::size_t end) const
    {
        if (pos >= end) {
            return end;
        }
        const Token& t = m_tokens[pos];
        if (is_punct(t, "{")) {
            return find_matching(m_tokens, pos, end).value_or(end - 1) + 1;
        }
        if (is_ident(t, "unchecked") && is_punct(tok(pos + 1), "{")) {
            return body_end(pos + 1, end);
        }
        if (is_ident(t, "if") || is_ident(t, "for") || is_ident(t, "while")) {
            auto close = find_matching(m_tokens, pos + 1, end);
            if (!close) {
                return end;
            }
            std::size_t next = body_end(*close + 1, end);
            if (is_ident(t, "if") && is_ident(tok(next), "else")) {
                next = body_end(next + 1, end);
            }
            return next;
        }
        if (is_ident(t, "do")) {
            const std::size_t next = body_end(pos + 1, end);
            return statement_end(next, end) + 1;
        }
        return std::min(statement_end(pos, end) + 1, end);
    }

    std::size_t walk_statement(std::size_t i, std::size_t end)
    {
        const Token& t = m_tokens[i];
        if (t.kind == TokenKind::kDoc || is_punct(t, ";")) {
            return i + 1;
        }
        if (is_punct(t, "{")) {
            auto close = find_matching(m_tokens, i, end);
            const std::size_t stop = close.value_or(end);
            walk_block(i + 1, stop);
            return stop + 1;
        }
        if (is_ident(t, "unchecked") && is_punct(tok(i + 1), "{")) {
            ++m_unchecked_depth;
            const std::size_t next = walk_statement(i + 1, end);
            --m_unchecked_depth;
            return next;
        }
        if (is_ident(t, "assembly")) {
            m_builder.mark_unsafe(t);
            m_builder.emit(t, ir::OpaqueOperation{.mnemonic = "assembly"});
            std::size_t open = i + 1;
            while (open < end && !is_punct(m_tokens[open], "{")) {
                ++open;
            }
            auto close = find_matching(m_tokens, open, end);
            return close ? *close + 1 : end;
        }
        if (is_ident(t, "if")) {
            return walk_if(i, end);
        }
        if (is_ident(t, "for")) {
            return walk_for(i, end);
        }
        if (is_ident(t, "while")) {
            return walk_while(i, end);
        }
        if (is_ident(t, "do")) {
            return walk_do(i, end);
        }
        if (is_ident(t, "try")) {
            return walk_try(i, end);
        }
        if (is_ident(t, "return")) {
            const std::size_t stop = statement_end(i + 1, end);
            process_expr(i + 1, stop, ExprContext{.handled = true});
            return stop + 1;
        }
        if (is_ident(t, "emit")) {
            const std::size_t stop = statement_end(i + 1, end);
            process_expr(i + 2, stop, ExprContext{});
            m_builder.emit(t, ir::EventEmission{.event = tok(i + 1).text});
            return stop + 1;
        }
        if (is_ident(t, "revert") || is_ident(t, "throw")) {
            const std::size_t stop = statement_end(i + 1, end);
            process_expr(i + 1, stop, ExprContext{});
            return stop + 1;
        }
        if (is_ident(t, "break") || is_ident(t, "continue")) {
            return statement_end(i, end) + 1;
        }

        const std::size_t stop = statement_end(i, end);
        if (is_punct(t, "(")) {
            if (auto eq = find_top_level(m_tokens, i, stop, "="); eq && is_punct(tok(*eq - 1), ")")) {
                walk_tuple_assignment(i, *eq, stop);
                return stop + 1;
            }
        }
        if (auto declared = declaration_name(i, stop)) {
            walk_declaration(i, stop, *declared);
            return stop + 1;
        }
        process_expr(i, stop, ExprContext{});
        return stop + 1;
    }

    [[nodiscard]] bool block_reverts(std::size_t begin, std::size_t end) const
    {
        for (std::size_t k = begin; k < end; ++k) {
            const Token& t = m_tokens[k];
            if (is_ident(t, "revert") || is_ident(t, "throw")) {
                return true;
            }
            if ((is_ident(t, "require") || is_ident(t, "assert")) && is_punct(tok(k + 1), "(")
                && is_ident(tok(k + 2), "false")) {
                return true;
            }
        }
        return false;
    }

    std::size_t walk_if(std::size_t i, std::size_t end)
    {
        auto close = find_matching(m_tokens, i + 1, end);
        if (!is_punct(tok(i + 1), "(") || !close) {
            return statement_end(i, end) + 1;
        }
        process_expr(i + 2, *close, ExprContext{.handled = true});
        const std::size_t then_end = body_end(*close + 1, end);
        m_builder.emit_branch(m_tokens[i], condition_facts(i + 2, *close), block_reverts(*close + 1, then_end));
        walk_block(*close + 1, then_end);
        if (is_ident(tok(then_end), "else")) {
            const std::size_t else_end = body_end(then_end + 1, end);
            walk_block(then_end + 1, else_end);
            return else_end;
        }
        return then_end;
    }

    std::size_t walk_for(std::size_t i, std::size_t end)
    {
        auto close = find_matching(m_tokens, i + 1, end);
        if (!is_punct(tok(i + 1), "(") || !close) {
            return statement_end(i, end) + 1;
        }
        auto parts = split_top_level(m_tokens, i + 2, *close, ";");
        if (!parts.empty() && !parts[0].empty()) {
            walk_block(parts[0].begin, parts[0].end);
        }
        bool storage_bound = false;
        if (parts.size() > 1) {
            process_expr(parts[1].begin, parts[1].end, ExprContext{});
            storage_bound = reads_storage(parts[1].begin, parts[1].end);
        }
        m_builder.open_loop(m_tokens[i], join_tokens(m_tokens, i, *close + 1), storage_bound);
        const std::size_t next = body_end(*close + 1, end);
        walk_block(*close + 1, next);
        if (parts.size() > 2) {
            process_expr(parts[2].begin, parts[2].end, ExprContext{});
        }
        m_builder.close_loop();
        return next;
    }

    std::size_t walk_while(std::size_t i, std::size_t end)
    {
        auto close = find_matching(m_tokens, i + 1, end);
        if (!is_punct(tok(i + 1), "(") || !close) {
            return statement_end(i, end) + 1;
        }
        process_expr(i + 2, *close, ExprContext{});
        m_builder.open_loop(m_tokens[i], join_tokens(m_tokens, i, *close + 1), reads_storage(i + 2, *close));
        const std::size_t next = body_end(*close + 1, end);
        walk_block(*close + 1, next);
        m_builder.close_loop();
        return next;
    }

    std::size_t walk_do(std::size_t i, std::size_t end)
    {
        const std::size_t body_stop = body_end(i + 1, end);
        std::optional<std::size_t> cond_close;
        if (is_ident(tok(body_stop), "while") && is_punct(tok(body_stop + 1), "(")) {
            cond_close = find_matching(m_tokens, body_stop + 1, end);
        }
        const bool storage_bound = cond_close && reads_storage(body_stop + 2, *cond_close);
        m_builder.open_loop(m_tokens[i], "do", storage_bound);
        walk_block(i + 1, body_stop);
        if (cond_close) {
            process_expr(body_stop + 2, *cond_close, ExprContext{});
        }
        m_builder.close_loop();
        return statement_end(body_stop, end) + 1;
    }

    /// try expr returns (...) { } catch ... { }
    std::size_t walk_try(std::size_t i, std::size_t end)
    {
        std::size_t open = i + 1;
        int depth = 0;
        for (; open < end; ++open) {
            const Token& t = m_tokens[open];
            if (depth == 0 && (is_punct(t, "{") || is_ident(t, "returns"))) {
                break;
            }
            if (is_punct(t, "(") || is_punct(t, "[")) {
                ++depth;
            } else if (is_punct(t, ")") || is_punct(t, "]")) {
                --depth;
            }
        }
        process_expr(i + 1, open, ExprContext{.handled = true});
        std::size_t k = open;
        while (k < end) {
            if (is_punct(tok(k), "{")) {
                auto close = find_matching(m_tokens, k, end);
                const std::size_t stop = close.value_or(end);
                walk_block(k + 1, stop);
                k = stop + 1;
                if (!is_ident(tok(k), "catch")) {
                    return k;
                }
                continue;
            }
            ++k;
        }
        return end;
    }

    /// Local declaration `Type [location] name [= value]`; returns the name index.
    [[nodiscard]] std::optional<std::size_t> declaration_name(std::size_t begin, std::size_t stop) const
    {
        const Token& first = m_tokens[begin];
        if (first.kind != TokenKind::kIdent || is_ident(first, "delete") || is_ident(first, "return")) {
            return std::nullopt;
        }
        auto eq = find_top_level(m_tokens, begin, stop, "=");
        const std::size_t lhs_end = eq.value_or(stop);
        if (lhs_end < begin + 2) {
            return std::nullopt;
        }
        const Token& name = m_tokens[lhs_end - 1];
        const Token& before = m_tokens[lhs_end - 2];
        if (name.kind != TokenKind::kIdent) {
            return std::nullopt;
        }
        if (before.kind == TokenKind::kIdent || is_punct(before, "]") || is_punct(before, ")")) {
            return lhs_end - 1;
        }
        return std::nullopt;
    }

    void walk_declaration(std::size_t begin, std::size_t stop, std::size_t name_at)
    {
        const std::string& name = m_tokens[name_at].text;
        if (m_symbols.interfaces.contains(m_tokens[begin].text)) {
            m_interface_locals.insert(name);
        }
        if (name_at + 1 >= stop) {
            m_builder.bind_local(name, ir::ValueSource::kNone);
            return;
        }
        const std::size_t rhs = name_at + 2;
        const bool storage_pointer = is_ident(m_tokens[name_at - 1], "storage");
        const std::size_t first_op = m_builder.size();
        m_pending_origin = false;
        process_expr(rhs, stop, ExprContext{});
        bind_results(name, first_op);
        m_builder.bind_local(name, source_of(rhs, stop));
        if (std::exchange(m_pending_origin, false)) {
            m_origin_locals.insert(name);
        }
        if (storage_pointer && is_state_var_at(rhs)) {
            m_storage_aliases[name] = m_tokens[rhs].text;
        }
    }

    /// (bool ok, bytes memory data) = target.call(...)
    void walk_tuple_assignment(std::size_t open, std::size_t eq, std::size_t stop)
    {
        std::optional<std::string> flag;
        std::vector<std::string> names;
        for (const Span& part : split_top_level(m_tokens, open + 1, eq - 1, ",")) {
            if (part.empty()) {
                continue;
            }
            const Token& last = m_tokens[part.end - 1];
            if (last.kind != TokenKind::kIdent) {
                continue;
            }
            names.push_back(last.text);
            if (!flag && part.end - part.begin >= 2 && is_ident(m_tokens[part.begin], "bool")) {
                flag = last.text;
            }
        }
        const std::size_t first_op = m_builder.size();
        process_expr(eq + 1, stop, ExprContext{});
        if (flag) {
            bind_results(*flag, first_op);
        }
        const ir::ValueSource source = source_of(eq + 1, stop);
        for (const auto& name : names) {
            m_builder.bind_local(name, source);
        }
    }

    void bind_results(const std::string& name, std::size_t first_op)
    {
        std::vector<std::size_t> arithmetic;
        for (std::size_t k = first_op; k < m_builder.size(); ++k) {
            const auto& op = m_builder.operation(k);
            if (const auto* value = std::get_if<ir::Arithmetic>(&op.kind);
                value != nullptr && value->sink == ir::ArithmeticSink::kNone) {
                arithmetic.push_back(k);
            }
            if (const auto* call = std::get_if<ir::ExternalCall>(&op.kind); call != nullptr && !call->result_checked) {
                m_builder.bind_call_result(name, k);
            }
        }
        m_builder.attach_arithmetic(name, arithmetic);
    }

    // ------------------------------------------------------------------
    // Facts
    // ------------------------------------------------------------------

    [[nodiscard]] bool shadowed(std::string_view name) const
    {
        return m_builder.is_param(name) || m_builder.is_local(name);
    }

    [[nodiscard]] bool is_member_access(std::size_t k) const
    {
        return k > 0 && is_punct(m_tokens[k - 1], ".");
    }

    [[nodiscard]] bool is_state_var_at(std::size_t k) const
    {
        const Token& t = tok(k);
        return t.kind == TokenKind::kIdent && m_symbols.state_vars.contains(t.text) && !shadowed(t.text)
               && !is_member_access(k);
    }

    [[nodiscard]] bool is_sender_at(std::size_t k) const
    {
        const Token& t = m_tokens[k];
        if (is_ident(t, "msg") && is_punct(tok(k + 1), ".") && is_ident(tok(k + 2), "sender")) {
            return true;
        }
        if (is_ident(t, "_msgSender") && is_punct(tok(k + 1), "(")) {
            return true;
        }
        return t.kind == TokenKind::kIdent && !is_member_access(k) && !m_origin_locals.contains(t.text)
               && m_builder.local_source(t.text) == ir::ValueSource::kSender;
    }

    [[nodiscard]] bool is_origin_at(std::size_t k) const
    {
        const Token& t = m_tokens[k];
        if (is_ident(t, "tx") && is_punct(tok(k + 1), ".") && is_ident(tok(k + 2), "origin")) {
            return true;
        }
        return t.kind == TokenKind::kIdent && !is_member_access(k) && m_origin_locals.contains(t.text);
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

    [[nodiscard]] bool reads_storage(std::size_t begin, std::size_t end) const
    {
        for (std::size_t k = begin; k < end; ++k) {
            if (is_state_var_at(k)) {
                return true;
            }
            const Token& t = m_tokens[k];
            if (t.kind == TokenKind::kIdent && !is_member_access(k)
                && (m_builder.local_source(t.text) == ir::ValueSource::kStorage
                    || m_storage_aliases.contains(t.text))) {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] ir::ValueSource source_of(std::size_t begin, std::size_t end) const
    {
        // Conversions wrap the value: payable(x), address(x).
        while (begin + 1 < end && (is_ident(m_tokens[begin], "payable") || is_ident(m_tokens[begin], "address"))
               && is_punct(m_tokens[begin + 1], "(")) {
            begin += 2;
            if (end > begin && is_punct(m_tokens[end - 1], ")")) {
                --end;
            }
        }
        if (begin < end && is_state_var_at(begin)) {
            return ir::ValueSource::kStorage;
        }
        return m_builder.classify_source(m_tokens, begin, end, mentions_sender(begin, end), reads_storage(begin, end));
    }

    [[nodiscard]] std::string target_text(std::size_t begin, std::size_t end) const
    {
        while (begin + 1 < end && (is_ident(m_tokens[begin], "payable") || is_ident(m_tokens[begin], "address"))
               && is_punct(m_tokens[begin + 1], "(") && is_punct(m_tokens[end - 1], ")")) {
            begin += 2;
            --end;
        }
        return join_tokens(m_tokens, begin, end);
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
                if (t.kind != TokenKind::kIdent) {
                    continue;
                }
                if (is_state_var_at(k)) {
                    clause.slots.push_back(t.text);
                } else if (auto alias = m_storage_aliases.find(t.text); alias != m_storage_aliases.end()) {
                    clause.slots.push_back(alias->second);
                }
                if (is_punct(tok(k + 1), "(")) {
                    clause.calls.push_back(t.text);
                } else if (!is_member_access(k) && shadowed(t.text)) {
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

    [[nodiscard]] bool checked() const { return m_symbols.checked_arithmetic && m_unchecked_depth == 0; }

    void emit_arithmetic(const Token& at, ir::ArithmeticOp op, ir::ArithmeticSink sink, bool storage_operands)
    {
        m_builder.emit(at,
                       ir::Arithmetic{.op = op,
                                      .checked = checked(),
                                      .sink = sink,
                                      .operand_reads_storage = storage_operands});
    }

    void process_expr(std::size_t begin, std::size_t end, ExprContext ctx)
    {
        const bool storage_operands = reads_storage(begin, end);
        std::size_t k = begin;
        while (k < end) {
            const Token& t = m_tokens[k];
            if (is_state_var_at(k)) {
                k = state_access(k, end);
                continue;
            }
            if (t.kind == TokenKind::kIdent && !is_member_access(k) && m_storage_aliases.contains(t.text)) {
                k = alias_access(k, end);
                continue;
            }
            if (auto next = environment_access(k)) {
                k = *next;
                continue;
            }
            if (is_punct(t, "++") || is_punct(t, "--")) {
                if (is_state_var_at(k + 1)) {
                    k = state_access(k + 1, end, &t);
                    continue;
                }
                emit_arithmetic(t, is_punct(t, "++") ? ir::ArithmeticOp::kAdd : ir::ArithmeticOp::kSub, ctx.sink,
                                storage_operands);
                ++k;
                continue;
            }
            if (is_ident(t, "delete")) {
                ++k;
                continue;
            }
            if (is_ident(t, "new")) {
                k = new_expression(k, end);
                continue;
            }
            if (t.kind == TokenKind::kIdent && is_punct(tok(k + 1), "(") && !is_member_access(k)) {
                k = free_call(k, end, ctx);
                continue;
            }
            if (is_punct(t, ".") && tok(k + 1).kind == TokenKind::kIdent
                && (is_punct(tok(k + 2), "(") || is_punct(tok(k + 2), "{"))) {
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
                emit_arithmetic(t, *op, ctx.sink, storage_operands);
                ++k;
                continue;
            }
            if (auto op = compound_operator(t)) {
                emit_arithmetic(t, *op, ctx.sink, storage_operands);
                ++k;
                continue;
            }
            if (t.kind == TokenKind::kIdent && !is_member_access(k)) {
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
        if (ctx.handled) {
            m_builder.mark_result_handled(name);
        }
    }

    std::optional<std::size_t> environment_access(std::size_t k)
    {
        const Token& t = m_tokens[k];
        if (is_member_access(k)) {
            return std::nullopt;
        }
        if (is_ident(t, "now")) {
            m_builder.emit(t, ir::EnvironmentRead{.kind = ir::EnvironmentKind::kTimestamp});
            return k + 1;
        }
        if (!is_punct(tok(k + 1), ".") || tok(k + 2).kind != TokenKind::kIdent) {
            return std::nullopt;
        }
        const std::string& member = tok(k + 2).text;
        std::optional<ir::EnvironmentKind> kind;
        if (is_ident(t, "msg") && member == "sender") {
            kind = ir::EnvironmentKind::kSender;
        } else if (is_ident(t, "msg") && member == "value") {
            kind = ir::EnvironmentKind::kValue;
        } else if (is_ident(t, "tx") && member == "origin") {
            kind = ir::EnvironmentKind::kOrigin;
        } else if (is_ident(t, "block") && member == "timestamp") {
            kind = ir::EnvironmentKind::kTimestamp;
        } else if (is_ident(t, "block") && member == "number") {
            kind = ir::EnvironmentKind::kBlockNumber;
        }
        if (!kind) {
            return std::nullopt;
        }
        m_builder.emit(t, ir::EnvironmentRead{.kind = *kind});
        if (*kind == ir::EnvironmentKind::kOrigin) {
            m_pending_origin = true;
        }
        return k + 3;
    }

    /// State variable use at k: indexing, assignment, increment, push/pop, plain read.
    std::size_t state_access(std::size_t k, std::size_t end, const Token* prefix_step = nullptr)
    {
        const Token& at = m_tokens[k];
        const std::string& slot = at.text;
        std::size_t j = k + 1;
        std::string key;
        ir::ValueSource key_source = ir::ValueSource::kNone;
        bool first_index = true;
        while (is_punct(tok(j), "[")) {
            auto close = find_matching(m_tokens, j, end);
            const std::size_t stop = close.value_or(end);
            process_expr(j + 1, stop, ExprContext{.sink = ir::ArithmeticSink::kIndex});
            if (first_index) {
                key = join_tokens(m_tokens, j + 1, stop);
                key_source = source_of(j + 1, stop);
                first_index = false;
            }
            j = stop + 1;
        }
        // Struct member of a mapping entry: balances[a].amount
        while (is_punct(tok(j), ".") && tok(j + 1).kind == TokenKind::kIdent && !is_punct(tok(j + 2), "(")
               && !is_ident(tok(j + 1), "length")) {
            j += 2;
        }
        const bool deleted = k > 0 && is_ident(m_tokens[k - 1], "delete");
        const auto read = [&] {
            m_builder.emit(at, ir::StorageRead{.slot = slot, .key = key, .key_source = key_source});
        };
        const auto write = [&] {
            m_builder.emit(at, ir::StorageWrite{.slot = slot, .key = key, .key_source = key_source});
        };

        if (prefix_step != nullptr) {
            read();
            emit_arithmetic(*prefix_step, is_punct(*prefix_step, "++") ? ir::ArithmeticOp::kAdd : ir::ArithmeticOp::kSub,
                            ir::ArithmeticSink::kStorage, true);
            write();
            return j;
        }
        if (deleted) {
            write();
            return j;
        }
        if (is_punct(tok(j), "=")) {
            process_expr(j + 1, end, ExprContext{.sink = ir::ArithmeticSink::kStorage});
            write();
            return end;
        }
        if (auto op = compound_operator(tok(j))) {
            read();
            process_expr(j + 1, end, ExprContext{.sink = ir::ArithmeticSink::kStorage});
            emit_arithmetic(tok(j), *op, ir::ArithmeticSink::kStorage, true);
            write();
            return end;
        }
        if (is_punct(tok(j), "++") || is_punct(tok(j), "--")) {
            read();
            emit_arithmetic(tok(j), is_punct(tok(j), "++") ? ir::ArithmeticOp::kAdd : ir::ArithmeticOp::kSub,
                            ir::ArithmeticSink::kStorage, true);
            write();
            return j + 1;
        }
        if (is_punct(tok(j), ".") && (is_ident(tok(j + 1), "push") || is_ident(tok(j + 1), "pop"))
            && is_punct(tok(j + 2), "(")) {
            auto close = find_matching(m_tokens, j + 2, end);
            const std::size_t stop = close.value_or(end);
            process_expr(j + 3, stop, ExprContext{.sink = ir::ArithmeticSink::kStorage});
            write();
            return stop + 1;
        }
        read();
        return j;
    }

    /// `p.field = x` where p is a storage pointer.
    std::size_t alias_access(std::size_t k, std::size_t end)
    {
        const Token& at = m_tokens[k];
        const std::string& slot = m_storage_aliases.at(at.text);
        std::size_t j = k + 1;
        while (is_punct(tok(j), ".") && tok(j + 1).kind == TokenKind::kIdent && !is_punct(tok(j + 2), "(")) {
            j += 2;
        }
        while (is_punct(tok(j), "[")) {
            auto close = find_matching(m_tokens, j, end);
            const std::size_t stop = close.value_or(end);
            process_expr(j + 1, stop, ExprContext{.sink = ir::ArithmeticSink::kIndex});
            j = stop + 1;
        }
        const ir::StorageWrite write{.slot = slot, .key = at.text, .key_source = ir::ValueSource::kLocal};
        if (is_punct(tok(j), "=")) {
            process_expr(j + 1, end, ExprContext{.sink = ir::ArithmeticSink::kStorage});
            m_builder.emit(at, write);
            return end;
        }
        if (auto op = compound_operator(tok(j))) {
            m_builder.emit(at, ir::StorageRead{.slot = slot, .key = at.text, .key_source = ir::ValueSource::kLocal});
            process_expr(j + 1, end, ExprContext{.sink = ir::ArithmeticSink::kStorage});
            emit_arithmetic(tok(j), *op, ir::ArithmeticSink::kStorage, true);
            m_builder.emit(at, write);
            return end;
        }
        m_builder.emit(at, ir::StorageRead{.slot = slot, .key = at.text, .key_source = ir::ValueSource::kLocal});
        return j;
    }

    std::size_t new_expression(std::size_t k, std::size_t end)
    {
        const Token& at = m_tokens[k];
        std::size_t j = k + 1;
        const std::string type = tok(j).text;
        while (j < end && !is_punct(tok(j), "(")) {
            ++j;
        }
        auto close = find_matching(m_tokens, j, end);
        const std::size_t stop = close.value_or(end);
        process_expr(j + 1, stop, ExprContext{});
        const bool array = is_punct(tok(j - 1), "]");
        if (array || type == "bytes" || type == "string") {
            m_builder.emit(at, ir::MemoryAllocation{.description = std::format("new {}", join_tokens(m_tokens, k + 1, j)),
                                                    .preallocated = true});
        } else {
            m_builder.emit(at, ir::OpaqueOperation{.mnemonic = "new " + type});
        }
        return stop + 1;
    }

    std::size_t free_call(std::size_t k, std::size_t end, ExprContext ctx)
    {
        const Token& name = m_tokens[k];
        auto close = find_matching(m_tokens, k + 1, end);
        const std::size_t stop = close.value_or(end);

        if (name.text == "require" || name.text == "assert") {
            auto args = split_top_level(m_tokens, k + 2, stop, ",");
            process_expr(k + 2, stop, ExprContext{.handled = true});
            if (!args.empty()) {
                m_builder.emit_branch(name, condition_facts(args.front().begin, args.front().end), true);
            }
            return stop + 1;
        }
        if (name.text == "selfdestruct" || name.text == "suicide") {
            process_expr(k + 2, stop, ExprContext{});
            m_builder.emit(name, ir::OpaqueOperation{.mnemonic = name.text});
            return stop + 1;
        }
        // IFoo(addr).method(...)
        if (m_symbols.interfaces.contains(name.text) && is_punct(tok(stop + 1), ".")
            && tok(stop + 2).kind == TokenKind::kIdent && is_punct(tok(stop + 3), "(")) {
            process_expr(k + 2, stop, ExprContext{});
            const Token& method = tok(stop + 2);
            auto method_close = find_matching(m_tokens, stop + 3, end);
            const std::size_t method_stop = method_close.value_or(end);
            emit_call(method, ir::CallKind::kCall, Span{.begin = k + 2, .end = stop}, method.text, stop + 3,
                      method_stop, ctx, !contains(kBoolReturningMethods, method.text));
            return method_stop + 1;
        }
        if (m_symbols.functions.contains(name.text) && !shadowed(name.text)) {
            process_expr(k + 2, stop, ExprContext{});
            m_builder.emit(name, ir::InternalCall{.callee = name.text});
            return stop + 1;
        }
        // Type conversions and builtins pass the context to their operand.
        note_local_use(k, ctx);
        process_expr(k + 2, stop, ctx);
        return stop + 1;
    }

    std::size_t emit_call(const Token& at,
                          ir::CallKind kind,
                          Span target,
                          std::string method,
                          std::size_t open,
                          std::size_t close,
                          ExprContext ctx,
                          bool checked_by_revert)
    {
        process_expr(open + 1, close, ExprContext{});
        ir::ValueSource source = source_of(target.begin, target.end);
        if (source == ir::ValueSource::kNone) {
            source = ir::ValueSource::kLocal;
        }
        const std::size_t index = m_builder.emit(at,
                                                 ir::ExternalCall{.kind = kind,
                                                                  .target = target_text(target.begin, target.end),
                                                                  .target_source = source,
                                                                  .method = std::move(method),
                                                                  .args = join_tokens(m_tokens, open + 1, close),
                                                                  .result_checked = checked_by_revert});
        if (ctx.handled) {
            m_builder.mark_handled(index);
        }
        return index;
    }

    std::size_t method_call(std::size_t dot, std::size_t floor, std::size_t end, ExprContext ctx, bool storage_operands)
    {
        const Token& method = tok(dot + 1);
        const std::size_t recv = receiver_begin(m_tokens, dot, floor);
        const Span receiver{.begin = recv, .end = dot};

        // Call options: target.call{value: v, gas: g}(data)
        std::size_t open = dot + 2;
        bool sends_value = false;
        if (is_punct(tok(open), "{")) {
            auto options_close = find_matching(m_tokens, open, end);
            if (!options_close || !is_punct(tok(*options_close + 1), "(")) {
                return dot + 2;
            }
            for (std::size_t k = open + 1; k < *options_close; ++k) {
                if (is_ident(m_tokens[k], "value")) {
                    sends_value = true;
                }
            }
            process_expr(open + 1, *options_close, ExprContext{});
            open = *options_close + 1;
        }
        auto close = find_matching(m_tokens, open, end);
        const std::size_t stop = close.value_or(end);
        const auto args = split_top_level(m_tokens, open + 1, stop, ",");
        const bool single_receiver = recv + 1 == dot && m_tokens[recv].kind == TokenKind::kIdent;
        const bool interface_receiver =
            single_receiver
            && (m_interface_locals.contains(m_tokens[recv].text) || m_symbols.interface_vars.contains(m_tokens[recv].text));

        if (!interface_receiver) {
            std::optional<ir::CallKind> kind;
            bool checked_by_revert = false;
            if (method.text == "call") {
                kind = sends_value ? ir::CallKind::kValueTransfer : ir::CallKind::kCall;
            } else if (method.text == "delegatecall") {
                kind = ir::CallKind::kDelegateCall;
            } else if (method.text == "staticcall") {
                kind = ir::CallKind::kStaticCall;
            } else if (method.text == "send") {
                kind = ir::CallKind::kValueTransfer;
            } else if (method.text == "transfer" && args.size() == 1) {
                kind = ir::CallKind::kValueTransfer;
                checked_by_revert = true;
            }
            if (kind) {
                emit_call(method, *kind, receiver, method.text, open, stop, ctx, checked_by_revert);
                return stop + 1;
            }
        }
        if (interface_receiver) {
            emit_call(method, ir::CallKind::kCall, receiver, method.text, open, stop, ctx,
                      !contains(kBoolReturningMethods, method.text));
            return stop + 1;
        }
        if (single_receiver && is_ident(m_tokens[recv], "this")) {
            emit_call(method, ir::CallKind::kCall, receiver, method.text, open, stop, ctx, true);
            return stop + 1;
        }
        if (single_receiver && is_ident(m_tokens[recv], "super")) {
            process_expr(open + 1, stop, ExprContext{});
            m_builder.emit(method, ir::InternalCall{.callee = method.text});
            return stop + 1;
        }
        if (single_receiver && (is_ident(m_tokens[recv], "abi") || is_ident(m_tokens[recv], "string")
                                || is_ident(m_tokens[recv], "bytes"))
            && (method.text.starts_with("encode") || method.text == "concat")) {
            process_expr(open + 1, stop, ExprContext{});
            m_builder.emit(method,
                           ir::MemoryAllocation{.description = std::format("{}.{}", m_tokens[recv].text, method.text),
                                                .preallocated = false});
            return stop + 1;
        }
        // using SafeMath for uint256: a.add(b)
        if (contains(kSafeMathMethods, method.text) && args.size() == 1) {
            process_expr(open + 1, stop, ExprContext{});
            static const std::map<std::string, ir::ArithmeticOp, std::less<>> kSafeMath = {
                {"add", ir::ArithmeticOp::kAdd},
                {"sub", ir::ArithmeticOp::kSub},
                {"mul", ir::ArithmeticOp::kMul},
                {"div", ir::ArithmeticOp::kDiv},
                {"mod", ir::ArithmeticOp::kMod},
            };
            m_builder.emit(method,
                           ir::Arithmetic{.op = kSafeMath.find(method.text)->second,
                                          .checked = true,
                                          .sink = ctx.sink,
                                          .operand_reads_storage = storage_operands});
            return stop + 1;
        }
        process_expr(open + 1, stop, ExprContext{});
        return stop + 1;
    }

    const std::vector<Token>& m_tokens;
    BodyBuilder& m_builder;
    const SoliditySymbols& m_symbols;
    NameSet m_interface_locals;
    NameSet m_origin_locals;
    std::map<std::string, std::string, std::less<>> m_storage_aliases;  ///< storage pointer -> slot
    int m_unchecked_depth = 0;
    bool m_pending_origin = false;
};

// ----------------------------------------------------------------------
// Declarations
// ----------------------------------------------------------------------

struct PendingFunction
{
    ir::Function function;
    std::vector<std::string> interface_params;
    std::size_t body_begin = 0;
    std::size_t body_end = 0;
};

class SolidityParser
{
public:
    SolidityParser(std::vector<Token> tokens, const ParseContext& context)
        : m_tokens(std::move(tokens))
        , m_context(context)
    {}

    [[nodiscard]] Result<ir::ContractModel> run()
    {
        scan_top_level();

        ir::ContractModel model;
        const ContractDecl* selected = select_contract();
        if (selected == nullptr) {
            model.name = m_context.contract_name;
            model.diagnostics = std::move(m_diagnostics);
            return model;
        }
        model.name = selected->name;

        // Parents declared in the same file contribute storage and modifiers.
        NameSet visited;
        collect_parents(*selected, visited);
        parse_members(*selected);

        m_symbols.interfaces = m_interfaces;
        for (const auto& slot : m_slots) {
            m_symbols.state_vars.insert(slot.name);
        }
        for (const auto& pending : m_pending) {
            m_symbols.functions.insert(pending.function.name);
        }
        model.slots = std::move(m_slots);

        for (auto& pending : m_pending) {
            BodyBuilder builder(pending.function, m_context.file);
            SolidityBodyWalker walker(m_tokens, builder, m_symbols);
            for (const auto& param : pending.interface_params) {
                walker.add_interface_local(param);
            }
            walker.walk_block(pending.body_begin, pending.body_end);
            model.functions.push_back(std::move(pending.function));
        }
        model.diagnostics = std::move(m_diagnostics);
        return model;
    }

private:
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

    void scan_top_level()
    {
        std::size_t i = 0;
        const std::size_t end = m_tokens.size();
        while (i < end) {
            const Token& t = m_tokens[i];
            if (is_ident(t, "pragma")) {
                const std::size_t stop = statement_end(i, end);
                if (is_ident(tok(i + 1), "solidity")) {
                    for (std::size_t k = i + 2; k < stop; ++k) {
                        if (m_tokens[k].kind == TokenKind::kNumber) {
                            m_symbols.checked_arithmetic = checked_by_default(m_tokens[k].text);
                            break;
                        }
                    }
                }
                i = stop + 1;
                continue;
            }
            if (is_ident(t, "abstract")) {
                ++i;
                continue;
            }
            if (is_ident(t, "contract") || is_ident(t, "library") || is_ident(t, "interface")) {
                i = scan_contract(i, end);
                continue;
            }
            if (is_punct(t, "{")) {
                auto close = find_matching(m_tokens, i, end);
                i = close ? *close + 1 : end;
                continue;
            }
            ++i;
        }
    }

    [[nodiscard]] std::size_t statement_end(std::size_t begin, std::size_t end) const
    {
        for (std::size_t k = begin; k < end; ++k) {
            if (is_punct(m_tokens[k], ";")) {
                return k;
            }
        }
        return end;
    }

    std::size_t scan_contract(std::size_t i, std::size_t end)
    {
        const Token& name = tok(i + 1);
        if (name.kind != TokenKind::kIdent) {
            diagnose(m_tokens[i], std::format("expected a name after '{}'", m_tokens[i].text));
            return i + 1;
        }
        std::size_t open = i + 2;
        std::vector<std::string> parents;
        if (is_ident(tok(open), "is")) {
            ++open;
            while (open < end && !is_punct(m_tokens[open], "{")) {
                if (m_tokens[open].kind == TokenKind::kIdent
                    && (is_punct(tok(open - 1), ",") || is_ident(tok(open - 1), "is"))) {
                    parents.push_back(m_tokens[open].text);
                }
                if (is_punct(m_tokens[open], "(")) {
                    open = find_matching(m_tokens, open, end).value_or(end - 1);
                }
                ++open;
            }
        }
        if (!is_punct(tok(open), "{")) {
            diagnose(name, std::format("expected '{{' to open '{}'", name.text));
            return open;
        }
        auto close = find_matching(m_tokens, open, end);
        if (!close) {
            diagnose(name, std::format("unterminated body of '{}'", name.text));
            close = end;
        }
        if (is_ident(m_tokens[i], "interface")) {
            m_interfaces.insert(name.text);
        } else {
            m_contracts.push_back(ContractDecl{.name = name.text,
                                               .name_index = i + 1,
                                               .parents = std::move(parents),
                                               .body_begin = open + 1,
                                               .body_end = *close});
        }
        return *close + 1;
    }

    [[nodiscard]] const ContractDecl* select_contract() const
    {
        if (!m_context.contract_name.empty()) {
            auto it = std::ranges::find(m_contracts, m_context.contract_name, &ContractDecl::name);
            return it == m_contracts.end() ? nullptr : &*it;
        }
        return m_contracts.empty() ? nullptr : &m_contracts.back();
    }

    void collect_parents(const ContractDecl& contract, NameSet& visited)
    {
        for (const auto& parent_name : contract.parents) {
            if (!visited.insert(parent_name).second) {
                continue;
            }
            auto it = std::ranges::find(m_contracts, parent_name, &ContractDecl::name);
            if (it == m_contracts.end()) {
                continue;
            }
            collect_parents(*it, visited);
            scan_inherited(*it);
        }
    }

    /// State variables and modifiers of a parent contract.
    void scan_inherited(const ContractDecl& contract)
    {
        std::size_t i = contract.body_begin;
        while (i < contract.body_end) {
            const Token& t = m_tokens[i];
            if (t.kind == TokenKind::kDoc) {
                ++i;
            } else if (is_ident(t, "modifier")) {
                i = parse_modifier(i, contract.body_end);
            } else if (is_ident(t, "function") || is_ident(t, "constructor") || is_ident(t, "fallback")
                       || is_ident(t, "receive") || contains(kSkippedMembers, t.text)) {
                i = skip_member(i, contract.body_end);
            } else {
                i = parse_state_variable(i, contract.body_end);
            }
        }
    }

    void parse_members(const ContractDecl& contract)
    {
        std::vector<std::string> docs;
        std::size_t i = contract.body_begin;
        const std::size_t end = contract.body_end;
        while (i < end) {
            const Token& t = m_tokens[i];
            if (t.kind == TokenKind::kDoc) {
                docs.push_back(t.text);
                ++i;
                continue;
            }
            if (is_ident(t, "function")) {
                i = parse_function(i, end, docs, CallableKind::kFunction);
            } else if (is_ident(t, "constructor")) {
                i = parse_function(i, end, docs, CallableKind::kConstructor);
            } else if ((is_ident(t, "fallback") || is_ident(t, "receive")) && is_punct(tok(i + 1), "(")) {
                i = parse_function(i, end, docs, CallableKind::kSpecial);
            } else if (is_ident(t, "modifier")) {
                i = parse_modifier(i, end);
            } else if (contains(kSkippedMembers, t.text)) {
                i = skip_member(i, end);
            } else {
                i = parse_state_variable(i, end);
            }
            docs.clear();
        }
    }

    std::size_t skip_member(std::size_t i, std::size_t end) const
    {
        for (std::size_t k = i; k < end; ++k) {
            if (is_punct(m_tokens[k], ";")) {
                return k + 1;
            }
            if (is_punct(m_tokens[k], "{")) {
                auto close = find_matching(m_tokens, k, end);
                return close ? *close + 1 : end;
            }
        }
        return end;
    }

    std::size_t parse_state_variable(std::size_t i, std::size_t end)
    {
        const std::size_t stop = statement_end(i, end);
        for (std::size_t k = i; k < stop; ++k) {
            if (is_punct(m_tokens[k], "{")) {
                return skip_member(i, end);
            }
        }
        std::size_t lhs_end = stop;
        if (auto eq = find_top_level(m_tokens, i, stop, "=")) {
            lhs_end = *eq;
        }
        bool constant = false;
        std::optional<std::size_t> type_end;
        for (std::size_t k = i; k < lhs_end; ++k) {
            const Token& t = m_tokens[k];
            if (is_ident(t, "constant") || is_ident(t, "immutable")) {
                constant = true;
            }
            if (!type_end
                && (is_ident(t, "public") || is_ident(t, "private") || is_ident(t, "internal")
                    || is_ident(t, "constant") || is_ident(t, "immutable") || is_ident(t, "override")
                    || is_ident(t, "transient"))) {
                type_end = k;
            }
        }
        if (lhs_end < i + 2 || m_tokens[lhs_end - 1].kind != TokenKind::kIdent) {
            if (stop > i) {
                diagnose(m_tokens[i], "unrecognized contract member");
            }
            return stop + 1;
        }
        if (constant) {
            return stop + 1;
        }
        const Token& name = m_tokens[lhs_end - 1];
        std::string type = join_tokens(m_tokens, i, type_end.value_or(lhs_end - 1));
        ir::SlotKind kind = ir::SlotKind::kValue;
        if (is_ident(m_tokens[i], "mapping")) {
            kind = ir::SlotKind::kMapping;
        } else if (type.find('[') != std::string::npos) {
            kind = ir::SlotKind::kArray;
        }
        if (m_interfaces.contains(m_tokens[i].text)) {
            m_symbols.interface_vars.insert(name.text);
        }
        m_slots.push_back(ir::StorageSlot{.name = name.text,
                                          .type = std::move(type),
                                          .kind = kind,
                                          .location = location_of(name, m_context.file),
                                          .access = ir::AccessPattern::kUnused,
                                          .readers = {},
                                          .writers = {}});
        return stop + 1;
    }

    /// Kind of a `modifier` declaration from its body, falling back to its name.
    std::size_t parse_modifier(std::size_t i, std::size_t end)
    {
        const Token& name = tok(i + 1);
        std::size_t open = i + 2;
        while (open < end && !is_punct(m_tokens[open], "{") && !is_punct(m_tokens[open], ";")) {
            ++open;
        }
        if (name.kind != TokenKind::kIdent || open >= end) {
            diagnose(m_tokens[i], "malformed modifier declaration");
            return skip_member(i, end);
        }
        if (is_punct(m_tokens[open], ";")) {
            return open + 1;
        }
        auto close = find_matching(m_tokens, open, end);
        const std::size_t stop = close.value_or(end);

        bool sender = false;
        bool compares = false;
        bool lock_state = false;
        for (std::size_t k = open + 1; k < stop; ++k) {
            const Token& t = m_tokens[k];
            sender = sender || (is_ident(t, "msg") && is_ident(tok(k + 2), "sender")) || is_ident(t, "_msgSender");
            compares = compares || is_punct(t, "==") || is_punct(t, "!=");
            lock_state = lock_state || is_ident(t, "locked") || is_ident(t, "_status") || is_ident(t, "entered")
                         || is_ident(t, "_locked") || is_ident(t, "_entered");
        }
        ir::ModifierKind kind = ir::ModifierKind::kOther;
        if (sender && compares) {
            kind = ir::ModifierKind::kAccessControl;
        } else if (lock_state || is_reentrancy_guard_name(name.text)) {
            kind = ir::ModifierKind::kReentrancyGuard;
        } else if (is_access_control_name(name.text)) {
            kind = ir::ModifierKind::kAccessControl;
        }
        m_modifier_kinds[name.text] = kind;
        return stop + 1;
    }

    enum class CallableKind {
        kFunction,
        kConstructor,
        kSpecial,  ///< fallback, receive
    };

    [[nodiscard]] std::size_t recover(std::size_t from, std::size_t end) const
    {
        for (std::size_t k = from; k < end; ++k) {
            const Token& t = m_tokens[k];
            if (is_punct(t, ";")) {
                return k + 1;
            }
            if (is_punct(t, "{")) {
                auto close = find_matching(m_tokens, k, end);
                return close ? *close + 1 : next_member(k + 1, end);
            }
            if (k > from && (is_ident(t, "function") || is_ident(t, "modifier") || is_ident(t, "constructor"))) {
                return k;
            }
        }
        return end;
    }

    [[nodiscard]] std::size_t next_member(std::size_t from, std::size_t end) const
    {
        for (std::size_t k = from; k < end; ++k) {
            if (is_ident(m_tokens[k], "function") || is_ident(m_tokens[k], "modifier")) {
                return k;
            }
        }
        return end;
    }

    [[nodiscard]] std::optional<std::size_t> body_close(std::size_t open, std::size_t end) const
    {
        int depth = 0;
        for (std::size_t k = open; k < end; ++k) {
            const Token& t = m_tokens[k];
            if (is_punct(t, "{")) {
                ++depth;
            } else if (is_punct(t, "}")) {
                if (--depth == 0) {
                    return k;
                }
            } else if ((is_ident(t, "function") && tok(k + 1).kind == TokenKind::kIdent)
                       || is_ident(t, "modifier")) {
                return std::nullopt;
            }
        }
        return std::nullopt;
    }

    std::size_t parse_function(std::size_t i, std::size_t end, const std::vector<std::string>& docs, CallableKind callable)
    {
        const Token& keyword = m_tokens[i];
        std::size_t paren = i + 1;
        std::string name;
        if (callable == CallableKind::kFunction) {
            const Token& name_tok = tok(i + 1);
            if (name_tok.kind != TokenKind::kIdent) {
                diagnose(keyword, "expected function name after 'function'");
                return recover(i + 1, end);
            }
            name = name_tok.text;
            paren = i + 2;
        } else {
            name = keyword.text;
        }
        const Token& name_at = callable == CallableKind::kFunction ? tok(i + 1) : keyword;
        if (!is_punct(tok(paren), "(")) {
            diagnose(name_at, std::format("expected parameter list for function '{}'", name));
            return recover(paren, end);
        }
        std::optional<std::size_t> params_close;
        int depth = 0;
        for (std::size_t k = paren; k < end; ++k) {
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
            diagnose(name_at, std::format("unterminated parameter list in function '{}'", name));
            return recover(paren, end);
        }

        ir::Function function;
        function.name = name;
        function.location = location_of(name_at, m_context.file);
        for (const auto& line : docs) {
            if (line.empty()) {
                continue;
            }
            if (!function.doc.empty()) {
                function.doc += ' ';
            }
            function.doc += line;
        }
        switch (callable) {
            case CallableKind::kFunction:
                function.visibility = ir::Visibility::kPublic;
                break;
            case CallableKind::kConstructor:
                function.visibility = ir::Visibility::kInternal;
                break;
            case CallableKind::kSpecial:
                function.visibility = ir::Visibility::kExternal;
                break;
        }
        function.mutability = name == "receive" ? ir::Mutability::kPayable : ir::Mutability::kNone;

        std::vector<std::string> interface_params;
        for (const Span& param : split_top_level(m_tokens, paren + 1, *params_close, ",")) {
            if (param.end - param.begin < 2 || m_tokens[param.end - 1].kind != TokenKind::kIdent
                || contains(kDataLocations, m_tokens[param.end - 1].text)) {
                continue;
            }
            const std::string& param_name = m_tokens[param.end - 1].text;
            function.params.push_back(param_name);
            if (m_interfaces.contains(m_tokens[param.begin].text)) {
                interface_params.push_back(param_name);
            }
        }

        // Header keywords and modifier invocations up to the body.
        std::size_t k = *params_close + 1;
        for (; k < end && !is_punct(m_tokens[k], "{") && !is_punct(m_tokens[k], ";"); ++k) {
            const Token& t = m_tokens[k];
            if (is_ident(t, "returns") || is_ident(t, "override")) {
                if (is_punct(tok(k + 1), "(")) {
                    k = find_matching(m_tokens, k + 1, end).value_or(end - 1);
                }
                continue;
            }
            if (is_ident(t, "public")) {
                function.visibility = ir::Visibility::kPublic;
            } else if (is_ident(t, "external")) {
                function.visibility = ir::Visibility::kExternal;
            } else if (is_ident(t, "internal")) {
                function.visibility = ir::Visibility::kInternal;
            } else if (is_ident(t, "private")) {
                function.visibility = ir::Visibility::kPrivate;
            } else if (is_ident(t, "view") || is_ident(t, "constant")) {
                function.mutability = ir::Mutability::kView;
            } else if (is_ident(t, "pure")) {
                function.mutability = ir::Mutability::kPure;
            } else if (is_ident(t, "payable")) {
                function.mutability = ir::Mutability::kPayable;
                function.modifiers.push_back(ir::Modifier{.name = "payable", .kind = ir::ModifierKind::kPayable});
            } else if (t.kind == TokenKind::kIdent && !contains(kFunctionKeywords, t.text)) {
                function.modifiers.push_back(ir::Modifier{.name = t.text, .kind = modifier_kind(t.text)});
                if (is_punct(tok(k + 1), "(")) {
                    k = find_matching(m_tokens, k + 1, end).value_or(end - 1);
                }
            }
        }
        if (k >= end) {
            diagnose(name_at, std::format("missing body for function '{}'", name));
            return end;
        }
        if (is_punct(m_tokens[k], ";")) {
            return k + 1;  // abstract or interface declaration
        }
        auto close = body_close(k, end);
        if (!close) {
            diagnose(name_at, std::format("unterminated body in function '{}'", name));
            return next_member(k + 1, end);
        }
        m_pending.push_back(PendingFunction{.function = std::move(function),
                                            .interface_params = std::move(interface_params),
                                            .body_begin = k + 1,
                                            .body_end = *close});
        return *close + 1;
    }

    [[nodiscard]] ir::ModifierKind modifier_kind(const std::string& name) const
    {
        if (auto it = m_modifier_kinds.find(name); it != m_modifier_kinds.end()) {
            return it->second;
        }
        if (is_reentrancy_guard_name(name)) {
            return ir::ModifierKind::kReentrancyGuard;
        }
        if (is_access_control_name(name)) {
            return ir::ModifierKind::kAccessControl;
        }
        return ir::ModifierKind::kOther;
    }

    std::vector<Token> m_tokens;
    const ParseContext& m_context;
    SoliditySymbols m_symbols;
    std::vector<ContractDecl> m_contracts;
    NameSet m_interfaces;
    std::map<std::string, ir::ModifierKind, std::less<>> m_modifier_kinds;
    std::vector<ir::StorageSlot> m_slots;
    std::vector<ir::Diagnostic> m_diagnostics;
    std::vector<PendingFunction> m_pending;
};

}  // namespace

Result<ir::ContractModel> parse_solidity(std::string_view source, const ParseContext& context)
{
    auto lexed = tokenize(source, context.file, solidity_lex_options());
    auto model = SolidityParser(std::move(lexed.tokens), context).run();
    if (model && lexed.fault) {
        model->diagnostics.push_back(ir::to_diagnostic(*lexed.fault));
    }
    return model;
}

}  // namespace stylint::frontend
