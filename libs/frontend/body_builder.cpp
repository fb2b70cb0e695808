/**
 * @file body_builder.cpp
 * @brief Operation emission and local data-flow facts for source front ends
 */

#include "body_builder.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <ranges>
#include <span>

namespace stylint::frontend {

namespace {

[[nodiscard]] std::string lower(std::string_view text)
{
    std::string out(text);
    std::ranges::transform(out, out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    // Normalize camelCase and snake_case to the same spelling.
    std::erase(out, '_');
    return out;
}

[[nodiscard]] bool contains_any(std::string_view name, std::span<const std::string_view> needles)
{
    const std::string folded = lower(name);
    return std::ranges::any_of(needles, [&folded](std::string_view needle) {
        return folded.find(needle) != std::string::npos;
    });
}

constexpr std::array<std::string_view, 11> kRoleWords = {
    "owner",    "admin",     "role",       "operator", "minter",  "governance",
    "governor", "authorized", "controller", "manager",  "guardian",
};

constexpr std::array<std::string_view, 8> kAccessHelpers = {
    "onlyowner", "checkowner", "isowner",  "hasrole",
    "isadmin",   "onlyrole",   "requireowner", "ensureowner",
};

constexpr std::array<std::string_view, 6> kAllowListWords = {
    "allow", "whitelist", "trusted", "approvedtarget", "registry", "validtarget",
};

constexpr std::array<std::string_view, 7> kAccessModifierWords = {
    "onlyowner", "onlyadmin", "onlyrole", "onlyauthorized", "auth", "restricted", "onlygov",
};

constexpr std::array<std::string_view, 5> kReentrancyWords = {
    "nonreentrant", "noreentrancy", "reentrancyguard", "nonreentrancy", "mutex",
};

[[nodiscard]] bool literal_token(const Token& token)
{
    return token.kind == TokenKind::kNumber || token.kind == TokenKind::kString;
}

}  // namespace

bool is_access_control_name(std::string_view name)
{
    return contains_any(name, kAccessModifierWords) || contains_any(name, kAccessHelpers);
}

bool is_reentrancy_guard_name(std::string_view name)
{
    return contains_any(name, kReentrancyWords) || lower(name) == "lock";
}

ir::GuardKind classify_guard(const ConditionFacts& facts)
{
    for (const auto& clause : facts.clauses) {
        if (clause.mentions_origin) {
            return ir::GuardKind::kTxOrigin;
        }
    }
    for (const auto& clause : facts.clauses) {
        const bool helper = std::ranges::any_of(clause.calls, [](const std::string& call) {
            return contains_any(call, kAccessHelpers);
        });
        const bool role_slot = std::ranges::any_of(clause.slots, [](const std::string& slot) {
            return contains_any(slot, kRoleWords);
        });
        if (helper || (clause.mentions_sender && (clause.compares || role_slot))) {
            return ir::GuardKind::kAccessControl;
        }
    }
    for (const auto& clause : facts.clauses) {
        const auto allow_list = [](const std::string& name) {
            return contains_any(name, kAllowListWords);
        };
        if (std::ranges::any_of(clause.slots, allow_list)
            || std::ranges::any_of(clause.calls, allow_list)) {
            return ir::GuardKind::kAllowList;
        }
    }
    return ir::GuardKind::kNone;
}

BodyBuilder::BodyBuilder(ir::Function& function, std::string file)
    : m_function(function)
    , m_file(std::move(file))
    , m_open_loops()
    , m_params(function.params.begin(), function.params.end())
    , m_locals()
    , m_collections()
    , m_local_arithmetic()
    , m_call_results()
{}

std::size_t BodyBuilder::emit(const Token& at, ir::OperationKind kind)
{
    m_function.operations.push_back(ir::Operation{.location = location_of(at, m_file),
                                                  .loop_depth = loop_depth(),
                                                  .kind = std::move(kind)});
    return m_function.operations.size() - 1;
}

void BodyBuilder::emit_branch(const Token& at, const ConditionFacts& facts, bool reverts)
{
    std::set<std::string> subjects;
    for (const auto& clause : facts.clauses) {
        subjects.insert(clause.slots.begin(), clause.slots.end());
        subjects.insert(clause.idents.begin(), clause.idents.end());
        if (clause.mentions_sender) {
            subjects.insert("sender");
        }
        if (clause.mentions_origin) {
            subjects.insert("origin");
        }
    }
    ir::GuardKind guard = classify_guard(facts);
    if (guard == ir::GuardKind::kNone && reverts) {
        guard = ir::GuardKind::kInputValidation;
    }
    emit(at,
         ir::Branch{.condition = facts.text,
                    .guard = guard,
                    .reverts = reverts,
                    .subjects = std::vector<std::string>(subjects.begin(), subjects.end())});
}

void BodyBuilder::open_loop(const Token& at, std::string header, bool storage_bound)
{
    const std::size_t index = emit(at,
                                   ir::Loop{.header = std::move(header),
                                            .storage_bound = storage_bound,
                                            .body_begin = size() + 1,
                                            .body_end = size() + 1});
    m_open_loops.push_back(index);
}

void BodyBuilder::close_loop()
{
    if (m_open_loops.empty()) {
        return;
    }
    const std::size_t index = m_open_loops.back();
    m_open_loops.pop_back();
    auto& loop = std::get<ir::Loop>(m_function.operations[index].kind);
    loop.body_end = size();
}

void BodyBuilder::mark_unsafe(const Token& at)
{
    m_function.unsafe_regions.push_back(location_of(at, m_file));
}

bool BodyBuilder::is_param(std::string_view name) const
{
    return m_params.contains(name);
}

bool BodyBuilder::is_local(std::string_view name) const
{
    return m_locals.contains(name);
}

void BodyBuilder::bind_local(const std::string& name, ir::ValueSource source)
{
    m_locals[name] = source;
}

std::optional<ir::ValueSource> BodyBuilder::local_source(std::string_view name) const
{
    if (auto it = m_locals.find(name); it != m_locals.end()) {
        return it->second;
    }
    return std::nullopt;
}

void BodyBuilder::bind_collection(const std::string& name, bool preallocated)
{
    m_collections[name] = preallocated;
}

std::optional<bool> BodyBuilder::collection_preallocated(std::string_view name) const
{
    if (auto it = m_collections.find(name); it != m_collections.end()) {
        return it->second;
    }
    return std::nullopt;
}

void BodyBuilder::attach_arithmetic(const std::string& name, const std::vector<std::size_t>& ops)
{
    auto& attached = m_local_arithmetic[name];
    attached.insert(attached.end(), ops.begin(), ops.end());
}

void BodyBuilder::sink_local(std::string_view name, ir::ArithmeticSink sink)
{
    auto it = m_local_arithmetic.find(name);
    if (it == m_local_arithmetic.end()) {
        return;
    }
    for (std::size_t index : it->second) {
        auto& arithmetic = std::get<ir::Arithmetic>(m_function.operations[index].kind);
        if (arithmetic.sink == ir::ArithmeticSink::kNone) {
            arithmetic.sink = sink;
        }
    }
}

void BodyBuilder::bind_call_result(const std::string& name, std::size_t op_index)
{
    m_call_results[name].push_back(op_index);
}

void BodyBuilder::mark_result_handled(std::string_view name)
{
    auto it = m_call_results.find(name);
    if (it == m_call_results.end()) {
        return;
    }
    for (std::size_t index : it->second) {
        mark_handled(index);
    }
    m_call_results.erase(it);
}

void BodyBuilder::mark_handled(std::size_t op_index)
{
    if (auto* call = std::get_if<ir::ExternalCall>(&m_function.operations[op_index].kind)) {
        call->result_checked = true;
    }
}

ir::ValueSource BodyBuilder::classify_source(const std::vector<Token>& tokens,
                                             std::size_t begin,
                                             std::size_t end,
                                             bool mentions_sender,
                                             bool mentions_storage) const
{
    if (begin >= end) {
        return ir::ValueSource::kNone;
    }
    if (mentions_sender) {
        return ir::ValueSource::kSender;
    }
    bool saw_local = false;
    std::optional<ir::ValueSource> inherited;
    for (std::size_t i = begin; i < end; ++i) {
        const Token& token = tokens[i];
        if (token.kind != TokenKind::kIdent) {
            continue;
        }
        // Path segments and method names are not values.
        if (i > begin && (is_punct(tokens[i - 1], "::") || is_punct(tokens[i - 1], "."))) {
            continue;
        }
        if (is_param(token.text)) {
            return ir::ValueSource::kParameter;
        }
        if (auto source = local_source(token.text)) {
            if (!inherited || *source == ir::ValueSource::kSender
                || *source == ir::ValueSource::kParameter) {
                inherited = source;
            }
            continue;
        }
        const bool constant_like = std::isupper(static_cast<unsigned char>(token.text.front())) != 0
                                   || token.text == "address" || token.text == "payable"
                                   || token.text == "true" || token.text == "false";
        if (!constant_like && !is_ident(token, "self") && !is_ident(token, "this")) {
            saw_local = true;
        }
    }
    if (inherited) {
        return *inherited;
    }
    if (mentions_storage) {
        return ir::ValueSource::kStorage;
    }
    if (saw_local) {
        return ir::ValueSource::kLocal;
    }
    const bool has_value = std::ranges::any_of(
        std::ranges::subrange(tokens.begin() + static_cast<std::ptrdiff_t>(begin),
                              tokens.begin() + static_cast<std::ptrdiff_t>(end)),
        [](const Token& token) { return literal_token(token) || token.kind == TokenKind::kIdent; });
    return has_value ? ir::ValueSource::kConstant : ir::ValueSource::kNone;
}

}  // namespace stylint::frontend
