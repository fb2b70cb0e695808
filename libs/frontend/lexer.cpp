/**
 * @file lexer.cpp
 * @brief Tokenizer shared by the Stylus Rust and Solidity front ends
 */

#include "lexer.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <utility>

namespace stylint::frontend {

namespace {

constexpr std::array<std::string_view, 4> kThreeCharPuncts = {"<<=", ">>=", "..=", "..."};

constexpr std::array<std::string_view, 22> kTwoCharPuncts = {
    "::", "->", "=>", "==", "!=", "<=", ">=", "&&", "||", "+=", "-=",
    "*=", "/=", "%=", "<<", ">>", "..", "++", "--", "|=", "&=", "^=",
};

[[nodiscard]] bool is_ident_start(char c)
{
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '$';
}

[[nodiscard]] bool is_ident_char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '$';
}

[[nodiscard]] std::string trim(std::string_view text)
{
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(first, last - first + 1));
}

class Scanner
{
public:
    Scanner(std::string_view source, const std::string& file, const LexOptions& options)
        : m_source(source)
        , m_file(file)
        , m_options(options)
    {}

    [[nodiscard]] TokenStream run()
    {
        while (m_pos < m_source.size()) {
            const char c = m_source[m_pos];
            if (c == '\n' || c == ' ' || c == '\t' || c == '\r') {
                advance(1);
                continue;
            }
            if (starts_with("//")) {
                line_comment();
                continue;
            }
            if (starts_with("/*")) {
                if (auto result = block_comment(); !result) {
                    return TokenStream{.tokens = std::move(m_tokens), .fault = result.error()};
                }
                continue;
            }
            if (m_options.rust_literals && rust_prefixed_string()) {
                if (auto result = raw_or_byte_string(); !result) {
                    return TokenStream{.tokens = std::move(m_tokens), .fault = result.error()};
                }
                continue;
            }
            if (c == '"' || (c == '\'' && m_options.single_quote_strings)) {
                if (auto result = quoted_string(c); !result) {
                    return TokenStream{.tokens = std::move(m_tokens), .fault = result.error()};
                }
                continue;
            }
            if (c == '\'' && m_options.rust_literals) {
                char_or_lifetime();
                continue;
            }
            if (std::isdigit(static_cast<unsigned char>(c)) != 0) {
                number();
                continue;
            }
            if (is_ident_start(c)) {
                identifier();
                continue;
            }
            punctuation();
        }
        return TokenStream{.tokens = std::move(m_tokens), .fault = std::nullopt};
    }

private:
    [[nodiscard]] bool starts_with(std::string_view text) const
    {
        return m_source.substr(m_pos).starts_with(text);
    }

    [[nodiscard]] char peek(std::size_t ahead) const
    {
        return m_pos + ahead < m_source.size() ? m_source[m_pos + ahead] : '\0';
    }

    void advance(std::size_t count)
    {
        for (std::size_t i = 0; i < count && m_pos < m_source.size(); ++i) {
            if (m_source[m_pos] == '\n') {
                ++m_line;
                m_col = 1;
            } else {
                ++m_col;
            }
            ++m_pos;
        }
    }

    void push(TokenKind kind, std::string text, int line, int col)
    {
        m_tokens.push_back(Token{.kind = kind, .text = std::move(text), .line = line, .col = col});
    }

    [[nodiscard]] Error error_here(std::string message, int line, int col) const
    {
        return Error::at(std::string(error_code::kParseError),
                         std::move(message),
                         SourceLocation{.file = m_file, .line = line, .col = col});
    }

    void line_comment()
    {
        const int line = m_line;
        const int col = m_col;
        const std::size_t end = std::min(m_source.find('\n', m_pos), m_source.size());
        const std::string_view body = m_source.substr(m_pos, end - m_pos);
        // "///" is documentation, "////" is an ordinary comment.
        if (body.starts_with("///") && !body.starts_with("////")) {
            push(TokenKind::kDoc, trim(body.substr(3)), line, col);
        }
        advance(end - m_pos);
    }

    VoidResult block_comment()
    {
        const int line = m_line;
        const int col = m_col;
        const std::size_t start = m_pos;
        const bool doc = starts_with("/**") && !starts_with("/**/");
        advance(2);
        int depth = 1;
        while (m_pos < m_source.size() && depth > 0) {
            if (m_options.nested_block_comments && starts_with("/*")) {
                ++depth;
                advance(2);
            } else if (starts_with("*/")) {
                --depth;
                advance(2);
            } else {
                advance(1);
            }
        }
        if (depth > 0) {
            return std::unexpected(error_here("unterminated block comment", line, col));
        }
        if (doc) {
            std::string text;
            const std::string_view inner = m_source.substr(start + 3, m_pos - start - 5);
            std::size_t from = 0;
            while (from <= inner.size()) {
                const std::size_t to = std::min(inner.find('\n', from), inner.size());
                std::string piece = trim(inner.substr(from, to - from));
                if (piece.starts_with('*')) {
                    piece = trim(std::string_view(piece).substr(1));
                }
                if (!piece.empty()) {
                    if (!text.empty()) {
                        text += ' ';
                    }
                    text += piece;
                }
                from = to + 1;
            }
            push(TokenKind::kDoc, std::move(text), line, col);
        }
        return {};
    }

    [[nodiscard]] bool rust_prefixed_string() const
    {
        const char c = peek(0);
        if (c == 'r' && (peek(1) == '"' || (peek(1) == '#' && (peek(2) == '"' || peek(2) == '#')))) {
            return true;
        }
        if (c == 'b' && (peek(1) == '"' || (peek(1) == 'r' && (peek(2) == '"' || peek(2) == '#')))) {
            return true;
        }
        return false;
    }

    VoidResult raw_or_byte_string()
    {
        const int line = m_line;
        const int col = m_col;
        if (peek(0) == 'b') {
            advance(1);
        }
        if (peek(0) != 'r') {
            return quoted_string('"');
        }
        advance(1);
        std::size_t hashes = 0;
        while (peek(0) == '#') {
            ++hashes;
            advance(1);
        }
        advance(1);  // opening quote
        const std::string terminator = "\"" + std::string(hashes, '#');
        const std::size_t end = m_source.find(terminator, m_pos);
        if (end == std::string_view::npos) {
            return std::unexpected(error_here("unterminated raw string literal", line, col));
        }
        std::string text(m_source.substr(m_pos, end - m_pos));
        advance(end - m_pos + terminator.size());
        push(TokenKind::kString, std::move(text), line, col);
        return {};
    }

    VoidResult quoted_string(char quote)
    {
        const int line = m_line;
        const int col = m_col;
        advance(1);
        std::string text;
        while (m_pos < m_source.size() && m_source[m_pos] != quote) {
            if (m_source[m_pos] == '\\' && m_pos + 1 < m_source.size()) {
                text += m_source[m_pos];
                advance(1);
            }
            text += m_source[m_pos];
            advance(1);
        }
        if (m_pos >= m_source.size()) {
            return std::unexpected(error_here("unterminated string literal", line, col));
        }
        advance(1);
        push(TokenKind::kString, std::move(text), line, col);
        return {};
    }

    void char_or_lifetime()
    {
        const int line = m_line;
        const int col = m_col;
        if (peek(1) == '\\') {
            std::size_t end = m_pos + 2;
            while (end < m_source.size() && m_source[end] != '\'' && m_source[end] != '\n') {
                ++end;
            }
            std::string text(m_source.substr(m_pos + 1, end - m_pos - 1));
            advance(end - m_pos + 1);
            push(TokenKind::kString, std::move(text), line, col);
            return;
        }
        if (peek(1) != '\0' && peek(2) == '\'') {
            std::string text(1, peek(1));
            advance(3);
            push(TokenKind::kString, std::move(text), line, col);
            return;
        }
        // Lifetime or label: the quote is dropped and the name lexes as an identifier.
        advance(1);
    }

    void number()
    {
        const int line = m_line;
        const int col = m_col;
        const std::size_t start = m_pos;
        while (m_pos < m_source.size()) {
            const char c = m_source[m_pos];
            if (is_ident_char(c)) {
                advance(1);
            } else if (c == '.' && std::isdigit(static_cast<unsigned char>(peek(1))) != 0) {
                advance(1);
            } else {
                break;
            }
        }
        push(TokenKind::kNumber, std::string(m_source.substr(start, m_pos - start)), line, col);
    }

    void identifier()
    {
        const int line = m_line;
        const int col = m_col;
        const std::size_t start = m_pos;
        while (m_pos < m_source.size() && is_ident_char(m_source[m_pos])) {
            advance(1);
        }
        push(TokenKind::kIdent, std::string(m_source.substr(start, m_pos - start)), line, col);
    }

    void punctuation()
    {
        const int line = m_line;
        const int col = m_col;
        for (auto punct : kThreeCharPuncts) {
            if (starts_with(punct)) {
                push(TokenKind::kPunct, std::string(punct), line, col);
                advance(3);
                return;
            }
        }
        if (m_options.power_operator && starts_with("**")) {
            push(TokenKind::kPunct, "**", line, col);
            advance(2);
            return;
        }
        for (auto punct : kTwoCharPuncts) {
            if (starts_with(punct)) {
                push(TokenKind::kPunct, std::string(punct), line, col);
                advance(2);
                return;
            }
        }
        push(TokenKind::kPunct, std::string(1, m_source[m_pos]), line, col);
        advance(1);
    }

    std::string_view m_source;
    const std::string& m_file;
    LexOptions m_options;
    std::size_t m_pos = 0;
    int m_line = 1;
    int m_col = 1;
    std::vector<Token> m_tokens;
};

[[nodiscard]] bool is_open_bracket(const Token& token)
{
    return is_punct(token, "(") || is_punct(token, "[") || is_punct(token, "{");
}

[[nodiscard]] bool is_close_bracket(const Token& token)
{
    return is_punct(token, ")") || is_punct(token, "]") || is_punct(token, "}");
}

[[nodiscard]] bool spaced_operator(const Token& token)
{
    static constexpr std::array<std::string_view, 25> kSpaced = {
        "==", "!=", "<=", ">=", "&&", "||", "=",  "+",  "-",  "*",  "/",  "%",  "<",
        ">",  "+=", "-=", "*=", "/=", "%=", "=>", "<<", ">>", "**", "<<=", ">>=",
    };
    return token.kind == TokenKind::kPunct && std::ranges::contains(kSpaced, token.text);
}

[[nodiscard]] bool wordlike(const Token& token)
{
    return token.kind == TokenKind::kIdent || token.kind == TokenKind::kNumber
           || token.kind == TokenKind::kString;
}

}  // namespace

LexOptions rust_lex_options()
{
    return LexOptions{.nested_block_comments = true,
                      .single_quote_strings = false,
                      .rust_literals = true,
                      .power_operator = false};
}

LexOptions solidity_lex_options()
{
    return LexOptions{.nested_block_comments = false,
                      .single_quote_strings = true,
                      .rust_literals = false,
                      .power_operator = true};
}

TokenStream tokenize(std::string_view source, const std::string& file, const LexOptions& options)
{
    return Scanner(source, file, options).run();
}

std::optional<std::size_t>
find_matching(const std::vector<Token>& tokens, std::size_t open, std::size_t limit)
{
    limit = std::min(limit, tokens.size());
    if (open >= limit || !is_open_bracket(tokens[open])) {
        return std::nullopt;
    }
    // Only the bracket kind being matched counts, so a stray '(' inside a
    // body cannot hide the closing '}'.
    const std::string& open_text = tokens[open].text;
    const std::string_view close_text = open_text == "(" ? ")" : open_text == "[" ? "]" : "}";
    int depth = 0;
    for (std::size_t i = open; i < limit; ++i) {
        if (is_punct(tokens[i], open_text)) {
            ++depth;
        } else if (is_punct(tokens[i], close_text)) {
            --depth;
            if (depth == 0) {
                return i;
            }
        }
    }
    return std::nullopt;
}

std::vector<Span> split_top_level(const std::vector<Token>& tokens,
                                  std::size_t begin,
                                  std::size_t end,
                                  std::string_view separator)
{
    std::vector<Span> parts;
    if (begin >= end) {
        return parts;
    }
    int depth = 0;
    std::size_t start = begin;
    for (std::size_t i = begin; i < end; ++i) {
        if (is_open_bracket(tokens[i])) {
            ++depth;
        } else if (is_close_bracket(tokens[i])) {
            --depth;
        } else if (depth == 0 && is_punct(tokens[i], separator)) {
            parts.push_back(Span{.begin = start, .end = i});
            start = i + 1;
        }
    }
    if (start < end) {
        parts.push_back(Span{.begin = start, .end = end});
    }
    return parts;
}

std::optional<std::size_t> find_top_level(const std::vector<Token>& tokens,
                                          std::size_t begin,
                                          std::size_t end,
                                          std::string_view text)
{
    int depth = 0;
    for (std::size_t i = begin; i < end && i < tokens.size(); ++i) {
        if (depth == 0 && is_punct(tokens[i], text)) {
            return i;
        }
        if (is_open_bracket(tokens[i])) {
            ++depth;
        } else if (is_close_bracket(tokens[i])) {
            --depth;
        }
    }
    return std::nullopt;
}

std::size_t receiver_begin(const std::vector<Token>& tokens, std::size_t dot, std::size_t floor)
{
    std::size_t i = dot;
    while (i > floor) {
        const Token& prev = tokens[i - 1];
        if (is_close_bracket(prev)) {
            // Walk back to the matching opener.
            int depth = 0;
            std::size_t j = i - 1;
            for (;; --j) {
                if (is_close_bracket(tokens[j])) {
                    ++depth;
                } else if (is_open_bracket(tokens[j])) {
                    --depth;
                }
                if (depth == 0 || j == floor) {
                    break;
                }
            }
            i = j;
            continue;
        }
        if (prev.kind == TokenKind::kIdent || prev.kind == TokenKind::kNumber
            || prev.kind == TokenKind::kString) {
            i -= 1;
            if (i > floor && (is_punct(tokens[i - 1], ".") || is_punct(tokens[i - 1], "::"))) {
                i -= 1;
                continue;
            }
            break;
        }
        break;
    }
    return i;
}

bool has_left_operand(const std::vector<Token>& tokens, std::size_t index, std::size_t floor)
{
    if (index <= floor) {
        return false;
    }
    const Token& prev = tokens[index - 1];
    if (prev.kind == TokenKind::kNumber || prev.kind == TokenKind::kString) {
        return true;
    }
    if (prev.kind == TokenKind::kIdent) {
        static constexpr std::array<std::string_view, 9> kPrefixKeywords = {
            "return", "in", "let", "mut", "if", "match", "while", "else", "emit",
        };
        return !std::ranges::contains(kPrefixKeywords, prev.text);
    }
    return is_punct(prev, ")") || is_punct(prev, "]") || is_punct(prev, "?");
}

std::string join_tokens(const std::vector<Token>& tokens, std::size_t begin, std::size_t end)
{
    std::string text;
    end = std::min(end, tokens.size());
    for (std::size_t i = begin; i < end; ++i) {
        const Token& token = tokens[i];
        if (token.kind == TokenKind::kDoc) {
            continue;
        }
        if (!text.empty()) {
            const Token& prev = tokens[i - 1];
            const bool space = (wordlike(prev) && wordlike(token)) || spaced_operator(prev)
                               || spaced_operator(token) || is_punct(prev, ",");
            if (space) {
                text += ' ';
            }
        }
        if (token.kind == TokenKind::kString) {
            text += std::format("\"{}\"", token.text);
        } else {
            text += token.text;
        }
    }
    return text;
}

}  // namespace stylint::frontend
