#pragma once

/**
 * @file lexer.hpp
 * @brief Tokenizer shared by the Stylus Rust and Solidity front ends
 */

#include "stylint/common.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stylint::frontend {

enum class TokenKind {
    kIdent,
    kNumber,
    kString,
    kPunct,
    kDoc,  ///< Doc comment; text holds the comment body
};

struct Token
{
    TokenKind kind = TokenKind::kPunct;
    std::string text;
    int line = 0;
    int col = 0;
};

struct LexOptions
{
    bool nested_block_comments = false;  ///< Rust allows /* /* */ */
    bool single_quote_strings = false;   ///< Solidity 'text'
    bool rust_literals = false;          ///< r#"raw"#, b"bytes", 'c' vs 'lifetime
    bool power_operator = false;         ///< Solidity **
};

[[nodiscard]] LexOptions rust_lex_options();
[[nodiscard]] LexOptions solidity_lex_options();

struct TokenStream
{
    std::vector<Token> tokens;
    std::optional<Error> fault;  ///< ParseError where scanning stopped early
};

/**
 * Split source text into tokens.
 *
 * An unterminated string or block comment stops the scan: the tokens before
 * it are kept and `fault` locates the literal, so the parsers can still
 * recover the declarations that precede it.
 */
[[nodiscard]] TokenStream tokenize(std::string_view source, const std::string& file, const LexOptions& options);

/// Index of the bracket closing tokens[open]; nullopt when unbalanced.
[[nodiscard]] std::optional<std::size_t>
find_matching(const std::vector<Token>& tokens, std::size_t open, std::size_t limit);

/// Readable text for tokens[begin, end), stable across runs.
[[nodiscard]] std::string
join_tokens(const std::vector<Token>& tokens, std::size_t begin, std::size_t end);

/// Half-open token range.
struct Span
{
    std::size_t begin = 0;
    std::size_t end = 0;

    [[nodiscard]] bool empty() const { return begin >= end; }
};

/// Split [begin, end) at `separator` tokens outside brackets.
[[nodiscard]] std::vector<Span> split_top_level(const std::vector<Token>& tokens,
                                                std::size_t begin,
                                                std::size_t end,
                                                std::string_view separator);

/// First `text` punct in [begin, end) outside brackets.
[[nodiscard]] std::optional<std::size_t> find_top_level(const std::vector<Token>& tokens,
                                                        std::size_t begin,
                                                        std::size_t end,
                                                        std::string_view text);

/// Start of the postfix expression ending just before tokens[dot] (a '.').
[[nodiscard]] std::size_t receiver_begin(const std::vector<Token>& tokens,
                                         std::size_t dot,
                                         std::size_t floor);

/// Whether an operator at tokens[index] has a left operand (binary use).
[[nodiscard]] bool has_left_operand(const std::vector<Token>& tokens,
                                    std::size_t index,
                                    std::size_t floor);

[[nodiscard]] inline bool is_punct(const Token& token, std::string_view text)
{
    return token.kind == TokenKind::kPunct && token.text == text;
}

[[nodiscard]] inline bool is_ident(const Token& token, std::string_view text)
{
    return token.kind == TokenKind::kIdent && token.text == text;
}

[[nodiscard]] inline SourceLocation location_of(const Token& token, const std::string& file)
{
    return SourceLocation{.file = file, .line = token.line, .col = token.col};
}

}  // namespace stylint::frontend
