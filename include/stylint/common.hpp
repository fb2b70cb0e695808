#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: error/result types, source locations, hash, path normalization
 */

#include <compare>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace stylint {

/**
 * @brief Position in a contract input.
 *
 * Source inputs use 1-based line/column. WASM inputs use line 0 and the byte
 * offset of the instruction as the column.
 */
struct SourceLocation
{
    std::string file;
    int line = 0;
    int col = 0;

    friend auto operator<=>(const SourceLocation&, const SourceLocation&) = default;
};

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;                       ///< Machine-readable error code
    std::string message;                    ///< Human-readable error message
    std::optional<SourceLocation> location; ///< Where the error was detected, if known

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message), .location = {}};
    }

    [[nodiscard]] static Error at(std::string code, std::string message, SourceLocation location)
    {
        return Error{.code = std::move(code),
                     .message = std::move(message),
                     .location = std::move(location)};
    }
};

/// Every fallible operation returns a Result; nothing throws across modules.
template <typename T>
using Result = std::expected<T, Error>;

using VoidResult = std::expected<void, Error>;

/// Error codes shared across modules
namespace error_code {
inline constexpr std::string_view kParseError = "ParseError";
inline constexpr std::string_view kConfigurationError = "ConfigurationError";
inline constexpr std::string_view kUnestimatedOperation = "UnestimatedOperation";
inline constexpr std::string_view kDetectorTimeout = "DetectorTimeout";
inline constexpr std::string_view kDetectorFailed = "DetectorFailed";
inline constexpr std::string_view kInvalidFinding = "InvalidFinding";
inline constexpr std::string_view kModelUnusable = "ModelUnusable";
inline constexpr std::string_view kSchemaValidationFailed = "SchemaValidationFailed";
}  // namespace error_code

}  // namespace stylint

namespace stylint::common {

/// Lower-case hex SHA-256 of the raw bytes (64 characters).
[[nodiscard]] std::string sha256(std::string_view data);

/// "sha256:<hex>", the form used for input digests and finding ids.
[[nodiscard]] std::string sha256_prefixed(std::string_view data);

/**
 * Normalize a contract path for report locations.
 *
 * Separators become '/', '.' segments are dropped and '..' folded. When
 * repo_root is given and contains the path, the result is relative to it.
 * An empty input yields ".".
 */
[[nodiscard]] std::string normalize_path(std::string_view input, std::string_view repo_root = "");

/// Unix root, UNC prefix or drive letter with separator.
[[nodiscard]] bool is_absolute_path(std::string_view path);

}  // namespace stylint::common
