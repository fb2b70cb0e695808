/**
 * @file canonical_json.cpp
 * @brief Canonical JSON writer
 *
 * Emits the canonical byte string in a single recursive pass. Scalars are
 * delegated to nlohmann::json::dump so string escaping matches the library.
 */

#include "stylint/canonical_json.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <string_view>
#include <vector>

namespace stylint::canonical {

namespace {

constexpr std::string_view kFloatNotAllowed = "FloatingPointNotAllowed";

[[nodiscard]] stylint::Error float_error(std::string_view path)
{
    return Error::make(std::string(kFloatNotAllowed),
                       std::format("Floating point numbers not allowed in canonical JSON at: {}",
                                   path));
}

// NOLINTNEXTLINE(misc-no-recursion) - JSON documents are trees.
stylint::VoidResult write_value(const nlohmann::json& j, std::string& out, const std::string& path)
{
    switch (j.type()) {
        case nlohmann::json::value_t::number_float:
            return std::unexpected(float_error(path));
        case nlohmann::json::value_t::object: {
            std::vector<std::string_view> keys;
            keys.reserve(j.size());
            for (const auto& [key, _] : j.items()) {
                keys.emplace_back(key);
            }
            std::ranges::sort(keys);

            out += '{';
            for (auto [i, key] : std::views::enumerate(keys)) {
                if (i > 0) {
                    out += ',';
                }
                out += nlohmann::json(key).dump(-1, ' ', false,
                                                nlohmann::json::error_handler_t::strict);
                out += ':';
                if (auto written = write_value(j.at(std::string(key)), out,
                                               std::format("{}.{}", path, key));
                    !written) {
                    return written;
                }
            }
            out += '}';
            return {};
        }
        case nlohmann::json::value_t::array: {
            out += '[';
            for (auto [i, elem] : std::views::enumerate(j)) {
                if (i > 0) {
                    out += ',';
                }
                if (auto written = write_value(elem, out, std::format("{}[{}]", path, i));
                    !written) {
                    return written;
                }
            }
            out += ']';
            return {};
        }
        default:
            out += j.dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
            return {};
    }
}

}  // namespace

stylint::Result<std::string> canonicalize(const nlohmann::json& j)
{
    std::string out;
    try {
        if (auto written = write_value(j, out, "$"); !written) {
            return std::unexpected(written.error());
        }
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(
            Error::make("InvalidJson", std::format("Failed to serialize JSON: {}", ex.what())));
    }
    return out;
}

stylint::Result<std::string> hash_canonical(const nlohmann::json& j)
{
    return canonicalize(j).transform(
        [](const std::string& canonical) { return common::sha256_prefixed(canonical); });
}

stylint::VoidResult validate_for_canonical(const nlohmann::json& j)
{
    return canonicalize(j).transform([](const std::string&) {});
}

}  // namespace stylint::canonical
