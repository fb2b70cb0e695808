/**
 * @file path.cpp
 * @brief Path normalization for deterministic source locations
 *
 * Contract file paths end up in every SourceLocation of a report, so they are
 * normalized once when the model is built: forward slashes, no '.' segments,
 * '..' folded where possible, and optionally made relative to a repo root.
 */

#include "stylint/common.hpp"

#include <algorithm>
#include <cctype>
#include <ranges>
#include <string>
#include <vector>

namespace stylint::common {

namespace {

struct SplitPath
{
    std::string root;  ///< "", "/" or a lower-cased drive prefix such as "c:/"
    std::vector<std::string> segments;
};

[[nodiscard]] SplitPath split(std::string_view input)
{
    std::string path(input);
    std::ranges::replace(path, '\\', '/');

    SplitPath result;
    std::string_view rest(path);
    if (rest.size() >= 2 && std::isalpha(static_cast<unsigned char>(rest[0])) != 0
        && rest[1] == ':') {
        result.root = std::string(1, static_cast<char>(std::tolower(rest[0]))) + ":/";
        rest.remove_prefix(2);
    } else if (rest.starts_with('/')) {
        result.root = "/";
    }

    for (auto part : rest | std::views::split('/')) {
        std::string_view segment(part.begin(), part.end());
        if (segment.empty() || segment == ".") {
            continue;
        }
        if (segment == "..") {
            if (!result.segments.empty() && result.segments.back() != "..") {
                result.segments.pop_back();
            } else if (result.root.empty()) {
                result.segments.emplace_back("..");
            }
            continue;
        }
        result.segments.emplace_back(segment);
    }
    return result;
}

[[nodiscard]] std::string join(const SplitPath& path)
{
    std::string out = path.root;
    for (auto [i, segment] : std::views::enumerate(path.segments)) {
        if (i > 0) {
            out += '/';
        }
        out += segment;
    }
    return out;
}

}  // namespace

bool is_absolute_path(std::string_view path)
{
    if (path.starts_with('/') || path.starts_with("\\\\")) {
        return true;
    }
    return path.size() >= 3 && std::isalpha(static_cast<unsigned char>(path[0])) != 0
           && path[1] == ':' && (path[2] == '/' || path[2] == '\\');
}

std::string normalize_path(std::string_view input, std::string_view repo_root)
{
    if (input.empty()) {
        return ".";
    }
    SplitPath path = split(input);

    if (!repo_root.empty()) {
        SplitPath root = split(repo_root);
        const bool under_root =
            root.root == path.root && root.segments.size() <= path.segments.size()
            && std::ranges::equal(root.segments,
                                  path.segments | std::views::take(root.segments.size()));
        if (under_root) {
            path.root.clear();
            path.segments.erase(path.segments.begin(),
                                path.segments.begin()
                                    + static_cast<std::ptrdiff_t>(root.segments.size()));
        }
    }

    std::string normalized = join(path);
    return normalized.empty() ? "." : normalized;
}

}  // namespace stylint::common
