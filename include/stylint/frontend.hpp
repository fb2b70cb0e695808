#pragma once

/**
 * @file frontend.hpp
 * @brief Contract model builder: Stylus Rust, Solidity and WASM inputs
 */

#include "stylint/common.hpp"
#include "stylint/model.hpp"

#include <string>
#include <string_view>

namespace stylint::frontend {

struct BuildOptions
{
    std::string file_path;      ///< Path recorded in locations (normalized)
    std::string repo_root;      ///< Makes file_path relative when set
    std::string contract_name;  ///< Contract to select; required to name WASM modules
};

/**
 * Guess the input dialect.
 * WASM by magic, Stylus Rust by SDK markers, Solidity by pragma or a top-level
 * contract/interface/library declaration, otherwise Stylus Rust.
 */
[[nodiscard]] ir::Dialect detect_dialect(std::string_view source);

/**
 * Build the contract model for one input.
 *
 * Malformed functions are skipped and recorded as diagnostics. Fails with
 * ParseError on empty or truncated input, a bad WASM header, or when nothing
 * but failed function regions was found.
 *
 * @param source Source text or raw WASM bytes
 * @param dialect Dialect, or kAuto to detect
 * @param options File path and contract selection
 */
[[nodiscard]] Result<ir::ContractModel>
build_model(std::string_view source, ir::Dialect dialect, const BuildOptions& options = {});

}  // namespace stylint::frontend
