#pragma once

/**
 * @file frontends.hpp
 * @brief Per-dialect model builders behind frontend::build_model
 *
 * Each builder fills functions, slots and diagnostics. Digest, dialect, slot
 * access summaries, call-site index and the location map are completed by
 * build_model.
 */

#include "stylint/common.hpp"
#include "stylint/model.hpp"

#include <string>
#include <string_view>

namespace stylint::frontend {

struct ParseContext
{
    std::string file;           ///< Normalized path used in every SourceLocation
    std::string contract_name;  ///< Explicit name; empty to infer
};

[[nodiscard]] Result<ir::ContractModel> parse_stylus_rust(std::string_view source,
                                                          const ParseContext& context);

[[nodiscard]] Result<ir::ContractModel> parse_solidity(std::string_view source,
                                                       const ParseContext& context);

[[nodiscard]] Result<ir::ContractModel> decode_wasm(std::string_view bytes,
                                                    const ParseContext& context);

}  // namespace stylint::frontend
