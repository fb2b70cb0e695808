#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation for config documents and reports
 */

#include "stylint/common.hpp"

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace stylint::common {

/**
 * Validate JSON against a JSON Schema file.
 *
 * Schemas may reference siblings as "stylint:schema/<name>", resolved to
 * "<name>.schema.json" next to the root schema.
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, error on failure
 */
[[nodiscard]] stylint::VoidResult validate_json(const nlohmann::json& j,
                                                const std::string& schema_path);

/**
 * Validate JSON against a named schema inside a schema directory.
 *
 * @param j JSON document to validate
 * @param schema_dir Directory holding "<name>.schema.json" files
 * @param schema_name Schema name, e.g. "report.v1"
 */
[[nodiscard]] stylint::VoidResult validate_json_in(const nlohmann::json& j,
                                                   std::string_view schema_dir,
                                                   std::string_view schema_name);

}  // namespace stylint::common
