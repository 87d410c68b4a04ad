/**
 * @file json_map.hpp
 * @brief Flat string→string JSON objects for context and label fields.
 * @author log_courier contributors
 */

#pragma once

#include <string>
#include <string_view>

#include "core/result.hpp"
#include "core/types.hpp"

namespace log_courier {

/// `{"k":"v",...}` with keys in map order; an empty map encodes as "".
[[nodiscard]] std::string encode_json_map(const ContextMap& map);

/**
 * @brief Parse a flat JSON object whose values are all strings.
 *
 * Empty input yields an empty map. Nested values, numbers or malformed
 * text are a ProtocolError.
 */
[[nodiscard]] Result<ContextMap> decode_json_map(std::string_view text);

}  // namespace log_courier
