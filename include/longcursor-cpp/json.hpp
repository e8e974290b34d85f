/// @file json.hpp
/// @brief nlohmann/json interoperability for longcursor-cpp.
///
/// Provides ADL serialization (to_json/from_json) for the error and state
/// types, and draining a cursor into a JSON array.

#pragma once

#include <longcursor-cpp/error.hpp>
#include <longcursor-cpp/long_cursor.hpp>

#include <nlohmann/json.hpp>

namespace longcursor_cpp {

// -- Error types ---------------------------------------------------------------

void to_json(nlohmann::json& j, ErrorKind kind);

/// @throws std::runtime_error if j is not a known kind name.
void from_json(const nlohmann::json& j, ErrorKind& kind);

void to_json(nlohmann::json& j, const Error& err);

/// Parse an Error from {"kind": ..., "message": ...}.
/// Error has no default state, so this stands in for from_json.
/// @throws std::runtime_error on a missing or malformed field.
auto error_from_json(const nlohmann::json& j) -> Error;

// -- Cursor state --------------------------------------------------------------

void to_json(nlohmann::json& j, CursorState state);

// -- Cursor contents -----------------------------------------------------------

/// Drain the remaining values of a cursor into a JSON array of integers.
auto drain_json(LongCursor& cursor) -> nlohmann::json;

}  // namespace longcursor_cpp
