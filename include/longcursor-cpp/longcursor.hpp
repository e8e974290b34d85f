/// @file longcursor.hpp
/// @brief Umbrella header for the longcursor-cpp library.
///
/// Include this single header for access to all public types:
/// LongCursor, CheckedCursor, the cursor factories, the traversal
/// algorithms, ModificationCounter, Error, and the JSON interop.

#pragma once

#include <longcursor-cpp/algorithm.hpp>
#include <longcursor-cpp/checked_cursor.hpp>
#include <longcursor-cpp/cursors.hpp>
#include <longcursor-cpp/error.hpp>
#include <longcursor-cpp/json.hpp>
#include <longcursor-cpp/long_cursor.hpp>
#include <longcursor-cpp/modification.hpp>
