#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace motionline::json
{

// Minimal JSON helpers for the project's own flat documents (config and
// timeline export). Not a general parser: keys are looked up by text search
// within the given object, so callers pass the narrowest object text they have.

std::string escape(std::string_view s);

// Shortest text that parses back to the same double.
std::string format_number(double value);

std::optional<std::string> read_string(std::string_view json, std::string_view key);
std::optional<double>      read_number(std::string_view json, std::string_view key);
std::optional<bool>        read_bool(std::string_view json, std::string_view key);

// Top-level "{...}" objects of the array stored under key, as raw text.
std::vector<std::string> read_object_array(std::string_view json, std::string_view key);

// Array of strings stored under key.
std::vector<std::string> read_string_array(std::string_view json, std::string_view key);

// Copy of json with the contents of the array stored under key blanked out,
// so remaining keys can be searched without hitting nested objects.
std::string without_array(std::string_view json, std::string_view key);

}   // namespace motionline::json
