#pragma once

// enginecert/util.hpp — File and clock helpers shared by the stores.

#include <ctime>
#include <optional>
#include <string>

namespace enginecert {

// Read a whole file in binary mode. nullopt if it cannot be opened.
std::optional<std::string> read_file(const std::string& path);

// Write to a temp file in the target directory, then rename into place.
// On POSIX, rename() is atomic within the same filesystem. Creates parent
// directories. Returns false (and leaves no temp file) on any failure.
bool atomic_write(const std::string& path, const std::string& data);

// Append one line (a '\n' is added) and flush. Returns false on write error.
bool append_line(const std::string& path, const std::string& line);

// "YYYY-MM-DDTHH:MM:SSZ"
std::string format_utc(std::time_t t);
std::string utc_now_iso8601();
bool is_utc_timestamp(const std::string& s);

// Relative, '/'-separated, no "." / ".." / empty segments, no backslashes.
bool is_canonical_relative_path(const std::string& p);

}  // namespace enginecert
