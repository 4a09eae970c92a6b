#pragma once

#include <optional>
#include <string>
#include <vector>

namespace safeproc {

// ============================================================================
// Filesystem Queries
// ============================================================================
//
// Non-throwing wrappers; any filesystem error reads as "no".

// Check if a path exists
bool path_exists(const std::string& path);

// Check if a path is a directory
bool is_directory(const std::string& path);

// Check if a path is a regular file
bool is_regular_file(const std::string& path);

// List directory entry names (not paths); empty if not a directory
std::vector<std::string> list_directory(const std::string& path);

// Create directories recursively; true if the directory exists afterwards
bool create_directories(const std::string& path);

// Make a path absolute against the current working directory
std::string make_absolute(const std::string& path);

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Read a whole file
std::optional<std::string> read_file(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

// ============================================================================
// Program Lookup
// ============================================================================

// Resolve a program name to an absolute executable path. Names containing
// '/' are checked as given; bare names are searched in the ':'-separated
// search_path. Relative names and relative search_path entries are taken
// against base_dir when it is set, else against the current directory.
std::optional<std::string> find_program(const std::string& program,
                                        const std::string& search_path,
                                        const std::string& base_dir = "");

} // namespace safeproc
