#pragma once
/*
 * FileReader
 *
 * Purpose: read a text file via mmap and split it into lines (CRLF
 *          normalized), and replace a file atomically.
 * Usage: read_lines(path, out_lines, msg) / write_file_atomic(path, data, msg);
 *        both return false with msg on failure.
 */
#include <filesystem>
#include <string>
#include <vector>

bool read_lines(const std::filesystem::path& path,
                std::vector<std::string>& out_lines,
                std::string& msg);

// Writes `<path>.tmp`, syncs it, then renames it over `path`.
bool write_file_atomic(const std::filesystem::path& path,
                       const std::string& contents,
                       std::string& msg);
