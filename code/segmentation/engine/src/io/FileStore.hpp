#pragma once
#include <string>

// Writes data to <path>.part and renames it onto path. On any failure the
// partial file is removed, path is left as it was, and std::runtime_error is
// thrown.
void store_file(const std::string &path, const std::string &data);
