#ifndef SEEKLINE_UTILS_FILESYSTEM_H
#define SEEKLINE_UTILS_FILESYSTEM_H

#include <filesystem>

namespace fs = std::filesystem;

#endif  // SEEKLINE_UTILS_FILESYSTEM_H
