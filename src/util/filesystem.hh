#ifndef FILESYSTEM_HH
#define FILESYSTEM_HH

#include <filesystem>
namespace fs = std::filesystem;

#endif /* FILESYSTEM_HH */
