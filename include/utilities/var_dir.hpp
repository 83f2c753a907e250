#pragma once

#include <string>

namespace dedupfs {

/// Override the base directory for logs, chunks and recipes.
void setVarDir(const std::string &dir);
const std::string &getVarDir();

std::string logsDir();
/// Root handed to FileChunkStore; chunks live under <casRoot>/cas.
std::string casRoot();
std::string recipesDir();

} // namespace dedupfs
