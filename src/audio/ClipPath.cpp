#include "ClipPath.hpp"
#include <string.h>
#include <algorithm>
#include "io/FoxIo.hpp"

namespace ClipPath {

std::string resolve(const std::string& id, const char* folder) {
  std::string path(folder);
  path += '/';
  path += id;
  if (strcmp(folder, PHRASE_FOLDER) == 0) path += PHRASE_EXT;
  return path;
}

std::string baseName(const char* name) {
  if (!name) return std::string();
  const char* slash = strrchr(name, '/');
  return std::string(slash ? slash + 1 : name);
}

bool addEntry(std::vector<std::string>& playlist, const char* name, bool isDirectory) {
  if (isDirectory) return false;
  std::string base = baseName(name);
  if (base.empty() || base[0] == '.') return false;
  playlist.push_back(base);
  return true;
}

void sortPlaylist(std::vector<std::string>& playlist) {
  std::sort(playlist.begin(), playlist.end());
}

} // namespace ClipPath
