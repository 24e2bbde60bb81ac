// File Overview: Declares the startup playlist loader for the message folder.
#pragma once
#include <string>
#include <vector>

namespace Playlist {
  // Lists the folder on LittleFS (mounted), sorted ascending by name. Directories
  // and dot-files are skipped. False if the folder cannot be opened.
  bool load(const char* folder, std::vector<std::string>& out);
}
