// File Overview: Declares the clip naming rules shared by the player and the playlist
// loader: path resolution per folder and which directory entries count as messages.
#pragma once
#include <string>
#include <vector>

namespace ClipPath {
  // "<folder>/<id>", with PHRASE_EXT appended only for the phrase folder
  std::string resolve(const std::string& id, const char* folder);

  // Last path component; some filesystem cores report entries with their full path
  std::string baseName(const char* name);

  // Adds one directory entry to a playlist being built. Directories, dot-files and
  // empty names are skipped. Returns true if the entry was kept.
  bool addEntry(std::vector<std::string>& playlist, const char* name, bool isDirectory);

  // Ascending byte-wise order of the file names
  void sortPlaylist(std::vector<std::string>& playlist);
}
