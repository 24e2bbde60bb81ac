#include "Playlist.hpp"

#include <Arduino.h>
#include <LittleFS.h>
#include <esp_log.h>
#include "ClipPath.hpp"

static const char* kPlaylistLogTag = "playlist";

bool Playlist::load(const char* folder, std::vector<std::string>& out) {
  out.clear();
  File root = LittleFS.open(folder);
  if (!root || !root.isDirectory()) {
    ESP_LOGE(kPlaylistLogTag, "Cannot open %s", folder);
    return false;
  }

  for (File f = root.openNextFile(); f; f = root.openNextFile()) {
    ClipPath::addEntry(out, f.name(), f.isDirectory());
    f.close();
  }
  root.close();

  ClipPath::sortPlaylist(out);
  ESP_LOGI(kPlaylistLogTag, "%u message(s) in %s", (unsigned)out.size(), folder);
  return true;
}
