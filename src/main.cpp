#include <iostream>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "app.hpp"
#include "config.hpp"
#include "feed_file.hpp"
#include "log.hpp"

int main(int argc, char** argv) {
  Settings settings;
  std::vector<std::string> warnings;
  std::string msg;
  if (!load_settings(argc, argv, settings, warnings, msg)) {
    std::cerr << "vtfeed: " << msg << "\n" << usage();
    return 1;
  }
  if (settings.help) { std::cout << usage(); return 0; }
  if (!init_logging(settings, msg)) { std::cerr << "vtfeed: " << msg << "\n"; return 1; }
  for (const auto& w : warnings) {
    std::cerr << "vtfeed: " << w << "\n";
    spdlog::warn("config: {}", w);
  }

  FeedFile feed(settings.feed, settings.page_size, settings.name, settings.handle);
  if (!feed.load(msg)) { std::cerr << "vtfeed: " << msg << "\n"; return 1; }
  App app(settings, feed);
  return app.run();
}
