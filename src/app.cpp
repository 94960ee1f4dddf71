#include "app.hpp"
#include <chrono>
#include <thread>
#include <spdlog/spdlog.h>
#include "input.hpp"
#include "painter.hpp"
#include "screens.hpp"
#include "terminal.hpp"

namespace {

// Rest of an escape sequence after ESC; a bare ESC is dropped after this.
constexpr int kSequenceTimeoutMs = 50;
constexpr auto kReconnectDelay = std::chrono::seconds(1);

}

App::App(Settings settings, IContentSource& source)
    : settings_(std::move(settings)), source_(source) {
  props_.name = settings_.name;
  props_.handle = settings_.handle;
  props_.expand_spoilers = settings_.expand_spoilers;
  props_.default_visibility = settings_.visibility;
}

int App::run() {
  spdlog::info("session: starting on {}", settings_.port == "-" ? "own tty" : settings_.port);
  for (;;) {
    try {
      session();
      spdlog::info("session: user quit");
      return 0;
    } catch (const LinkError& e) {
      spdlog::error("session: link failed: {}", e.what());
    }
    std::this_thread::sleep_for(kReconnectDelay);
    spdlog::info("session: reconnecting");
    reconnected_ = true;
  }
}

void App::session() {
  Terminal term(settings_);
  VtTerminal& vt = term.vt();
  Painter painter(vt);
  ScreenStack stack(painter, source_, props_);
  open_timeline(stack, Timeline::Home);
  if (reconnected_) {
    stack.status("Link restored. Press '?' for help.");
    reconnected_ = false;
  }

  Input input;
  for (;;) {
    std::vector<Key> keys;
    unsigned char b = 0;
    if (!vt.read_byte(b, -1)) continue;
    // take everything already queued so repeats can be collapsed
    do {
      if (auto key = input.feed(b)) keys.push_back(*key);
    } while (vt.read_byte(b, input.pending() ? kSequenceTimeoutMs : 0));
    if (input.pending()) input.reset();

    for (const Key& key : collapse_repeats(keys)) {
      std::optional<Action> action = stack.process_input(key);
      if (action && !stack.apply(*action)) return;
    }
  }
}
