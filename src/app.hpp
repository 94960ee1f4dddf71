#pragma once
/*
 * App
 *
 * Purpose: the session loop. Opens the link, shows the home timeline and
 *          feeds decoded keys to the screen stack until the user quits.
 * Recovery: a LinkError ends the session; after a second the link is
 *           reopened and everything is repainted from scratch. Settings, the
 *           content source and the session values carry over.
 */
#include "config.hpp"
#include "content_source.hpp"
#include "screen_stack.hpp"

class App {
public:
  App(Settings settings, IContentSource& source);
  int run();

private:
  // Returns when the user quits; throws LinkError when the link fails.
  void session();

  Settings settings_;
  IContentSource& source_;
  SessionProps props_;
  bool reconnected_ = false;
};
