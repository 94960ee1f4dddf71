#pragma once
/*
 * IContentSource
 *
 * Purpose: upstream collaborator that supplies timeline pages and accepts new
 *          posts. Results are opaque to the renderer.
 * Contract: failures return false with a human-readable message; callers
 *           surface it and never retry on their own.
 */
#include <ctime>
#include <string>
#include <vector>
#include "types.hpp"

struct Attachment {
  std::string file;         // bare file name, no path
  std::string description;  // may be empty
};

struct PostRecord {
  std::string id;
  std::vector<Timeline> timelines;
  std::string author;
  std::string acct;
  // Set when this entry is a boost of someone else's post.
  std::string boosted_by;
  std::string boosted_by_acct;
  std::time_t created = 0;
  std::string cw;
  std::string body;  // restricted markup, '\n' separated
  std::vector<Attachment> attachments;
  int replies = 0;
  int boosts = 0;
  int favs = 0;
  bool boosted = false;
  bool liked = false;
  bool bookmarked = false;
};

class IContentSource {
public:
  virtual ~IContentSource() = default;

  // Newest first. `since` empty = from the top, else the page after that id.
  virtual bool fetch_timeline(Timeline timeline, const std::string& since, std::vector<PostRecord>& out,
                              std::string& msg) = 0;
  virtual bool create_post(const std::string& text, Visibility visibility, const std::string& cw,
                           PostRecord& out, std::string& msg) = 0;
};
