#pragma once
/*
 * FeedFile
 *
 * Purpose: content source backed by a YAML feed file.
 * Format: a list of post maps, newest post first:
 *
 *   - id: 42
 *     timelines: [home, local]
 *     author: Ada Lovelace
 *     acct: ada@example.org
 *     boosted_by: {name: Charles, acct: babbage@example.org}
 *     created: 1700000000
 *     cw: engine talk
 *     body: |
 *       first line
 *       second line
 *     attachments:
 *       - {file: diagram.png, description: the analytical engine}
 *     replies: 1
 *     boosted: true
 *
 * Only `id` is required; `timelines` defaults to home. The final line break
 * of a block scalar body is dropped.
 */
#include <filesystem>
#include <string>
#include <vector>
#include "content_source.hpp"

class FeedFile : public IContentSource {
public:
  struct Entry {
    PostRecord post;
    Visibility visibility = Visibility::Public;
  };

  FeedFile(std::filesystem::path path, int page_size, std::string author, std::string acct);

  bool load(std::string& msg);
  bool save(std::string& msg) const;
  const std::vector<Entry>& entries() const { return entries_; }

  bool fetch_timeline(Timeline timeline, const std::string& since, std::vector<PostRecord>& out,
                      std::string& msg) override;
  bool create_post(const std::string& text, Visibility visibility, const std::string& cw,
                   PostRecord& out, std::string& msg) override;

  static bool parse(const std::string& text, std::vector<Entry>& out, std::string& msg);
  static std::string serialize(const std::vector<Entry>& entries);

private:
  std::string next_id() const;

  std::filesystem::path path_;
  int page_size_;
  std::string author_;
  std::string acct_;
  std::vector<Entry> entries_;
};

const char* timeline_name(Timeline timeline);
const char* visibility_name(Visibility visibility);
