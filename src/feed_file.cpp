#include "feed_file.hpp"
#include <algorithm>
#include <charconv>
#include <set>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include "config.hpp"
#include "file_reader.hpp"
#include "markup.hpp"

namespace {

std::string where(const YAML::Node& node) {
  return "line " + std::to_string(node.Mark().line + 1) + ": ";
}

template <typename T>
bool read_count(const YAML::Node& node, T& out) {
  return node.IsScalar() && YAML::convert<T>::decode(node, out) && out >= 0;
}

bool read_flag(const YAML::Node& node, bool& out) {
  return node.IsScalar() && YAML::convert<bool>::decode(node, out);
}

bool timeline_from(const std::string& s, Timeline& out) {
  if (s == "home") out = Timeline::Home;
  else if (s == "local") out = Timeline::Local;
  else if (s == "global") out = Timeline::Global;
  else return false;
  return true;
}

// `timelines: [home, local]` or a single name.
bool read_timelines(const YAML::Node& node, std::vector<Timeline>& out) {
  out.clear();
  Timeline t = Timeline::Home;
  if (node.IsScalar()) {
    if (!timeline_from(node.Scalar(), t)) return false;
    out.push_back(t);
    return true;
  }
  if (!node.IsSequence()) return false;
  for (const auto& item : node) {
    if (!item.IsScalar() || !timeline_from(item.Scalar(), t)) return false;
    out.push_back(t);
  }
  return !out.empty();
}

// Each attachment is a bare file name or a {file, description} map.
bool read_attachments(const YAML::Node& node, std::vector<Attachment>& out) {
  if (!node.IsSequence()) return false;
  for (const auto& item : node) {
    Attachment a;
    if (item.IsScalar()) {
      a.file = item.Scalar();
    } else if (item.IsMap() && item["file"] && item["file"].IsScalar()) {
      a.file = item["file"].Scalar();
      if (item["description"]) a.description = item["description"].Scalar();
    } else {
      return false;
    }
    out.push_back(std::move(a));
  }
  return true;
}

bool on_timeline(const PostRecord& post, Timeline timeline) {
  return std::find(post.timelines.begin(), post.timelines.end(), timeline) != post.timelines.end();
}

// Applies one key of a post map to the entry being built.
bool read_field(FeedFile::Entry& entry, const std::string& key, const YAML::Node& value, std::string& err) {
  PostRecord& p = entry.post;
  const std::string text = value.IsScalar() ? value.Scalar() : "";
  if (key == "id") { if (!value.IsScalar()) { err = "bad id"; return false; } p.id = text; }
  else if (key == "timelines") { if (!read_timelines(value, p.timelines)) { err = "bad timelines"; return false; } }
  else if (key == "author") p.author = text;
  else if (key == "acct") p.acct = text;
  else if (key == "boosted_by") {
    if (!value.IsMap() || !value["name"] || !value["acct"]) { err = "boosted_by needs name and acct"; return false; }
    p.boosted_by = value["name"].Scalar();
    p.boosted_by_acct = value["acct"].Scalar();
  }
  else if (key == "created") { if (!read_count(value, p.created)) { err = "bad timestamp: " + text; return false; } }
  else if (key == "cw") p.cw = text;
  else if (key == "body") {
    p.body = text;
    // a block scalar keeps the final line break
    if (!p.body.empty() && p.body.back() == '\n') p.body.pop_back();
  }
  else if (key == "attachments") { if (!read_attachments(value, p.attachments)) { err = "bad attachments"; return false; } }
  else if (key == "replies") { if (!read_count(value, p.replies)) { err = "bad count: " + text; return false; } }
  else if (key == "boosts") { if (!read_count(value, p.boosts)) { err = "bad count: " + text; return false; } }
  else if (key == "favs") { if (!read_count(value, p.favs)) { err = "bad count: " + text; return false; } }
  else if (key == "boosted") { if (!read_flag(value, p.boosted)) { err = "bad flag: " + text; return false; } }
  else if (key == "liked") { if (!read_flag(value, p.liked)) { err = "bad flag: " + text; return false; } }
  else if (key == "bookmarked") { if (!read_flag(value, p.bookmarked)) { err = "bad flag: " + text; return false; } }
  else if (key == "visibility") { if (!parse_visibility(text, entry.visibility)) { err = "bad visibility: " + text; return false; } }
  else { err = "unknown key: " + key; return false; }
  return true;
}

bool read_feed(const YAML::Node& root, std::vector<FeedFile::Entry>& out, std::string& msg) {
  out.clear();
  if (!root || root.IsNull()) return true;
  if (!root.IsSequence()) {
    msg = where(root) + "expected a list of posts";
    return false;
  }
  std::set<std::string> ids;
  for (const auto& node : root) {
    if (!node.IsMap()) { msg = where(node) + "expected a post"; return false; }
    FeedFile::Entry entry;
    std::set<std::string> seen;
    for (const auto& kv : node) {
      const std::string key = kv.first.Scalar();
      if (!seen.insert(key).second) { msg = where(kv.first) + "repeated key: " + key; return false; }
      std::string err;
      if (!read_field(entry, key, kv.second, err)) { msg = where(kv.first) + err; return false; }
    }
    if (entry.post.id.empty()) { msg = where(node) + "post without id"; return false; }
    if (!ids.insert(entry.post.id).second) { msg = "duplicate post id: " + entry.post.id; return false; }
    if (entry.post.timelines.empty()) entry.post.timelines.push_back(Timeline::Home);
    out.push_back(std::move(entry));
  }
  return true;
}

}

const char* timeline_name(Timeline timeline) {
  switch (timeline) {
    case Timeline::Home: return "home";
    case Timeline::Local: return "local";
    case Timeline::Global: return "global";
  }
  return "home";
}

const char* visibility_name(Visibility visibility) {
  switch (visibility) {
    case Visibility::Public: return "public";
    case Visibility::Unlisted: return "unlisted";
    case Visibility::Private: return "private";
    case Visibility::Direct: return "direct";
  }
  return "public";
}

FeedFile::FeedFile(std::filesystem::path path, int page_size, std::string author, std::string acct)
    : path_(std::move(path)), page_size_(page_size), author_(std::move(author)), acct_(std::move(acct)) {}

bool FeedFile::parse(const std::string& text, std::vector<Entry>& out, std::string& msg) {
  try {
    return read_feed(YAML::Load(text), out, msg);
  } catch (const YAML::Exception& e) {
    msg = e.what();
    return false;
  }
}

std::string FeedFile::serialize(const std::vector<Entry>& entries) {
  YAML::Emitter y;
  y << YAML::BeginSeq;
  for (const Entry& e : entries) {
    const PostRecord& p = e.post;
    y << YAML::BeginMap;
    y << YAML::Key << "id" << YAML::Value << p.id;
    y << YAML::Key << "timelines" << YAML::Value << YAML::Flow << YAML::BeginSeq;
    for (Timeline t : p.timelines) y << timeline_name(t);
    y << YAML::EndSeq;
    y << YAML::Key << "author" << YAML::Value << p.author;
    y << YAML::Key << "acct" << YAML::Value << p.acct;
    if (!p.boosted_by.empty()) {
      y << YAML::Key << "boosted_by" << YAML::Value << YAML::Flow << YAML::BeginMap;
      y << YAML::Key << "name" << YAML::Value << p.boosted_by;
      y << YAML::Key << "acct" << YAML::Value << p.boosted_by_acct;
      y << YAML::EndMap;
    }
    y << YAML::Key << "created" << YAML::Value << static_cast<long long>(p.created);
    if (e.visibility != Visibility::Public) y << YAML::Key << "visibility" << YAML::Value << visibility_name(e.visibility);
    if (!p.cw.empty()) y << YAML::Key << "cw" << YAML::Value << p.cw;
    if (!p.body.empty()) {
      y << YAML::Key << "body" << YAML::Value;
      if (p.body.find('\n') != std::string::npos) {
        // a literal block can not open with indentation or keep trailing breaks
        size_t first = p.body.find_first_not_of('\n');
        bool literal = first != std::string::npos && p.body[first] != ' ' && p.body.back() != '\n';
        y << (literal ? YAML::Literal : YAML::DoubleQuoted);
      }
      y << p.body;
    }
    if (!p.attachments.empty()) {
      y << YAML::Key << "attachments" << YAML::Value << YAML::BeginSeq;
      for (const auto& a : p.attachments) {
        y << YAML::Flow << YAML::BeginMap;
        y << YAML::Key << "file" << YAML::Value << a.file;
        if (!a.description.empty()) y << YAML::Key << "description" << YAML::Value << a.description;
        y << YAML::EndMap;
      }
      y << YAML::EndSeq;
    }
    if (p.replies) y << YAML::Key << "replies" << YAML::Value << p.replies;
    if (p.boosts) y << YAML::Key << "boosts" << YAML::Value << p.boosts;
    if (p.favs) y << YAML::Key << "favs" << YAML::Value << p.favs;
    if (p.boosted) y << YAML::Key << "boosted" << YAML::Value << true;
    if (p.liked) y << YAML::Key << "liked" << YAML::Value << true;
    if (p.bookmarked) y << YAML::Key << "bookmarked" << YAML::Value << true;
    y << YAML::EndMap;
  }
  y << YAML::EndSeq;
  return std::string(y.c_str()) + "\n";
}

bool FeedFile::load(std::string& msg) {
  std::vector<Entry> parsed;
  try {
    if (!read_feed(YAML::LoadFile(path_.string()), parsed, msg)) {
      msg = path_.string() + ": " + msg;
      return false;
    }
  } catch (const YAML::BadFile&) {
    msg = "can not open file: " + path_.string();
    return false;
  } catch (const YAML::Exception& e) {
    msg = path_.string() + ": " + e.what();
    return false;
  }
  entries_ = std::move(parsed);
  spdlog::info("feed: loaded {} posts from {}", entries_.size(), path_.string());
  return true;
}

bool FeedFile::save(std::string& msg) const {
  return write_file_atomic(path_, serialize(entries_), msg);
}

bool FeedFile::fetch_timeline(Timeline timeline, const std::string& since, std::vector<PostRecord>& out,
                              std::string& msg) {
  std::vector<const PostRecord*> matching;
  for (const auto& e : entries_) {
    if (on_timeline(e.post, timeline)) matching.push_back(&e.post);
  }
  size_t start = 0;
  if (!since.empty()) {
    auto it = std::find_if(matching.begin(), matching.end(), [&](const PostRecord* p){ return p->id == since; });
    if (it == matching.end()) {
      msg = "Post " + since + " is no longer on the " + timeline_name(timeline) + " timeline.";
      spdlog::warn("feed: {}", msg);
      return false;
    }
    start = static_cast<size_t>(it - matching.begin()) + 1;
  }
  out.clear();
  size_t end = std::min(matching.size(), start + static_cast<size_t>(page_size_));
  for (size_t i = start; i < end; ++i) out.push_back(*matching[i]);
  spdlog::debug("feed: {} page after '{}' has {} posts", timeline_name(timeline), since, out.size());
  return true;
}

std::string FeedFile::next_id() const {
  long long max_id = 0;
  for (const auto& e : entries_) {
    const std::string& id = e.post.id;
    long long v = 0;
    auto [end, ec] = std::from_chars(id.data(), id.data() + id.size(), v);
    if (ec == std::errc() && end == id.data() + id.size()) max_id = std::max(max_id, v);
  }
  return std::to_string(max_id + 1);
}

bool FeedFile::create_post(const std::string& text, Visibility visibility, const std::string& cw,
                           PostRecord& out, std::string& msg) {
  if (text.find_first_not_of(" \t\n") == std::string::npos) {
    msg = "Cannot post an empty status.";
    return false;
  }
  Entry entry;
  PostRecord& p = entry.post;
  entry.visibility = visibility;
  p.id = next_id();
  if (visibility == Visibility::Public) p.timelines = {Timeline::Home, Timeline::Local, Timeline::Global};
  else p.timelines = {Timeline::Home};
  p.author = author_;
  p.acct = acct_;
  p.created = std::time(nullptr);
  p.cw = cw;
  std::replace(p.cw.begin(), p.cw.end(), '\n', ' ');
  p.body = sanitize(text);
  while (p.body.back() == '\n') p.body.pop_back();

  entries_.insert(entries_.begin(), entry);
  if (!save(msg)) {
    entries_.erase(entries_.begin());
    spdlog::error("feed: saving new post failed: {}", msg);
    return false;
  }
  spdlog::info("feed: posted {} ({})", p.id, visibility_name(visibility));
  out = p;
  return true;
}
