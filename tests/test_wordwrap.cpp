#include "wordwrap.hpp"
#include <cassert>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

static std::vector<std::u32string> texts(const std::u32string& s, int width, const WrapOptions& opts = {}) {
  std::vector<std::u32string> out;
  for (const auto& line : wordwrap(StyledLine::plain(s), width, opts)) out.push_back(line.text);
  return out;
}

static void test_breaks() {
  assert((texts(U"hello world foo", 11) == std::vector<std::u32string>{U"hello world", U"foo"}));
  assert((texts(U"abcdefghij", 4) == std::vector<std::u32string>{U"abcd", U"efgh", U"ij"}));
  assert((texts(U"a\nb", 10) == std::vector<std::u32string>{U"a", U"b"}));
  assert((texts(U"a\r\nb\rc", 10) == std::vector<std::u32string>{U"a", U"b", U"c"}));
  // after punctuation, before the word it introduces
  assert((texts(U"well-known thing", 6) == std::vector<std::u32string>{U"well-", U"known", U"thing"}));
  assert((texts(U"short", 80) == std::vector<std::u32string>{U"short"}));
  assert((texts(U"123 4567 890", 10) == std::vector<std::u32string>{U"123 4567", U"890"}));
  assert((texts(U"abcdefg", 5) == std::vector<std::u32string>{U"abcde", U"fg"}));
}

static void test_trailing_newlines() {
  assert((texts(U"a\n", 10) == std::vector<std::u32string>{U"a"}));
  WrapOptions keep;
  keep.strip_trailing_newlines = false;
  assert((texts(U"a\n", 10, keep) == std::vector<std::u32string>{U"a", U""}));
  assert((texts(U"a\n\n", 10, keep) == std::vector<std::u32string>{U"a", U"", U""}));
  assert((texts(U"a\nb\n\nc\n", 64, keep) == std::vector<std::u32string>{U"a", U"b", U"", U"c", U""}));
  assert(texts(U"", 10).size() == 1);
  assert(texts(U"", 10)[0].empty());
}

// Wraps `text` with one metadata character per text character and checks both.
static void verify(const std::u32string& text, const std::u32string& meta, int width,
                   const std::vector<std::u32string>& want_text, const std::vector<std::u32string>& want_meta,
                   bool strip_spaces = true, bool strip_newlines = true) {
  WrapOptions opts;
  opts.strip_trailing_spaces = strip_spaces;
  opts.strip_trailing_newlines = strip_newlines;
  auto lines = wordwrap<char32_t>(text, std::vector<char32_t>(meta.begin(), meta.end()), width, opts);
  assert(lines.size() == want_text.size());
  for (size_t i = 0; i < lines.size(); ++i) {
    assert(lines[i].text == want_text[i]);
    assert(std::u32string(lines[i].meta.begin(), lines[i].meta.end()) == want_meta[i]);
  }
}

static void test_whitespace_table() {
  verify(U"", U"", 15, {U""}, {U""});
  // leading spaces stay, trailing ones go
  verify(U"  test", U"123456", 15, {U"  test"}, {U"123456"});
  verify(U"test  ", U"123456", 15, {U"test"}, {U"1234"});
  verify(U"123\n\n45", U"abc  de", 15, {U"123", U"", U"45"}, {U"abc", U"", U"de"});
  verify(U"  test\ntest  ", U"123456 123456", 15, {U"  test", U"test"}, {U"123456", U"1234"});
  verify(U"test  \n  test", U"123456 123456", 15, {U"test", U"  test"}, {U"1234", U"123456"});

  verify(U"123 4567 890", U"abc defg hij", 4, {U"123", U"4567", U"890"}, {U"abc", U"defg", U"hij"});
  verify(U"123-4567 890", U"abc-defg hij", 10, {U"123-4567", U"890"}, {U"abc-defg", U"hij"});
  verify(U"123 4567-890", U"abc defg-hij", 10, {U"123 4567-", U"890"}, {U"abc defg-", U"hij"});

  // runs of spaces
  verify(U"123  4567  890", U"abc  defg  hij", 9, {U"123  4567", U"890"}, {U"abc  defg", U"hij"});
  verify(U"123  4567  890", U"abc  defg  hij", 10, {U"123  4567", U"890"}, {U"abc  defg", U"hij"});
  verify(U"123 4567\n890", U"abc defg hij", 10, {U"123 4567", U"890"}, {U"abc defg", U"hij"});
  verify(U"123\n4567 890", U"abc defg hij", 10, {U"123", U"4567 890"}, {U"abc", U"defg hij"});
  verify(U"abcdefg hij kl", U"1234567 123 45", 6, {U"abcdef", U"g hij", U"kl"}, {U"123456", U"7 123", U"45"});

  // stripping trailing spaces
  verify(U"a     b  ", U"1     2  ", 5, {U"a", U"b"}, {U"1", U"2"});
  verify(U"a  \n b  ", U"1   23  ", 5, {U"a", U" b"}, {U"1", U"23"});
  verify(U"abcde f ", U"12345678", 5, {U"abcde", U"f"}, {U"12345", U"7"});
  verify(U"abcde ", U"123456", 5, {U"abcde"}, {U"12345"});

  // keeping them
  verify(U"a     b  ", U"123456789", 5, {U"a    ", U" b  "}, {U"12345", U"6789"}, false);
  verify(U"abcde f ", U"12345678", 5, {U"abcde", U"f "}, {U"12345", U"78"}, false);
  // a space exactly at the width is replaced by the line break
  verify(U"abcde ", U"123456", 5, {U"abcde"}, {U"12345"}, false, true);
  verify(U"abcde ", U"123456", 5, {U"abcde", U""}, {U"12345", U""}, false, false);
}

// Random text: no line is wider than `width`, and the metadata of all lines
// together is an in-order subsequence of the input positions.
static void test_random_inputs() {
  const std::u32string alphabet = U"ab  -(\n\tx;";
  std::mt19937 rng(1234);
  for (int round = 0; round < 2000; ++round) {
    int len = static_cast<int>(rng() % 24);
    std::u32string text;
    std::vector<int> idx;
    for (int i = 0; i < len; ++i) {
      text.push_back(alphabet[rng() % alphabet.size()]);
      idx.push_back(i);
    }
    int width = 1 + static_cast<int>(rng() % 8);
    for (int flags = 0; flags < 4; ++flags) {
      WrapOptions opts;
      opts.strip_trailing_spaces = flags & 1;
      opts.strip_trailing_newlines = flags & 2;
      auto lines = wordwrap<int>(text, idx, width, opts);
      assert(!lines.empty());
      int last = -1;
      for (const auto& line : lines) {
        assert(static_cast<int>(line.text.size()) <= width);
        assert(line.text.size() == line.meta.size());
        for (size_t i = 0; i < line.meta.size(); ++i) {
          assert(line.meta[i] > last);
          assert(line.text[i] == text[line.meta[i]]);
          last = line.meta[i];
        }
      }
    }
  }
}

static void test_metadata() {
  std::vector<int> idx = {0, 1, 2, 3, 4};
  auto lines = wordwrap<int>(U"ab cd", idx, 2);
  assert(lines.size() == 2);
  assert(lines[0].text == U"ab");
  assert((lines[0].meta == std::vector<int>{0, 1}));
  assert(lines[1].text == U"cd");
  assert((lines[1].meta == std::vector<int>{3, 4}));

  // CRLF collapses to one newline without shifting the indices after it
  std::vector<int> crlf = {0, 1, 2, 3};
  auto split = wordwrap<int>(U"a\r\nb", crlf, 5);
  assert(split.size() == 2);
  assert(split[1].text == U"b");
  assert((split[1].meta == std::vector<int>{3}));

  Attr bold;
  bold.bold = true;
  StyledLine styled = join({StyledLine::plain(U"plain "), StyledLine::plain(U"bold", bold)});
  auto wrapped = wordwrap(styled, 6);
  assert(wrapped.size() == 2);
  assert(wrapped[1].text == U"bold");
  for (const auto& a : wrapped[1].attrs) assert(a.bold);
  for (const auto& line : wrapped) assert(line.text.size() == line.attrs.size());
}

static void test_contract() {
  bool threw = false;
  try {
    wordwrap<int>(U"abc", std::vector<int>{1, 2}, 5);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
  threw = false;
  try {
    texts(U"abc", 0);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

int main() {
  test_breaks();
  test_trailing_newlines();
  test_whitespace_table();
  test_random_inputs();
  test_metadata();
  test_contract();
  return 0;
}
