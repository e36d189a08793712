#include <doctest/doctest.h>

#include "z3n/engine/text_buffer.hpp"

#include <string>
#include <vector>

namespace {

using z3n::engine::split_patch_lines;
using z3n::engine::text_buffer;

} // namespace

TEST_CASE("text buffer splits on line feeds and remembers the final terminator") {
  auto with_newline = text_buffer::split("a\nb\n");
  CHECK(with_newline.lines == std::vector<std::string>{"a", "b"});
  CHECK(with_newline.trailing_newline);
  CHECK_FALSE(with_newline.crlf);
  CHECK(with_newline.join() == "a\nb\n");

  auto without_newline = text_buffer::split("a\nb");
  CHECK(without_newline.lines == std::vector<std::string>{"a", "b"});
  CHECK_FALSE(without_newline.trailing_newline);
  CHECK(without_newline.join() == "a\nb");
}

TEST_CASE("text buffer keeps blank lines") {
  auto buffer = text_buffer::split("a\n\n\nb\n");
  CHECK(buffer.size() == 4);
  CHECK(buffer.lines[1].empty());
  CHECK(buffer.join() == "a\n\n\nb\n");

  auto lone = text_buffer::split("\n");
  CHECK(lone.lines == std::vector<std::string>{""});
  CHECK(lone.join() == "\n");
}

TEST_CASE("empty content has no lines") {
  auto buffer = text_buffer::split("");
  CHECK(buffer.empty());
  CHECK_FALSE(buffer.trailing_newline);
  CHECK(buffer.join().empty());
}

TEST_CASE("crlf content round-trips") {
  auto buffer = text_buffer::split("one\r\ntwo\r\n");
  CHECK(buffer.crlf);
  CHECK(buffer.lines == std::vector<std::string>{"one", "two"});
  CHECK(buffer.join() == "one\r\ntwo\r\n");

  auto unterminated = text_buffer::split("one\r\ntwo");
  CHECK(unterminated.crlf);
  CHECK(unterminated.join() == "one\r\ntwo");
}

TEST_CASE("mixed terminators keep carriage returns in the lines") {
  auto buffer = text_buffer::split("one\r\ntwo\n");
  CHECK_FALSE(buffer.crlf);
  CHECK(buffer.lines == std::vector<std::string>{"one\r", "two"});
  CHECK(buffer.join() == "one\r\ntwo\n");
}

TEST_CASE("patch lines drop carriage returns") {
  auto lines = split_patch_lines("a\r\nb\nc");
  CHECK(lines == std::vector<std::string>{"a", "b", "c"});

  auto trailing = split_patch_lines("a\n");
  CHECK(trailing == std::vector<std::string>{"a", ""});
}
