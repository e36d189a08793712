#include <doctest/doctest.h>

#include "z3n/z3n.hpp"
#include "test_helpers.hpp"

#include <string>

namespace {

using z3n::error_code;
using z3n::file_map;
using z3n::test_helpers::make_patch;
using z3n::test_helpers::make_text;

} // namespace

TEST_CASE("update replaces a line between context") {
  auto patch = make_patch({
      "*** Update File: file.txt",
      "@@",
      " line 1",
      "-line 2",
      "+line two",
      " line 3",
  });

  auto out = z3n::apply(patch, "line 1\nline 2\nline 3\n");
  REQUIRE(out.ok());
  CHECK(out.value == "line 1\nline two\nline 3\n");
}

TEST_CASE("multi-action document updates, adds and deletes") {
  file_map files = {
      {"update_me.txt", "line 1\nold content\nline 3"},
      {"delete_me.txt", "this file will be deleted"},
      {"untouched.txt", "same\n"},
  };
  auto patch = make_patch({
      "*** Update File: update_me.txt",
      "@@",
      " line 1",
      "-old content",
      "+new content",
      " line 3",
      "*** Add File: new_file.txt",
      "+hello world",
      "*** Delete File: delete_me.txt",
      "-this file will be deleted",
  });

  auto out = z3n::apply(patch, files);
  REQUIRE(out.ok());
  CHECK(out.value.at("update_me.txt") == "line 1\nnew content\nline 3");
  CHECK(out.value.at("new_file.txt") == "hello world");
  CHECK(out.value.count("delete_me.txt") == 0);
  CHECK(out.value.at("untouched.txt") == "same\n");

  // the caller's map is left as it was
  CHECK(files.at("update_me.txt") == "line 1\nold content\nline 3");
  CHECK(files.count("delete_me.txt") == 1);
  CHECK(files.count("new_file.txt") == 0);
}

TEST_CASE("repeated pattern is ambiguous at the exact level") {
  auto content = make_text({"start", "target line", "middle", "target line", "end"});
  auto patch = make_patch({
      "*** Update File: dup.txt",
      "@@",
      "-target line",
      "+changed",
  });

  auto out = z3n::apply(patch, content);
  CHECK_FALSE(out.ok());
  CHECK(out.status_info.code == error_code::ambiguous_match);
  CHECK(out.status_info.level == 0);
  CHECK(out.status_info.count == 2);
  CHECK(out.status_info.path == "dup.txt");
  CHECK(out.status_info.hunk_index == 0);
}

TEST_CASE("trailing whitespace differences resolve at the second level") {
  auto content = make_text({"def f():   ", "    return 1  ", "", "print(f())"});
  auto patch = make_patch({
      "*** Update File: f.py",
      "@@",
      " def f():",
      "-    return 1",
      "+    return 2",
  });

  auto out = z3n::apply(patch, content);
  REQUIRE(out.ok());
  // context lines keep the target's trailing spaces
  CHECK(out.value == make_text({"def f():   ", "    return 2", "", "print(f())"}));
}

TEST_CASE("add onto an existing path fails") {
  file_map files = {{"exists.txt", "already here\n"}};
  auto patch = make_patch({"*** Add File: exists.txt", "+new"});

  auto out = z3n::apply(patch, files);
  CHECK(out.status_info.code == error_code::file_exists);
  CHECK(out.status_info.path == "exists.txt");
  CHECK(out.status_info.action_index == 0);
}

TEST_CASE("normalized matching tolerates indentation and punctuation drift") {
  auto content = make_text({"    // range \xE2\x80\x94 inclusive", "    for (int i = 0; i <= n; ++i) {", "    }"});
  auto patch = make_patch({
      "*** Update File: loop.cpp",
      "@@",
      " // range - inclusive",
      "-for (int i = 0; i <= n; ++i) {",
      "+for (int i = 0; i < n; ++i) {",
  });

  auto out = z3n::apply(patch, content);
  REQUIRE(out.ok());
  CHECK(out.value == make_text({"    // range \xE2\x80\x94 inclusive", "for (int i = 0; i < n; ++i) {", "    }"}));
}

TEST_CASE("a failing action leaves no partial result") {
  file_map files = {
      {"a.txt", "alpha\n"},
      {"b.txt", "beta\n"},
  };
  auto patch = make_patch({
      "*** Update File: a.txt",
      "-alpha",
      "+ALPHA",
      "*** Add File: c.txt",
      "+gamma",
      "*** Update File: b.txt",
      "-missing",
      "+nothing",
  });

  const file_map before = files;
  auto out = z3n::apply(patch, files);
  CHECK_FALSE(out.ok());
  CHECK(out.status_info.code == error_code::no_match);
  CHECK(out.status_info.path == "b.txt");
  CHECK(out.status_info.action_index == 2);
  CHECK(out.value.empty());
  CHECK(files == before);
}

TEST_CASE("re-applying an update with removed lines fails") {
  auto original = make_text({"keep", "remove me", "keep too"});
  auto patch = make_patch({
      "*** Update File: f.txt",
      " keep",
      "-remove me",
      "+inserted",
  });

  auto first = z3n::apply(patch, original);
  REQUIRE(first.ok());

  auto second = z3n::apply(patch, first.value);
  CHECK(second.status_info.code == error_code::no_match);
}

TEST_CASE("re-applying a context-anchored insertion matches again") {
  auto original = make_text({"header", "body"});
  auto patch = make_patch({
      "*** Update File: f.txt",
      " header",
      "+inserted",
  });

  auto first = z3n::apply(patch, original);
  REQUIRE(first.ok());
  CHECK(first.value == make_text({"header", "inserted", "body"}));

  auto second = z3n::apply(patch, first.value);
  REQUIRE(second.ok());
  CHECK(second.value == make_text({"header", "inserted", "inserted", "body"}));
}

TEST_CASE("update with move renames the file") {
  file_map files = {{"old/name.txt", "x\ny\n"}};
  auto patch = make_patch({
      "*** Update File: old/name.txt",
      "*** Move to: new/name.txt",
      "@@",
      " x",
      "-y",
      "+z",
  });

  auto out = z3n::apply(patch, files);
  REQUIRE(out.ok());
  CHECK(out.value.count("old/name.txt") == 0);
  CHECK(out.value.at("new/name.txt") == "x\nz\n");
}

TEST_CASE("move onto an existing path fails") {
  file_map files = {{"a.txt", "x\n"}, {"b.txt", "y\n"}};
  auto patch = make_patch({
      "*** Update File: a.txt",
      "*** Move to: b.txt",
      "-x",
      "+x2",
  });

  auto out = z3n::apply(patch, files);
  CHECK(out.status_info.code == error_code::file_exists);
  CHECK(out.status_info.path == "b.txt");
}

TEST_CASE("update and delete of a missing path fail") {
  file_map files;

  auto update = z3n::apply(make_patch({"*** Update File: nope.txt", "-a", "+b"}), files);
  CHECK(update.status_info.code == error_code::unknown_file);
  CHECK(update.status_info.path == "nope.txt");

  auto remove = z3n::apply(make_patch({"*** Delete File: nope.txt", "-a"}), files);
  CHECK(remove.status_info.code == error_code::unknown_file);
}

TEST_CASE("delete verifies the whole file") {
  file_map files = {{"d.txt", "one\ntwo\nthree\n"}};

  SUBCASE("matching content") {
    auto out = z3n::apply(make_patch({"*** Delete File: d.txt", "-one", "-two", "-three"}), files);
    REQUIRE(out.ok());
    CHECK(out.value.empty());
  }
  SUBCASE("content matched leniently") {
    auto out = z3n::apply(make_patch({"*** Delete File: d.txt", "-one  ", "-  two", "-three"}), files);
    REQUIRE(out.ok());
    CHECK(out.value.count("d.txt") == 0);
  }
  SUBCASE("only part of the file") {
    auto out = z3n::apply(make_patch({"*** Delete File: d.txt", "-two"}), files);
    CHECK(out.status_info.code == error_code::no_match);
  }
  SUBCASE("different content") {
    auto out = z3n::apply(make_patch({"*** Delete File: d.txt", "-one", "-2", "-three"}), files);
    CHECK(out.status_info.code == error_code::no_match);
  }
}

TEST_CASE("actions see the effects of earlier actions") {
  file_map files;
  auto patch = make_patch({
      "*** Add File: fresh.txt",
      "+first",
      "+second",
      "*** Update File: fresh.txt",
      " first",
      "-second",
      "+2nd",
  });

  auto out = z3n::apply(patch, files);
  REQUIRE(out.ok());
  CHECK(out.value.at("fresh.txt") == "first\n2nd");
}

TEST_CASE("a file deleted earlier in the document cannot be updated") {
  file_map files = {{"gone.txt", "bye\n"}};
  auto patch = make_patch({
      "*** Delete File: gone.txt",
      "-bye",
      "*** Update File: gone.txt",
      "-bye",
      "+hello",
  });

  auto out = z3n::apply(patch, files);
  CHECK(out.status_info.code == error_code::unknown_file);
  CHECK(out.status_info.action_index == 1);
}

TEST_CASE("trailing newline state is preserved") {
  auto patch = make_patch({"*** Update File: f", "-b", "+B"});

  auto with_newline = z3n::apply(patch, "a\nb\n");
  REQUIRE(with_newline.ok());
  CHECK(with_newline.value == "a\nB\n");

  auto without_newline = z3n::apply(patch, "a\nb");
  REQUIRE(without_newline.ok());
  CHECK(without_newline.value == "a\nB");
}

TEST_CASE("crlf files keep their terminators") {
  auto patch = make_patch({"*** Update File: win.txt", " one", "-two", "+TWO", "+2.5"});

  auto out = z3n::apply(patch, "one\r\ntwo\r\nthree\r\n");
  REQUIRE(out.ok());
  CHECK(out.value == "one\r\nTWO\r\n2.5\r\nthree\r\n");
}

TEST_CASE("several hunks apply top to bottom") {
  auto content = make_text({"a", "b", "c", "d", "e", "f", "g"});
  auto patch = make_patch({
      "*** Update File: f.txt",
      "@@",
      " a",
      "-b",
      "+B",
      "@@",
      " d",
      "+d2",
      " e",
      "@@",
      "-g",
      "+G",
  });

  auto out = z3n::apply(patch, content);
  REQUIRE(out.ok());
  CHECK(out.value == make_text({"a", "B", "c", "d", "d2", "e", "f", "G"}));
}

TEST_CASE("large files patch in place") {
  std::string content;
  for (int i = 0; i < 20000; ++i) {
    content += "row " + std::to_string(i) + "\n";
  }
  auto patch = make_patch({
      "*** Update File: big.txt",
      " row 15000",
      "-row 15001",
      "+row fifteen thousand and one",
      " row 15002",
  });

  auto out = z3n::apply(patch, content);
  REQUIRE(out.ok());
  CHECK(out.value.size() == content.size() - std::string("row 15001").size() +
                                  std::string("row fifteen thousand and one").size());
  CHECK(out.value.find("row 15000\nrow fifteen thousand and one\nrow 15002\n") != std::string::npos);
}

TEST_CASE("single-content form handles add and delete") {
  auto added = z3n::apply(make_patch({"*** Add File: n.txt", "+one", "+two"}), "");
  REQUIRE(added.ok());
  CHECK(added.value == "one\ntwo");

  auto clash = z3n::apply(make_patch({"*** Add File: n.txt", "+one"}), "existing");
  CHECK(clash.status_info.code == error_code::file_exists);

  auto deleted = z3n::apply(make_patch({"*** Delete File: n.txt", "-one", "-two"}), "one\ntwo\n");
  REQUIRE(deleted.ok());
  CHECK(deleted.value.empty());
}

TEST_CASE("single-content form returns renamed content") {
  auto out = z3n::apply(make_patch({"*** Update File: a", "*** Move to: b", "-x", "+y"}), "x\n");
  REQUIRE(out.ok());
  CHECK(out.value == "y\n");
}

TEST_CASE("single-content form rejects several actions") {
  auto patch = make_patch({"*** Add File: a", "+x", "*** Add File: b", "+y"});
  auto out = z3n::apply(patch, "");
  CHECK(out.status_info.code == error_code::invalid_argument);
}

TEST_CASE("parse errors surface through apply") {
  auto out = z3n::apply("not a patch", "content");
  CHECK(out.status_info.code == error_code::parse_error);
  CHECK(out.status_info.line == 1);
}

TEST_CASE("check lists changes without applying them") {
  file_map files = {{"a.txt", "a\n"}, {"b.txt", "b\n"}};
  auto patch = make_patch({
      "*** Update File: a.txt",
      "-a",
      "+A",
      "*** Delete File: b.txt",
      "-b",
      "*** Add File: c.txt",
      "+c",
  });

  auto changes = z3n::check(patch, files);
  REQUIRE(changes.ok());
  REQUIRE(changes.value.size() == 3);
  CHECK(changes.value[0].path == "a.txt");
  CHECK(changes.value[0].kind == z3n::engine::change_kind::write);
  CHECK(changes.value[0].content == "A\n");
  REQUIRE(changes.value[0].previous.has_value());
  CHECK(*changes.value[0].previous == "a\n");
  CHECK(changes.value[1].kind == z3n::engine::change_kind::remove);
  CHECK(changes.value[2].path == "c.txt");
  CHECK_FALSE(changes.value[2].previous.has_value());
}

TEST_CASE("status descriptions name the location") {
  auto out = z3n::apply(make_patch({"*** Update File: x.txt", "-a", "+b"}), file_map{{"x.txt", "a\na\n"}});
  REQUIRE_FALSE(out.ok());
  std::string text = z3n::engine::describe(out.status_info);
  CHECK(text.find("ambiguous_match") != std::string::npos);
  CHECK(text.find("x.txt") != std::string::npos);
}
