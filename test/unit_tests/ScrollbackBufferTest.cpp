#include "ScrollbackBuffer.hpp"

#include "TestHeaders.hpp"

using namespace wt;

namespace {
string joined(const ScrollbackBuffer &buffer) {
  string result;
  auto lines = buffer.snapshot();
  for (size_t i = 0; i < lines.size(); i++) {
    if (i) {
      result += "\n";
    }
    result += lines[i];
  }
  return result;
}
}  // namespace

TEST_CASE("ScrollbackBuffer basic operations", "[ScrollbackBuffer]") {
  ScrollbackBuffer buffer(5);

  SECTION("Empty buffer state") {
    REQUIRE(buffer.empty());
    REQUIRE(buffer.size() == 0);
    REQUIRE(buffer.snapshot().empty());
    REQUIRE(buffer.getMaxLines() == 5);
  }

  SECTION("Empty chunks are ignored") {
    buffer.append("");
    REQUIRE(buffer.empty());
  }

  SECTION("Chunk splits on newlines") {
    buffer.append("one\ntwo\nthree");
    REQUIRE(buffer.snapshot() == vector<string>({"one", "two", "three"}));
  }

  SECTION("Open last line is continued by the next chunk") {
    buffer.append("hel");
    buffer.append("lo\nwor");
    buffer.append("ld");
    REQUIRE(buffer.snapshot() == vector<string>({"hello", "world"}));
  }

  SECTION("Trailing newline starts an empty open line") {
    buffer.append("prompt$ ls\n");
    REQUIRE(buffer.snapshot() == vector<string>({"prompt$ ls", ""}));
    buffer.append("file.txt");
    REQUIRE(buffer.snapshot() == vector<string>({"prompt$ ls", "file.txt"}));
  }

  SECTION("Joining the lines reproduces the output") {
    string output = "a\r\nb\x1b[31mred\x1b[0m\n\nc";
    buffer.append(output.substr(0, 4));
    buffer.append(output.substr(4, 9));
    buffer.append(output.substr(13));
    REQUIRE(joined(buffer) == output);
  }

  SECTION("Clear") {
    buffer.append("x\ny");
    buffer.clear();
    REQUIRE(buffer.empty());
    buffer.append("z");
    REQUIRE(buffer.snapshot() == vector<string>({"z"}));
  }
}

TEST_CASE("ScrollbackBuffer evicts the oldest lines", "[ScrollbackBuffer]") {
  ScrollbackBuffer buffer(3);

  SECTION("Single chunk over the cap") {
    buffer.append("1\n2\n3\n4\n5");
    REQUIRE(buffer.snapshot() == vector<string>({"3", "4", "5"}));
  }

  SECTION("Many chunks over the cap") {
    for (int i = 0; i < 100; i++) {
      buffer.append(to_string(i) + "\n");
    }
    REQUIRE(buffer.size() == 3);
    REQUIRE(buffer.snapshot() == vector<string>({"98", "99", ""}));
  }

  SECTION("Snapshot is a copy") {
    buffer.append("a\nb");
    auto snapshot = buffer.snapshot();
    buffer.append("\nc\nd");
    REQUIRE(snapshot == vector<string>({"a", "b"}));
    REQUIRE(buffer.snapshot() == vector<string>({"b", "c", "d"}));
  }
}
