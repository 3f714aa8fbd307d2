#include "ExecutableResolver.hpp"

#include "TestHeaders.hpp"

using namespace wt;

namespace {
void writeFile(const string &path, mode_t mode) {
  {
    ofstream out(path);
    out << "#!/bin/sh\n";
  }
  REQUIRE(::chmod(path.c_str(), mode) == 0);
}
}  // namespace

TEST_CASE("ExecutableResolver candidates", "[ExecutableResolver]") {
  SECTION("Agents use their configured binary") {
    ExecutableResolver resolver("claude", "codex", "");
    REQUIRE(resolver.getCandidates(KIND_CLAUDE) == vector<string>({"claude"}));
    REQUIRE(resolver.getCandidates(KIND_CODEX) == vector<string>({"codex"}));
  }

  SECTION("Shell falls back to bash then sh") {
    ExecutableResolver resolver("claude", "codex", "/bin/fish");
    REQUIRE(resolver.getCandidates(KIND_SHELL) ==
            vector<string>({"/bin/fish", "bash", "sh"}));
  }

  SECTION("Shell without a preference tries $SHELL") {
    ExecutableResolver resolver("claude", "codex", "");
    auto candidates = resolver.getCandidates(KIND_SHELL);
    REQUIRE(candidates.size() >= 2);
    REQUIRE(candidates[candidates.size() - 2] == "bash");
    REQUIRE(candidates.back() == "sh");
  }
}

TEST_CASE("ExecutableResolver findExecutable", "[ExecutableResolver]") {
  string dirPattern = GetTempDirectory() + string("wt_exec_XXXXXXXX");
  string dir = string(mkdtemp(&dirPattern[0]));
  string otherPattern = GetTempDirectory() + string("wt_exec_XXXXXXXX");
  string otherDir = string(mkdtemp(&otherPattern[0]));

  writeFile(dir + "/agent", 0755);
  writeFile(dir + "/notes", 0644);
  writeFile(otherDir + "/agent", 0755);
  fs::create_directories(dir + "/folder");

  SECTION("Searches the path in order") {
    REQUIRE(ExecutableResolver::findExecutable(
                "agent", dir + ":" + otherDir) == dir + "/agent");
    REQUIRE(ExecutableResolver::findExecutable(
                "agent", otherDir + ":" + dir) == otherDir + "/agent");
  }

  SECTION("Skips files that are not executable") {
    REQUIRE_FALSE(ExecutableResolver::findExecutable("notes", dir));
    REQUIRE_FALSE(ExecutableResolver::findExecutable("folder", dir));
    REQUIRE_FALSE(ExecutableResolver::findExecutable("missing", dir));
  }

  SECTION("Paths with a slash are checked directly") {
    REQUIRE(ExecutableResolver::findExecutable(dir + "/agent", "") ==
            dir + "/agent");
    REQUIRE_FALSE(ExecutableResolver::findExecutable(dir + "/notes", ""));
  }

  fs::remove_all(dir);
  fs::remove_all(otherDir);
}

TEST_CASE("ExecutableResolver resolve", "[ExecutableResolver]") {
  SECTION("Missing agent binary resolves to nothing") {
    ExecutableResolver resolver("/nonexistent/claude-binary", "", "");
    REQUIRE_FALSE(resolver.resolve(KIND_CLAUDE));
    REQUIRE_FALSE(resolver.resolve(KIND_CODEX));
  }

  SECTION("Shell falls through a missing preferred shell") {
    ExecutableResolver resolver("claude", "codex", "/nonexistent/shell");
    auto shell = resolver.resolve(KIND_SHELL);
    REQUIRE(shell);
    auto name = fs::path(*shell).filename().string();
    REQUIRE((name == "bash" || name == "sh"));
  }
}
