#include "commitgate/diff.hpp"
#include <iostream>
#include <vector>

int main() {
  using commitgate::diff::parse_unified;

  const char *text = "diff --git a/cmd/main.go b/cmd/main.go\n"
                     "index 3b18e51..a5c1966 100644\n"
                     "--- a/cmd/main.go\n"
                     "+++ b/cmd/main.go\n"
                     "@@ -10,0 +11,2 @@ func main() {\n"
                     "+\tlog.Println(\"x\")\n"
                     "+++counter\n"
                     "@@ -20 +22 @@\n"
                     "-old\n"
                     "+new\n"
                     "diff --git a/gone.go b/gone.go\n"
                     "deleted file mode 100644\n"
                     "--- a/gone.go\n"
                     "+++ /dev/null\n"
                     "@@ -1 +0,0 @@\n"
                     "-package gone\n"
                     "diff --git a/new.go b/new.go\n"
                     "new file mode 100644\n"
                     "--- /dev/null\n"
                     "+++ b/new.go\n"
                     "@@ -0,0 +1,3 @@\n"
                     "+package x\n"
                     "+\n"
                     "+// TODO\n";

  const auto deltas = parse_unified(text);
  if (deltas.size() != 2) { std::cerr << "expected 2 files, got " << deltas.size() << "\n"; return 1; }

  const auto &m = deltas[0];
  if (m.path != "cmd/main.go") { std::cerr << "bad path: " << m.path << "\n"; return 1; }
  if (m.added.size() != 3) { std::cerr << "expected 3 added lines in main.go\n"; return 1; }
  if (m.added[0].line_no != 11 || m.added[0].text != "\tlog.Println(\"x\")") { std::cerr << "first added line wrong\n"; return 1; }
  // "+++counter" inside a hunk is content, not a header
  if (m.added[1].line_no != 12 || m.added[1].text != "++counter") { std::cerr << "in-hunk +++ misparsed\n"; return 1; }
  if (m.added[2].line_no != 22 || m.added[2].text != "new") { std::cerr << "second hunk misnumbered\n"; return 1; }

  const auto &n = deltas[1];
  if (n.path != "new.go" || n.added.size() != 3) { std::cerr << "new.go misparsed\n"; return 1; }
  if (n.added[2].line_no != 3 || n.added[2].text != "// TODO") { std::cerr << "new.go line 3 wrong\n"; return 1; }

  const auto lines = commitgate::diff::split_lines("a\r\nb\n\nc");
  if (lines.size() != 4 || lines[0] != "a" || lines[2] != "" || lines[3] != "c") { std::cerr << "split_lines wrong\n"; return 1; }

  // Quoted names: octal bytes, escaped quote and backslash; plain names keep the tab cut
  const auto quoted = parse_unified("diff --git \"a/caf\\303\\251.go\" \"b/caf\\303\\251.go\"\n"
                                    "+++ \"b/caf\\303\\251.go\"\n"
                                    "@@ -0,0 +1 @@\n"
                                    "+x\n"
                                    "diff --git a/q b/q\n"
                                    "+++ \"b/say \\\"hi\\\" \\\\ tab\\there.go\"\n"
                                    "@@ -0,0 +1 @@\n"
                                    "+y\n"
                                    "diff --git a/with space.go b/with space.go\n"
                                    "+++ b/with space.go\t\n"
                                    "@@ -0,0 +1 @@\n"
                                    "+z\n");
  if (quoted.size() != 3 || quoted[0].path != "caf\xc3\xa9.go" ||
      quoted[1].path != "say \"hi\" \\ tab\there.go" || quoted[2].path != "with space.go") {
    std::cerr << "quoted paths not decoded\n";
    for (const auto &q : quoted) std::cerr << "  [" << q.path << "]\n";
    return 1;
  }

  if (!parse_unified("").empty()) { std::cerr << "empty diff produced files\n"; return 1; }

  std::cout << "OK\n";
  return 0;
}
