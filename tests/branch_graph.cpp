#include "gitstack/branch_graph.hpp"
#include "gitstack/errors.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

using gitstack::BranchGraph;
using gitstack::LoadBranchItem;
using strings = std::vector<std::string>;

static LoadBranchItem item(const std::string &name, const std::string &base) {
  return LoadBranchItem{.name = name, .head = name + "-head", .base = base};
}

static std::string show(const strings &v) {
  std::string out = "[";
  for (const auto &s : v) {
    out += (out.size() > 1 ? "," : "") + s;
  }
  return out + "]";
}

static bool expect(const char *what, const strings &got, const strings &want) {
  if (got != want) {
    std::cerr << what << ": got " << show(got) << ", want " << show(want) << "\n";
    return false;
  }
  return true;
}

int main() {
  // main -> feature1 -> {feature2, feature4}
  // main -> feature3 -> feature5
  const BranchGraph graph{"main",
                          {item("feature1", "main"), item("feature2", "feature1"),
                           item("feature3", "main"), item("feature4", "feature1"),
                           item("feature5", "feature3")}};

  if (graph.count() != 5 || graph.lookup("main") != nullptr ||
      graph.lookup("feature2") == nullptr || graph.lookup("feature2")->base != "feature1") {
    std::cerr << "lookup mismatch\n";
    return 1;
  }

  if (!expect("aboves(main)", graph.aboves("main"), {"feature1", "feature3"})) return 1;
  if (!expect("aboves(feature2)", graph.aboves("feature2"), {})) return 1;
  if (!expect("tops(main)", graph.tops("main"), {"feature2", "feature4", "feature5"})) return 1;
  if (!expect("tops(feature3)", graph.tops("feature3"), {"feature5"})) return 1;
  if (!expect("downstack(feature5)", graph.downstack("feature5"), {"feature5", "feature3"}))
    return 1;
  if (!expect("downstack(main)", graph.downstack("main"), {})) return 1;
  if (!expect("upstack(main)", graph.upstack("main"),
              {"main", "feature1", "feature3", "feature2", "feature4", "feature5"}))
    return 1;
  if (!expect("upstack(feature1)", graph.upstack("feature1"),
              {"feature1", "feature2", "feature4"}))
    return 1;
  if (!expect("stack(feature1)", graph.stack("feature1"), {"feature1", "feature2", "feature4"}))
    return 1;
  if (!expect("stack(feature4)", graph.stack("feature4"), {"feature1", "feature4"})) return 1;

  if (graph.bottom("feature2") != "feature1" || graph.bottom("feature5") != "feature3" ||
      !graph.bottom("main").empty()) {
    std::cerr << "bottom mismatch\n";
    return 1;
  }

  // Properties over every tracked branch.
  for (const auto &b : graph.all()) {
    const auto st = graph.stack(b.name);
    if (std::ranges::count(st, b.name) != 1) {
      std::cerr << "stack(" << b.name << ") has it " << std::ranges::count(st, b.name)
                << " times\n";
      return 1;
    }
    const auto down = graph.downstack(b.name);
    if (down.empty() || down.front() != b.name || std::ranges::count(down, "main") != 0) {
      std::cerr << "downstack(" << b.name << ") = " << show(down) << "\n";
      return 1;
    }
    const auto tops = graph.tops(b.name);
    if (tops.empty()) {
      std::cerr << "tops(" << b.name << ") is empty\n";
      return 1;
    }
    for (const auto &t : tops) {
      if (!graph.aboves(t).empty()) {
        std::cerr << "top " << t << " has branches above it\n";
        return 1;
      }
    }
  }

  // Linear stacks
  if (!expect("stack_linear(feature3)", graph.stack_linear("feature3"), {"feature3", "feature5"}))
    return 1;
  if (!expect("stack_linear(feature5)", graph.stack_linear("feature5"), {"feature3", "feature5"}))
    return 1;

  for (const std::string start : {"feature1", "feature2", "feature4"}) {
    try {
      (void)graph.stack_linear(start);
      std::cerr << "stack_linear(" << start << ") should fail\n";
      return 1;
    } catch (const gitstack::NonLinearStackError &e) {
      if (e.branch() != "feature1" || e.aboves() != strings{"feature2", "feature4"}) {
        std::cerr << "unexpected non-linear error: " << e.what() << "\n";
        return 1;
      }
    }
  }

  std::cout << "OK\n";
  return 0;
}
