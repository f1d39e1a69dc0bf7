#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <sstream>

#include "graph_model.hpp"
#include "kernel/services/graph_traversal_service.hpp"

namespace {

tg::Handler first_source() {
  return [](const tg::Value&, const tg::SourceValues& sources) {
    return sources.begin()->second;
  };
}

}  // namespace

TEST(TraversalTest, LevelUsesDeepestSource) {
  auto in = tg::make_input_node();
  auto a = tg::make_compute_node({{"source", in}}, first_source());
  auto b = tg::make_compute_node({{"x", in}, {"y", a}}, first_source());
  tg::Graph g = tg::make_graph({{"in", in}, {"b", b}});

  tg::GraphTraversalService traversal;
  tg::Schedule levels = traversal.levels(g);
  ASSERT_EQ(levels.size(), 3u);
  EXPECT_EQ(levels[0], tg::Level{in->id()});
  EXPECT_EQ(levels[1], tg::Level{a->id()});
  EXPECT_EQ(levels[2], tg::Level{b->id()});
}

TEST(TraversalTest, LevelsFromPartialInputs) {
  auto in1 = tg::make_input_node();
  auto in2 = tg::make_input_node();
  auto a = tg::make_compute_node({{"source", in1}}, first_source());
  auto b = tg::make_compute_node({{"a", a}, {"in", in2}}, first_source());
  tg::Graph g = tg::make_graph({{"in1", in1}, {"in2", in2}, {"b", b}});

  tg::GraphTraversalService traversal;
  tg::Schedule all = traversal.levels(g);
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0], (tg::Level{in1->id(), in2->id()}));
  EXPECT_EQ(all[1], tg::Level{a->id()});
  EXPECT_EQ(all[2], tg::Level{b->id()});

  // a is not reachable from in2 and does not constrain b.
  tg::Schedule partial = traversal.levels(g, std::vector<tg::NodeId>{in2->id()});
  ASSERT_EQ(partial.size(), 2u);
  EXPECT_EQ(partial[0], tg::Level{in2->id()});
  EXPECT_EQ(partial[1], tg::Level{b->id()});
}

TEST(TraversalTest, LevelsAreDeterministic) {
  auto in = tg::make_input_node();
  std::map<std::string, tg::NodePtr> labelled{{"in", in}};
  for (int i = 0; i < 8; ++i) {
    labelled["n" + std::to_string(i)] =
        tg::make_compute_node({{"source", in}}, first_source());
  }
  tg::Graph g = tg::make_graph(labelled);

  tg::GraphTraversalService traversal;
  tg::Schedule first = traversal.levels(g);
  tg::Schedule second = traversal.levels(g);
  EXPECT_EQ(first, second);
  ASSERT_EQ(first.size(), 2u);
  EXPECT_EQ(first[1].size(), 8u);
  EXPECT_TRUE(std::is_sorted(first[1].begin(), first[1].end()));
}

TEST(TraversalTest, UnknownInputIsRejected) {
  tg::GraphTraversalService traversal;
  tg::Graph g;
  EXPECT_THROW(traversal.levels(g, std::vector<tg::NodeId>{999999}), tg::GraphError);
  EXPECT_THROW(traversal.label_paths(g, 999999), tg::GraphError);
  EXPECT_THROW(traversal.dependants_of(g, 999999), tg::GraphError);
}

TEST(TraversalTest, LabelPathsThroughBothBranches) {
  auto in = tg::make_input_node();
  auto c = tg::make_compute_node({{"input", in}}, first_source());
  auto c1 = tg::make_compute_node({{"source", c}}, first_source());
  auto c2 = tg::make_compute_node({{"source", c}}, first_source());
  auto c3 = tg::make_compute_node({{"c1", c1}, {"c2", c2}}, first_source());
  tg::Graph g = tg::make_graph({{"input", in}, {"c3", c3}});

  tg::GraphTraversalService traversal;
  std::set<tg::LabelPath> expected{{"c3", "c1", "source"}, {"c3", "c2", "source"}};
  EXPECT_EQ(traversal.label_paths(g, c->id()), expected);
  EXPECT_EQ(traversal.label_paths(g, c3->id()), (std::set<tg::LabelPath>{{"c3"}}));
  EXPECT_EQ(tg::format_path({"c3", "c1", "source"}), "[:c3 :c1 :source]");
}

TEST(TraversalTest, LabelPathsStopAtNearestLabel) {
  auto in = tg::make_input_node();
  auto c = tg::make_compute_node({{"input", in}}, first_source());
  auto mid = tg::make_compute_node({{"raw", c}}, first_source());
  auto top = tg::make_compute_node({{"mid", mid}}, first_source());
  tg::Graph g = tg::make_graph({{"mid", mid}, {"top", top}});

  tg::GraphTraversalService traversal;
  EXPECT_EQ(traversal.label_paths(g, c->id()),
            (std::set<tg::LabelPath>{{"mid", "raw"}}));
}

TEST(TraversalTest, EndingNodesAndDependants) {
  auto in = tg::make_input_node();
  auto a = tg::make_compute_node({{"source", in}}, first_source());
  auto b = tg::make_compute_node({{"source", in}}, first_source());
  tg::Graph g = tg::make_graph({{"a", a}, {"b", b}});

  tg::GraphTraversalService traversal;
  std::vector<tg::NodeId> ends{a->id(), b->id()};
  std::sort(ends.begin(), ends.end());
  EXPECT_EQ(traversal.ending_nodes(g), ends);
  EXPECT_EQ(traversal.dependants_of(g, in->id()), ends);
  EXPECT_TRUE(traversal.dependants_of(g, a->id()).empty());
}

TEST(TraversalTest, PrintDependencyTree) {
  auto in = tg::make_input_node();
  auto a = tg::make_compute_node({{"source", in}}, first_source());
  tg::Graph g = tg::make_graph({{"price", in}, {"avg", a}});

  tg::GraphTraversalService traversal;
  std::ostringstream os;
  traversal.print_dependency_tree(g, os);
  const std::string text = os.str();
  EXPECT_NE(text.find("Dependency Tree"), std::string::npos);
  EXPECT_NE(text.find("- avg [compute"), std::string::npos);
  EXPECT_NE(text.find("  - (source) price [input"), std::string::npos);

  std::ostringstream empty;
  traversal.print_dependency_tree(tg::Graph(), empty);
  EXPECT_NE(empty.str().find("(Graph is empty)"), std::string::npos);

  std::ostringstream missing;
  traversal.print_dependency_tree(g, missing, "nope");
  EXPECT_NE(missing.str().find("not found"), std::string::npos);
}
