#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>

#include "graph_model.hpp"
#include "kernel/context.hpp"
#include "kernel/ops.hpp"
#include "kernel/processor.hpp"

namespace {

tg::Handler scaled_accumulator(double factor) {
  return [factor](const tg::Value& previous, const tg::SourceValues& sources) {
    const tg::Value& in = sources.at("in");
    double base = previous.IsNull() ? 0.0 : previous.as<double>();
    if (in.IsNull()) return tg::Value(base);
    return tg::Value(base + factor * in.as<double>());
  };
}

tg::Handler sum_all() {
  return [](const tg::Value&, const tg::SourceValues& sources) {
    double total = 0.0;
    for (const auto& [label, v] : sources) {
      if (!v.IsNull()) total += v.as<double>();
    }
    return tg::Value(total);
  };
}

struct FanOut {
  tg::NodePtr x = tg::make_input_node();
  tg::NodePtr y = tg::make_input_node();
  tg::NodePtr a = tg::make_compute_node({{"in", x}}, scaled_accumulator(1.0));
  tg::NodePtr b = tg::make_compute_node({{"in", x}}, scaled_accumulator(2.0));
  tg::NodePtr c = tg::make_compute_node({{"in", y}}, scaled_accumulator(3.0));
  tg::NodePtr d = tg::make_compute_node({{"in", y}}, scaled_accumulator(-1.0));
  tg::NodePtr total =
      tg::make_compute_node({{"a", a}, {"b", b}, {"c", c}, {"d", d}}, sum_all());
  tg::NodePtr running = tg::make_compute_node({{"in", total}}, scaled_accumulator(0.5));

  tg::Graph graph() const {
    return tg::make_graph({{"x", x}, {"y", y}, {"a", a}, {"b", b}, {"c", c},
                           {"d", d}, {"total", total}, {"running", running}});
  }
};

std::map<std::string, double> as_doubles(const tg::Context& ctx) {
  std::map<std::string, double> out;
  for (const auto& [label, value] : ctx.values()) {
    out[label] = value.as<double>();
  }
  return out;
}

}  // namespace

TEST(ProcessorTest, SequentialCompileFlattensLevels) {
  FanOut f;
  tg::Graph g = f.graph();
  tg::SequentialProcessor sequential;
  tg::Schedule schedule = sequential.compile(g, {f.x->id(), f.y->id()});
  ASSERT_EQ(schedule.size(), 1u);
  const tg::Level& order = schedule[0];
  EXPECT_EQ(order.size(), 6u);

  auto position = [&order](tg::NodeId id) {
    return std::find(order.begin(), order.end(), id) - order.begin();
  };
  EXPECT_LT(position(f.a->id()), position(f.total->id()));
  EXPECT_LT(position(f.d->id()), position(f.total->id()));
  EXPECT_LT(position(f.total->id()), position(f.running->id()));
}

TEST(ProcessorTest, ParallelCompileKeepsLevels) {
  FanOut f;
  tg::Graph g = f.graph();
  tg::ParallelProcessor parallel(2);
  EXPECT_EQ(parallel.num_workers(), 2u);
  tg::Schedule schedule = parallel.compile(g, {f.x->id(), f.y->id()});
  ASSERT_EQ(schedule.size(), 3u);
  EXPECT_EQ(schedule[0].size(), 4u);
  EXPECT_EQ(schedule[1], tg::Level{f.total->id()});
  EXPECT_EQ(schedule[2], tg::Level{f.running->id()});
}

TEST(ProcessorTest, CompileWithoutInputsIsEmpty) {
  FanOut f;
  tg::SequentialProcessor sequential;
  tg::ParallelProcessor parallel(2);
  EXPECT_TRUE(sequential.compile(f.graph(), {}).empty());
  EXPECT_TRUE(parallel.compile(f.graph(), {}).empty());
}

TEST(ProcessorTest, ParallelMatchesSequential) {
  FanOut f;
  tg::Graph g = f.graph();
  tg::Context seq = tg::make_context(g);
  tg::Context par = tg::make_context(g, std::make_shared<tg::ParallelProcessor>(4));

  std::vector<std::map<std::string, tg::Value>> batches = {
      {{"x", tg::Value(1)}, {"y", tg::Value(2)}},
      {{"x", tg::Value(5)}},
      {{"y", tg::Value(-3)}},
      {},
      {{"x", tg::Value(0.5)}, {"y", tg::Value(10)}},
  };
  for (const auto& batch : batches) {
    seq = seq.process(batch);
    par = par.process(batch);
    EXPECT_EQ(as_doubles(seq), as_doubles(par));
  }
  EXPECT_EQ(as_doubles(seq).size(), 6u);
}

TEST(ProcessorTest, ExecuteCarriesUntouchedValues) {
  FanOut f;
  tg::Graph g = f.graph();
  tg::SequentialProcessor sequential;

  tg::ValueMap current;
  current.emplace(f.c->id(), tg::Value(42));
  tg::Schedule schedule = sequential.compile(g, {f.x->id()});
  tg::ValueMap next =
      sequential.execute(g, schedule, current, {{f.x->id(), tg::Value(1)}});
  EXPECT_EQ(next.at(f.c->id()).as<int>(), 42);
  EXPECT_EQ(next.at(f.a->id()).as<double>(), 1.0);
  EXPECT_EQ(next.at(f.b->id()).as<double>(), 2.0);
  EXPECT_FALSE(next.count(f.d->id()));
  // the argument map is left as it was
  EXPECT_EQ(current.size(), 1u);
}

TEST(ProcessorTest, ParallelFailureCommitsNothing) {
  auto in = tg::make_input_node();
  auto ok = tg::make_compute_node({{"in", in}}, scaled_accumulator(1.0));
  auto bad = tg::make_compute_node(
      {{"in", in}}, [](const tg::Value&, const tg::SourceValues& sources) -> tg::Value {
        if (sources.at("in").as<int>() > 100) throw std::runtime_error("too large");
        return sources.at("in");
      });
  tg::Graph g = tg::make_graph({{"in", in}, {"ok", ok}, {"bad", bad}});

  tg::Context ctx = tg::make_context(g, std::make_shared<tg::ParallelProcessor>(2));
  tg::Context first = ctx.process({{"in", tg::Value(1)}});
  ASSERT_EQ(first.value("ok")->as<double>(), 1.0);

  try {
    first.process({{"in", tg::Value(1000)}});
    FAIL() << "expected ComputationError";
  } catch (const tg::ComputationError& e) {
    EXPECT_EQ(e.node(), bad->id());
    EXPECT_EQ(e.paths(), (std::set<tg::LabelPath>{{"bad"}}));
    EXPECT_THROW(e.rethrow_cause(), std::runtime_error);
  }
  EXPECT_EQ(first.value("ok")->as<double>(), 1.0);
  EXPECT_EQ(first.value("bad")->as<int>(), 1);
}

TEST(ProcessorTest, EvaluateInputNodeIsRejected) {
  auto in = tg::make_input_node();
  tg::Graph g = tg::make_graph({{"in", in}});
  try {
    tg::evaluate_node(g, in->id(), {}, {});
    FAIL() << "expected GraphError";
  } catch (const tg::GraphError& e) {
    EXPECT_EQ(e.code(), tg::GraphErrc::WrongNodeKind);
  }
}

TEST(ProcessorTest, HandlerSeesClonedPrevious) {
  auto in = tg::make_input_node();
  auto node = tg::make_compute_node(
      {{"in", in}}, [](const tg::Value& previous, const tg::SourceValues&) {
        tg::Value out = previous.IsNull() ? tg::Value(YAML::NodeType::Sequence) : previous;
        out.push_back(1);
        return out;
      });
  tg::Graph g = tg::make_graph({{"in", in}, {"list", node}});

  tg::Context one = tg::make_context(g).process({{"in", tg::Value(0)}});
  tg::Context two = one.process({{"in", tg::Value(0)}});
  EXPECT_EQ(one.value("list")->size(), 1u);
  EXPECT_EQ(two.value("list")->size(), 2u);
}

TEST(ProcessorTest, EventsAreRecorded) {
  FanOut f;
  auto events = std::make_shared<tg::GraphEventService>();
  tg::ProcessorOptions options;
  options.events = events;
  tg::Context ctx =
      tg::make_context(f.graph(), std::make_shared<tg::SequentialProcessor>(options));

  ctx.process({{"x", tg::Value(1)}});
  auto drained = events->drain();
  ASSERT_EQ(drained.size(), 4u);  // a, b, total, running
  for (const auto& ev : drained) {
    EXPECT_EQ(ev.source, "computed");
    EXPECT_GE(ev.elapsed_ms, 0.0);
  }
  EXPECT_EQ(drained.back().name, "running");
  EXPECT_EQ(drained.front().batch, drained.back().batch);
  EXPECT_EQ(events->size(), 0u);

  ctx.process({{"y", tg::Value(1)}});
  auto totals = events->totals();
  EXPECT_EQ(totals.size(), 4u);  // c, d, total, running
  EXPECT_EQ(totals.at("total").count, 1u);
  EXPECT_FALSE(totals.count("a"));
  EXPECT_GT(events->drain().front().batch, drained.front().batch);
}

TEST(ProcessorTest, FailedParallelLevelKeepsSiblingEvents) {
  auto in = tg::make_input_node();
  auto ok = tg::make_compute_node({{"in", in}}, scaled_accumulator(1.0));
  auto bad = tg::make_compute_node(
      {{"in", in}}, [](const tg::Value&, const tg::SourceValues&) -> tg::Value {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        throw std::runtime_error("boom");
      });
  tg::Graph g = tg::make_graph({{"in", in}, {"ok", ok}, {"bad", bad}});

  auto events = std::make_shared<tg::GraphEventService>();
  tg::ProcessorOptions options;
  options.events = events;
  tg::Context ctx =
      tg::make_context(g, std::make_shared<tg::ParallelProcessor>(2, options));
  EXPECT_THROW(ctx.process({{"in", tg::Value(1)}}), tg::ComputationError);

  auto totals = events->totals();
  ASSERT_EQ(totals.size(), 1u);
  EXPECT_EQ(totals.at("ok").count, 1u);
  EXPECT_FALSE(totals.count("bad"));
}

TEST(ProcessorTest, SiblingsReadingOneWindowAgree) {
  tg::ops::register_builtin();
  auto& registry = tg::OpRegistry::instance();
  YAML::Node params;
  params["n"] = 4;
  auto price = tg::make_input_node();
  auto window = tg::make_compute_node({{"input", price}},
                                      (*registry.find("stream:latest_n"))(params));
  std::map<std::string, tg::NodePtr> labelled{{"price", price}};
  for (int i = 0; i < 6; ++i) {
    labelled["mean" + std::to_string(i)] =
        tg::make_compute_node({{"source", window}}, (*registry.find("math:mean"))(YAML::Node()));
  }
  tg::Graph g = tg::make_graph(labelled);

  tg::Context seq = tg::make_context(g);
  tg::Context par = tg::make_context(g, std::make_shared<tg::ParallelProcessor>(6));
  for (int p = 1; p <= 20; ++p) {
    seq = seq.process({{"price", tg::Value(p)}});
    par = par.process({{"price", tg::Value(p)}});
  }
  EXPECT_EQ(as_doubles(seq), as_doubles(par));
  EXPECT_DOUBLE_EQ(par.value("mean5")->as<double>(), 18.5);  // 17..20
}
