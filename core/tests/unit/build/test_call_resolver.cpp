// tests/unit/build/test_call_resolver.cpp - Call-site resolution rules
//

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "codegraph/build/call_resolver.hpp"
#include "codegraph/build/graph_builder.hpp"
#include "codegraph/build/node_identity.hpp"
#include "codegraph/graph/memory_graph_store.hpp"
#include "codegraph/test_support/payload_builder.hpp"

using namespace codegraph;
using test_support::PayloadBuilder;

namespace
{

std::shared_ptr<const CodeGraph> index_all(const std::vector<ExtractionPayload> & payloads)
{
  MemoryGraphStore store;
  GraphBuilder builder(store);
  for (const auto & p : payloads) {
    const auto r = builder.apply_extraction(p);
    EXPECT_TRUE(r.success) << r.error;
  }
  return store.view();
}

Resolution resolve_in(const CodeGraph & g, const std::string & caller, const std::string & callee)
{
  const Node * fn = g.find_node(make_node_id(NodeKind::Function, caller));
  EXPECT_NE(fn, nullptr) << caller;
  if (fn == nullptr) return Unresolved{};
  return CallResolver(g).resolve(*fn, callee);
}

Resolution resolved_to(const std::string & qname)
{
  return Resolved{make_node_id(NodeKind::Function, qname)};
}

}  // namespace

// ============================================================================
// Receiver and inheritance
// ============================================================================

TEST(CallResolverTest, SelfCallsFindMethodsOfTheEnclosingClass)
{
  PayloadBuilder b("shop");
  b.cls("shop.Cart").function("shop.Cart.total").function("shop.Cart.checkout");
  b.function("shop.standalone");
  const auto g = index_all({b.build()});

  EXPECT_EQ(resolve_in(*g, "shop.Cart.checkout", "self.total"), resolved_to("shop.Cart.total"));
  EXPECT_EQ(resolve_in(*g, "shop.Cart.checkout", "cls.total"), resolved_to("shop.Cart.total"));
  EXPECT_EQ(resolve_in(*g, "shop.Cart.checkout", "self.missing"), Resolution{Unresolved{}});

  // No enclosing class
  EXPECT_EQ(resolve_in(*g, "shop.standalone", "self.total"), Resolution{Unresolved{}});
}

TEST(CallResolverTest, InheritedMethodsResolveThroughBases)
{
  PayloadBuilder b("models");
  b.cls("models.Base").function("models.Base.save").function("models.Base.load");
  b.cls("models.Mid", {"models.Base"});
  b.cls("models.User", {"models.Mid"}).function("models.User.load").function("models.User.run");
  const auto g = index_all({b.build()});

  EXPECT_EQ(resolve_in(*g, "models.User.run", "self.save"), resolved_to("models.Base.save"));
  // The nearest definition wins
  EXPECT_EQ(resolve_in(*g, "models.User.run", "self.load"), resolved_to("models.User.load"));
}

// ============================================================================
// Lexical scopes
// ============================================================================

TEST(CallResolverTest, InnermostScopeShadowsOuterDefinitions)
{
  PayloadBuilder b("m");
  b.function("m.calc").function("m.outer").function("m.outer.calc").function("m.other");
  const auto g = index_all({b.build()});

  EXPECT_EQ(resolve_in(*g, "m.outer", "calc"), resolved_to("m.outer.calc"));
  EXPECT_EQ(resolve_in(*g, "m.other", "calc"), resolved_to("m.calc"));
  EXPECT_EQ(resolve_in(*g, "m.other", "nothing_here"), Resolution{Unresolved{}});
}

TEST(CallResolverTest, ClassNamesDenoteTheirConstructor)
{
  PayloadBuilder b("m");
  b.cls("m.Helper").function("m.Helper.__init__").function("m.Helper.create");
  b.function("m.main");
  const auto g = index_all({b.build()});

  EXPECT_EQ(resolve_in(*g, "m.main", "Helper"), resolved_to("m.Helper.__init__"));
  EXPECT_EQ(resolve_in(*g, "m.main", "Helper.create"), resolved_to("m.Helper.create"));
}

// ============================================================================
// Imports
// ============================================================================

TEST(CallResolverTest, ImportForms)
{
  PayloadBuilder lib("lib.util");
  lib.function("lib.util.calc").function("lib.util.parse");

  PayloadBuilder aliased("app.aliased");
  aliased.import("lib.util", "u").function("app.aliased.main");

  PayloadBuilder plain("app.plain");
  plain.import("lib.util").function("app.plain.main");

  PayloadBuilder from("app.from");
  from.import("lib.util.calc", "", NodeKind::Function).function("app.from.main");

  PayloadBuilder star("app.star");
  star.import("lib.util", "*").function("app.star.main");

  const auto g =
    index_all({lib.build(), aliased.build(), plain.build(), from.build(), star.build()});

  EXPECT_EQ(resolve_in(*g, "app.aliased.main", "u.calc"), resolved_to("lib.util.calc"));
  EXPECT_EQ(resolve_in(*g, "app.plain.main", "lib.util.parse"), resolved_to("lib.util.parse"));
  EXPECT_EQ(resolve_in(*g, "app.from.main", "calc"), resolved_to("lib.util.calc"));
  EXPECT_EQ(resolve_in(*g, "app.from.main", "parse"), Resolution{Unresolved{}});
  EXPECT_EQ(resolve_in(*g, "app.star.main", "parse"), resolved_to("lib.util.parse"));
}

TEST(CallResolverTest, ImportTable)
{
  PayloadBuilder b("app");
  b.import("lib.util", "u").import("lib.io").import("lib.fmt", "*").import(
    "lib.util.calc", "", NodeKind::Function);
  const auto g = index_all({b.build()});

  const Node * app = g->find_node(make_node_id(NodeKind::Module, "app"));
  const auto entries = CallResolver(*g).imports_of(*app);
  ASSERT_EQ(entries.size(), 4u);

  int wildcards = 0;
  for (const auto & e : entries) {
    if (e.wildcard) {
      ++wildcards;
      EXPECT_EQ(e.target, "lib.fmt");
    } else if (e.target == "lib.util") {
      EXPECT_EQ(e.alias, "u");
    } else if (e.target == "lib.io") {
      EXPECT_EQ(e.alias, "lib.io");
    } else {
      EXPECT_EQ(e.target, "lib.util.calc");
      EXPECT_EQ(e.alias, "calc");
    }
  }
  EXPECT_EQ(wildcards, 1);
}

TEST(CallResolverTest, LocalDefinitionBeatsImport)
{
  PayloadBuilder lib("lib");
  lib.function("lib.run");
  PayloadBuilder app("app");
  app.import("lib.run", "", NodeKind::Function).function("app.run").function("app.main");
  const auto g = index_all({lib.build(), app.build()});

  EXPECT_EQ(resolve_in(*g, "app.main", "run"), resolved_to("app.run"));
}

TEST(CallResolverTest, SeveralCandidatesAreAmbiguous)
{
  PayloadBuilder a("a");
  a.function("a.load");
  PayloadBuilder b("b");
  b.function("b.load");
  PayloadBuilder app("app");
  app.import("a", "*").import("b", "*").function("app.main");
  const auto g = index_all({a.build(), b.build(), app.build()});

  const auto r = resolve_in(*g, "app.main", "load");
  ASSERT_TRUE(std::holds_alternative<Ambiguous>(r));
  EXPECT_EQ(
    std::get<Ambiguous>(r).candidates,
    (std::vector<NodeId>{make_node_id(NodeKind::Function, "a.load"),
                         make_node_id(NodeKind::Function, "b.load")}));
}

TEST(CallResolverTest, CallSiteNodesResolveThroughTheirOwner)
{
  PayloadBuilder b("m");
  b.function("m.helper").function("m.main").call("m.main", "helper", 0);
  const auto g = index_all({b.build()});

  const Node * cs = g->find_node(make_callsite_id("m.main", "helper", 0));
  ASSERT_NE(cs, nullptr);
  EXPECT_EQ(CallResolver(*g).resolve(*cs), resolved_to("m.helper"));
  EXPECT_EQ(read_resolution(*g, *cs), resolved_to("m.helper"));
}

TEST(CallResolverTest, ToResolutionCollapsesCandidates)
{
  EXPECT_EQ(to_resolution({}), Resolution{Unresolved{}});
  EXPECT_EQ(to_resolution({"x", "x"}), Resolution{Resolved{"x"}});
  EXPECT_EQ(to_resolution({"y", "x", "y"}), (Resolution{Ambiguous{{"x", "y"}}}));
}
