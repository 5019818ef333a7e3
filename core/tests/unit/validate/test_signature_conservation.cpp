// tests/unit/validate/test_signature_conservation.cpp - Arity, keywords, visibility
//

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "codegraph/build/graph_builder.hpp"
#include "codegraph/build/node_identity.hpp"
#include "codegraph/graph/memory_graph_store.hpp"
#include "codegraph/test_support/payload_builder.hpp"
#include "codegraph/validate/conservation_validator.hpp"
#include "codegraph/validate/signature_checker.hpp"

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

std::vector<Violation> signature_violations(const CodeGraph & g)
{
  return ConservationValidator()
    .validate(g, NodeFilter::all(), {}, {Law::SignatureConservation})
    .violations;
}

/// Violation with the given message, or nullptr
const Violation * with_message(const std::vector<Violation> & found, const std::string & message)
{
  for (const auto & v : found) {
    if (v.message == message) return &v;
  }
  return nullptr;
}

}  // namespace

// ============================================================================
// Arity
// ============================================================================

TEST(SignatureConservationTest, TooManyArgumentsIsReported)
{
  PayloadBuilder b("app.main");
  b.function("app.main.calc", "int")
    .param("app.main.calc", "a", "int")
    .param("app.main.calc", "b", "int");
  b.function("app.main.run", "None").call("app.main.run", "calc", 3);
  const auto g = index_all({b.build()});

  const auto report = ConservationValidator().validate_full(*g);
  ASSERT_EQ(report.violations.size(), 1u);

  const Violation & v = report.violations.front();
  EXPECT_EQ(v.law, Law::SignatureConservation);
  EXPECT_EQ(v.type, "signature_mismatch");
  EXPECT_EQ(v.severity, Severity::Error);
  EXPECT_EQ(v.message, "Function calc expects 2 arguments but is called with 3");
  EXPECT_EQ(v.location, "app/main.py:6:0");
  ASSERT_EQ(v.entity_ids.size(), 2u);
  EXPECT_EQ(v.entity_ids[0], make_callsite_id("app.main.run", "calc", 0));
  EXPECT_EQ(v.entity_ids[1], make_node_id(NodeKind::Function, "app.main.calc"));
  EXPECT_EQ(get_int(v.details, "expected_args").value_or(-1), 2);
  EXPECT_EQ(get_int(v.details, "actual_args").value_or(-1), 3);
  EXPECT_TRUE(v.suggested_fix.has_value());
  EXPECT_TRUE(report.has_errors());
}

TEST(SignatureConservationTest, MatchingCallIsClean)
{
  PayloadBuilder b("m");
  b.function("m.calc", "int").param("m.calc", "a", "int").param("m.calc", "b", "int");
  b.function("m.run", "None").call("m.run", "calc", 2);
  const auto g = index_all({b.build()});

  const auto report = ConservationValidator().validate_full(*g);
  EXPECT_TRUE(report.violations.empty());
  EXPECT_EQ(report.scope_size, g->node_count());
  EXPECT_FALSE(report.incremental);
}

TEST(SignatureConservationTest, DefaultsWidenTheAcceptedRange)
{
  PayloadBuilder b("m");
  b.function("m.f").param("m.f", "a").param("m.f", "b", "", ParamKind::Positional, true);
  b.function("m.run")
    .call("m.run", "f", 1)
    .call("m.run", "f", 2)
    .call("m.run", "f", 0)
    .call("m.run", "f", 3);
  const auto g = index_all({b.build()});

  const auto found = signature_violations(*g);
  ASSERT_EQ(found.size(), 2u);
  const Violation * too_few =
    with_message(found, "Function f expects 1-2 arguments but is called with 0");
  const Violation * too_many =
    with_message(found, "Function f expects 1-2 arguments but is called with 3");
  ASSERT_NE(too_few, nullptr);
  ASSERT_NE(too_many, nullptr);
  EXPECT_EQ(get_int(too_few->details, "expected_args").value_or(-1), 1);
  EXPECT_EQ(get_int(too_many->details, "expected_args").value_or(-1), 2);
  EXPECT_EQ(get_int(too_many->details, "min_args").value_or(-1), 1);
  EXPECT_EQ(get_int(too_many->details, "max_args").value_or(-1), 2);
}

TEST(SignatureConservationTest, VariadicParametersLiftTheUpperBound)
{
  PayloadBuilder b("m");
  b.function("m.log").param("m.log", "fmt").param("m.log", "args", "", ParamKind::VarPositional);
  b.function("m.run").call("m.run", "log", 7).call("m.run", "log", 0);
  const auto g = index_all({b.build()});

  const auto found = signature_violations(*g);
  ASSERT_EQ(found.size(), 1u);
  EXPECT_EQ(found[0].message, "Function log expects at least 1 argument but is called with 0");
  EXPECT_FALSE(get_int(found[0].details, "max_args").has_value());
}

TEST(SignatureConservationTest, ReceiverIsNotCounted)
{
  PayloadBuilder b("m");
  b.cls("m.Box")
    .function("m.Box.put")
    .param("m.Box.put", "self", "", ParamKind::Receiver)
    .param("m.Box.put", "item");
  b.function("m.Box.fill").param("m.Box.fill", "self", "", ParamKind::Receiver);
  b.call("m.Box.fill", "self.put", 1).call("m.Box.fill", "self.put", 2);
  const auto g = index_all({b.build()});

  const auto found = signature_violations(*g);
  ASSERT_EQ(found.size(), 1u);
  EXPECT_EQ(found[0].message, "Function put expects 1 argument but is called with 2");
}

TEST(SignatureConservationTest, ArityOfParameterKinds)
{
  Node dummy;
  const std::vector<ParameterInfo> params{
    {&dummy, 0, ParamKind::Receiver, false},
    {&dummy, 1, ParamKind::PositionalOnly, false},
    {&dummy, 2, ParamKind::Positional, true},
    {&dummy, 3, ParamKind::KeywordOnly, true},
  };
  const Arity arity = arity_of(params);
  EXPECT_EQ(arity.min, 1);
  EXPECT_EQ(arity.max.value_or(-1), 3);
  EXPECT_TRUE(arity.accepts(3));
  EXPECT_FALSE(arity.accepts(4));

  const std::vector<ParameterInfo> kwargs{{&dummy, 0, ParamKind::VarKeyword, false}};
  EXPECT_FALSE(arity_of(kwargs).max.has_value());
}

// ============================================================================
// Keywords
// ============================================================================

TEST(SignatureConservationTest, UnknownKeywordArgument)
{
  PayloadBuilder b("m");
  b.function("m.f").param("m.f", "a").param("m.f", "b");
  b.function("m.g").param("m.g", "a").param("m.g", "options", "", ParamKind::VarKeyword);
  b.function("m.run")
    .call("m.run", "f", 2, {"b"})
    .call("m.run", "f", 2, {"c"})
    .call("m.run", "g", 2, {"anything"});
  const auto g = index_all({b.build()});

  const auto found = signature_violations(*g);
  ASSERT_EQ(found.size(), 1u);
  EXPECT_EQ(found[0].message, "Function f has no parameter named 'c'");
  EXPECT_EQ(get_string(found[0].details, "keyword").value_or(""), "c");
}

// ============================================================================
// Visibility
// ============================================================================

TEST(SignatureConservationTest, PrivateFunctionCalledFromOutsideItsScope)
{
  PayloadBuilder b("m");
  b.cls("m.Vault").function("m.Vault._secret");
  b.last().visibility = Visibility::Private;
  b.function("m.Vault.open").call("m.Vault.open", "self._secret", 0);
  b.function("m.thief").call("m.thief", "Vault._secret", 0);
  const auto g = index_all({b.build()});

  const auto found = signature_violations(*g);
  ASSERT_EQ(found.size(), 1u);
  EXPECT_EQ(found[0].type, "visibility_violation");
  EXPECT_EQ(found[0].entity_ids.front(), make_callsite_id("m.thief", "Vault._secret", 0));
  EXPECT_EQ(get_string(found[0].details, "caller").value_or(""), "m.thief");
  EXPECT_EQ(get_string(found[0].details, "function").value_or(""), "m.Vault._secret");
}

TEST(SignatureConservationTest, UnresolvedCallsAreNotChecked)
{
  PayloadBuilder b("m");
  b.function("m.run").call("m.run", "nowhere", 9);
  const auto g = index_all({b.build()});

  EXPECT_TRUE(signature_violations(*g).empty());
}
