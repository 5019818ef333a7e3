// codegraph/test_support/payload_builder.hpp - helpers for unit/integration tests
//
// Builds well-formed extraction payloads the way an extractor would report
// them: declaring parents are derived from qualified names, parameter
// positions are numbered per function and locations get increasing lines.
//
#pragma once

#include <fmt/format.h>

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "codegraph/extract/extraction.hpp"

namespace codegraph::test_support
{

class PayloadBuilder
{
public:
  /// `file` defaults to the module path ("app.main" -> "app/main.py")
  explicit PayloadBuilder(std::string module, std::string file = {})
  : file_(std::move(file))
  {
    payload_.module_id = std::move(module);
    if (file_.empty()) {
      file_ = payload_.module_id;
      for (auto & c : file_) {
        if (c == '.') c = '/';
      }
      file_ += ".py";
    }
    RawEntity m;
    m.kind = NodeKind::Module;
    m.name = last_part(payload_.module_id);
    m.qualified_name = payload_.module_id;
    m.location = file_ + ":1:0";
    payload_.entities.push_back(std::move(m));
  }

  PayloadBuilder & cls(const std::string & qname, const std::vector<std::string> & bases = {})
  {
    declare(NodeKind::Class, qname);
    for (const auto & base : bases) {
      relate(EdgeKind::Inherits, qname, base);
    }
    return *this;
  }

  PayloadBuilder & function(const std::string & qname, const std::string & return_type = {})
  {
    declare(NodeKind::Function, qname).type_annotation = return_type;
    return *this;
  }

  PayloadBuilder & variable(const std::string & qname, const std::string & type = {})
  {
    declare(NodeKind::Variable, qname).type_annotation = type;
    return *this;
  }

  PayloadBuilder & param(
    const std::string & function_qname, const std::string & name, const std::string & type = {},
    ParamKind kind = ParamKind::Positional, bool has_default = false)
  {
    RawEntity & p = add(NodeKind::Parameter, function_qname + "." + name);
    p.type_annotation = type;
    p.param_kind = kind;
    p.has_default = has_default;
    p.position = next_position_[function_qname]++;
    relate(EdgeKind::HasParameter, function_qname, p.qualified_name);
    return *this;
  }

  /// Call site keyed "<caller>/<callee>#<n>"; see last_key()
  PayloadBuilder & call(
    const std::string & caller_qname, const std::string & callee, int64_t arg_count,
    std::vector<std::string> keyword_args = {}, std::vector<std::string> arg_types = {})
  {
    RawEntity cs;
    cs.kind = NodeKind::CallSite;
    cs.key = fmt::format("{}/{}#{}", caller_qname, callee, call_counter_++);
    cs.name = callee;
    cs.callee = callee;
    cs.arg_count = arg_count;
    cs.keyword_args = std::move(keyword_args);
    cs.arg_types = std::move(arg_types);
    cs.location = next_location();
    payload_.entities.push_back(std::move(cs));
    relate(EdgeKind::HasCallsite, caller_qname, payload_.entities.back().key);
    return *this;
  }

  PayloadBuilder & import(
    const std::string & target, const std::string & alias = {},
    std::optional<NodeKind> to_kind = std::nullopt)
  {
    RawRelationship & r = relate(EdgeKind::Imports, payload_.module_id, target);
    r.alias = alias;
    r.to_kind = to_kind;
    return *this;
  }

  RawRelationship & relate(EdgeKind kind, const std::string & from, const std::string & to)
  {
    RawRelationship r;
    r.kind = kind;
    r.from = from;
    r.to = to;
    payload_.relationships.push_back(std::move(r));
    return payload_.relationships.back();
  }

  /// Most recently added entity (for tweaking fields the helpers do not cover)
  RawEntity & last() { return payload_.entities.back(); }

  [[nodiscard]] const std::string & last_key() const
  {
    return payload_.entities.back().effective_key();
  }

  [[nodiscard]] const std::string & file() const { return file_; }

  [[nodiscard]] ExtractionPayload build() const { return payload_; }

private:
  static std::string last_part(const std::string & qname)
  {
    const auto dot = qname.rfind('.');
    return dot == std::string::npos ? qname : qname.substr(dot + 1);
  }

  static std::string parent_part(const std::string & qname)
  {
    const auto dot = qname.rfind('.');
    return dot == std::string::npos ? std::string{} : qname.substr(0, dot);
  }

  std::string next_location() { return fmt::format("{}:{}:0", file_, ++line_); }

  RawEntity & add(NodeKind kind, const std::string & qname)
  {
    RawEntity e;
    e.kind = kind;
    e.name = last_part(qname);
    e.qualified_name = qname;
    e.location = next_location();
    payload_.entities.push_back(std::move(e));
    return payload_.entities.back();
  }

  RawEntity & declare(NodeKind kind, const std::string & qname)
  {
    const std::string parent = parent_part(qname);
    relate(EdgeKind::Declares, parent.empty() ? payload_.module_id : parent, qname);
    return add(kind, qname);
  }

  ExtractionPayload payload_;
  std::string file_;
  uint32_t line_ = 1;
  int call_counter_ = 0;
  std::map<std::string, int64_t> next_position_;
};

}  // namespace codegraph::test_support
