// codegraph/build/graph_builder.cpp - Extraction payload -> graph mutations
//
#include "codegraph/build/graph_builder.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <optional>
#include <set>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "codegraph/basic/location.hpp"
#include "codegraph/basic/log.hpp"
#include "codegraph/build/call_resolver.hpp"
#include "codegraph/build/node_identity.hpp"
#include "codegraph/graph/graph_queries.hpp"

namespace codegraph
{

/// What one module should own once its extraction has been applied
struct GraphBuilder::DesiredState
{
  std::map<NodeId, Node> nodes;
  std::map<NodeId, Node> types;
  std::map<EdgeKey, Edge> edges;
  std::vector<NodeId> callsites;
};

namespace
{

struct Rejection
{
  std::string message;
  std::vector<std::string> keys;
};

Node make_type_node(std::string_view type_text)
{
  Node n;
  n.id = make_type_id(type_text);
  n.kind = NodeKind::Type;
  set_string(n.props, std::string(prop::k_name), std::string(type_text));
  set_string(n.props, std::string(prop::k_qualified_name), std::string(type_text));
  return n;
}

struct ParamSlot
{
  size_t entity = 0;
  int64_t position = 0;
};

std::string render_signature(
  const RawEntity & fn, const std::vector<ParamSlot> & params,
  const std::vector<RawEntity> & entities)
{
  std::string sig = fn.name + "(";
  for (size_t i = 0; i < params.size(); ++i) {
    const RawEntity & p = entities[params[i].entity];
    if (i > 0) sig += ", ";
    if (p.param_kind == ParamKind::VarPositional) sig += "*";
    if (p.param_kind == ParamKind::VarKeyword) sig += "**";
    sig += p.name;
    if (!p.type_annotation.empty()) sig += ": " + p.type_annotation;
    if (p.has_default) sig += "=...";
  }
  sig += ")";
  if (!fn.type_annotation.empty()) sig += " -> " + fn.type_annotation;
  return sig;
}

// ============================================================================
// PayloadPlanner
// ============================================================================

/**
 * Checks a payload's structure and computes the nodes and edges it
 * describes (without call-site resolution, which needs the graph).
 */
class PayloadPlanner
{
public:
  explicit PayloadPlanner(const ExtractionPayload & payload) : payload_(payload) {}

  std::optional<Rejection> plan(std::map<NodeId, Node> & nodes, std::map<NodeId, Node> & types,
                                std::map<EdgeKey, Edge> & edges, std::vector<NodeId> & callsites);

private:
  std::optional<Rejection> index_keys();
  std::optional<Rejection> check_module_entity();
  std::optional<Rejection> index_relationships();
  std::optional<Rejection> check_parameters();
  std::optional<Rejection> check_callsites();
  std::optional<Rejection> check_declarations();
  std::optional<Rejection> assign_ids();

  Node build_node(size_t index) const;
  void add_edge(std::map<EdgeKey, Edge> & edges, Edge edge) const;
  Edge base_edge(EdgeKind kind, NodeId source, NodeId target) const;

  const RawEntity & entity(size_t i) const { return payload_.entities[i]; }
  const std::string & module() const { return payload_.module_id; }

  const ExtractionPayload & payload_;

  std::unordered_map<std::string, size_t> by_key_;
  std::vector<NodeId> ids_;
  size_t module_index_ = 0;

  // Ownership, keyed by child entity index (values are owner indexes).
  std::unordered_map<size_t, std::vector<size_t>> declares_parents_;
  std::unordered_map<size_t, std::vector<std::pair<size_t, const RawRelationship *>>> param_owners_;
  std::unordered_map<size_t, std::vector<size_t>> callsite_owners_;

  // Function entity index -> parameters ordered by position
  std::map<size_t, std::vector<ParamSlot>> params_by_function_;
  std::unordered_map<size_t, int64_t> param_position_;
};

std::optional<Rejection> PayloadPlanner::plan(
  std::map<NodeId, Node> & nodes, std::map<NodeId, Node> & types, std::map<EdgeKey, Edge> & edges,
  std::vector<NodeId> & callsites)
{
  if (module().empty()) {
    return Rejection{"payload has no module id", {}};
  }

  for (auto step : {&PayloadPlanner::index_keys, &PayloadPlanner::check_module_entity,
                    &PayloadPlanner::index_relationships, &PayloadPlanner::check_parameters,
                    &PayloadPlanner::check_callsites, &PayloadPlanner::check_declarations,
                    &PayloadPlanner::assign_ids}) {
    if (auto err = (this->*step)()) {
      return err;
    }
  }

  // Nodes
  for (size_t i = 0; i < payload_.entities.size(); ++i) {
    const RawEntity & e = entity(i);
    if (e.kind == NodeKind::Type) {
      types.insert_or_assign(ids_[i], make_type_node(e.qualified_name));
      continue;
    }
    nodes.insert_or_assign(ids_[i], build_node(i));
    if (e.kind == NodeKind::CallSite) {
      callsites.push_back(ids_[i]);
    }
  }

  // Explicit relationships
  std::set<std::pair<NodeId, EdgeKind>> typed;
  for (const auto & rel : payload_.relationships) {
    const size_t from = by_key_.at(rel.from);
    NodeId target;
    std::string external_name;

    if (const auto it = by_key_.find(rel.to); it != by_key_.end()) {
      target = ids_[it->second];
    } else {
      const NodeKind kind = rel.to_kind.value_or(default_target_kind(rel.kind));
      if (kind == NodeKind::Type) {
        target = make_type_id(rel.to);
        types.insert_or_assign(target, make_type_node(rel.to));
      } else {
        target = make_node_id(kind, rel.to);
        external_name = rel.to;
      }
    }

    Edge edge = base_edge(rel.kind, ids_[from], std::move(target));
    if (!external_name.empty()) {
      set_string(edge.props, std::string(prop::k_target_name), std::move(external_name));
    }
    if (rel.arg_count) set_int(edge.props, std::string(prop::k_arg_count), *rel.arg_count);
    if (!rel.access_kind.empty()) {
      set_string(edge.props, std::string(prop::k_access_kind), rel.access_kind);
    }
    if (!rel.alias.empty()) set_string(edge.props, std::string(prop::k_alias), rel.alias);
    if (!rel.value_type.empty()) {
      set_string(edge.props, std::string(prop::k_value_type), rel.value_type);
    }
    if (!rel.expected_type.empty()) {
      set_string(edge.props, std::string(prop::k_expected_type), rel.expected_type);
    }
    if (rel.kind == EdgeKind::HasParameter) {
      set_int(edge.props, std::string(prop::k_position), param_position_.at(by_key_.at(rel.to)));
    } else if (rel.position) {
      set_int(edge.props, std::string(prop::k_position), *rel.position);
    }

    if (rel.kind == EdgeKind::HasType || rel.kind == EdgeKind::ReturnsType) {
      typed.emplace(edge.source, rel.kind);
    }
    add_edge(edges, std::move(edge));
  }

  // Type annotations without an explicit type edge
  for (size_t i = 0; i < payload_.entities.size(); ++i) {
    const RawEntity & e = entity(i);
    if (e.type_annotation.empty()) continue;

    EdgeKind via = EdgeKind::HasType;
    if (e.kind == NodeKind::Function) {
      via = EdgeKind::ReturnsType;
    } else if (e.kind != NodeKind::Variable && e.kind != NodeKind::Parameter) {
      continue;
    }
    if (typed.count({ids_[i], via}) > 0) continue;

    Node type = make_type_node(e.type_annotation);
    add_edge(edges, base_edge(via, ids_[i], type.id));
    types.insert_or_assign(type.id, std::move(type));
  }

  return std::nullopt;
}

std::optional<Rejection> PayloadPlanner::index_keys()
{
  for (size_t i = 0; i < payload_.entities.size(); ++i) {
    const auto & key = entity(i).effective_key();
    if (key.empty()) {
      return Rejection{fmt::format("entity #{} has neither key nor qualified name", i), {}};
    }
    if (!by_key_.emplace(key, i).second) {
      return Rejection{fmt::format("duplicate entity key '{}'", key), {key}};
    }
  }
  return std::nullopt;
}

std::optional<Rejection> PayloadPlanner::check_module_entity()
{
  std::optional<size_t> found;
  for (size_t i = 0; i < payload_.entities.size(); ++i) {
    const RawEntity & e = entity(i);
    if (e.kind != NodeKind::Module) continue;
    if (e.qualified_name != module()) {
      return Rejection{
        fmt::format("module entity '{}' does not match payload module '{}'", e.qualified_name,
                    module()),
        {e.effective_key()}};
    }
    if (found) {
      return Rejection{fmt::format("duplicate module entity '{}'", module()), {e.effective_key()}};
    }
    found = i;
  }
  if (!found) {
    return Rejection{fmt::format("payload has no Module entity for '{}'", module()), {}};
  }
  module_index_ = *found;
  return std::nullopt;
}

std::optional<Rejection> PayloadPlanner::index_relationships()
{
  for (const auto & rel : payload_.relationships) {
    const auto from = by_key_.find(rel.from);
    if (from == by_key_.end()) {
      return Rejection{
        fmt::format("{} relationship source '{}' is not an entity of this payload",
                    to_string(rel.kind), rel.from),
        {rel.from}};
    }
    if (rel.kind == EdgeKind::ResolvesTo) {
      return Rejection{"RESOLVES_TO edges are computed by the builder", {rel.from, rel.to}};
    }
    if (!is_ownership_edge(rel.kind)) continue;

    const auto to = by_key_.find(rel.to);
    if (to == by_key_.end()) {
      return Rejection{
        fmt::format("{} target '{}' is not an entity of this payload", to_string(rel.kind),
                    rel.to),
        {rel.from, rel.to}};
    }
    const NodeKind target_kind = entity(to->second).kind;
    if ((rel.kind == EdgeKind::HasParameter && target_kind != NodeKind::Parameter) ||
        (rel.kind == EdgeKind::HasCallsite && target_kind != NodeKind::CallSite)) {
      return Rejection{
        fmt::format("{} target '{}' is a {}", to_string(rel.kind), rel.to, to_string(target_kind)),
        {rel.from, rel.to}};
    }
    switch (rel.kind) {
      case EdgeKind::Declares:
        declares_parents_[to->second].push_back(from->second);
        break;
      case EdgeKind::HasParameter:
        param_owners_[to->second].emplace_back(from->second, &rel);
        break;
      case EdgeKind::HasCallsite:
        callsite_owners_[to->second].push_back(from->second);
        break;
      default:
        break;
    }
  }
  return std::nullopt;
}

std::optional<Rejection> PayloadPlanner::check_parameters()
{
  for (size_t i = 0; i < payload_.entities.size(); ++i) {
    const RawEntity & p = entity(i);
    if (p.kind != NodeKind::Parameter) continue;

    const auto it = param_owners_.find(i);
    const size_t owners = it == param_owners_.end() ? 0 : it->second.size();
    if (owners != 1) {
      return Rejection{
        fmt::format("parameter '{}' must belong to exactly one function (found {})",
                    p.effective_key(), owners),
        {p.effective_key()}};
    }
    const auto [owner, rel] = it->second.front();
    if (entity(owner).kind != NodeKind::Function) {
      return Rejection{
        fmt::format("parameter '{}' is owned by a {}, not a Function", p.effective_key(),
                    to_string(entity(owner).kind)),
        {p.effective_key(), entity(owner).effective_key()}};
    }

    const std::optional<int64_t> position = rel->position ? rel->position : p.position;
    if (!position) {
      return Rejection{
        fmt::format("parameter '{}' has no position", p.effective_key()), {p.effective_key()}};
    }
    param_position_[i] = *position;
    params_by_function_[owner].push_back(ParamSlot{i, *position});
  }

  for (auto & [fn, slots] : params_by_function_) {
    std::stable_sort(slots.begin(), slots.end(), [](const ParamSlot & a, const ParamSlot & b) {
      return a.position < b.position;
    });
    for (size_t expected = 0; expected < slots.size(); ++expected) {
      const auto actual = slots[expected].position;
      if (actual == static_cast<int64_t>(expected)) continue;
      const auto & fn_key = entity(fn).effective_key();
      std::vector<std::string> keys{fn_key, entity(slots[expected].entity).effective_key()};
      if (expected > 0 && actual == slots[expected - 1].position) {
        return Rejection{
          fmt::format("duplicate parameter position {} in '{}'", actual, fn_key), keys};
      }
      return Rejection{
        fmt::format("parameter position gap in '{}': expected {}, found {}", fn_key, expected,
                    actual),
        keys};
    }
  }
  return std::nullopt;
}

std::optional<Rejection> PayloadPlanner::check_callsites()
{
  for (size_t i = 0; i < payload_.entities.size(); ++i) {
    const RawEntity & cs = entity(i);
    if (cs.kind != NodeKind::CallSite) continue;

    const auto it = callsite_owners_.find(i);
    const size_t owners = it == callsite_owners_.end() ? 0 : it->second.size();
    if (owners != 1) {
      return Rejection{
        fmt::format("call site '{}' must belong to exactly one function (found {})",
                    cs.effective_key(), owners),
        {cs.effective_key()}};
    }
    if (entity(it->second.front()).kind != NodeKind::Function) {
      return Rejection{
        fmt::format("call site '{}' is not owned by a Function", cs.effective_key()),
        {cs.effective_key()}};
    }
  }
  return std::nullopt;
}

std::optional<Rejection> PayloadPlanner::check_declarations()
{
  for (size_t i = 0; i < payload_.entities.size(); ++i) {
    const RawEntity & e = entity(i);
    const auto it = declares_parents_.find(i);
    const size_t parents = it == declares_parents_.end() ? 0 : it->second.size();

    if (e.kind == NodeKind::Module) {
      if (parents != 0) {
        return Rejection{
          fmt::format("module '{}' cannot be declared by another entity", e.effective_key()),
          {e.effective_key()}};
      }
      continue;
    }
    if (e.kind == NodeKind::Type || e.kind == NodeKind::Parameter ||
        e.kind == NodeKind::CallSite) {
      continue;
    }
    if (parents != 1) {
      return Rejection{
        fmt::format("{} '{}' must have exactly one declaring parent (found {})",
                    to_string(e.kind), e.effective_key(), parents),
        {e.effective_key()}};
    }

    // The declaration chain must reach the module without looping.
    std::unordered_set<size_t> seen{i};
    size_t cur = it->second.front();
    while (cur != module_index_) {
      if (!seen.insert(cur).second) {
        return Rejection{
          fmt::format("declaration cycle through '{}'", entity(cur).effective_key()),
          {e.effective_key(), entity(cur).effective_key()}};
      }
      const auto up = declares_parents_.find(cur);
      if (up == declares_parents_.end() || up->second.size() != 1) {
        return Rejection{
          fmt::format("'{}' is not reachable from module '{}'", e.effective_key(), module()),
          {e.effective_key()}};
      }
      cur = up->second.front();
    }
  }
  return std::nullopt;
}

std::optional<Rejection> PayloadPlanner::assign_ids()
{
  ids_.resize(payload_.entities.size());
  std::map<std::pair<size_t, std::string>, int64_t> ordinals;

  for (size_t i = 0; i < payload_.entities.size(); ++i) {
    const RawEntity & e = entity(i);
    switch (e.kind) {
      case NodeKind::Type:
        ids_[i] = make_type_id(e.qualified_name);
        break;
      case NodeKind::CallSite: {
        const size_t owner = callsite_owners_.at(i).front();
        const int64_t ordinal = ordinals[{owner, e.callee}]++;
        ids_[i] = make_callsite_id(entity(owner).qualified_name, e.callee, ordinal);
        break;
      }
      default:
        ids_[i] = make_node_id(e.kind, e.qualified_name);
        break;
    }
  }

  std::unordered_map<NodeId, size_t> seen;
  for (size_t i = 0; i < ids_.size(); ++i) {
    const auto [it, inserted] = seen.emplace(ids_[i], i);
    if (!inserted) {
      const auto & first = entity(it->second).effective_key();
      const auto & second = entity(i).effective_key();
      return Rejection{
        fmt::format("entities '{}' and '{}' map to the same id {}", first, second, ids_[i]),
        {first, second}};
    }
  }
  return std::nullopt;
}

Node PayloadPlanner::build_node(size_t index) const
{
  const RawEntity & e = entity(index);

  Node n;
  n.id = ids_[index];
  n.kind = e.kind;
  n.props = e.attributes;

  auto & props = n.props;
  set_string(props, std::string(prop::k_name), e.name);
  set_string(props, std::string(prop::k_module), module());
  set_string(props, std::string(prop::k_visibility), std::string(to_string(e.visibility)));
  if (!e.location.empty()) {
    set_string(props, std::string(prop::k_location), e.location);
    if (const auto loc = Location::parse(e.location)) {
      set_string(props, std::string(prop::k_file), loc->file);
    }
  }
  if (!e.type_annotation.empty()) {
    set_string(props, std::string(prop::k_type_annotation), e.type_annotation);
  }
  if (!e.decorators.empty()) {
    set_list(props, std::string(prop::k_decorators), e.decorators);
  }

  switch (e.kind) {
    case NodeKind::Module: {
      const auto file = get_string(props, prop::k_file);
      if (file && !find_property(props, prop::k_path)) {
        set_string(props, std::string(prop::k_path), std::string(*file));
      }
      break;
    }
    case NodeKind::Function: {
      const auto it = params_by_function_.find(index);
      static const std::vector<ParamSlot> k_none;
      const auto & slots = it != params_by_function_.end() ? it->second : k_none;
      StringList names;
      names.reserve(slots.size());
      for (const auto & s : slots) {
        names.push_back(entity(s.entity).name);
      }
      set_list(props, std::string(prop::k_parameters), std::move(names));
      set_string(
        props, std::string(prop::k_signature), render_signature(e, slots, payload_.entities));
      break;
    }
    case NodeKind::Parameter:
      set_int(props, std::string(prop::k_position), param_position_.at(index));
      set_string(props, std::string(prop::k_param_kind), std::string(to_string(e.param_kind)));
      set_bool(props, std::string(prop::k_has_default), e.has_default);
      break;
    case NodeKind::CallSite:
      set_string(props, std::string(prop::k_callee), e.callee);
      set_int(props, std::string(prop::k_arg_count), e.arg_count);
      if (!e.keyword_args.empty()) {
        set_list(props, std::string(prop::k_keyword_args), e.keyword_args);
      }
      if (!e.arg_types.empty()) {
        set_list(props, std::string(prop::k_arg_types), e.arg_types);
      }
      break;
    default:
      break;
  }

  std::string qname = e.qualified_name;
  if (qname.empty() && e.kind == NodeKind::CallSite) {
    qname = fmt::format(
      "{}/{}#{}", entity(callsite_owners_.at(index).front()).qualified_name, e.callee, n.id);
  }
  set_string(props, std::string(prop::k_qualified_name), std::move(qname));
  return n;
}

Edge PayloadPlanner::base_edge(EdgeKind kind, NodeId source, NodeId target) const
{
  Edge edge;
  edge.kind = kind;
  edge.source = std::move(source);
  edge.target = std::move(target);
  set_string(edge.props, std::string(prop::k_module), module());
  return edge;
}

void PayloadPlanner::add_edge(std::map<EdgeKey, Edge> & edges, Edge edge) const
{
  const EdgeKey key = edge.key();
  auto it = edges.find(key);
  if (it == edges.end()) {
    edges.emplace(key, std::move(edge));
    return;
  }
  // Repeated relationship: later attributes win.
  for (auto & [k, v] : edge.props) {
    it->second.props.insert_or_assign(k, std::move(v));
  }
}

// ============================================================================
// Resolution helpers
// ============================================================================

/// Write a resolution into a CallSite's properties and the desired edge set
void record_resolution(
  const CodeGraph & graph, const Resolution & r, Node & callsite, std::string_view module,
  std::map<EdgeKey, Edge> & edges)
{
  set_string(callsite.props, std::string(prop::k_resolution), std::string(resolution_state(r)));
  callsite.props.erase(std::string(prop::k_candidates));

  if (const auto * resolved = std::get_if<Resolved>(&r)) {
    Edge edge;
    edge.kind = EdgeKind::ResolvesTo;
    edge.source = callsite.id;
    edge.target = resolved->target;
    set_string(edge.props, std::string(prop::k_module), std::string(module));
    edges.insert_or_assign(edge.key(), std::move(edge));
  } else if (const auto * ambiguous = std::get_if<Ambiguous>(&r)) {
    StringList names;
    for (const auto & id : ambiguous->candidates) {
      if (const Node * n = graph.find_node(id)) {
        names.emplace_back(n->qualified_name());
      }
    }
    std::sort(names.begin(), names.end());
    set_list(callsite.props, std::string(prop::k_candidates), std::move(names));
  }
}

template <typename T>
void sort_ids(std::vector<T> & v)
{
  std::sort(v.begin(), v.end());
}

}  // namespace

// ============================================================================
// GraphBuilder
// ============================================================================

std::mutex & GraphBuilder::module_mutex(std::string_view module_id)
{
  const std::lock_guard<std::mutex> lock(registry_mutex_);
  auto it = module_mutexes_.find(module_id);
  if (it == module_mutexes_.end()) {
    it = module_mutexes_.emplace(std::string(module_id), std::make_unique<std::mutex>()).first;
  }
  return *it->second;
}

BuildResult GraphBuilder::apply_extraction(const ExtractionPayload & payload)
{
  std::shared_ptr<const CodeGraph> before;
  std::shared_ptr<const CodeGraph> after;
  BuildResult result;
  {
    const std::lock_guard<std::mutex> lock(module_mutex(payload.module_id));
    before = store_.view();
    result = apply_locked(payload, false);
    after = store_.view();
  }

  // Other modules are refreshed without holding this module's lock.
  if (result.success && result.stats.mutations() > 0) {
    refresh_dependents(*before, *after, result);
  }
  return result;
}

BuildResult GraphBuilder::remove_module(std::string_view module_id)
{
  ExtractionPayload empty;
  empty.module_id = std::string(module_id);

  std::shared_ptr<const CodeGraph> before;
  std::shared_ptr<const CodeGraph> after;
  BuildResult result;
  {
    const std::lock_guard<std::mutex> lock(module_mutex(module_id));
    before = store_.view();
    result = apply_locked(empty, true);
    after = store_.view();
  }
  if (result.success && result.stats.mutations() > 0) {
    refresh_dependents(*before, *after, result);
  }
  return result;
}

BuildResult GraphBuilder::apply_locked(const ExtractionPayload & payload, bool removal)
{
  const std::string & module = payload.module_id;
  const auto base = store_.view();

  DesiredState desired;
  if (!removal) {
    PayloadPlanner planner(payload);
    if (auto err = planner.plan(desired.nodes, desired.types, desired.edges, desired.callsites)) {
      log::warn("build: module '{}' rejected: {}", module, err->message);
      return BuildResult::fail(module, std::move(err->message), std::move(err->keys));
    }
  }

  // Type nodes are shared and live only while something refers to them; a
  // Type entity no edge of this payload targets is not materialized.
  {
    std::set<NodeId> referenced;
    for (const auto & [key, e] : desired.edges) referenced.insert(e.target);
    for (auto it = desired.types.begin(); it != desired.types.end();) {
      it = referenced.count(it->first) > 0 ? std::next(it) : desired.types.erase(it);
    }
  }

  const auto owned_nodes = base->nodes_in_module(module);
  const auto owned_edges = base->edges_in_module(module);

  // Scratch graph: the store as it will look after this build, used to
  // resolve call sites against the module's new content.
  if (!desired.callsites.empty()) {
    CodeGraph scratch(*base);
    for (const auto * e : owned_edges) scratch.erase_edge(e->key());
    for (const auto * n : owned_nodes) scratch.erase_node(n->id);
    for (const auto & [id, t] : desired.types) {
      if (!scratch.contains(id)) scratch.upsert_node(t);
    }
    for (const auto & [id, n] : desired.nodes) scratch.upsert_node(n);
    for (const auto & [key, e] : desired.edges) scratch.upsert_edge(e);

    const CallResolver resolver(scratch);
    for (const auto & cs_id : desired.callsites) {
      Node & cs = desired.nodes.at(cs_id);
      record_resolution(
        scratch, resolver.resolve(*scratch.find_node(cs_id)), cs, module, desired.edges);
    }
  }

  // ---- Diff against what the module owns now ----
  BuildResult result = BuildResult::ok(module);
  MutationBatch batch;
  std::set<NodeId> prune;

  for (auto & [id, node] : desired.types) {
    const Node * current = base->find_node(id);
    if (current == nullptr) {
      node.changed = true;
      batch.upsert_node(node);
      result.added.push_back(id);
    } else if (!current->same_content(node)) {
      batch.upsert_node(node);
      result.updated.push_back(id);
    }
  }

  for (auto & [id, node] : desired.nodes) {
    const Node * current = base->find_node(id);
    if (current == nullptr) {
      node.changed = true;
      batch.upsert_node(node);
      result.added.push_back(id);
    } else if (!current->same_content(node)) {
      node.changed = true;
      batch.upsert_node(node);
      result.updated.push_back(id);
    }
  }

  for (const auto * e : owned_edges) {
    if (desired.edges.count(e->key()) > 0) continue;
    batch.delete_edge(e->key());
    ++result.stats.edges_removed;
    const Node * target = base->find_node(e->target);
    if (target != nullptr && target->is(NodeKind::Type)) {
      prune.insert(e->target);
    }
  }

  for (const auto * n : owned_nodes) {
    if (desired.nodes.count(n->id) > 0) continue;
    batch.delete_node(n->id);
    result.removed.push_back(n->id);
  }

  for (const auto & [key, edge] : desired.edges) {
    const Edge * current = base->find_edge(key);
    if (current != nullptr && current->props == edge.props) continue;
    if (current == nullptr) {
      ++result.stats.edges_added;
      // A new reference must not race with another module pruning the type.
      if (const auto t = desired.types.find(edge.target); t != desired.types.end()) {
        batch.upsert_node(t->second);
      }
    } else {
      ++result.stats.edges_updated;
    }
    batch.upsert_edge(edge);
  }

  for (const auto & id : prune) {
    if (desired.types.count(id) == 0) {
      batch.prune_if_detached(id);
    }
  }

  result.stats.nodes_added = result.added.size();
  result.stats.nodes_updated = result.updated.size();
  result.stats.nodes_removed = result.removed.size();
  sort_ids(result.added);
  sort_ids(result.updated);
  sort_ids(result.removed);

  if (result.stats.mutations() == 0) {
    log::debug("build: module '{}' unchanged", module);
    return result;
  }

  store_.commit(batch);
  const auto & s = result.stats;
  log::info(
    "build: module '{}': nodes +{} ~{} -{}, edges +{} ~{} -{}", module, s.nodes_added,
    s.nodes_updated, s.nodes_removed, s.edges_added, s.edges_updated, s.edges_removed);
  return result;
}

void GraphBuilder::refresh_dependents(
  const CodeGraph & before, const CodeGraph & after, BuildResult & build)
{
  // Names whose set of callable targets may have changed.
  std::unordered_set<std::string> names;
  const auto collect = [&names](const CodeGraph & g, const std::vector<NodeId> & ids) {
    for (const auto & id : ids) {
      const Node * n = g.find_node(id);
      if (n != nullptr && (n->is(NodeKind::Function) || n->is(NodeKind::Class))) {
        names.emplace(last_segment(n->qualified_name()));
      }
    }
  };
  collect(after, build.added);
  collect(before, build.removed);
  const std::unordered_set<std::string_view> removed(build.removed.begin(), build.removed.end());

  std::set<std::string> affected = linked_modules(before, after, build.module_id);
  for (const auto * cs : after.nodes_of_kind(NodeKind::CallSite)) {
    const auto module = cs->module();
    if (module.empty() || module == build.module_id) continue;

    bool hit = false;
    for (const auto * e : after.out_edges(cs->id, EdgeKind::ResolvesTo)) {
      hit = hit || removed.count(e->target) > 0 || !after.contains(e->target);
    }
    const auto callee = get_string(cs->props, prop::k_callee).value_or(std::string_view{});
    hit = hit || names.count(std::string(last_segment(callee))) > 0;
    if (hit) {
      affected.emplace(module);
    }
  }

  for (const auto & module : affected) {
    if (refresh_resolution(module) > 0) {
      build.refreshed_modules.push_back(module);
    }
  }
}

std::set<std::string> GraphBuilder::linked_modules(
  const CodeGraph & before, const CodeGraph & after, std::string_view module_id)
{
  // Modules that resolve into, import from or inherit from the rebuilt
  // module. Inheritance is followed transitively: a subclass of a subclass
  // walks the same base chain during method lookup.
  std::set<std::string> linked;
  std::set<NodeId, std::less<>> visited;
  std::vector<NodeId> frontier;
  for (const CodeGraph * g : {&before, &after}) {
    for (const auto * n : g->nodes_in_module(module_id)) {
      if (visited.insert(n->id).second) frontier.push_back(n->id);
    }
  }

  while (!frontier.empty()) {
    std::vector<NodeId> next;
    for (const auto & id : frontier) {
      for (const auto * e : after.in_edges(id)) {
        if (
          e->kind != EdgeKind::ResolvesTo && e->kind != EdgeKind::Imports &&
          e->kind != EdgeKind::Inherits) {
          continue;
        }
        const Node * source = after.find_node(e->source);
        if (source == nullptr) continue;
        const auto module = source->module();
        if (!module.empty() && module != module_id) linked.emplace(module);
        if (e->kind == EdgeKind::Inherits && visited.insert(source->id).second) {
          next.push_back(source->id);
        }
      }
    }
    frontier = std::move(next);
  }
  return linked;
}

size_t GraphBuilder::refresh_resolution(std::string_view module_id)
{
  const std::lock_guard<std::mutex> lock(module_mutex(module_id));
  const auto base = store_.view();
  const CallResolver resolver(*base);

  MutationBatch batch;
  size_t changed = 0;

  for (const auto * cs : base->nodes_in_module(module_id)) {
    if (!cs->is(NodeKind::CallSite)) continue;

    Node next = *cs;
    std::map<EdgeKey, Edge> wanted;
    record_resolution(*base, resolver.resolve(*cs), next, module_id, wanted);

    const auto current = base->out_edges(cs->id, EdgeKind::ResolvesTo);
    bool edges_same = current.size() == wanted.size();
    for (const auto * e : current) {
      edges_same = edges_same && wanted.count(e->key()) > 0;
    }
    if (edges_same && next.props == cs->props) continue;

    ++changed;
    next.changed = true;
    batch.upsert_node(std::move(next));
    for (const auto * e : current) {
      if (wanted.count(e->key()) == 0) batch.delete_edge(e->key());
    }
    for (auto & [key, e] : wanted) {
      batch.upsert_edge(std::move(e));
    }
  }

  if (changed > 0) {
    store_.commit(batch);
    log::info("build: re-resolved {} call site(s) in module '{}'", changed, module_id);
  }
  return changed;
}

}  // namespace codegraph
