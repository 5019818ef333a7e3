// cgc/cli.cpp - Argument parsing and commands of the cgc tool
//
#include "cli.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "codegraph/basic/log.hpp"
#include "codegraph/driver/workflow.hpp"
#include "codegraph/extract/payload_json.hpp"
#include "codegraph/graph/memory_graph_store.hpp"
#include "codegraph/project/project_config.hpp"
#include "codegraph/query/graph_query.hpp"
#include "codegraph/snapshot/snapshot_json.hpp"
#include "codegraph/validate/change_validator.hpp"
#include "codegraph/validate/report_json.hpp"
#include "codegraph/validate/violation_printer.hpp"

namespace fs = std::filesystem;

namespace codegraph::cli
{

// ============================================================================
// Argument Parsing
// ============================================================================

void print_usage(std::ostream & os, std::string_view program_name)
{
  os << "Code graph checker v0.1.0\n\n"
     << "Usage: " << program_name << " <command> [options]\n\n"
     << "Commands:\n"
     << "  check <payload.json>...     Build the graph and validate every law\n"
     << "  impact <payload.json>...    Show what depends on changed files\n"
     << "  change <payload.json>...    Check a proposed edit of one entity\n"
     << "  snapshot <payload.json>...  Build the graph and write a snapshot\n"
     << "  diff <old.json> <new.json>  Compare two snapshots\n"
     << "  init                        Write a default codegraph.yaml\n\n"
     << "Options:\n"
     << "  --config <path>             Use this codegraph.yaml\n"
     << "  --changed <file>            Changed source file (impact, repeatable)\n"
     << "  --entity <id|name>          Entity to change (change)\n"
     << "  --type <kind>               modify, delete or rename (change, default modify)\n"
     << "  --new-name <name>           New name (change --type rename)\n"
     << "  -o, --output <path>         Snapshot output file\n"
     << "  --label <text>              Snapshot label\n"
     << "  --json                      Machine-readable output on stdout\n"
     << "  -v, --verbose               Verbose output (repeat for debug)\n"
     << "  -h, --help                  Show this help message\n";
}

CommandArgs parse_args(int argc, const char * const * argv)
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  const auto value_of = [&](int & i, const std::string & flag) -> std::string {
    if (i + 1 < argc) {
      return argv[++i];
    }
    args.error = "missing value for " + flag;
    return {};
  };

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "-o" || arg == "--output") {
      args.output_path = value_of(i, arg);
    } else if (arg == "--config") {
      args.config_path = value_of(i, arg);
    } else if (arg == "--changed") {
      args.changed_files.push_back(value_of(i, arg));
    } else if (arg == "--label") {
      args.label = value_of(i, arg);
    } else if (arg == "--entity") {
      args.entity = value_of(i, arg);
    } else if (arg == "--type") {
      args.change_type = value_of(i, arg);
    } else if (arg == "--new-name") {
      args.new_name = value_of(i, arg);
    } else if (arg == "--json") {
      args.json = true;
    } else if (arg == "-v" || arg == "--verbose") {
      ++args.verbosity;
    } else if (arg == "-vv") {
      args.verbosity += 2;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] != '-') {
      args.inputs.push_back(arg);
    } else {
      args.error = "unknown option: " + arg;
    }
  }

  return args;
}

namespace
{

// ============================================================================
// Shared steps
// ============================================================================

/// Configuration from --config, else codegraph.yaml above the working directory
std::optional<ProjectConfig> load_config(const CommandArgs & args, const Console & console)
{
  std::optional<fs::path> path;
  if (!args.config_path.empty()) {
    path = fs::path(args.config_path);
  } else {
    path = find_project_config(fs::current_path());
  }

  if (!path) {
    ProjectConfig defaults;
    defaults.project_root = fs::current_path();
    return defaults;
  }

  auto result = load_project_config(*path);
  if (!result.success) {
    console.err << "error: " << result.error << "\n";
    return std::nullopt;
  }
  log::info("using configuration {}", path->string());
  return std::move(result.config);
}

/// Payload files from the command line, else from the configuration
std::optional<std::vector<ExtractionPayload>> load_payloads(
  const CommandArgs & args, const ProjectConfig & config, const Console & console)
{
  std::vector<fs::path> files(args.inputs.begin(), args.inputs.end());
  if (files.empty()) {
    files = config.resolved_payloads();
  }
  if (files.empty()) {
    console.err << "error: no payload files given\n";
    return std::nullopt;
  }

  std::vector<ExtractionPayload> payloads;
  payloads.reserve(files.size());
  for (const auto & file : files) {
    auto loaded = load_payload_file(file);
    if (!loaded.success) {
      console.err << "error: " << file.string() << ": " << loaded.error << "\n";
      return std::nullopt;
    }
    payloads.push_back(std::move(loaded.payload));
  }
  return payloads;
}

bool report_rejections(const std::vector<BuildResult> & builds, const Console & console)
{
  bool rejected = false;
  for (const auto & build : builds) {
    if (build.success) continue;
    rejected = true;
    console.err << "error: module '" << build.module_id << "' rejected: " << build.error << "\n";
  }
  return rejected;
}

nlohmann::json rejections_json(const std::vector<BuildResult> & builds)
{
  nlohmann::json arr = nlohmann::json::array();
  for (const auto & build : builds) {
    if (build.success) continue;
    nlohmann::json j;
    j["module"] = build.module_id;
    j["error"] = build.error;
    j["offending_ids"] = build.offending_ids;
    arr.push_back(std::move(j));
  }
  return arr;
}

int exit_code(const WorkflowResult & result)
{
  if (result.failed_builds() > 0) return k_exit_usage;
  return result.report.has_errors() ? k_exit_violations : k_exit_ok;
}

/// Index every payload and validate the whole graph; no propagation, no snapshot
WorkflowOptions full_check()
{
  WorkflowOptions options;
  options.propagate = false;
  options.create_snapshot = false;
  options.incremental = false;
  return options;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args, const Console & console)
{
  const auto config = load_config(args, console);
  if (!config) return k_exit_usage;
  const auto payloads = load_payloads(args, *config, console);
  if (!payloads) return k_exit_usage;

  MemoryGraphStore store;
  Workflow workflow(store, config->validation);
  const auto result = workflow.validate_after_edit(*payloads, full_check());

  if (result.status == WorkflowStatus::Failed) {
    console.err << "error: " << result.message << "\n";
    return k_exit_usage;
  }

  if (args.json) {
    auto j = to_json(result.report);
    j["rejected"] = rejections_json(result.builds);
    console.out << j.dump(2) << "\n";
  } else {
    report_rejections(result.builds, console);
    ViolationPrinter printer(console.err, console.color);
    printer.print_report(result.report);
  }
  return exit_code(result);
}

int cmd_impact(const CommandArgs & args, const Console & console)
{
  if (args.changed_files.empty()) {
    console.err << "error: at least one --changed <file> is required\n";
    return k_exit_usage;
  }
  const auto config = load_config(args, console);
  if (!config) return k_exit_usage;
  const auto payloads = load_payloads(args, *config, console);
  if (!payloads) return k_exit_usage;

  MemoryGraphStore store;
  Workflow workflow(store, config->validation);

  // Index first so that only the named files count as edited.
  const auto indexed = workflow.validate_after_edit(*payloads, full_check());
  if (indexed.status == WorkflowStatus::Failed) {
    console.err << "error: " << indexed.message << "\n";
    return k_exit_usage;
  }

  WorkflowOptions options;
  options.changed_files = args.changed_files;
  options.create_snapshot = false;
  const gsl::span<const ExtractionPayload> no_payloads;
  const auto result = workflow.validate_after_edit(no_payloads, options);
  if (result.status == WorkflowStatus::Failed) {
    console.err << "error: " << result.message << "\n";
    return k_exit_usage;
  }

  const auto view = store.view();
  const auto changed = view->changed_node_ids();
  const auto is_propagated = [&](const NodeId & id) {
    return std::find(result.propagated.begin(), result.propagated.end(), id) !=
           result.propagated.end();
  };

  if (args.json) {
    nlohmann::json impacted = nlohmann::json::array();
    for (const auto & id : changed) {
      const auto * node = view->find_node(id);
      nlohmann::json entry;
      entry["id"] = id;
      entry["kind"] = std::string(to_string(node->kind));
      entry["qualified_name"] = std::string(node->qualified_name());
      entry["propagated"] = is_propagated(id);
      impacted.push_back(std::move(entry));
    }
    nlohmann::json j;
    j["impacted"] = std::move(impacted);
    j["report"] = to_json(result.report);
    j["rejected"] = rejections_json(indexed.builds);
    console.out << j.dump(2) << "\n";
  } else {
    report_rejections(indexed.builds, console);
    fmt::print(console.out, "{} node(s) impacted, {} through dependencies\n", changed.size(),
               result.propagated.size());
    for (const auto & id : changed) {
      const auto * node = view->find_node(id);
      fmt::print(console.out, "  {} {:<9} {}\n", is_propagated(id) ? "+" : " ",
                 to_string(node->kind), node->qualified_name());
    }
    ViolationPrinter printer(console.err, console.color);
    printer.print_report(result.report);
  }

  if (indexed.failed_builds() > 0) return k_exit_usage;
  return result.report.has_errors() ? k_exit_violations : k_exit_ok;
}

/// Node id given directly, or the single node with that qualified name
std::optional<NodeId> find_entity(
  const CodeGraph & graph, const std::string & text, const Console & console)
{
  if (graph.contains(text)) return text;

  const auto matches = graph.find_by_qualified_name(text);
  if (matches.size() == 1) return matches.front()->id;
  if (matches.empty()) {
    console.err << "error: no entity named '" << text << "'\n";
  } else {
    console.err << "error: '" << text << "' names " << matches.size()
                << " entities; pass a node id\n";
  }
  return std::nullopt;
}

nlohmann::json change_json(const CodeGraph & graph, const ChangeValidationResult & result)
{
  const ImpactAnalysis & impact = result.impact;
  nlohmann::json callers = nlohmann::json::array();
  for (const auto & link : impact.affected_callers) {
    nlohmann::json entry;
    entry["caller"] = std::string(link.function->qualified_name());
    entry["callsite"] = link.callsite->id;
    if (link.arg_count) entry["arg_count"] = *link.arg_count;
    callers.push_back(std::move(entry));
  }
  nlohmann::json references = nlohmann::json::array();
  for (const auto & ref : impact.affected_references) {
    nlohmann::json entry;
    entry["source"] = ref.source->id;
    entry["kind"] = std::string(to_string(ref.kind));
    entry["location"] = ref.location;
    references.push_back(std::move(entry));
  }
  nlohmann::json cascading = nlohmann::json::array();
  for (const auto & c : impact.cascading_changes) {
    nlohmann::json entry;
    entry["edge"] = std::string(to_string(c.edge_kind));
    entry["connected_kind"] = std::string(to_string(c.connected_kind));
    entry["count"] = c.count;
    cascading.push_back(std::move(entry));
  }
  nlohmann::json violations = nlohmann::json::array();
  for (const auto & v : result.violations) {
    violations.push_back(to_json(v));
  }

  nlohmann::json j;
  j["entity"] = impact.entity_id;
  j["qualified_name"] = std::string(graph.find_node(impact.entity_id)->qualified_name());
  j["change_type"] = std::string(to_string(impact.change_type));
  j["callers"] = std::move(callers);
  j["references"] = std::move(references);
  j["cascading"] = std::move(cascading);
  j["violations"] = std::move(violations);
  return j;
}

int cmd_change(const CommandArgs & args, const Console & console)
{
  if (args.entity.empty()) {
    console.err << "error: --entity <id or qualified name> is required\n";
    return k_exit_usage;
  }
  const auto type = parse_change_type(args.change_type.empty() ? "modify" : args.change_type);
  if (!type) {
    console.err << "error: unknown change type '" << args.change_type
                << "' (modify, delete, rename)\n";
    return k_exit_usage;
  }
  const auto config = load_config(args, console);
  if (!config) return k_exit_usage;
  const auto payloads = load_payloads(args, *config, console);
  if (!payloads) return k_exit_usage;

  MemoryGraphStore store;
  Workflow workflow(store, config->validation);
  const auto indexed = workflow.validate_after_edit(*payloads, full_check());
  if (indexed.status == WorkflowStatus::Failed) {
    console.err << "error: " << indexed.message << "\n";
    return k_exit_usage;
  }

  const auto view = store.view();
  const auto entity = find_entity(*view, args.entity, console);
  if (!entity) return k_exit_usage;

  ProposedChange change;
  change.entity_id = *entity;
  change.type = *type;
  if (!args.new_name.empty()) change.new_name = args.new_name;
  const auto result = validate_change(*view, change);
  if (!result.success) {
    console.err << "error: " << result.error << "\n";
    return k_exit_usage;
  }

  if (args.json) {
    auto j = change_json(*view, result);
    j["rejected"] = rejections_json(indexed.builds);
    console.out << j.dump(2) << "\n";
  } else {
    report_rejections(indexed.builds, console);
    const auto & impact = result.impact;
    fmt::print(console.out, "{} {}: {} caller(s), {} reference(s)\n", to_string(*type),
               view->find_node(*entity)->qualified_name(), impact.affected_callers.size(),
               impact.affected_references.size());
    for (const auto & link : impact.affected_callers) {
      fmt::print(console.out, "  called from {} at {}\n", link.function->qualified_name(),
                 link.callsite->location());
    }
    for (const auto & ref : impact.affected_references) {
      fmt::print(console.out, "  {} from {}\n", to_string(ref.kind), ref.source->qualified_name());
    }
    ValidationReport report;
    report.violations = result.violations;
    report.scope_size = 1;
    ViolationPrinter printer(console.err, console.color);
    printer.print_report(report);
  }

  if (indexed.failed_builds() > 0) return k_exit_usage;
  return result.has_errors() ? k_exit_violations : k_exit_ok;
}

int cmd_snapshot(const CommandArgs & args, const Console & console)
{
  if (args.output_path.empty()) {
    console.err << "error: -o <snapshot.json> is required\n";
    return k_exit_usage;
  }
  const auto config = load_config(args, console);
  if (!config) return k_exit_usage;
  const auto payloads = load_payloads(args, *config, console);
  if (!payloads) return k_exit_usage;

  MemoryGraphStore store;
  Workflow workflow(store, config->validation);

  WorkflowOptions options;
  options.description = args.label.empty() ? "cgc snapshot" : args.label;
  options.propagate = false;
  options.compare_with_previous = false;
  options.incremental = false;
  const auto result = workflow.validate_after_edit(*payloads, options);
  if (result.status == WorkflowStatus::Failed || !result.snapshot_id) {
    console.err << "error: " << result.message << "\n";
    return k_exit_usage;
  }
  if (report_rejections(result.builds, console)) {
    return k_exit_usage;
  }

  const auto snapshot = workflow.snapshots().get(*result.snapshot_id);
  if (const auto error = save_snapshot_file(*snapshot, args.output_path); !error.empty()) {
    console.err << "error: " << error << "\n";
    return k_exit_usage;
  }
  console.err << "Snapshot " << snapshot->id << ": " << snapshot->node_count() << " nodes, "
              << snapshot->edge_count() << " edges -> " << args.output_path << "\n";
  return k_exit_ok;
}

void print_changes(std::ostream & out, const std::vector<PropertyChange> & changes)
{
  for (const auto & c : changes) {
    const std::string before = c.before ? to_display_string(*c.before) : "<absent>";
    const std::string after = c.after ? to_display_string(*c.after) : "<absent>";
    fmt::print(out, "      {}: {} -> {}\n", c.key, before, after);
    for (const auto & a : c.added) fmt::print(out, "        + {}\n", a);
    for (const auto & r : c.removed) fmt::print(out, "        - {}\n", r);
  }
}

int cmd_diff(const CommandArgs & args, const Console & console)
{
  if (args.inputs.size() != 2) {
    console.err << "error: diff takes exactly two snapshot files\n";
    return k_exit_usage;
  }

  const auto before = load_snapshot_file(args.inputs[0]);
  if (!before.success) {
    console.err << "error: " << before.error << "\n";
    return k_exit_usage;
  }
  const auto after = load_snapshot_file(args.inputs[1]);
  if (!after.success) {
    console.err << "error: " << after.error << "\n";
    return k_exit_usage;
  }

  const auto diff = diff_graphs(*before.snapshot.graph, *after.snapshot.graph);
  if (args.json) {
    console.out << to_json(diff).dump(2) << "\n";
    return k_exit_ok;
  }

  std::ostream & out = console.out;
  const auto s = diff.summary();
  fmt::print(
    out, "nodes: +{} -{} ~{} ({} unchanged)\nedges: +{} -{} ~{} ({} unchanged)\n",
    s.nodes_added, s.nodes_removed, s.nodes_modified, s.nodes_unchanged, s.edges_added,
    s.edges_removed, s.edges_modified, s.edges_unchanged);
  for (const auto & n : diff.added_nodes) {
    fmt::print(out, "  + {} {}\n", to_string(n.kind), n.qualified_name());
  }
  for (const auto & n : diff.removed_nodes) {
    fmt::print(out, "  - {} {}\n", to_string(n.kind), n.qualified_name());
  }
  for (const auto & m : diff.modified_nodes) {
    fmt::print(out, "  ~ {} {}\n", to_string(m.kind), m.qualified_name);
    print_changes(out, m.changes);
  }
  for (const auto & e : diff.added_edges) {
    fmt::print(out, "  + {}\n", e.key().to_string());
  }
  for (const auto & e : diff.removed_edges) {
    fmt::print(out, "  - {}\n", e.key().to_string());
  }
  for (const auto & m : diff.modified_edges) {
    fmt::print(out, "  ~ {}\n", m.key.to_string());
    print_changes(out, m.changes);
  }
  return k_exit_ok;
}

int cmd_init(const Console & console)
{
  const fs::path path = fs::current_path() / k_project_config_file_name;
  if (fs::exists(path)) {
    console.err << "error: file already exists: " << path.string() << "\n";
    return k_exit_usage;
  }

  std::ofstream config(path);
  config << "project:\n"
         << "  name: '" << fs::current_path().filename().string() << "'\n"
         << "  payloads: []\n\n"
         << "validation:\n"
         << "  unresolved_severity: warning   # error | warning | info | off\n"
         << "  type_compatibility: nominal    # exact | nominal | off\n"
         << "  missing_annotations: true\n"
         << "  incremental_hops: 1\n";
  if (!config) {
    console.err << "error: failed to write " << path.string() << "\n";
    return k_exit_usage;
  }
  console.out << "Wrote " << path.string() << "\n";
  return k_exit_ok;
}

}  // namespace

// ============================================================================
// Entry points
// ============================================================================

namespace
{

bool is_command(std::string_view name)
{
  for (const std::string_view known : {"check", "impact", "change", "snapshot", "diff", "init"}) {
    if (name == known) return true;
  }
  return false;
}

}  // namespace

int run_command(const CommandArgs & args, const Console & console)
{
  try {
    if (args.command == "check") {
      return cmd_check(args, console);
    }
    if (args.command == "impact") {
      return cmd_impact(args, console);
    }
    if (args.command == "change") {
      return cmd_change(args, console);
    }
    if (args.command == "snapshot") {
      return cmd_snapshot(args, console);
    }
    if (args.command == "diff") {
      return cmd_diff(args, console);
    }
    if (args.command == "init") {
      return cmd_init(console);
    }
  } catch (const StoreError & e) {
    console.err << "error: " << e.what() << "\n";
    return k_exit_usage;
  }

  console.err << "error: unknown command: " << args.command << "\n";
  return k_exit_usage;
}

int run(int argc, const char * const * argv, const Console & console)
{
  const CommandArgs args = parse_args(argc, argv);
  const std::string_view program = argc > 0 ? argv[0] : "cgc";

  if (args.show_help) {
    print_usage(console.err, program);
    return args.command.empty() ? k_exit_usage : k_exit_ok;
  }
  if (!args.error.empty()) {
    console.err << "error: " << args.error << "\n";
    return k_exit_usage;
  }

  if (args.verbosity >= 2) {
    log::set_level(log::Level::Debug);
  } else if (args.verbosity == 1) {
    log::set_level(log::Level::Info);
  }

  const int status = run_command(args, console);
  if (!is_command(args.command)) {
    print_usage(console.err, program);
  }
  return status;
}

}  // namespace codegraph::cli
