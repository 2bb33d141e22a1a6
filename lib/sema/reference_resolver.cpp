// iapi/sema/reference_resolver.cpp - Reference resolution and alias cycle detection

#include "iapi/sema/reference_resolver.hpp"

#include <algorithm>
#include <gsl/span>
#include <string>
#include <utility>
#include <vector>

namespace iapi
{

namespace
{

enum class Color : uint8_t { White, Gray, Black };

/// Rotate a cycle so it starts at its smallest name (stable across traversal order)
std::vector<TypeId> canonical_cycle(gsl::span<const TypeId> cycle, const TypeGraph & graph)
{
  auto smallest = std::min_element(cycle.begin(), cycle.end(), [&](TypeId a, TypeId b) {
    return graph.node(a).name < graph.node(b).name;
  });

  std::vector<TypeId> out;
  out.reserve(cycle.size());
  out.insert(out.end(), smallest, cycle.end());
  out.insert(out.end(), cycle.begin(), smallest);
  return out;
}

std::string cycle_message(gsl::span<const TypeId> cycle, const TypeGraph & graph)
{
  std::string msg = "cyclic type alias: ";
  for (const TypeId id : cycle) {
    msg += graph.node(id).name;
    msg += " -> ";
  }
  msg += graph.node(cycle.front()).name;
  return msg;
}

}  // namespace

// ============================================================================
// Entry Point
// ============================================================================

bool ReferenceResolver::resolve()
{
  has_errors_ = false;
  error_count_ = 0;
  pass_diags_ = DiagnosticBag{};

  resolve_aliases();
  resolve_error_type();
  for (auto & call : model_.calls_out) {
    resolve_call(call);
  }
  for (auto & call : model_.calls_in) {
    resolve_call(call);
  }

  pass_diags_.sort_canonical();
  if (diags_) {
    diags_->merge(std::move(pass_diags_));
  }
  return !has_errors_;
}

// ============================================================================
// Aliases
// ============================================================================

void ReferenceResolver::resolve_aliases()
{
  TypeGraph & graph = model_.types;
  std::vector<Color> color(graph.size(), Color::White);
  std::vector<TypeId> stack;
  stack.reserve(16);

  for (size_t i = 0; i < graph.size(); ++i) {
    const TypeId start(static_cast<uint32_t>(i));
    if (!graph.node(start).is_alias() || color[i] != Color::White) {
      continue;
    }

    // Walk the chain start -> ... until a non-alias, a finished alias,
    // a missing name, or an alias already on the stack.
    stack.clear();
    TypeId result = TypeId::invalid();
    TypeId current = start;

    while (true) {
      const TypeNode & node = graph.node(current);
      if (!node.is_alias()) {
        result = current;
        break;
      }

      const Color c = color[current.get_value()];
      if (c == Color::Black) {
        result = node.target;
        break;
      }
      if (c == Color::Gray) {
        auto pos = std::find(stack.begin(), stack.end(), current);
        const gsl::span<const TypeId> cycle(&*pos, static_cast<size_t>(stack.end() - pos));
        const std::vector<TypeId> ordered = canonical_cycle(cycle, graph);

        has_errors_ = true;
        ++error_count_;
        const TypeNode & anchor = graph.node(ordered.front());
        auto builder = pass_diags_.report_error(
          DiagnosticKind::CyclicAlias, anchor.path.child("content"),
          cycle_message(ordered, graph), "aliases '" + anchor.alias_name + "'");
        for (size_t k = 1; k < ordered.size(); ++k) {
          const TypeNode & member = graph.node(ordered[k]);
          builder.with_secondary_label(
            member.path.child("content"), "aliases '" + member.alias_name + "'");
        }
        builder.with_help("an alias chain must end at a non-alias type");
        break;
      }

      color[current.get_value()] = Color::Gray;
      stack.push_back(current);

      const TypeId next = graph.lookup(node.alias_name);
      if (!next.is_valid()) {
        report_unresolved(node.path.child("content"), node.name, node.alias_name);
        break;
      }
      current = next;
    }

    for (const TypeId id : stack) {
      graph.node(id).target = result;
      color[id.get_value()] = Color::Black;
    }
  }
}

// ============================================================================
// Document-level References
// ============================================================================

void ReferenceResolver::resolve_error_type()
{
  // A document without declared types has no error contract to bind yet.
  if (model_.types.declared().empty()) {
    model_.error_type = TypeId::invalid();
    return;
  }

  model_.error_type =
    bind_name(model_.header.error_type_name, DocumentPath{k_error_type_key}, k_error_type_key);
}

void ReferenceResolver::resolve_call(CallEntry & call)
{
  const std::string referrer = std::string(call_direction_key(call.direction)) + "." + call.name;
  call.input_type = bind_name(call.input, call.path.child("input"), referrer);
  call.output_type = bind_name(call.output, call.path.child("output"), referrer);
}

TypeId ReferenceResolver::bind_name(
  std::string_view name, const DocumentPath & path, std::string_view referrer)
{
  const TypeId id = model_.types.lookup(name);
  if (!id.is_valid()) {
    report_unresolved(path, referrer, name);
  }
  return id;
}

void ReferenceResolver::report_unresolved(
  const DocumentPath & path, std::string_view referrer, std::string_view missing)
{
  has_errors_ = true;
  ++error_count_;
  pass_diags_
    .report_error(
      DiagnosticKind::UnresolvedReference, path,
      "'" + std::string(referrer) + "' references undeclared type '" + std::string(missing) +
        "'",
      "not found in types")
    .with_help("declare '" + std::string(missing) + "' under types");
}

}  // namespace iapi
