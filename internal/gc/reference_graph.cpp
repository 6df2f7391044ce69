#include "internal/gc/reference_graph.hpp"

#include <deque>
#include <utility>

#include "internal/util/errors.hpp"

namespace catalog::gc {

namespace {

std::string Describe(const db::model::ReferenceRecord& r) {
  return "source_key=" + r.source_key.value_or("<null>") + " source_entity_ref=" + r.source_entity_ref.value_or("<null>") +
         " target_entity_ref=" + (r.target_entity_ref.empty() ? "<empty>" : r.target_entity_ref);
}

const std::vector<std::string> kNoChildren;

} // namespace

ReferenceGraph::ReferenceGraph(const std::vector<db::model::ReferenceRecord>& references) {
  for (const auto& reference : references) {
    Add(reference);
  }
}

void ReferenceGraph::Add(const db::model::ReferenceRecord& reference) {
  if (reference.source_key.has_value() == reference.source_entity_ref.has_value()) {
    throw util::IntegrityViolation("reference must have exactly one source: " + Describe(reference));
  }
  if (reference.target_entity_ref.empty()) {
    throw util::IntegrityViolation("reference has no target: " + Describe(reference));
  }

  if (reference.IsRoot()) {
    root_targets_.push_back(reference.target_entity_ref);
    return;
  }

  children_[*reference.source_entity_ref].push_back(reference.target_entity_ref);
  ++internal_edges_;
}

ReferenceGraph::RefSet ReferenceGraph::Reachable() const {
  RefSet                  visited;
  std::deque<std::string> frontier;

  for (const auto& target : root_targets_) {
    if (visited.insert(target).second) {
      frontier.push_back(target);
    }
  }

  while (!frontier.empty()) {
    const std::string current = std::move(frontier.front());
    frontier.pop_front();

    for (const auto& child : Children(current)) {
      if (visited.insert(child).second) {
        frontier.push_back(child);
      }
    }
  }

  return visited;
}

const std::vector<std::string>& ReferenceGraph::Children(const std::string& source) const {
  auto it = children_.find(source);
  if (it == children_.end()) {
    return kNoChildren;
  }
  return it->second;
}

} // namespace catalog::gc
