#include "core/AudioGraph.h"

#include <algorithm>
#include <sstream>

namespace sympathetic {

void AudioGraph::AddNode(Node node)
{
    auto id = node.id;
    nodes_.insert_or_assign(std::move(id), std::move(node));
}

void AudioGraph::AddEdge(Edge edge)
{
    edges_.push_back(std::move(edge));
}

std::vector<AudioGraph::Edge> AudioGraph::audio_edges() const
{
    std::vector<Edge> result;
    result.reserve(edges_.size());

    for (const auto& e : edges_) {
        if (!e.is_modulation()) {
            result.push_back(e);
        }
    }

    return result;
}

std::vector<AudioGraph::Edge> AudioGraph::modulation_edges() const
{
    std::vector<Edge> result;

    for (const auto& e : edges_) {
        if (e.is_modulation()) {
            result.push_back(e);
        }
    }

    return result;
}

std::vector<AudioGraph::Edge> AudioGraph::edges_from(
    const std::string& node_id) const
{
    std::vector<Edge> result;

    for (const auto& e : edges_) {
        if (e.from_node_id == node_id) {
            result.push_back(e);
        }
    }

    return result;
}

std::size_t AudioGraph::count_nodes_of_kind(const std::string& kind) const
{
    return static_cast<std::size_t>(std::count_if(
        nodes_.begin(), nodes_.end(),
        [&kind](const auto& entry) { return entry.second.kind == kind; }));
}

std::string AudioGraph::Describe() const
{
    std::vector<const Node*> sorted;
    sorted.reserve(nodes_.size());
    for (const auto& [id, node] : nodes_) {
        sorted.push_back(&node);
    }
    std::sort(sorted.begin(), sorted.end(),
              [](const Node* a, const Node* b) { return a->id < b->id; });

    std::ostringstream out;
    for (const auto* node : sorted) {
        out << "node " << node->id << ' ' << node->kind << '\n';
    }
    for (const auto& e : edges_) {
        out << "edge " << e.from_node_id << " -> " << e.to_node_id;
        if (e.is_modulation()) {
            out << '.' << e.to_param;
        }
        out << '\n';
    }
    return out.str();
}

}  // namespace sympathetic
