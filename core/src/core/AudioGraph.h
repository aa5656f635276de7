#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace sympathetic {

// Logical snapshot of the wiring held by an AudioContext: nodes keyed
// by a context-assigned id and the directed edges between them.
//
// The snapshot does not reference live nodes, so it can be inspected
// (or printed) after the context has moved on. Edges that target an
// automation parameter instead of a node input carry the parameter
// name in `to_param`.
class AudioGraph {
public:
    struct Node {
        std::string id;
        std::string kind;  // "oscillator", "gain", "filter", ...
    };

    struct Edge {
        std::string from_node_id;
        std::string to_node_id;
        std::string to_param;  // Empty for audio-input edges.

        [[nodiscard]] bool is_modulation() const noexcept
        {
            return !to_param.empty();
        }
    };

    AudioGraph() = default;

    void AddNode(Node node);
    void AddEdge(Edge edge);

    [[nodiscard]] const std::unordered_map<std::string, Node>& nodes() const noexcept
    {
        return nodes_;
    }

    [[nodiscard]] const std::vector<Edge>& edges() const noexcept
    {
        return edges_;
    }

    // Convenience: only edges that carry audio into node inputs.
    [[nodiscard]] std::vector<Edge> audio_edges() const;

    // Convenience: only edges that modulate a parameter.
    [[nodiscard]] std::vector<Edge> modulation_edges() const;

    [[nodiscard]] std::vector<Edge> edges_from(const std::string& node_id) const;

    [[nodiscard]] std::size_t count_nodes_of_kind(const std::string& kind) const;

    // Human-readable dump, one line per node and per edge.
    [[nodiscard]] std::string Describe() const;

private:
    std::unordered_map<std::string, Node> nodes_;
    std::vector<Edge> edges_;
};

}  // namespace sympathetic
