#pragma once

#include <map>
#include <set>
#include <utility>
#include <vector>

#include "anamnesis/core/errors.hpp"
#include "anamnesis/core/models.hpp"

namespace anamnesis::reasoning {
    // A message or artifact with its conversation always filled in.
    using Fragment = core::FragmentRef;

    // Directed reference edges between fragments. Closure queries iterate to a
    // fixed point over the adjacency index, so cycles terminate.
    class ReferenceGraph {
    public:
        void add_fragment(const Fragment& f);
        // Endpoints are registered implicitly; repeated edges are kept once.
        void add_edge(const Fragment& from, const Fragment& to);

        [[nodiscard]] size_t fragment_count() const noexcept { return nodes_.size(); }
        [[nodiscard]] size_t edge_count() const noexcept { return edges_.size(); }

        // Everything reachable from f, sorted. f itself is included only when a
        // cycle leads back to it. NotFound for an unknown fragment.
        [[nodiscard]] core::Status linked(const Fragment& f, std::vector<Fragment>* out) const;

        // Edges whose endpoints belong to different conversations, in insertion order.
        [[nodiscard]] std::vector<core::CrossReference> cross_conversation_refs() const;

    private:
        size_t intern(const Fragment& f);

        std::map<Fragment, size_t> index_;
        std::vector<Fragment> nodes_;
        std::vector<std::vector<size_t>> out_;
        std::vector<std::pair<size_t, size_t>> edges_;
        std::set<std::pair<size_t, size_t>> edge_set_;
    };

    // Fragments for every message and artifact of conv and an edge for every
    // message reference; references without a conversation resolve to conv.
    [[nodiscard]] ReferenceGraph reference_graph_of(const core::Conversation& conv);

} // namespace anamnesis::reasoning
