#include "anamnesis/reasoning/references.hpp"

#include <algorithm>

namespace anamnesis::reasoning {
    size_t ReferenceGraph::intern(const Fragment& f) {
        auto it = index_.find(f);
        if (it != index_.end()) {
            return it->second;
        }
        const size_t id = nodes_.size();
        index_.emplace(f, id);
        nodes_.push_back(f);
        out_.emplace_back();
        return id;
    }

    void ReferenceGraph::add_fragment(const Fragment& f) {
        (void)intern(f);
    }

    void ReferenceGraph::add_edge(const Fragment& from, const Fragment& to) {
        const size_t a = intern(from);
        const size_t b = intern(to);
        if (edge_set_.insert({a, b}).second) {
            edges_.emplace_back(a, b);
            out_[a].push_back(b);
        }
    }

    core::Status ReferenceGraph::linked(const Fragment& f, std::vector<Fragment>* out) const {
        if (out == nullptr) {
            return core::make_status(core::StatusDomain::Reasoning, core::StatusCode::Invalid);
        }
        auto it = index_.find(f);
        if (it == index_.end()) {
            return core::make_status(core::StatusDomain::Reasoning, core::StatusCode::NotFound);
        }

        std::vector<bool> reached(nodes_.size(), false);
        std::vector<size_t> frontier = out_[it->second];
        for (size_t n : frontier) {
            reached[n] = true;
        }
        while (!frontier.empty()) {
            std::vector<size_t> next;
            for (size_t u : frontier) {
                for (size_t v : out_[u]) {
                    if (!reached[v]) {
                        reached[v] = true;
                        next.push_back(v);
                    }
                }
            }
            frontier = std::move(next);
        }

        std::vector<Fragment> result;
        for (size_t i = 0; i < nodes_.size(); ++i) {
            if (reached[i]) {
                result.push_back(nodes_[i]);
            }
        }
        std::sort(result.begin(), result.end());
        *out = std::move(result);
        return core::ok_status();
    }

    std::vector<core::CrossReference> ReferenceGraph::cross_conversation_refs() const {
        std::vector<core::CrossReference> out;
        for (const auto& [a, b] : edges_) {
            if (nodes_[a].conversation != nodes_[b].conversation) {
                out.push_back(core::CrossReference{nodes_[a], nodes_[b]});
            }
        }
        return out;
    }

    ReferenceGraph reference_graph_of(const core::Conversation& conv) {
        ReferenceGraph g;
        for (const core::Message& m : conv.messages) {
            g.add_fragment(Fragment{conv.id, m.id});
        }
        for (const core::Artifact& a : conv.artifacts) {
            g.add_fragment(Fragment{conv.id, a.id});
        }
        for (const core::Message& m : conv.messages) {
            for (const core::FragmentRef& ref : m.references) {
                Fragment to = ref;
                if (to.conversation.empty()) {
                    to.conversation = conv.id;
                }
                g.add_edge(Fragment{conv.id, m.id}, to);
            }
        }
        return g;
    }
} // namespace anamnesis::reasoning
