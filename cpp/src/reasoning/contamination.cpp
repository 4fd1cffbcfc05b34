#include "anamnesis/reasoning/contamination.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>

#include "anamnesis/reasoning/membership.hpp"

namespace anamnesis::reasoning {
    ConversationProfile profile_of(const core::Conversation& conv) {
        ConversationProfile p;
        p.id = conv.id;

        std::string primary;
        if (core::is_ok(primary_category(conv.memberships, &primary))) {
            p.primary_category = std::move(primary);
        }

        for (const core::Artifact& a : conv.artifacts) {
            if (!a.content_hash.empty()) {
                p.artifact_keys.push_back(a.content_hash);
            }
        }
        std::sort(p.artifact_keys.begin(), p.artifact_keys.end());
        p.artifact_keys.erase(std::unique(p.artifact_keys.begin(), p.artifact_keys.end()), p.artifact_keys.end());
        return p;
    }

    bool profiles_contaminate(const ConversationProfile& a, const ConversationProfile& b) {
        if (!a.primary_category || !b.primary_category || *a.primary_category == *b.primary_category) {
            return false;
        }

        std::unordered_set<std::string> keys(a.artifact_keys.begin(), a.artifact_keys.end());
        for (const std::string& k : b.artifact_keys) {
            if (keys.count(k) != 0) {
                return true;
            }
        }
        return false;
    }

    core::Status ContaminationIndex::add(ConversationProfile profile) {
        if (profile.id.empty() || by_id_.count(profile.id) != 0) {
            return core::make_status(core::StatusDomain::Reasoning, core::StatusCode::Invalid);
        }

        const size_t index = profiles_.size();
        by_id_.emplace(profile.id, index);

        std::unordered_set<std::string> seen;
        for (const std::string& key : profile.artifact_keys) {
            if (seen.insert(key).second) {
                by_key_[key].push_back(index);
            }
        }
        profiles_.push_back(std::move(profile));
        return core::ok_status();
    }

    bool ContaminationIndex::contains(const std::string& id) const {
        return by_id_.count(id) != 0;
    }

    bool ContaminationIndex::contaminates(const std::string& a, const std::string& b) const {
        auto ia = by_id_.find(a);
        auto ib = by_id_.find(b);
        if (ia == by_id_.end() || ib == by_id_.end()) {
            return false;
        }
        return profiles_contaminate(profiles_[ia->second], profiles_[ib->second]);
    }

    std::vector<size_t> ContaminationIndex::neighbours(size_t index) const {
        const ConversationProfile& p = profiles_[index];
        std::vector<size_t> out;
        if (!p.primary_category) {
            return out;
        }

        for (const std::string& key : p.artifact_keys) {
            auto it = by_key_.find(key);
            if (it == by_key_.end()) {
                continue;
            }
            for (size_t other : it->second) {
                const ConversationProfile& q = profiles_[other];
                if (other != index && q.primary_category && *q.primary_category != *p.primary_category) {
                    out.push_back(other);
                }
            }
        }
        std::sort(out.begin(), out.end());
        out.erase(std::unique(out.begin(), out.end()), out.end());
        return out;
    }

    core::Status ContaminationIndex::contamination_spread(const std::string& seed, std::vector<std::string>* out) const {
        if (out == nullptr) {
            return core::make_status(core::StatusDomain::Reasoning, core::StatusCode::Invalid);
        }
        auto it = by_id_.find(seed);
        if (it == by_id_.end()) {
            return core::make_status(core::StatusDomain::Reasoning, core::StatusCode::NotFound);
        }

        // Expand the frontier until no new member appears.
        std::vector<bool> member(profiles_.size(), false);
        member[it->second] = true;
        std::vector<size_t> frontier{it->second};
        while (!frontier.empty()) {
            std::vector<size_t> next;
            for (size_t u : frontier) {
                for (size_t v : neighbours(u)) {
                    if (!member[v]) {
                        member[v] = true;
                        next.push_back(v);
                    }
                }
            }
            frontier = std::move(next);
        }

        std::vector<std::string> result;
        for (size_t i = 0; i < profiles_.size(); ++i) {
            if (member[i] && i != it->second) {
                result.push_back(profiles_[i].id);
            }
        }
        std::sort(result.begin(), result.end());
        *out = std::move(result);
        return core::ok_status();
    }
} // namespace anamnesis::reasoning
