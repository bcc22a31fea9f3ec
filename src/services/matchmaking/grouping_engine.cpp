/// @file grouping_engine.cpp
/// @brief GroupingEngine implementation.

#include "openmelee/service/grouping_engine.hpp"

#include <algorithm>
#include <map>
#include <unordered_set>
#include <utility>

namespace openmelee::service {

using protocol::OnlinePlayMode;

namespace {

using BucketKey = std::pair<std::string, std::string>;

BucketKey directKey(const TicketedPeer& peer) {
    const auto& own = peer.ticket.user.connectCode;
    const auto& target = *peer.ticket.search.targetConnectCode;
    return own < target ? BucketKey{own, target} : BucketKey{target, own};
}

bool targets(const TicketedPeer& from, const TicketedPeer& to) {
    return *from.ticket.search.targetConnectCode == to.ticket.user.connectCode;
}

} // namespace

std::vector<MatchGroup> GroupingEngine::group(
    const std::vector<TicketedPeer>& candidates) const {
    std::vector<const TicketedPeer*> direct;
    for (const auto& peer : candidates) {
        if (peer.ticket.search.mode == OnlinePlayMode::Direct &&
            peer.ticket.search.targetConnectCode) {
            direct.push_back(&peer);
        }
    }
    std::stable_sort(direct.begin(), direct.end(),
                     [](const TicketedPeer* a, const TicketedPeer* b) {
                         return a->ticketSeq < b->ticketSeq;
                     });

    // Ranked, Unranked and Teams have no grouping rule.
    return groupDirect(direct);
}

std::vector<MatchGroup> GroupingEngine::group(
    const std::vector<TicketedPeer>& candidates,
    const std::vector<transport::PeerInfo>& peers) const {
    std::unordered_set<PeerId> connected;
    for (const auto& info : peers) {
        if (info.state == transport::PeerState::Connected) {
            connected.insert(info.id);
        }
    }

    std::vector<TicketedPeer> eligible;
    for (const auto& candidate : candidates) {
        if (connected.count(candidate.id) > 0) {
            eligible.push_back(candidate);
        }
    }
    return group(eligible);
}

std::vector<MatchGroup> GroupingEngine::groupDirect(
    const std::vector<const TicketedPeer*>& direct) const {
    // Buckets keep arrival order; std::map keeps the pass deterministic.
    std::map<BucketKey, std::vector<const TicketedPeer*>> buckets;
    for (const auto* peer : direct) {
        buckets[directKey(*peer)].push_back(peer);
    }

    std::vector<std::pair<uint64_t, MatchGroup>> ordered;
    for (const auto& [key, members] : buckets) {
        if (members.size() < 2) {
            continue;
        }

        std::vector<bool> matched(members.size(), false);
        for (std::size_t i = 0; i < members.size(); ++i) {
            if (matched[i]) {
                continue;
            }
            for (std::size_t j = i + 1; j < members.size(); ++j) {
                if (matched[j] || !targets(*members[i], *members[j]) ||
                    !targets(*members[j], *members[i])) {
                    continue;
                }
                matched[i] = true;
                matched[j] = true;

                MatchGroup group;
                group.mode = OnlinePlayMode::Direct;
                group.members = {members[i]->id, members[j]->id};
                ordered.emplace_back(members[i]->ticketSeq, std::move(group));
                break;
            }
        }
    }

    std::sort(ordered.begin(), ordered.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<MatchGroup> groups;
    groups.reserve(ordered.size());
    for (auto& [seq, group] : ordered) {
        groups.push_back(std::move(group));
    }
    return groups;
}

} // namespace openmelee::service
