#include "game/holdem/pot_distribution.hpp"

#include "game/game_error.hpp"
#include "game/holdem/hand_comparison.hpp"
#include "game/holdem/pot_ledger.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace {
class PotSplitter {
public:
    PotSplitter(const std::vector<Contender>& contenders, bool awardRemainder) :
        m_contenders{ contenders },
        m_awardRemainder{ awardRemainder },
        m_result{ .winnings = {}, .undistributed = 0 } {}

    void split(int amount, const std::vector<std::string>& group) {
        assert(!group.empty());

        std::vector<std::string> ordered = getSeatOrder(group);
        int share = amount / static_cast<int>(ordered.size());
        int remainder = amount % static_cast<int>(ordered.size());

        for (const std::string& name : ordered) {
            m_result.winnings[name] += share;
        }

        if (m_awardRemainder) {
            m_result.winnings[ordered.front()] += remainder;
        }
        else {
            m_result.undistributed += remainder;
        }
    }

    // Resolves a side pot among its own non-folded members, falling back to the given group when it has none
    void resolveSidePot(const SidePot& sidePot, const std::vector<std::string>& fallback) {
        std::vector<PlayerHand> candidates;
        for (const Contender& contender : m_contenders) {
            const std::vector<std::string>& eligible = sidePot.players;
            if (std::find(eligible.begin(), eligible.end(), contender.hand.name) != eligible.end()) {
                candidates.push_back(contender.hand);
            }
        }

        std::optional<Winner> sidePotWinner = determineWinner(candidates);
        if (sidePotWinner) {
            split(sidePot.amount, sidePotWinner->getNames());
        }
        else {
            split(sidePot.amount, fallback);
        }
    }

    bool isAllIn(const std::string& name) const {
        auto it = findContender(name);
        return (it != m_contenders.end()) && it->allIn;
    }

    bool contains(const std::string& name) const {
        return findContender(name) != m_contenders.end();
    }

    DistributionResult getResult() const {
        return m_result;
    }

private:
    std::vector<Contender>::const_iterator findContender(const std::string& name) const {
        return std::find_if(m_contenders.begin(), m_contenders.end(), [&name](const Contender& contender) {
            return contender.hand.name == name;
        });
    }

    std::vector<std::string> getSeatOrder(const std::vector<std::string>& group) const {
        std::vector<std::string> ordered;
        for (const Contender& contender : m_contenders) {
            if (std::find(group.begin(), group.end(), contender.hand.name) != group.end()) {
                ordered.push_back(contender.hand.name);
            }
        }
        return ordered;
    }

    const std::vector<Contender>& m_contenders;
    bool m_awardRemainder;
    DistributionResult m_result;
};
} // namespace

Result<DistributionResult, GameError> distributePots(
    int mainPot,
    const std::vector<SidePot>& sidePots,
    const std::vector<Contender>& contenders,
    const std::optional<Winner>& winner,
    bool awardRemainder
) {
    if (!winner) {
        std::cerr << "Error: No winner set, pots were not distributed.\n";
        return DistributionResult{ .winnings = {}, .undistributed = 0 };
    }

    PotSplitter splitter{ contenders, awardRemainder };

    std::vector<std::string> winnerNames = winner->getNames();
    for (const std::string& name : winnerNames) {
        if (!splitter.contains(name)) {
            return GameError{
                .kind = GameError::Kind::DistributionInconsistency,
                .message = "Winner " + name + " is not an active player."
            };
        }
    }

    splitter.split(mainPot, winnerNames);

    if (!winner->isDraw() && !splitter.isAllIn(winner->getSoleWinner().name)) {
        // A winner who never went all in is eligible for every side pot
        for (const SidePot& sidePot : sidePots) {
            splitter.split(sidePot.amount, winnerNames);
        }
    }
    else {
        for (const SidePot& sidePot : sidePots) {
            splitter.resolveSidePot(sidePot, winnerNames);
        }
    }

    return splitter.getResult();
}
