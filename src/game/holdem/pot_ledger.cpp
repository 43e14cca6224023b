#include "game/holdem/pot_ledger.hpp"

#include <algorithm>
#include <cassert>
#include <map>
#include <string>
#include <vector>

PotLedger::PotLedger() : m_mainPot{ 0 } {
    startStage();
}

void PotLedger::startStage() {
    int topPotIndex = m_sidePots.empty() ? MainPotIndex : static_cast<int>(m_sidePots.size()) - 1;
    if (!m_lanes.empty()) {
        topPotIndex = m_lanes.back().potIndex;
    }

    m_lanes = { Lane{ .potIndex = topPotIndex, .upperBound = Unbounded } };
    m_stageContributions.clear();
}

void PotLedger::addContribution(const std::string& name, int amount) {
    assert(amount >= 0);

    int start = getStageContribution(name);
    int end = start + amount;
    for (std::size_t i = 0; i < m_lanes.size(); ++i) {
        getPotAmount(m_lanes[i].potIndex) += getOverlap(start, end, i);
    }
    m_stageContributions[name] = end;
    m_roundContributions[name] += amount;
}

void PotLedger::registerAllIn(const std::string& name, const std::vector<std::string>& inHand) {
    int allInLevel = getStageContribution(name);
    assert(allInLevel > 0);

    auto laneIt = std::find_if(m_lanes.begin(), m_lanes.end(), [allInLevel](const Lane& lane) {
        return allInLevel <= lane.upperBound;
    });
    assert(laneIt != m_lanes.end());
    std::size_t laneIndex = static_cast<std::size_t>(laneIt - m_lanes.begin());

    if (allInLevel < m_lanes[laneIndex].upperBound) {
        int splitPotIndex = m_lanes[laneIndex].potIndex;

        // Everyone who could win the split pot can win the part above the all-in level, except the all-in player
        std::vector<std::string> eligible = (splitPotIndex == MainPotIndex) ? inHand : m_sidePots[splitPotIndex].players;
        eligible.erase(std::remove(eligible.begin(), eligible.end(), name), eligible.end());

        Lane upperLane{ .potIndex = static_cast<int>(m_sidePots.size()), .upperBound = m_lanes[laneIndex].upperBound };
        int movedAmount = 0;
        for (const auto& [player, contribution] : m_stageContributions) {
            movedAmount += std::max(0, std::min(contribution, upperLane.upperBound) - allInLevel);
        }

        getPotAmount(splitPotIndex) -= movedAmount;
        m_sidePots.push_back(SidePot{ .players = std::move(eligible), .amount = movedAmount });
        m_lanes[laneIndex].upperBound = allInLevel;
        m_lanes.insert(m_lanes.begin() + laneIndex + 1, upperLane);
    }

    // The all-in player cannot win anything above their level
    for (std::size_t i = laneIndex + 1; i < m_lanes.size(); ++i) {
        std::vector<std::string>& players = m_sidePots[m_lanes[i].potIndex].players;
        players.erase(std::remove(players.begin(), players.end(), name), players.end());
    }
}

int PotLedger::getMainPot() const {
    return m_mainPot;
}

const std::vector<SidePot>& PotLedger::getSidePots() const {
    return m_sidePots;
}

int PotLedger::getTotal() const {
    int total = m_mainPot;
    for (const SidePot& sidePot : m_sidePots) {
        total += sidePot.amount;
    }
    return total;
}

int PotLedger::getStageContribution(const std::string& name) const {
    auto it = m_stageContributions.find(name);
    return (it != m_stageContributions.end()) ? it->second : 0;
}

int PotLedger::getHighestStageContribution() const {
    int highest = 0;
    for (const auto& [player, contribution] : m_stageContributions) {
        highest = std::max(highest, contribution);
    }
    return highest;
}

const std::map<std::string, int>& PotLedger::getRoundContributions() const {
    return m_roundContributions;
}

void PotLedger::clear() {
    m_mainPot = 0;
    m_sidePots.clear();
    m_roundContributions.clear();
    m_lanes.clear();
    startStage();
}

int& PotLedger::getPotAmount(int potIndex) {
    if (potIndex == MainPotIndex) {
        return m_mainPot;
    }

    assert(potIndex >= 0 && potIndex < static_cast<int>(m_sidePots.size()));
    return m_sidePots[potIndex].amount;
}

int PotLedger::getLowerBound(std::size_t laneIndex) const {
    return (laneIndex == 0) ? 0 : m_lanes[laneIndex - 1].upperBound;
}

int PotLedger::getOverlap(int start, int end, std::size_t laneIndex) const {
    int lower = std::max(start, getLowerBound(laneIndex));
    int upper = std::min(end, m_lanes[laneIndex].upperBound);
    return std::max(0, upper - lower);
}
