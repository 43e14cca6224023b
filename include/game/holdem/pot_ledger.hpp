#ifndef POT_LEDGER_HPP
#define POT_LEDGER_HPP

#include <limits>
#include <map>
#include <string>
#include <vector>

struct SidePot {
    std::vector<std::string> players; // Eligible players, in seat order
    int amount;

    bool operator==(const SidePot&) const = default;
};

// Tracks the main pot and the side pots of a round.
//
// Within a betting stage every pot owns a lane: a band of per-player stage contributions.
// The main pot starts as the only lane. An all-in player's stage contribution splits the lane it
// falls in, and everything above the split moves into a new side pot the all-in player is not
// eligible for. When a new stage starts, only the topmost pot keeps accepting chips.
class PotLedger {
public:
    PotLedger();

    void startStage();
    void addContribution(const std::string& name, int amount);

    // Call after the all-in player's last contribution. inHand lists the players who have not folded, in seat order.
    void registerAllIn(const std::string& name, const std::vector<std::string>& inHand);

    int getMainPot() const;
    const std::vector<SidePot>& getSidePots() const;
    int getTotal() const;
    int getStageContribution(const std::string& name) const;
    int getHighestStageContribution() const;
    // Everything the player has put in since the ledger was last cleared
    const std::map<std::string, int>& getRoundContributions() const;

    void clear();

private:
    static constexpr int Unbounded = std::numeric_limits<int>::max();
    static constexpr int MainPotIndex = -1;

    struct Lane {
        int potIndex;
        int upperBound;
    };

    int& getPotAmount(int potIndex);
    int getLowerBound(std::size_t laneIndex) const;
    int getOverlap(int start, int end, std::size_t laneIndex) const;

    int m_mainPot;
    std::vector<SidePot> m_sidePots;
    std::vector<Lane> m_lanes;
    std::map<std::string, int> m_stageContributions;
    std::map<std::string, int> m_roundContributions;
};

#endif // POT_LEDGER_HPP
