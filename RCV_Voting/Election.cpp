// Election.cpp : Instant-runoff counting.
//
// Counting proceeds in rounds:
//  1. A candidate holding more than half of all ballots (integer division) wins.
//  2. If only one candidate is left in contention, that candidate wins.
//  3. If every continuing candidate holds the same count, they tie.
//  4. Otherwise the continuing candidate with the fewest ballots (lowest id on
//     equal counts) is eliminated and each of its ballots moves to that
//     ballot's next continuing preference.

#include "Election.h"
#include "ElectionErrors.h"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <utility>

Election::Election(std::size_t numCandidates)
    : capacity_(numCandidates)
{
    candidates_.reserve(numCandidates);
    tally_.reserve(numCandidates);
}

CandidateId Election::addCandidate(const std::string& name)
{
    if (candidates_.size() >= capacity_) {
        throw CandidateOverflowError("election is sized for " + std::to_string(capacity_) +
                                     " candidate(s); cannot add \"" + name + "\"");
    }
    for (const auto& c : candidates_) {
        if (c.getName() == name) {
            throw std::invalid_argument("duplicate candidate name \"" + name + "\"");
        }
    }
    const CandidateId id = candidates_.size();
    candidates_.emplace_back(id, name);
    tally_.push_back(0);
    return id;
}

bool Election::isBallotValid(const std::vector<int>& ranks) const
{
    if (capacity_ == 0 || ranks.size() != capacity_) return false;

    std::vector<int> sortedRanks(ranks);
    std::sort(sortedRanks.begin(), sortedRanks.end());
    for (std::size_t i = 0; i < sortedRanks.size(); ++i) {
        if (sortedRanks[i] != static_cast<int>(i) + 1) return false;
    }
    return true;
}

void Election::addBallot(const std::vector<int>& ranks)
{
    if (!isBallotValid(ranks)) {
        throw InvalidBallotError();
    }
    requireFullyPopulated("addBallot");
    assignBallotToCandidate(Ballot(ranks));
}

int Election::numBallots() const
{
    return std::accumulate(tally_.begin(), tally_.end(), 0);
}

void Election::requireFullyPopulated(const char* operation) const
{
    if (candidates_.size() != capacity_) {
        throw std::logic_error(std::string(operation) + ": only " + std::to_string(candidates_.size()) +
                               " of " + std::to_string(capacity_) + " candidate(s) registered");
    }
}

// Earlier eliminations are only marked on ballots that were moved at the time,
// so stale top choices are dropped here before the ballot is handed over.
CandidateId Election::assignBallotToCandidate(Ballot ballot)
{
    CandidateId top = ballot.getTopCandidate();
    while (candidates_[top].isEliminated()) {
        ballot.eliminateCandidate(top);
        top = ballot.getTopCandidate();
    }
    candidates_[top].addBallot(std::move(ballot));
    ++tally_[top];
    return top;
}

void Election::redistribute(CandidateId loser, Round& round)
{
    std::vector<Ballot> released = candidates_[loser].eliminate();
    tally_[loser] = 0;
    round.eliminated = loser;

    for (auto& ballot : released) {
        ballot.eliminateCandidate(loser);
        const CandidateId next = assignBallotToCandidate(std::move(ballot));
        round.transferred[next] += 1;
    }
}

void Election::checkBallotCount(int numBallots) const
{
    int held = 0;
    for (const auto& c : candidates_) {
        if (c.getVotes() != tally_[c.getId()]) {
            throw std::logic_error("tally for \"" + c.getName() + "\" does not match its held ballots");
        }
        if (c.isEliminated()) {
            if (c.getVotes() != 0) {
                throw std::logic_error("eliminated candidate \"" + c.getName() + "\" still holds ballots");
            }
            continue;
        }
        held += c.getVotes();
    }
    if (held != numBallots) {
        throw std::logic_error("ballot count drifted from " + std::to_string(numBallots) +
                               " to " + std::to_string(held));
    }
}

// Both searches seed from the first continuing candidate so that a stale
// count in an eliminated slot can never win the comparison.
std::size_t Election::getMinVotesIndex() const
{
    std::size_t minIndex = candidates_.size();
    for (std::size_t i = 0; i < candidates_.size(); ++i) {
        if (candidates_[i].isEliminated()) continue;
        if (minIndex == candidates_.size() || tally_[i] < tally_[minIndex]) minIndex = i;
    }
    return minIndex;
}

std::size_t Election::getMaxVotesIndex() const
{
    std::size_t maxIndex = candidates_.size();
    for (std::size_t i = 0; i < candidates_.size(); ++i) {
        if (candidates_[i].isEliminated()) continue;
        if (maxIndex == candidates_.size() || tally_[i] > tally_[maxIndex]) maxIndex = i;
    }
    return maxIndex;
}

bool Election::allContinuingHave(int votes) const
{
    for (std::size_t i = 0; i < candidates_.size(); ++i) {
        if (!candidates_[i].isEliminated() && tally_[i] != votes) return false;
    }
    return true;
}

std::size_t Election::continuingCount() const
{
    return static_cast<std::size_t>(std::count_if(candidates_.begin(), candidates_.end(),
        [](const Candidate& c) { return !c.isEliminated(); }));
}

std::vector<std::string> Election::selectWinner()
{
    requireFullyPopulated("selectWinner");
    rounds_.clear();
    outcome_ = Outcome::Pending;
    if (candidates_.empty()) return {};

    // Ballots are only ever moved, never created or dropped, while counting.
    const int numBallots = this->numBallots();

    std::vector<std::string> winners;
    for (int number = 0;; ++number) {
        Round round;
        round.number = number;
        round.votes = tally_;

        for (const auto& c : candidates_) {
            if (c.getVotes() > numBallots / 2) {
                outcome_ = Outcome::Majority;
                round.winners.push_back(c.getId());
                winners.push_back(c.getName());
                rounds_.push_back(std::move(round));
                return winners;
            }
        }

        const std::size_t maxIndex = getMaxVotesIndex();
        const bool tie = allContinuingHave(tally_[maxIndex]);
        const bool soleSurvivor = continuingCount() == 1;

        if (soleSurvivor) {
            outcome_ = Outcome::SoleSurvivor;
            round.winners.push_back(maxIndex);
            winners.push_back(candidates_[maxIndex].getName());
        } else if (tie) {
            outcome_ = Outcome::Tie;
            for (const auto& c : candidates_) {
                if (c.isEliminated()) continue;
                round.winners.push_back(c.getId());
                winners.push_back(c.getName());
            }
        } else {
            redistribute(getMinVotesIndex(), round);
            checkBallotCount(numBallots);
        }

        rounds_.push_back(std::move(round));
        if (!winners.empty()) return winners;
    }
}
