// Election.h : Instant-runoff (ranked-choice) counting over a fixed candidate roster.

#pragma once

#include "Ballot.h"
#include "Candidate.h"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Which rule ended the count.
enum class Outcome {
    Pending,      // selectWinner has not run
    Majority,     // one candidate holds more than half of the ballots
    Tie,          // every continuing candidate holds the same count
    SoleSurvivor  // only one candidate is left in contention
};

// Snapshot of one pass of the counting loop.
struct Round {
    int number = 0;
    std::vector<int> votes;                   // per candidate, at the start of the round
    std::optional<CandidateId> eliminated;    // candidate dropped at the end of the round
    std::map<CandidateId, int> transferred;   // recipient -> ballots received from the eliminated candidate
    std::vector<CandidateId> winners;         // filled on the final round only
};

class Election {
public:
    // Room for exactly numCandidates candidates; none registered yet.
    explicit Election(std::size_t numCandidates);

    // Register the next candidate. Throws CandidateOverflowError past the declared
    // count and std::invalid_argument on a duplicate name.
    CandidateId addCandidate(const std::string& name);

    // Checks that ranks has one entry per candidate and is a permutation of 1..N.
    bool isBallotValid(const std::vector<int>& ranks) const;

    // Validate and route a ballot to its top continuing candidate.
    // Throws InvalidBallotError without touching the election when ranks is malformed.
    void addBallot(const std::vector<int>& ranks);

    // Run the instant-runoff count. Returns the single winner, or every continuing
    // candidate in registration order when they tie.
    std::vector<std::string> selectWinner();

    std::size_t capacity() const { return capacity_; }
    std::size_t candidateCount() const { return candidates_.size(); }
    const Candidate& candidate(CandidateId id) const { return candidates_.at(id); }

    // Ballots currently held across all candidates.
    int numBallots() const;

    Outcome outcome() const { return outcome_; }

    // Round history of the most recent selectWinner call.
    const std::vector<Round>& rounds() const { return rounds_; }

private:
    void requireFullyPopulated(const char* operation) const;
    CandidateId assignBallotToCandidate(Ballot ballot);
    void redistribute(CandidateId loser, Round& round);
    void checkBallotCount(int numBallots) const;

    std::size_t getMinVotesIndex() const;
    std::size_t getMaxVotesIndex() const;
    bool allContinuingHave(int votes) const;
    std::size_t continuingCount() const;

    std::size_t capacity_;
    std::vector<Candidate> candidates_;
    std::vector<int> tally_;
    std::vector<Round> rounds_;
    Outcome outcome_ = Outcome::Pending;
};
