// Ballot.h : One voter's complete ranking of the candidates.

#pragma once

#include <cstddef>
#include <vector>

// Candidates are identified by their registration slot in the election.
using CandidateId = std::size_t;

class Ballot {
public:
    // ranks[i] is the rank given to candidate i (1 = top choice).
    // The caller guarantees ranks is a permutation of 1..N.
    explicit Ballot(std::vector<int> ranks);

    // Candidate with the lowest rank value among those still eligible on this ballot.
    // Throws std::logic_error when every candidate has been eliminated.
    CandidateId getTopCandidate() const;

    // Mark a candidate as no longer eligible on this ballot. Repeated calls are harmless.
    void eliminateCandidate(CandidateId id);

    bool isEliminated(CandidateId id) const;

    int rankOf(CandidateId id) const;

    std::size_t size() const { return ranks_.size(); }

private:
    std::vector<int> ranks_;
    std::vector<bool> eliminated_;
};
