// Candidate.h : A contestant and the ballots currently counted for it.

#pragma once

#include "Ballot.h"

#include <string>
#include <vector>

class Candidate {
public:
    Candidate(CandidateId id, std::string name);

    // Take a ballot whose current top choice is this candidate. No dedup.
    void addBallot(Ballot ballot);

    int getVotes() const { return static_cast<int>(ballots_.size()); }

    bool isEliminated() const { return eliminated_; }

    // Mark eliminated and hand back every held ballot for redistribution.
    // Throws DegenerateEliminationError if the candidate was already eliminated.
    std::vector<Ballot> eliminate();

    const std::string& getName() const { return name_; }

    CandidateId getId() const { return id_; }

private:
    CandidateId id_;
    std::string name_;
    std::vector<Ballot> ballots_;
    bool eliminated_ = false;
};
