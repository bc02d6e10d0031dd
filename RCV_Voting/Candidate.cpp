// Candidate.cpp : Ballot holding and elimination for a single contestant.

#include "Candidate.h"
#include "ElectionErrors.h"

#include <utility>

Candidate::Candidate(CandidateId id, std::string name)
    : id_(id), name_(std::move(name))
{
}

void Candidate::addBallot(Ballot ballot)
{
    ballots_.push_back(std::move(ballot));
}

std::vector<Ballot> Candidate::eliminate()
{
    if (eliminated_) {
        throw DegenerateEliminationError("candidate \"" + name_ + "\" is already eliminated");
    }
    eliminated_ = true;
    std::vector<Ballot> released;
    released.swap(ballots_);
    return released;
}
