// Ballot.cpp : Top-choice lookup over the continuing candidates of one ballot.

#include "Ballot.h"

#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

Ballot::Ballot(std::vector<int> ranks)
    : ranks_(std::move(ranks)), eliminated_(ranks_.size(), false)
{
}

CandidateId Ballot::getTopCandidate() const
{
    int best = std::numeric_limits<int>::max();
    CandidateId top = ranks_.size();
    for (CandidateId i = 0; i < ranks_.size(); ++i) {
        if (eliminated_[i]) continue;
        if (ranks_[i] < best) { best = ranks_[i]; top = i; }
    }
    if (top == ranks_.size()) {
        throw std::logic_error("ballot has no continuing candidate");
    }
    return top;
}

void Ballot::eliminateCandidate(CandidateId id)
{
    if (id >= eliminated_.size()) {
        throw std::out_of_range("candidate id " + std::to_string(id) + " is not on the ballot");
    }
    eliminated_[id] = true;
}

bool Ballot::isEliminated(CandidateId id) const
{
    return id < eliminated_.size() && eliminated_[id];
}

int Ballot::rankOf(CandidateId id) const
{
    return ranks_.at(id);
}
