#include "Election.h"

#include <iostream>
#include <numeric>
#include <string>
#include <vector>

static int fail(const char* msg) { std::cout << "FAIL: " << msg << "\n"; return 1; }

static Election makeElection(const std::vector<std::string>& names)
{
    Election e(names.size());
    for (const auto& n : names) e.addCandidate(n);
    return e;
}

static void addBallots(Election& e, int count, const std::vector<int>& ranks)
{
    for (int i = 0; i < count; ++i) e.addBallot(ranks);
}

// Every round starts with all ballots held by candidates still in contention.
static bool roundsConserveBallots(const Election& e, int total)
{
    std::vector<bool> out(e.candidateCount(), false);
    for (const auto& round : e.rounds()) {
        int held = 0;
        for (CandidateId id = 0; id < round.votes.size(); ++id) {
            if (out[id] && round.votes[id] != 0) return false;
            if (!out[id]) held += round.votes[id];
        }
        if (held != total) return false;
        if (round.eliminated) out[*round.eliminated] = true;
    }
    return true;
}

int main()
{
    // Equal lowest counts: the lower id (B) goes first, so C inherits B's ballot and ties A.
    // Eliminating C instead would have produced an A/B tie.
    {
        Election e = makeElection({"A", "B", "C"});
        addBallots(e, 2, {1, 2, 3});
        addBallots(e, 1, {3, 1, 2});
        addBallots(e, 1, {3, 2, 1});
        auto winners = e.selectWinner();
        if (!e.rounds()[0].eliminated || *e.rounds()[0].eliminated != 1) return fail("B should be eliminated first");
        if (winners != std::vector<std::string>{"A", "C"}) return fail("expected A,C tie after B elimination");
        if (!roundsConserveBallots(e, 4)) return fail("ballot count not conserved (tie-break)");
    }

    // A redistributed ballot skips a preference eliminated in an earlier round.
    // Round 0: A out, its ballot moves to D. Round 1: B out, B ballots list A next (gone) then C.
    {
        Election e = makeElection({"A", "B", "C", "D"});
        addBallots(e, 1, {1, 3, 4, 2});
        addBallots(e, 2, {2, 1, 3, 4});
        addBallots(e, 3, {4, 3, 1, 2});
        addBallots(e, 3, {4, 3, 2, 1});
        auto winners = e.selectWinner();
        if (winners != std::vector<std::string>{"C"}) return fail("expected C after skipping eliminated A");
        if (e.rounds().size() != 3) return fail("expected three rounds");
        if (*e.rounds()[0].eliminated != 0) return fail("round 0 should eliminate A");
        if (e.rounds()[0].transferred.at(3) != 1) return fail("A's ballot should move to D");
        if (*e.rounds()[1].eliminated != 1) return fail("round 1 should eliminate B");
        if (e.rounds()[1].transferred.count(0) != 0) return fail("eliminated A received ballots");
        if (e.rounds()[1].transferred.at(2) != 2) return fail("both B ballots should move to C");
        if (e.candidate(0).getVotes() != 0) return fail("eliminated A holds ballots");
        if (e.candidate(2).getVotes() + e.candidate(3).getVotes() != 9) return fail("ballots lost in redistribution");
        if (!roundsConserveBallots(e, 9)) return fail("ballot count not conserved (skip)");
    }

    // Minimum search ignores slot 0 once it is eliminated.
    // Round 0 removes A (slot 0, now 0 votes); round 1 must remove B, not pick A again.
    {
        Election e = makeElection({"A", "B", "C", "D"});
        addBallots(e, 1, {1, 3, 2, 4});
        addBallots(e, 2, {3, 1, 2, 4});
        addBallots(e, 3, {2, 3, 1, 4});
        addBallots(e, 4, {2, 3, 4, 1});
        auto winners = e.selectWinner();
        if (winners != std::vector<std::string>{"C"}) return fail("min-seed scenario winner != C");
        if (e.rounds().size() != 3) return fail("min-seed scenario should take three rounds");
        if (*e.rounds()[0].eliminated != 0) return fail("round 0 should eliminate A");
        if (*e.rounds()[1].eliminated != 1) return fail("round 1 should eliminate B, not revisit A");
        if (e.rounds()[2].votes[2] != 6) return fail("C should reach 6 of 10");
        if (!roundsConserveBallots(e, 10)) return fail("ballot count not conserved (min seed)");

        // Late ballots route past eliminated candidates
        e.addBallot({1, 2, 3, 4});
        if (e.candidate(2).getVotes() != 7) return fail("late ballot for A,B,C should land on C");
        e.addBallot({1, 2, 4, 3});
        if (e.candidate(3).getVotes() != 5) return fail("late ballot for A,B,D should land on D");
        if (e.selectWinner() != std::vector<std::string>{"C"}) return fail("recount after late ballots != C");
    }

    // Long chain: five candidates eliminated one by one until a majority appears
    {
        Election e = makeElection({"A", "B", "C", "D", "E"});
        addBallots(e, 5, {1, 2, 3, 4, 5});
        addBallots(e, 4, {5, 1, 2, 3, 4});
        addBallots(e, 3, {4, 5, 1, 2, 3});
        addBallots(e, 2, {3, 4, 5, 1, 2});
        addBallots(e, 1, {2, 3, 4, 5, 1});
        const int total = e.numBallots();
        auto winners = e.selectWinner();
        if (total != 15) return fail("expected 15 ballots");
        if (!roundsConserveBallots(e, total)) return fail("ballot count not conserved (chain)");
        if (winners != std::vector<std::string>{"A"}) return fail("chain winner != A");
        const int sum = std::accumulate(e.rounds().back().votes.begin(), e.rounds().back().votes.end(), 0);
        if (sum != total) return fail("final round tallies do not add up");
    }

    std::cout << "EliminationOrderTests: All tests passed.\n";
    return 0;
}
