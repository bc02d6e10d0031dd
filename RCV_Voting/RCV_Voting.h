// RCV_Voting.h : Console and file front end for the ranked-choice counting core.

#pragma once

#include "Election.h"

#include <iostream>
#include <string>
#include <vector>

// Read candidate names from stdin, one per line, until an empty line.
// - Trims surrounding whitespace.
// - Ignores duplicate names (case-sensitive).
// - Preserves insertion order for unique names.
std::vector<std::string> inputCandidateNames();

// Display a row-numbered candidate list (1-based).
void displayCandidateList(const std::vector<std::string>& candidates);

// Parsed form of one ballot line: comma-separated ranks in candidate list order.
struct ParseBallotResult {
    std::vector<int> ranks;
    bool hadInvalid = false;
    bool hasError() const { return hadInvalid; }
};

ParseBallotResult parseBallotLine(const std::string& line);

// Input ballots from stdin into the election, one per line, until an empty line.
// Rejected ballots are re-prompted. Returns the number of ballots accepted.
int inputBallots(Election& election, const std::vector<std::string>& candidates);

// Read a ballot file: candidate names one per line, an empty line, then ballot lines.
// '#' starts a comment line. Invalid ballots are reported on `log` and skipped.
Election readElection(std::istream& in, std::ostream& log);

// Print the per-round CSV trace of the last count.
void printCsvRounds(const Election& election, std::ostream& out);

// Print "Winner is X", or the tied candidates.
void printResult(const std::vector<std::string>& winners, std::ostream& out);
