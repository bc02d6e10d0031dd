// RCV_Voting.cpp : Defines the entry point for the application.
//

#include "RCV_Voting.h"
#include "ElectionErrors.h"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <new>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>
#ifdef _WIN32
#include <conio.h>
#endif

// Helper to trim leading/trailing whitespace
static std::string trim(const std::string& s)
{
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

static std::string csvQuote(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (char ch : s) {
        if (ch == '"') out.push_back('"'); // escape double-quote by doubling
        out.push_back(ch);
    }
    out.push_back('"');
    return out;
}

void displayCandidateList(const std::vector<std::string>& candidates)
{
    if (candidates.empty()) {
        std::cout << "No candidates.\n";
        return;
    }
    const int width = static_cast<int>(std::to_string(candidates.size()).size());
    std::cout << "Candidates:\n";
    for (size_t i = 0; i < candidates.size(); ++i) {
        std::cout << std::setw(width) << (i + 1) << ") " << candidates[i] << "\n";
    }
}

ParseBallotResult parseBallotLine(const std::string& line)
{
    ParseBallotResult res;
    std::stringstream ss(line);
    std::string token;
    while (std::getline(ss, token, ',')) {
        const std::string t = trim(token);
        if (t.empty()) continue;

        try {
            size_t idxPos = 0;
            long long val = std::stoll(t, &idxPos, 10);
            if (idxPos != t.size() || val < 0 || val > 1000000) {
                res.hadInvalid = true;
                continue;
            }
            res.ranks.push_back(static_cast<int>(val));
        } catch (const std::exception&) {
            res.hadInvalid = true;
        }
    }
    return res;
}

std::vector<std::string> inputCandidateNames()
{
    std::vector<std::string> candidates;
    std::set<std::string> seen;

    std::cout << "Enter candidate names, one per line. Press Enter on an empty line to finish.\n";
    for (;;)
    {
        std::string line;
        if (!std::getline(std::cin, line)) break; // EOF
        auto name = trim(line);
        if (name.empty()) break; // end input
        if (seen.insert(name).second) {
            candidates.push_back(std::move(name));
        } else {
            std::cout << "(duplicate ignored)\n";
        }
    }

    std::cout << "Captured " << candidates.size() << " unique candidate(s).\n";
    return candidates;
}

int inputBallots(Election& election, const std::vector<std::string>& candidates)
{
    displayCandidateList(candidates);

    std::cout << "Enter ballots as comma-separated ranks, one per candidate in list order (e.g., 1,3,2).\n";
    std::cout << "Press Enter on an empty line to finish.\n";

    int accepted = 0;
    int i = 1;
    while (true) {
        std::cout << i << ": ";
        std::string line;
        if (!std::getline(std::cin, line)) break; // EOF
        const std::string s = trim(line);
        if (s.empty()) break;

        ParseBallotResult parsed = parseBallotLine(s);
        if (parsed.hasError()) {
            std::cout << "(please re-enter ballot " << i << ": invalid token detected)\n";
            continue; // re-prompt same ballot number
        }

        try {
            election.addBallot(parsed.ranks);
        } catch (const InvalidBallotError&) {
            std::cout << "(please re-enter ballot " << i << ": ranks must be a permutation of 1.."
                      << candidates.size() << ")\n";
            continue;
        }

        ++accepted;
        ++i;
    }

    std::cout << "Captured " << accepted << " ballot(s).\n";
    return accepted;
}

Election readElection(std::istream& in, std::ostream& log)
{
    std::vector<std::string> names;
    std::set<std::string> seen;
    std::string line;
    int lineNo = 0;

    // Candidate section ends at the first empty line.
    while (std::getline(in, line)) {
        ++lineNo;
        const std::string s = trim(line);
        if (!s.empty() && s[0] == '#') continue;
        if (s.empty()) {
            if (names.empty()) continue; // leading blank lines
            break;
        }
        if (seen.insert(s).second) {
            names.push_back(s);
        } else {
            log << "Line " << lineNo << ": duplicate candidate \"" << s << "\" ignored\n";
        }
    }

    Election election(names.size());
    for (const auto& name : names) election.addCandidate(name);

    while (std::getline(in, line)) {
        ++lineNo;
        const std::string s = trim(line);
        if (s.empty() || s[0] == '#') continue;

        ParseBallotResult parsed = parseBallotLine(s);
        if (parsed.hasError()) {
            log << "Line " << lineNo << ": invalid token, ballot skipped\n";
            continue;
        }
        try {
            election.addBallot(parsed.ranks);
        } catch (const InvalidBallotError& ex) {
            log << "Line " << lineNo << ": " << ex.what() << ", skipped\n";
        }
    }
    return election;
}

static void printCsvHeader(std::ostream& out)
{
    out << "Round";
    out << ",Candidate";
    out << ",Votes";
    out << ",Status";
    out << ",Transferred";
    out << ",Sources";
    out << "\n";
}

void printCsvRounds(const Election& election, std::ostream& out)
{
    const auto& rounds = election.rounds();
    if (rounds.empty()) return;

    out << "MajorityThreshold," << (election.numBallots() / 2 + 1) << "\n";
    printCsvHeader(out);

    std::set<CandidateId> eliminated;
    for (const auto& round : rounds) {
        if (round.eliminated) eliminated.insert(*round.eliminated);

        for (CandidateId id = 0; id < election.candidateCount(); ++id) {
            const Candidate& cand = election.candidate(id);
            out << round.number;
            out << "," << csvQuote(cand.getName());
            out << "," << round.votes[id];

            std::string status = "Continuing";
            for (CandidateId w : round.winners) {
                if (w == id) status = "Elected";
            }
            if (eliminated.count(id)) status = "Eliminated";
            out << "," << status;

            out << ",";
            auto tIt = round.transferred.find(id);
            if (tIt != round.transferred.end()) {
                out << tIt->second;
            }

            out << ",";
            if (tIt != round.transferred.end() && round.eliminated) {
                out << election.candidate(*round.eliminated).getName() << "(" << tIt->second << ")";
            }
            out << "\n";
        }
        out << "\n";
    }
}

void printResult(const std::vector<std::string>& winners, std::ostream& out)
{
    if (winners.empty()) {
        out << "No winner could be determined.\n";
    } else if (winners.size() == 1) {
        out << "Winner is " << winners.front() << "\n";
    } else {
        out << "Tie between ";
        for (size_t i = 0; i < winners.size(); ++i) {
            if (i > 0) out << ", ";
            out << winners[i];
        }
        out << "\n";
    }
}

#ifndef RCV_NO_MAIN
static void printUsage(const char* prog)
{
    std::cerr << "Usage: " << prog << " [--rounds] [ballot-file]\n";
}

static int runFromFile(const std::string& path, bool showRounds)
{
    std::ifstream in(path);
    if (!in) {
        std::cerr << "Error: cannot open ballot file " << path << "\n";
        return EXIT_FAILURE;
    }
    Election election = readElection(in, std::cout);
    auto winners = election.selectWinner();
    if (showRounds) printCsvRounds(election, std::cout);
    printResult(winners, std::cout);
    return EXIT_SUCCESS;
}

static int runInteractive(bool showRounds)
{
    for (;;)
    {
        std::vector<std::string> candidates = inputCandidateNames();

        Election election(candidates.size());
        for (const auto& name : candidates) election.addCandidate(name);
        if (!candidates.empty()) inputBallots(election, candidates);

        auto winners = election.selectWinner();
        std::cout << "\n";
        if (showRounds) printCsvRounds(election, std::cout);
        printResult(winners, std::cout);

        // Prompt until we get a clear Y or N
        for (;;)
        {
            std::cout << "\nRun a new election (Y/N)?\n";
            char again = 'N';
#ifdef _WIN32
            again = _getch(); // single key, no Enter needed
#else
            std::string line;
            if (!std::getline(std::cin, line)) return EXIT_SUCCESS;
            // take first non-space char if present
            again = 0;
            for (char ch : line) {
                if (!std::isspace(static_cast<unsigned char>(ch))) { again = ch; break; }
            }
#endif
            if (std::toupper(static_cast<unsigned char>(again)) == 'Y') {
                std::cout << "\n\n";
                break; // rerun the entire workflow
            }
            else if (std::toupper(static_cast<unsigned char>(again)) == 'N') {
                return EXIT_SUCCESS;
            }
            else {
                std::cout << "Unrecognized input.\n";
            }
        }
    }
}

int main(int argc, char* argv[])
{
    bool showRounds = false;
    std::string path;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--rounds") {
            showRounds = true;
        } else if (!arg.empty() && arg[0] == '-') {
            printUsage(argv[0]);
            return EXIT_FAILURE;
        } else if (path.empty()) {
            path = arg;
        } else {
            printUsage(argv[0]);
            return EXIT_FAILURE;
        }
    }

    try {
        if (!path.empty()) return runFromFile(path, showRounds);
        return runInteractive(showRounds);
    } catch (const std::bad_alloc& ex) {
        std::cerr << "Error: memory allocation failed (std::bad_alloc). " << ex.what() << "\n";
        return EXIT_FAILURE;
    } catch (const std::exception& ex) {
        std::cerr << "Unhandled exception: " << ex.what() << "\n";
        return EXIT_FAILURE;
    }
}
#endif
