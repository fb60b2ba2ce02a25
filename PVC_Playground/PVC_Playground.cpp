// PVC_Playground.cpp : Defines the entry point for the application.
//

#include "PVC_Playground.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <map>
#include <new> // for std::bad_alloc
#include <numeric> // for std::gcd
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#ifdef _WIN32
#include <conio.h>
#endif

// Numeric epsilon for FP comparisons of the veto inequality
constexpr double kEps = 1e-9;

// --- Veto power arithmetic ---

VetoPower reducedVetoPower(int m, int n)
{
    if (m < 1) throw std::invalid_argument("number of alternatives must be at least 1");
    if (n < 1) throw std::invalid_argument("number of voters must be at least 1");

    // gcd(0, n) == n, so m == 1 reduces to 0/1
    const long long num = m - 1;
    const long long den = n;
    const long long g = std::gcd(num, den);
    return VetoPower{ num / g, den / g };
}

bool approxGreaterEqual(double a, double b)
{
    return a > b || std::abs(a - b) < kEps;
}

bool vetoInequalityHolds(int coalitionSize, int preferredCount, int m, int n)
{
    if (m < 1 || n < 1) return false;
    const VetoPower vp = reducedVetoPower(m, n);
    // |T| * p/q >= m - |B|  <=>  |T| * p >= (m - |B|) * q
    const long long lhs = static_cast<long long>(coalitionSize) * vp.numerator;
    const long long rhs = static_cast<long long>(m - preferredCount) * vp.denominator;
    return lhs >= rhs;
}

bool vetoInequalityHoldsApprox(int coalitionSize, int preferredCount, int m, int n)
{
    if (m < 1 || n < 1) return false;
    const double vT = static_cast<double>(coalitionSize) * (m - 1) / n;
    const double vetoSize = static_cast<double>(m - preferredCount);
    return approxGreaterEqual(vT, vetoSize);
}

static bool vetoHolds(int coalitionSize, int preferredCount, int m, int n)
{
#if PVC_EXACT_ARITHMETIC
    return vetoInequalityHolds(coalitionSize, preferredCount, m, n);
#else
    return vetoInequalityHoldsApprox(coalitionSize, preferredCount, m, n);
#endif
}

// --- Alternatives and validation ---

std::vector<Alternative> generateAlternatives(int m)
{
    if (m < 0 || m > kMaxAlternatives) {
        throw std::out_of_range("number of alternatives must be between 0 and " + std::to_string(kMaxAlternatives));
    }
    std::vector<Alternative> alternatives;
    alternatives.reserve(static_cast<size_t>(m));
    for (int i = 0; i < m; ++i) alternatives.push_back(std::string(1, static_cast<char>('a' + i)));
    return alternatives;
}

RankingDiagnosis diagnoseRanking(const Ranking& ranking, const std::vector<Alternative>& universe)
{
    RankingDiagnosis diag;
    if (ranking.size() != universe.size()) diag.wrongLength = true;

    const std::set<Alternative> known(universe.begin(), universe.end());
    std::set<Alternative> seen;
    for (const auto& entry : ranking) {
        if (entry.empty()) {
            diag.hadEmpty = true;
            continue;
        }
        if (!seen.insert(entry).second) diag.hadDuplicate = true;
        if (!known.count(entry)) diag.hadUnknown = true;
    }
    return diag;
}

bool validateRanking(const Ranking& ranking, const std::vector<Alternative>& universe)
{
    return !diagnoseRanking(ranking, universe).hasError();
}

const char* pvcStatusText(PvcStatus status)
{
    switch (status) {
    case PvcStatus::Ok: return "Ok";
    case PvcStatus::InvalidRanking: return "InvalidRanking";
    case PvcStatus::UnknownAlternative: return "UnknownAlternative";
    case PvcStatus::TooManyVoters: return "TooManyVoters";
    }
    return "Unknown";
}

ProfileCheck validateProfile(const PreferenceProfile& profile, const std::vector<Alternative>& universe)
{
    ProfileCheck check;
    if (profile.size() > static_cast<size_t>(kMaxVoters)) {
        check.status = PvcStatus::TooManyVoters;
        return check;
    }

    bool sawUnknown = false;
    for (size_t v = 0; v < profile.size(); ++v) {
        const RankingDiagnosis diag = diagnoseRanking(profile[v], universe);
        if (diag.hasError()) {
            check.invalidVoters.push_back(static_cast<int>(v));
            if (diag.hadUnknown) sawUnknown = true;
        }
    }
    if (!check.invalidVoters.empty()) {
        check.status = sawUnknown ? PvcStatus::UnknownAlternative : PvcStatus::InvalidRanking;
    }
    return check;
}

// --- Veto coalition search ---

// Scan coalitions for one target on an already validated profile.
// Masks run from 2^n-1 down to 1 and the first valid one wins, which is the
// last valid coalition in increasing-mask order.
static VetoCoalitionResult scanCoalitions(const Alternative& target,
                                          const PreferenceProfile& profile,
                                          const std::vector<Alternative>& universe)
{
    VetoCoalitionResult res;
    res.selectedAlternative = target;

    const int m = static_cast<int>(universe.size());
    const int n = static_cast<int>(profile.size());

    std::map<Alternative, int> indexOf;
    for (int i = 0; i < m; ++i) indexOf[universe[i]] = i;

    // above[v][i] != 0 when voter v ranks universe[i] strictly above target
    std::vector<std::vector<char>> above(n, std::vector<char>(m, 0));
    std::vector<bool> ranksTarget(n, false);
    for (int v = 0; v < n; ++v) {
        for (const auto& alt : profile[v]) {
            if (alt == target) {
                ranksTarget[v] = true;
                break;
            }
            auto it = indexOf.find(alt);
            if (it != indexOf.end()) above[v][it->second] = 1;
        }
    }

    const std::uint64_t full = (std::uint64_t{1} << n) - 1;
    std::vector<char> inB(m);
    for (std::uint64_t mask = full; mask >= 1; --mask) {
        std::fill(inB.begin(), inB.end(), 1);
        int tSize = 0;
        bool skip = false;
        for (int v = 0; v < n; ++v) {
            if (!((mask >> v) & 1u)) continue;
            if (!ranksTarget[v]) { skip = true; break; }
            ++tSize;
            for (int i = 0; i < m; ++i) inB[i] = static_cast<char>(inB[i] & above[v][i]);
        }
        if (skip) continue;

        const int bCount = static_cast<int>(std::count(inB.begin(), inB.end(), 1));
        if (bCount == 0 || !vetoHolds(tSize, bCount, m, n)) continue;

        for (int v = 0; v < n; ++v) if ((mask >> v) & 1u) res.coalition.push_back(v);
        for (int i = 0; i < m; ++i) if (inB[i]) res.preferredAlternatives.push_back(universe[i]);
        res.coalitionSize = tSize;
        res.vetoPower = static_cast<double>(tSize) * (m - 1) / n;
        res.votingPower = static_cast<double>(tSize) / n;
        res.vetoSize = 1.0 - static_cast<double>(bCount) / m;
        return res;
    }
    return res;
}

VetoCoalitionResult findVetoCoalition(const Alternative& target,
                                      const PreferenceProfile& profile,
                                      const std::vector<Alternative>& universe)
{
    VetoCoalitionResult res;
    res.selectedAlternative = target;

    // m == 0 or n == 0: no coalitions
    if (universe.empty() || profile.empty()) return res;

    const ProfileCheck check = validateProfile(profile, universe);
    if (!check.ok()) {
        res.status = check.status;
        res.invalidVoters = check.invalidVoters;
        return res;
    }
    if (std::find(universe.begin(), universe.end(), target) == universe.end()) {
        res.status = PvcStatus::UnknownAlternative;
        return res;
    }
    return scanCoalitions(target, profile, universe);
}

PvcOutcome computePvc(const PreferenceProfile& profile, const std::vector<Alternative>& universe)
{
    PvcOutcome out;
    if (universe.empty() || profile.empty()) return out;

    const ProfileCheck check = validateProfile(profile, universe);
    if (!check.ok()) {
        out.status = check.status;
        out.invalidVoters = check.invalidVoters;
        return out;
    }

    for (const auto& alt : universe) {
        if (!scanCoalitions(alt, profile, universe).found()) out.alternatives.push_back(alt);
    }
    return out;
}

// --- Successive elimination ---

// One duplicated copy of an alternative.
struct EliminationItem {
    int alternative = 0;
    int copy = 0;
};

// Runs the n elimination rounds. Returns false if a ranking names an
// alternative outside the universe; survivors is left empty in that case.
static bool runSuccessiveElimination(const PreferenceProfile& profile,
                                     const std::vector<Alternative>& universe,
                                     std::set<int>& survivors)
{
    const int m = static_cast<int>(universe.size());
    const int n = static_cast<int>(profile.size());
    const VetoPower vp = reducedVetoPower(m, n);
    const long long p = vp.numerator;
    const long long q = vp.denominator;

    std::map<Alternative, int> indexOf;
    for (int i = 0; i < m; ++i) indexOf[universe[i]] = i;

    std::vector<EliminationItem> remaining;
    remaining.reserve(static_cast<size_t>(m * q));
    for (int i = 0; i < m; ++i) {
        for (int c = 0; c < q; ++c) remaining.push_back(EliminationItem{ i, c });
    }

    for (int v = 0; v < n; ++v) {
        std::vector<int> rankOf(m, -1);
        for (size_t r = 0; r < profile[v].size(); ++r) {
            auto it = indexOf.find(profile[v][r]);
            if (it == indexOf.end()) return false;
            rankOf[it->second] = static_cast<int>(r);
        }

        // m == 1 gives p == 0; nothing to eliminate
        if (p == 0 || remaining.size() < 2) continue;

        std::stable_sort(remaining.begin(), remaining.end(),
            [&rankOf](const EliminationItem& x, const EliminationItem& y) {
                if (rankOf[x.alternative] != rankOf[y.alternative])
                    return rankOf[x.alternative] < rankOf[y.alternative];
                return x.copy < y.copy;
            });

        // Always keep at least one item
        const size_t drop = static_cast<size_t>(std::min<long long>(p, static_cast<long long>(remaining.size()) - 1));
        remaining.resize(remaining.size() - drop);
    }

    for (const auto& item : remaining) survivors.insert(item.alternative);
    return true;
}

PvcOutcome computePvcSuccessive(const PreferenceProfile& profile, const std::vector<Alternative>& universe)
{
    PvcOutcome out;
    if (universe.empty() || profile.empty()) return out;

    const ProfileCheck check = validateProfile(profile, universe);
    if (!check.ok()) {
        out.status = check.status;
        out.invalidVoters = check.invalidVoters;
        return out;
    }

    std::set<int> survivors;
    if (!runSuccessiveElimination(profile, universe, survivors)) return out;

    for (int i : survivors) out.alternatives.push_back(universe[static_cast<size_t>(i)]);
    return out;
}

// --- Profile grid conversion ---

PreferenceProfile matrixToProfile(const PreferenceMatrix& matrix)
{
    const size_t m = matrix.size();
    size_t n = 0;
    for (const auto& row : matrix) n = std::max(n, row.size());

    PreferenceProfile profile(n, Ranking(m));
    for (size_t rank = 0; rank < m; ++rank) {
        for (size_t voter = 0; voter < matrix[rank].size(); ++voter) {
            profile[voter][rank] = matrix[rank][voter];
        }
    }
    return profile;
}

PreferenceMatrix profileToMatrix(const PreferenceProfile& profile)
{
    size_t m = 0;
    for (const auto& ranking : profile) m = std::max(m, ranking.size());

    PreferenceMatrix matrix(m, std::vector<Alternative>(profile.size()));
    for (size_t voter = 0; voter < profile.size(); ++voter) {
        for (size_t rank = 0; rank < profile[voter].size(); ++rank) {
            matrix[rank][voter] = profile[voter][rank];
        }
    }
    return matrix;
}

// --- Console input ---

// Helper to trim leading/trailing whitespace
static std::string trim(const std::string& s)
{
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

Ranking parseRankingLine(const std::string& line)
{
    Ranking ranking;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        std::istringstream words(field);
        std::string token;
        while (words >> token) {
            token = trim(token);
            if (!token.empty()) ranking.push_back(token);
        }
    }
    return ranking;
}

// Prompt for an integer in [lo, hi]. Returns 0 when stdin closes.
static int inputBoundedInt(const std::string& prompt, int lo, int hi)
{
    for (;;)
    {
        std::cout << prompt;
        std::string line;
        if (!std::getline(std::cin, line)) {
            std::cout << "Input stream closed.\n";
            return 0;
        }

        const auto s = trim(line);
        if (s.empty()) {
            std::cout << "Please enter a value.\n";
            continue;
        }

        try {
            size_t idx = 0;
            long long v = std::stoll(s, &idx, 10);
            if (idx != s.size()) {
                std::cout << "Invalid characters detected. Try again.\n";
                continue;
            }
            if (v < lo || v > hi) {
                std::cout << "Value must be between " << lo << " and " << hi << ". Try again.\n";
                continue;
            }
            return static_cast<int>(v);
        } catch (const std::exception&) {
            std::cout << "Invalid number. Try again.\n";
        }
    }
}

int inputNumberOfAlternatives()
{
    return inputBoundedInt("Enter number of alternatives (1-" + std::to_string(kMaxAlternatives) + "): ",
                           1, kMaxAlternatives);
}

int inputNumberOfVoters()
{
    return inputBoundedInt("Enter number of voters (1-" + std::to_string(kMaxVoters) + "): ",
                           1, kMaxVoters);
}

static std::string joinTokens(const std::vector<std::string>& items)
{
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out.push_back(' ');
        out += item;
    }
    return out;
}

PreferenceProfile inputProfile(const std::vector<Alternative>& universe, int n)
{
    PreferenceProfile profile;
    std::cout << "Alternatives: " << joinTokens(universe) << "\n";
    std::cout << "Enter each voter's ranking, most preferred first (e.g., a,b,c).\n";

    int voter = 1;
    while (voter <= n) {
        std::cout << "Voter " << voter << ": ";
        std::string line;
        if (!std::getline(std::cin, line)) break; // EOF

        Ranking ranking = parseRankingLine(line);
        const RankingDiagnosis diag = diagnoseRanking(ranking, universe);
        if (diag.hasError()) {
            std::cout << "(please re-enter ranking for voter " << voter << ": ";
            bool first = true;
            if (diag.wrongLength)  { std::cout << (first ? "" : ", ") << "wrong length";          first = false; }
            if (diag.hadEmpty)     { std::cout << (first ? "" : ", ") << "empty entry";           first = false; }
            if (diag.hadDuplicate) { std::cout << (first ? "" : ", ") << "duplicate alternative"; first = false; }
            if (diag.hadUnknown)   { std::cout << (first ? "" : ", ") << "unknown alternative";   first = false; }
            std::cout << " detected)\n";
            continue; // re-prompt same voter
        }

        profile.push_back(std::move(ranking));
        ++voter;
    }

    std::cout << "Captured " << profile.size() << " ranking(s).\n";
    return profile;
}

// --- Report ---

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

static std::string joinVoters(const std::vector<int>& voters)
{
    std::vector<std::string> labels;
    for (int v : voters) labels.push_back(std::to_string(v + 1));
    return joinTokens(labels);
}

void printPvcReport(const PreferenceProfile& profile, const std::vector<Alternative>& universe)
{
    const int m = static_cast<int>(universe.size());
    const int n = static_cast<int>(profile.size());

    const PvcOutcome pvc = computePvc(profile, universe);
    if (!pvc.computable()) {
        std::cout << "NotComputable," << pvcStatusText(pvc.status)
                  << ",Voters," << csvQuote(joinVoters(pvc.invalidVoters)) << "\n";
        return;
    }

    if (m > 0 && n > 0) {
        const VetoPower vp = reducedVetoPower(m, n);
        std::cout << "VetoPower," << vp.numerator << "/" << vp.denominator << "\n";
    }
    std::cout << "PVC," << csvQuote(joinTokens(pvc.alternatives)) << "\n";

    const PvcOutcome overlay = computePvcSuccessive(profile, universe);
    std::cout << "SuccessiveElimination," << csvQuote(joinTokens(overlay.alternatives)) << "\n";

    std::cout << "Alternative,InPVC,Coalition,B,T_size,v_T,VotingPower,VetoSize\n";
    const std::set<Alternative> inPvc(pvc.alternatives.begin(), pvc.alternatives.end());
    for (const auto& alt : universe) {
        const VetoCoalitionResult res = findVetoCoalition(alt, profile, universe);
        std::cout << csvQuote(alt)
                  << "," << (inPvc.count(alt) ? "Yes" : "No")
                  << "," << csvQuote(joinVoters(res.coalition))
                  << "," << csvQuote(joinTokens(res.preferredAlternatives))
                  << "," << res.coalitionSize
                  << std::fixed << std::setprecision(2)
                  << "," << res.vetoPower
                  << "," << res.votingPower
                  << "," << res.vetoSize
                  << "\n";
    }
}

#ifndef PVC_NO_MAIN
int main()
{
    try {
        for (;;)
        {
            const int m = inputNumberOfAlternatives();
            if (m == 0) return 0;
            const int n = inputNumberOfVoters();
            if (n == 0) return 0;

            const std::vector<Alternative> universe = generateAlternatives(m);
            const PreferenceProfile profile = inputProfile(universe, n);
            if (static_cast<int>(profile.size()) < n) {
                std::cout << "Profile incomplete, nothing computed.\n";
                return 0;
            }

            std::cout << "\n";
            printPvcReport(profile, universe);

            // Prompt until we get a clear Y or N
            bool runAgain = false;
            for (;;)
            {
                std::cout << "\nCompute another profile (Y/N)?\n";
                char again = 'N';
#ifdef _WIN32
                again = static_cast<char>(_getch()); // single key, no Enter needed
#else
                std::string line;
                if (!std::getline(std::cin, line)) return 0;
                // take first non-space char if present
                again = 0;
                for (char ch : line) {
                    if (!std::isspace(static_cast<unsigned char>(ch))) { again = ch; break; }
                }
#endif
                if (std::toupper(static_cast<unsigned char>(again)) == 'Y') {
                    std::cout << "\n\n";
                    runAgain = true;
                    break;
                }
                else if (std::toupper(static_cast<unsigned char>(again)) == 'N') {
                    return 0;
                }
                else {
                    std::cout << "Unrecognized input.\n";
                }
            }

            if (!runAgain) break;
        }
    } catch (const std::bad_alloc& ex) {
        std::cerr << "Error: memory allocation failed (std::bad_alloc). " << ex.what() << "\n";
        return EXIT_FAILURE;
    } catch (const std::exception& ex) {
        std::cerr << "Unhandled exception: " << ex.what() << "\n";
        return EXIT_FAILURE;
    }
    return 0;
}
#endif
