// PVC_Playground.h : Proportional Veto Core computation and console helpers.
//

#pragma once

#include <iostream>
#include <string>
#include <vector>

#ifndef PVC_MAX_VOTERS
#define PVC_MAX_VOTERS 20
#endif

#ifndef PVC_EXACT_ARITHMETIC
#define PVC_EXACT_ARITHMETIC 1
#endif

using Alternative = std::string;
using Ranking = std::vector<Alternative>;          // most-preferred first
using PreferenceProfile = std::vector<Ranking>;    // one ranking per voter
using PreferenceMatrix = std::vector<std::vector<Alternative>>; // matrix[rank][voter]

// Masks are 64-bit, so the cap can never go past 62 voters.
static_assert(PVC_MAX_VOTERS >= 1 && PVC_MAX_VOTERS <= 62, "PVC_MAX_VOTERS must be in [1, 62]");

constexpr int kMaxVoters = PVC_MAX_VOTERS;
constexpr int kMaxAlternatives = 26;

// Reduced fraction (m-1)/n: the number of alternatives each voter may veto.
struct VetoPower {
    long long numerator = 0;
    long long denominator = 1;
};

// Throws std::invalid_argument when m < 1 or n < 1.
VetoPower reducedVetoPower(int m, int n);

// a >= b, treating |a - b| < kEps as equal.
bool approxGreaterEqual(double a, double b);

// Veto inequality |T|*(m-1)/n >= m-|B|, exact integer form.
bool vetoInequalityHolds(int coalitionSize, int preferredCount, int m, int n);

// Same inequality evaluated in doubles with the tolerance comparison.
bool vetoInequalityHoldsApprox(int coalitionSize, int preferredCount, int m, int n);

// First m symbols of "a".."z". Throws std::out_of_range if m < 0 or m > 26.
std::vector<Alternative> generateAlternatives(int m);

// Per-voter validation flags. Safe to call on partial rankings.
struct RankingDiagnosis {
    bool wrongLength = false;
    bool hadEmpty = false;
    bool hadDuplicate = false;
    bool hadUnknown = false;
    bool hasError() const { return wrongLength || hadEmpty || hadDuplicate || hadUnknown; }
};

RankingDiagnosis diagnoseRanking(const Ranking& ranking, const std::vector<Alternative>& universe);
bool validateRanking(const Ranking& ranking, const std::vector<Alternative>& universe);

enum class PvcStatus {
    Ok,
    InvalidRanking,
    UnknownAlternative,
    TooManyVoters
};

const char* pvcStatusText(PvcStatus status);

struct ProfileCheck {
    PvcStatus status = PvcStatus::Ok;
    std::vector<int> invalidVoters; // ascending voter indices
    bool ok() const { return status == PvcStatus::Ok; }
};

// Validates every voter independently and enforces the voter cap.
ProfileCheck validateProfile(const PreferenceProfile& profile, const std::vector<Alternative>& universe);

// Result of computePvc / computePvcSuccessive. alternatives is in universe order.
struct PvcOutcome {
    PvcStatus status = PvcStatus::Ok;
    std::vector<int> invalidVoters;
    std::vector<Alternative> alternatives;
    bool computable() const { return status == PvcStatus::Ok; }
};

// A veto coalition for one target. An empty coalition means none exists.
struct VetoCoalitionResult {
    PvcStatus status = PvcStatus::Ok;
    std::vector<int> invalidVoters;
    Alternative selectedAlternative;
    std::vector<int> coalition;                    // voter indices, ascending
    std::vector<Alternative> preferredAlternatives; // B, in universe order
    int coalitionSize = 0;                         // |T|
    double vetoPower = 0.0;                        // v(T) = |T|(m-1)/n
    double votingPower = 0.0;                      // |T|/n
    double vetoSize = 0.0;                         // 1 - |B|/m
    bool computable() const { return status == PvcStatus::Ok; }
    bool found() const { return !coalition.empty(); }
};

VetoCoalitionResult findVetoCoalition(const Alternative& target,
                                      const PreferenceProfile& profile,
                                      const std::vector<Alternative>& universe);

// Authoritative PVC: every alternative without a veto coalition.
PvcOutcome computePvc(const PreferenceProfile& profile, const std::vector<Alternative>& universe);

// Sequential elimination overlay. Advisory only, may differ from computePvc.
PvcOutcome computePvcSuccessive(const PreferenceProfile& profile, const std::vector<Alternative>& universe);

// matrix[rank][voter] -> profile[voter][rank]. Missing cells become "".
PreferenceProfile matrixToProfile(const PreferenceMatrix& matrix);
PreferenceMatrix profileToMatrix(const PreferenceProfile& profile);

// Split a ranking typed as "a,b,c" or "a b c". Tokens are trimmed, empty ones dropped.
Ranking parseRankingLine(const std::string& line);

// Read m (1..26) from stdin, re-prompting until valid. Returns 0 on EOF.
int inputNumberOfAlternatives();

// Read n (1..kMaxVoters) from stdin, re-prompting until valid. Returns 0 on EOF.
int inputNumberOfVoters();

// Read one ranking per voter, re-prompting a voter until the ranking validates.
// Returns fewer than n rankings if stdin closes early.
PreferenceProfile inputProfile(const std::vector<Alternative>& universe, int n);

// Print the CSV report: veto power, PVC, overlay, then one row per alternative.
// Voters are shown 1-based.
void printPvcReport(const PreferenceProfile& profile, const std::vector<Alternative>& universe);
