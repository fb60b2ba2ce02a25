#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "PVC_Playground.h"

static int fail(const char* m){ std::cout << "FAIL: " << m << "\n"; return 1; }
static bool has(const std::string& out, const std::string& s) { return out.find(s) != std::string::npos; }

static std::string captureReport(const PreferenceProfile& profile, const std::vector<Alternative>& alts)
{
    std::streambuf* old = std::cout.rdbuf();
    std::ostringstream cap; std::cout.rdbuf(cap.rdbuf());
    printPvcReport(profile, alts);
    std::cout.rdbuf(old);
    return cap.str();
}

int main() {
    // parseRankingLine accepts commas, spaces or both
    {
        if (parseRankingLine("a,b,c") != Ranking{ "a", "b", "c" }) return fail("comma ranking");
        if (parseRankingLine("  c b  a ") != Ranking{ "c", "b", "a" }) return fail("space ranking");
        if (parseRankingLine("b, a ,,c") != Ranking{ "b", "a", "c" }) return fail("mixed ranking");
        if (!parseRankingLine("   ").empty()) return fail("blank line produced tokens");
    }
    // Report for m=4, n=2 identical rankings
    {
        const std::vector<Alternative> alts = generateAlternatives(4);
        const PreferenceProfile profile = { { "a", "b", "c", "d" }, { "a", "b", "c", "d" } };
        const std::string out = captureReport(profile, alts);
        if (!has(out, "VetoPower,3/2\n")) return fail("veto power line");
        if (!has(out, "PVC,\"a\"\n")) return fail("PVC line");
        if (!has(out, "SuccessiveElimination,\"a\"\n")) return fail("overlay line");
        if (!has(out, "Alternative,InPVC,Coalition,B,T_size,v_T,VotingPower,VetoSize\n")) return fail("header");
        if (!has(out, "\"a\",Yes,\"\",\"\",0,0.00,0.00,0.00\n")) return fail("row a");
        if (!has(out, "\"b\",No,\"1 2\",\"a\",2,3.00,1.00,0.75\n")) return fail("row b");
        if (!has(out, "\"d\",No,\"1 2\",\"a b c\",2,3.00,1.00,0.25\n")) return fail("row d");
    }
    // Invalid profile is reported, not computed
    {
        const std::vector<Alternative> alts = generateAlternatives(3);
        const PreferenceProfile profile = { { "a", "b", "c" }, { "a", "b", "c" }, { "a", "a", "b" } };
        const std::string out = captureReport(profile, alts);
        if (!has(out, "NotComputable,InvalidRanking,Voters,\"3\"\n")) return fail("refusal line");
        if (has(out, "PVC,")) return fail("PVC printed for invalid profile");
    }
    // Interactive input re-prompts a voter until the ranking is valid
    {
        std::istringstream in("a,b,c\na a b\nb c a\n");
        std::streambuf* oldIn = std::cin.rdbuf(in.rdbuf());
        std::streambuf* oldOut = std::cout.rdbuf();
        std::ostringstream cap; std::cout.rdbuf(cap.rdbuf());
        const PreferenceProfile profile = inputProfile(generateAlternatives(3), 2);
        std::cin.rdbuf(oldIn);
        std::cout.rdbuf(oldOut);

        const PreferenceProfile expected = { { "a", "b", "c" }, { "b", "c", "a" } };
        if (profile != expected) return fail("captured profile mismatch");
        if (!has(cap.str(), "re-enter ranking for voter 2: duplicate alternative detected")) return fail("duplicate diagnostic");
        if (!has(cap.str(), "Captured 2 ranking(s).")) return fail("capture summary");
    }
    // Bounded integer prompts
    {
        std::istringstream in("0\nx\n25\n5\n");
        std::streambuf* oldIn = std::cin.rdbuf(in.rdbuf());
        std::streambuf* oldOut = std::cout.rdbuf();
        std::ostringstream cap; std::cout.rdbuf(cap.rdbuf());
        const int n = inputNumberOfVoters();
        std::cin.rdbuf(oldIn);
        std::cout.rdbuf(oldOut);
        if (n != 5) return fail("inputNumberOfVoters != 5");
        if (!has(cap.str(), "Invalid characters detected.") && !has(cap.str(), "Invalid number.")) return fail("bad token not reported");
    }
    // EOF ends input early
    {
        std::istringstream in("");
        std::streambuf* oldIn = std::cin.rdbuf(in.rdbuf());
        std::streambuf* oldOut = std::cout.rdbuf();
        std::ostringstream cap; std::cout.rdbuf(cap.rdbuf());
        const int m = inputNumberOfAlternatives();
        std::cin.rdbuf(oldIn);
        std::cout.rdbuf(oldOut);
        if (m != 0) return fail("EOF did not return 0");
    }
    std::cout << "ConsoleReportTests: All tests passed.\n";
    return 0;
}
