#include <doctest/doctest.h>

#include <sstream>
#include <stdexcept>
#include <string>

#include "coverage.h"
#include "report.h"

static fragment::Fragment makeFrag(const std::string& seq, int_t start, int_t end,
                                   int_t ref_start, int_t ref_end, const coords::RefSpace& space) {
    fragment::Fragment f;
    f.seq_name = seq;
    f.start = start;
    f.end = end;
    f.length = end - start + 1;
    f.identity = f.length;
    f.ref = space.project(coords::DoubledPos{ref_start}, coords::DoubledPos{ref_end});
    return f;
}

TEST_SUITE("coverage")
{
    TEST_CASE("aggregateCoverage - plain and wrapped fragments") {
        const auto space = coords::RefSpace::circular(1000);
        fragment::FragmentTable frags;
        frags.push_back(makeFrag("chr1", 1, 101, 100, 200, space));
        frags.push_back(makeFrag("chr1", 500, 550, 980, 1030, space));   // 980..1000 + 1..30
        frags.push_back(makeFrag("chr2", 1, 51, 150, 200, space));

        const auto prof = coverage::aggregateCoverage(frags, space, "MT");
        CHECK(prof.ref_id == "MT");
        CHECK(prof.ref_len == 1000);
        REQUIRE(prof.depth.size() == 1000);

        CHECK(prof.at(1) == 1);
        CHECK(prof.at(30) == 1);
        CHECK(prof.at(31) == 0);
        CHECK(prof.at(99) == 0);
        CHECK(prof.at(100) == 1);
        CHECK(prof.at(150) == 2);
        CHECK(prof.at(200) == 2);
        CHECK(prof.at(201) == 0);
        CHECK(prof.at(979) == 0);
        CHECK(prof.at(980) == 1);
        CHECK(prof.at(1000) == 1);

        CHECK_THROWS_AS(prof.at(0), std::out_of_range);
        CHECK_THROWS_AS(prof.at(1001), std::out_of_range);
    }

    TEST_CASE("aggregateCoverage - depth sum equals total projected span") {
        const auto space = coords::RefSpace::circular(16569);
        fragment::FragmentTable frags;
        int_t expected = 0;
        for (int i = 0; i < 60; ++i) {
            const int_t s = 1 + (i * 1543) % 16569;
            const int_t len = 30 + (i * 211) % 3000;
            frags.push_back(makeFrag("s" + std::to_string(i), 1, len, s, s + len - 1, space));
            expected += space.span(frags.back().ref);
        }

        const auto prof = coverage::aggregateCoverage(frags, space, "MT");
        CHECK(prof.total() == static_cast<std::uint64_t>(expected));
        CHECK(prof.fragments == 60);
    }

    TEST_CASE("aggregateCoverage - full-circle fragment adds exactly one everywhere") {
        const auto space = coords::RefSpace::circular(500);
        fragment::FragmentTable frags;
        frags.push_back(makeFrag("mt", 1, 500, 201, 700, space));

        const auto prof = coverage::aggregateCoverage(frags, space, "MT");
        const auto s = prof.summary();
        CHECK(s.covered == 500);
        CHECK(s.max_depth == 1);
        CHECK(s.mean_depth == doctest::Approx(1.0));
        CHECK(s.covered_pct == doctest::Approx(100.0));
    }

    TEST_CASE("aggregateCoverage - no fragments") {
        const auto prof = coverage::aggregateCoverage({}, coords::RefSpace::linear(100), "MT");
        CHECK(prof.depth.size() == 100);
        CHECK(prof.total() == 0);
        CHECK(prof.summary().covered == 0);
    }

    TEST_CASE("coverage JSON and TSV output") {
        const auto space = coords::RefSpace::linear(5);
        fragment::FragmentTable frags;
        frags.push_back(makeFrag("chr1", 1, 3, 2, 4, space));
        const auto prof = coverage::aggregateCoverage(frags, space, "MT");

        std::ostringstream json;
        report::writeCoverageJson(json, prof);
        const std::string j = json.str();
        CHECK(j.find("\"mtcoverage\"") != std::string::npos);
        CHECK(j.find("\"ref_id\": \"MT\"") != std::string::npos);
        CHECK(j.find("\"ref_len\": 5") != std::string::npos);
        CHECK(j.find("\"max_depth\": 1") != std::string::npos);
        CHECK(j.find("\"depth\"") != std::string::npos);

        std::ostringstream tsv;
        report::writeCoverageTsv(tsv, prof);
        CHECK(tsv.str() == "Pos\tDepth\n1\t0\n2\t1\n3\t1\n4\t1\n5\t0\n");
    }

} // TEST_SUITE(coverage)
