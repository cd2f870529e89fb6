#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "report.h"

namespace fs = std::filesystem;

static fs::path makeTempDir(std::string_view name) {
    fs::path dir = fs::temp_directory_path() / std::string(name);
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir, ec);
    REQUIRE_MESSAGE(!ec, "cannot create temp dir: " << dir.string() << " (" << ec.message() << ")");
    return dir;
}

static std::vector<std::string> readLines(const fs::path& p) {
    std::ifstream in(p);
    REQUIRE_MESSAGE(in.good(), "cannot read: " << p.string());
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

static fragment::Fragment makeFrag(const std::string& seq, int_t start, int_t end, bool is_rev,
                                   int_t ref_start, int_t ref_end, std::size_t num) {
    static const auto space = coords::RefSpace::circular(1000);
    fragment::Fragment f;
    f.seq_name = seq;
    f.start = start;
    f.end = end;
    f.is_rev = is_rev;
    f.length = end - start + 1;
    f.identity = f.length;
    f.bit_score = 12.34;
    f.expect = 2.5e-12;
    f.ref = space.project(coords::DoubledPos{ref_start}, coords::DoubledPos{ref_end});
    f.frag_num = num;
    return f;
}

TEST_SUITE("report")
{
    TEST_CASE("formatExpect") {
        CHECK(report::formatExpect(0.0) == "0");
        CHECK(report::formatExpect(2.5e-12) == "2.5e-12");
        CHECK(report::formatExpect(0.001) == "0.001");
    }

    TEST_CASE("writeFragmentTable - header and wrapped reference coordinates") {
        fragment::FragmentTable frags;
        frags.push_back(makeFrag("chr1", 100, 150, true, 980, 1030, 1));

        std::ostringstream os;
        report::writeFragmentTable(os, frags);
        CHECK(os.str() ==
              "SeqName\tStart\tEnd\tStrand\tBitScore\tExpect\tLength\tIdentity\tmtStart\tmtEnd\tFragNum\n"
              "chr1\t100\t150\t-\t12.3\t2.5e-12\t51\t51\t980\t30\t1\n");
    }

    TEST_CASE("writeBlockTable - provenance columns") {
        fragment::FragmentTable frags;
        frags.push_back(makeFrag("chr1", 100, 200, false, 10, 110, 1));
        frags.push_back(makeFrag("chr1", 205, 300, true, 120, 215, 2));
        const auto blocks = block::mergeBlocks(frags, block::MergeParams{});

        std::ostringstream os;
        report::writeBlockTable(os, blocks);
        std::istringstream in(os.str());
        std::string header;
        std::string row;
        std::getline(in, header);
        std::getline(in, row);
        CHECK(header == "SeqName\tStart\tEnd\tStrand\tBitScore\tExpect\tLength\tIdentity\t"
                        "mtFrag\tFragNum\tFragLen\tFragGaps\tFragNums");
        CHECK(row == "chr1\t100\t300\t+/-\t24.7\t2.5e-12\t197\t197\t10-110|120-215\t2\t197\t4\t1,2");
    }

    TEST_CASE("writeSelfHitTable") {
        selfhit::SelfHitReport r;
        r.seq_name = "mtcopy";
        r.coverage = 100.0;
        r.identity = 99.5;
        r.core_frags = 1;
        r.extra_frags = 2;
        r.excluded = true;

        std::ostringstream os;
        report::writeSelfHitTable(os, {r});
        CHECK(os.str() ==
              "SeqName\tCoverage\tIdentity\tCoreFrags\tExtraFrags\tExcluded\n"
              "mtcopy\t100.00\t99.50\t1\t2\tTrue\n");
    }

    TEST_CASE("writeExclusionList - sorted, one per line") {
        auto dir = makeTempDir("numtfinder_tests_report_exclude");
        const fs::path p = dir / "sub" / "x.exclude.txt";
        report::writeExclusionList(p, {"chrM", "chrUn_2", "chrUn_1"});
        const auto lines = readLines(p);
        REQUIRE(lines.size() == 3);
        CHECK(lines[0] == "chrM");
        CHECK(lines[1] == "chrUn_1");
        CHECK(lines[2] == "chrUn_2");

        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    TEST_CASE("extractRegion") {
        const std::string seq = "ACGTACGTAC";
        CHECK(report::extractRegion(seq, 1, 4) == "ACGT");
        CHECK(report::extractRegion(seq, 10, 10) == "C");
        CHECK_THROWS_AS(report::extractRegion(seq, 0, 4), std::out_of_range);
        CHECK_THROWS_AS(report::extractRegion(seq, 8, 11), std::out_of_range);
    }

    TEST_CASE("exportSequences - fragments and blocks from one pass over the assembly") {
        auto dir = makeTempDir("numtfinder_tests_report_export");
        const fs::path assembly = dir / "asm.fa";
        {
            std::ofstream ofs(assembly, std::ios::binary);
            REQUIRE(ofs.good());
            ofs << ">chr1 first\nAAAACCCCGGGGTTTT\n>chr2\nACGTACGTAA\n>chr3\nNNNN\n";
        }

        fragment::FragmentTable frags;
        frags.push_back(makeFrag("chr1", 1, 4, false, 1, 4, 1));
        frags.push_back(makeFrag("chr1", 5, 8, true, 10, 13, 2));
        frags.push_back(makeFrag("chr2", 2, 5, true, 20, 23, 3));
        const auto blocks = block::mergeBlocks(frags, block::MergeParams{});

        report::ExportParams ep;
        ep.fragfas = true;
        ep.fragrevcomp = true;
        ep.blockfas = true;
        const fs::path frag_fa = dir / "fas" / "x.numtfrag.fasta";
        const fs::path block_fa = dir / "fas" / "x.numtblock.fasta";
        const auto stats = report::exportSequences(assembly, frags, blocks, ep, frag_fa, block_fa);
        CHECK(stats.fragments == 3);
        CHECK(stats.blocks == 2);

        const auto fl = readLines(frag_fa);
        REQUIRE(fl.size() == 6);
        CHECK(fl[0] == ">chr1.1-4 + mt:1-4 frag:1");
        CHECK(fl[1] == "AAAA");
        CHECK(fl[2] == ">chr1.5-8 - mt:10-13 frag:2");
        CHECK(fl[3] == "GGGG");
        CHECK(fl[4] == ">chr2.2-5 - mt:20-23 frag:3");
        CHECK(fl[5] == "TACG");     // CGTA 的反向互补

        const auto bl = readLines(block_fa);
        REQUIRE(bl.size() == 4);
        CHECK(bl[0] == ">chr1.1-8 +/- frags:2 block:1");
        CHECK(bl[1] == "AAAACCCC");
        CHECK(bl[2] == ">chr2.2-5 - frags:1 block:2");
        CHECK(bl[3] == "CGTA");

        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    TEST_CASE("exportSequences - unknown sequence or bad coordinates are errors") {
        auto dir = makeTempDir("numtfinder_tests_report_export_err");
        const fs::path assembly = dir / "asm.fa";
        {
            std::ofstream ofs(assembly, std::ios::binary);
            ofs << ">chr1\nACGT\n";
        }

        report::ExportParams ep;
        ep.fragfas = true;
        ep.blockfas = false;

        fragment::FragmentTable missing;
        missing.push_back(makeFrag("chrX", 1, 2, false, 1, 2, 1));
        CHECK_THROWS_AS(report::exportSequences(assembly, missing, {}, ep, dir / "a.fa", dir / "b.fa"),
                        std::runtime_error);

        fragment::FragmentTable too_long;
        too_long.push_back(makeFrag("chr1", 3, 9, false, 1, 7, 1));
        CHECK_THROWS_AS(report::exportSequences(assembly, too_long, {}, ep, dir / "a.fa", dir / "b.fa"),
                        std::runtime_error);

        std::error_code ec;
        fs::remove_all(dir, ec);
    }

} // TEST_SUITE(report)
