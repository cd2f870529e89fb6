#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include "mtdna.h"

namespace fs = std::filesystem;

static fs::path makeTempDir(std::string_view name) {
    fs::path dir = fs::temp_directory_path() / std::string(name);
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir, ec);
    REQUIRE_MESSAGE(!ec, "cannot create temp dir: " << dir.string() << " (" << ec.message() << ")");
    return dir;
}

static void writeText(const fs::path& p, const std::string& text) {
    std::ofstream ofs(p, std::ios::binary);
    REQUIRE_MESSAGE(ofs.good(), "cannot write: " << p.string());
    ofs << text;
}

TEST_SUITE("mtdna")
{
    TEST_CASE("circularize - doubled sequence with tagged identifier") {
        seq_io::SeqRecord rec;
        rec.id = "NC_012920.1";
        rec.desc = "Homo sapiens mitochondrion";
        rec.seq = "ACGTTGCA";

        const auto out = mtdna::circularize(rec);
        CHECK(out.id == "NC_012920.12X");
        CHECK(out.desc.empty());
        CHECK(out.seq == "ACGTTGCAACGTTGCA");
        CHECK(out.seq.size() == 2 * rec.seq.size());
    }

    TEST_CASE("doubledQueryPath - extension is replaced") {
        CHECK(mtdna::doubledQueryPath("/data/mito.fasta", "out") == fs::path("out") / "mito2X.fasta");
        CHECK(mtdna::doubledQueryPath("chrM.fa.gz", "out") == fs::path("out") / "chrM2X.fasta");
    }

    TEST_CASE("loadReference - first sequence only") {
        auto dir = makeTempDir("numtfinder_tests_mtdna_load");
        const fs::path p = dir / "mt.fa";
        writeText(p, ">MT first\nACGTACGTAA\nCCGG\n>other\nTTTT\n");

        const auto ref = mtdna::loadReference(p, true);
        CHECK(ref.id() == "MT");
        CHECK(ref.length() == 14);
        CHECK(ref.num_seqs == 2);
        CHECK(ref.circular);
        CHECK(ref.space().doubledLength() == 28);
        CHECK(ref.space().isCircular());

        const auto names = mtdna::queryNames(ref);
        REQUIRE(names.size() == 2);
        CHECK(names[0] == "MT");
        CHECK(names[1] == "MT2X");

        const auto lin = mtdna::loadReference(p, false);
        CHECK(lin.space().doubledLength() == 14);

        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    TEST_CASE("loadReference - empty or missing input is an error") {
        auto dir = makeTempDir("numtfinder_tests_mtdna_empty");
        CHECK_THROWS_AS(mtdna::loadReference(dir / "missing.fa", true), std::runtime_error);

        const fs::path empty = dir / "empty.fa";
        writeText(empty, "");
        CHECK_THROWS_AS(mtdna::loadReference(empty, true), std::runtime_error);

        const fs::path no_seq = dir / "noseq.fa";
        writeText(no_seq, ">MT\n");
        CHECK_THROWS_AS(mtdna::loadReference(no_seq, true), std::runtime_error);

        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    TEST_CASE("writeSearchQuery - write once, reuse unless forced") {
        auto dir = makeTempDir("numtfinder_tests_mtdna_query");
        const fs::path p = dir / "mito.fasta";
        writeText(p, ">MT\nACGTTGCA\n");
        const auto ref = mtdna::loadReference(p, true);

        const fs::path outdir = dir / "out";
        const fs::path q = mtdna::writeSearchQuery(ref, p, outdir, false);
        CHECK(q == outdir / "mito2X.fasta");
        {
            std::ifstream in(q);
            std::string header, seq;
            std::getline(in, header);
            std::getline(in, seq);
            CHECK(header == ">MT2X");
            CHECK(seq == "ACGTTGCAACGTTGCA");
        }

        // 已有文件被复用（即使内容不同）
        writeText(q, ">stale\nAAAA\n");
        mtdna::writeSearchQuery(ref, p, outdir, false);
        {
            std::ifstream in(q);
            std::string header;
            std::getline(in, header);
            CHECK(header == ">stale");
        }

        // force 重新生成
        mtdna::writeSearchQuery(ref, p, outdir, true);
        {
            std::ifstream in(q);
            std::string header;
            std::getline(in, header);
            CHECK(header == ">MT2X");
        }

        // 线性参考直接使用原始文件
        const auto lin = mtdna::loadReference(p, false);
        CHECK(mtdna::writeSearchQuery(lin, p, outdir, false) == p);

        std::error_code ec;
        fs::remove_all(dir, ec);
    }

} // TEST_SUITE(mtdna)
