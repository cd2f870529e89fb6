#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <zlib.h>

#include "utils.h"   // seq_io::KseqReader / SeqWriter / SeqRecord

namespace fs = std::filesystem;

// ------------------------- helpers -------------------------

static fs::path makeTempDir(std::string_view name) {
    fs::path dir = fs::temp_directory_path() / std::string(name);
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir, ec);
    REQUIRE_MESSAGE(!ec, "cannot create temp dir: " << dir.string() << " (" << ec.message() << ")");
    return dir;
}

static std::vector<seq_io::SeqRecord> readAll(const fs::path& p) {
    seq_io::KseqReader r(p);
    seq_io::SeqRecord rec;
    std::vector<seq_io::SeqRecord> out;
    while (r.next(rec)) out.push_back(rec);
    REQUIRE(r.count() == out.size());
    return out;
}

// ------------------------- tests -------------------------

TEST_SUITE("read_fasta")
{
    TEST_CASE("KseqReader - ids, descriptions and multi-line sequences") {
        auto dir = makeTempDir("numtfinder_tests_read_plain");
        const fs::path in = dir / "asm.fasta";
        {
            std::ofstream ofs(in, std::ios::binary);
            REQUIRE(ofs.good());
            ofs << ">chr1 assembled chromosome 1\nACGT\nACGT\nAC\n>chrM\nTTTT\n>scaffold_9\nacgtn\n";
        }

        const auto recs = readAll(in);
        REQUIRE(recs.size() == 3);
        CHECK(recs[0].id == "chr1");
        CHECK(recs[0].desc == "assembled chromosome 1");
        CHECK(recs[0].seq == "ACGTACGTAC");
        CHECK(recs[1].id == "chrM");
        CHECK(recs[1].desc.empty());
        CHECK(recs[1].seq == "TTTT");
        CHECK(recs[2].seq == "acgtn");

        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    TEST_CASE("KseqReader - gzip input is transparent") {
        auto dir = makeTempDir("numtfinder_tests_read_gz");
        const fs::path in = dir / "mito.fa.gz";
        {
            gzFile gz = gzopen(in.string().c_str(), "wb");
            REQUIRE(gz != nullptr);
            const std::string text = ">MT human mtDNA\nGATCACAGGT\nCTATCACCCT\n";
            REQUIRE(gzwrite(gz, text.data(), static_cast<unsigned>(text.size())) == static_cast<int>(text.size()));
            REQUIRE(gzclose(gz) == Z_OK);
        }

        const auto recs = readAll(in);
        REQUIRE(recs.size() == 1);
        CHECK(recs[0].id == "MT");
        CHECK(recs[0].desc == "human mtDNA");
        CHECK(recs[0].seq == "GATCACAGGTCTATCACCCT");

        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    TEST_CASE("KseqReader - missing file throws") {
        CHECK_THROWS_AS(seq_io::KseqReader(fs::temp_directory_path() / "numtfinder_no_such_file.fa"),
                        std::runtime_error);
    }

    TEST_CASE("SeqWriter - header and line wrapping") {
        auto dir = makeTempDir("numtfinder_tests_write_fasta");
        const fs::path out = dir / "out.fasta";

        {
            seq_io::SeqWriter w(out, 4);
            seq_io::SeqRecord a;
            a.id = "chr1.1-10";
            a.desc = "+ mt:1-10 frag:1";
            a.seq = "ACGTACGTAC";
            w.writeFasta(a);

            seq_io::SeqRecord b;
            b.id = "empty";
            w.writeFasta(b);
            CHECK(w.written() == 2);
            w.flush();
        }

        std::ifstream in(out);
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(in, line)) lines.push_back(line);

        REQUIRE(lines.size() == 6);
        CHECK(lines[0] == ">chr1.1-10 + mt:1-10 frag:1");
        CHECK(lines[1] == "ACGT");
        CHECK(lines[2] == "ACGT");
        CHECK(lines[3] == "AC");
        CHECK(lines[4] == ">empty");
        CHECK(lines[5].empty());

        // 写出再读回
        const auto recs = readAll(out);
        REQUIRE(recs.size() == 2);
        CHECK(recs[0].seq == "ACGTACGTAC");

        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    TEST_CASE("reverseComplement") {
        std::string s = "AACGTTN";
        seq_io::reverseComplement(s);
        CHECK(s == "NAACGTT");

        std::string odd = "acGTa";
        seq_io::reverseComplement(odd);
        CHECK(odd == "tACgt");

        std::string ambiguous = "RYK-";
        seq_io::reverseComplement(ambiguous);
        CHECK(ambiguous == "-NNN");
    }

} // TEST_SUITE(read_fasta)
