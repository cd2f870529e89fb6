#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include "search.h"
#include "utils.h"

namespace fs = std::filesystem;

TEST_SUITE("cmd")
{
    TEST_CASE("buildCommand - placeholders and quiet redirects") {
        cmd::Placeholders values{{"input", "q.fa"}, {"output", "o.tsv"}, {"thread", "8"}};

        const auto with_redirect = cmd::buildCommand("tool -t {thread} {input} > {output}", values);
        CHECK(with_redirect == "tool -t 8 q.fa > o.tsv 2>/dev/null < /dev/null");

        const auto no_redirect = cmd::buildCommand("tool {input} -o {output}", values);
        CHECK(no_redirect == "tool q.fa -o o.tsv > /dev/null 2>&1 < /dev/null");

        cmd::BuildOptions raw;
        raw.quiet = false;
        raw.close_stdin = false;
        CHECK(cmd::buildCommand("tool {input} {output} {unknown}", values, raw) == "tool q.fa o.tsv {unknown}");
    }

    TEST_CASE("buildCommand - {input} and {output} are required") {
        CHECK_THROWS_AS(cmd::buildCommand("tool {input}", {}), std::runtime_error);
        CHECK_THROWS_AS(cmd::buildCommand("tool > {output}", {}), std::runtime_error);
    }

    TEST_CASE("runCommand - exit codes") {
        CHECK(cmd::runCommand("true") == 0);
        CHECK(cmd::runCommand("exit 3") == 3);
    }

    TEST_CASE("buildSearchCommand - default blastn template") {
        search::SearchParams sp;
        sp.query = "out/mito2X.fasta";
        sp.db = "genome.fa";
        sp.output = "out/numtfinder.numtsearch.blast.tsv";
        sp.evalue = 1e-4;

        const auto c = search::buildSearchCommand(sp);
        CHECK(c.find("blastn -task blastn -query out/mito2X.fasta -subject genome.fa -evalue 0.0001 -outfmt 6 "
                     "> out/numtfinder.numtsearch.blast.tsv") == 0);
    }

    TEST_CASE("runSearch - existing output is reused unless forced") {
        const fs::path dir = fs::temp_directory_path() / "numtfinder_tests_cmd_search";
        std::error_code ec;
        fs::remove_all(dir, ec);
        fs::create_directories(dir, ec);
        REQUIRE(!ec);

        search::SearchParams sp;
        sp.query = dir / "q.fa";
        sp.db = dir / "db.fa";
        sp.output = dir / "hits.tsv";
        std::ofstream(sp.query) << ">q\nACGT\n";
        std::ofstream(sp.db) << ">db\nACGT\n";
        std::ofstream(sp.output) << "previous\n";

        // 命令若被执行就会失败
        sp.cmd_template = "false {input} {db} > {output}";
        CHECK(search::runSearch(sp) == sp.output);

        sp.force = true;
        CHECK_THROWS_AS(search::runSearch(sp), std::runtime_error);

        fs::remove_all(dir, ec);
    }

} // TEST_SUITE(cmd)
