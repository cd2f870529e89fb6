#include "report.h"

#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <cereal/archives/json.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>

namespace report
{
    const std::vector<std::string> FRAG_COLUMNS = {
        "SeqName", "Start", "End", "Strand", "BitScore", "Expect", "Length", "Identity",
        "mtStart", "mtEnd", "FragNum"
    };

    // mtFrag 为成员的 mtStart-mtEnd 区间（'|' 分隔），FragNum 为成员数，FragNums 为成员片段编号（',' 分隔）
    const std::vector<std::string> BLOCK_COLUMNS = {
        "SeqName", "Start", "End", "Strand", "BitScore", "Expect", "Length", "Identity",
        "mtFrag", "FragNum", "FragLen", "FragGaps", "FragNums"
    };

    const std::vector<std::string> SELFHIT_COLUMNS = {
        "SeqName", "Coverage", "Identity", "CoreFrags", "ExtraFrags", "Excluded"
    };

    static void writeHeader(std::ostream& os, const std::vector<std::string>& cols)
    {
        for (std::size_t i = 0; i < cols.size(); ++i) {
            if (i) os << '\t';
            os << cols[i];
        }
        os << '\n';
    }

    // 打开输出文件并调用 ostream 版本；写完后检查流状态
    template <class Fn>
    static void writeFile(const FilePath& path, std::string_view what, Fn&& fn)
    {
        std::ofstream ofs = file_io::openOutput(path, what);
        fn(ofs);
        ofs.flush();
        if (!ofs) {
            throw std::runtime_error("failed to write " + std::string(what) + ": " + path.string());
        }
        spdlog::info("Wrote {}: {}", what, path.string());
    }

    std::string formatExpect(double e)
    {
        std::ostringstream oss;
        oss << std::setprecision(3) << e;
        return oss.str();
    }

    void writeFragmentTable(std::ostream& os, const fragment::FragmentTable& frags)
    {
        writeHeader(os, FRAG_COLUMNS);
        os << std::fixed << std::setprecision(1);
        for (const auto& f : frags) {
            os << f.seq_name << '\t'
               << f.start << '\t'
               << f.end << '\t'
               << f.strand() << '\t'
               << f.bit_score << '\t'
               << formatExpect(f.expect) << '\t'
               << f.length << '\t'
               << f.identity << '\t'
               << f.ref.start.value << '\t'
               << f.ref.end.value << '\t'
               << f.frag_num << '\n';
        }
    }

    void writeFragmentTable(const FilePath& path, const fragment::FragmentTable& frags)
    {
        writeFile(path, "NUMT fragment table", [&](std::ostream& os) { writeFragmentTable(os, frags); });
    }

    void writeBlockTable(std::ostream& os, const block::Blocks& blocks)
    {
        writeHeader(os, BLOCK_COLUMNS);
        os << std::fixed << std::setprecision(1);
        for (const auto& b : blocks) {
            os << b.seq_name << '\t'
               << b.start << '\t'
               << b.end << '\t'
               << block::toString(b.strand) << '\t'
               << b.bit_score << '\t'
               << formatExpect(b.expect) << '\t'
               << b.length << '\t'
               << b.identity << '\t'
               << b.mt_frag << '\t'
               << b.fragCount() << '\t'
               << b.frag_len << '\t'
               << b.frag_gaps << '\t';
            for (std::size_t i = 0; i < b.frag_nums.size(); ++i) {
                if (i) os << ',';
                os << b.frag_nums[i];
            }
            os << '\n';
        }
    }

    void writeBlockTable(const FilePath& path, const block::Blocks& blocks)
    {
        writeFile(path, "NUMT block table", [&](std::ostream& os) { writeBlockTable(os, blocks); });
    }

    void writeSelfHitTable(std::ostream& os, const std::vector<selfhit::SelfHitReport>& reports)
    {
        writeHeader(os, SELFHIT_COLUMNS);
        os << std::fixed << std::setprecision(2);
        for (const auto& r : reports) {
            os << r.seq_name << '\t'
               << r.coverage << '\t'
               << r.identity << '\t'
               << r.core_frags << '\t'
               << r.extra_frags << '\t'
               << (r.excluded ? "True" : "False") << '\n';
        }
    }

    void writeSelfHitTable(const FilePath& path, const std::vector<selfhit::SelfHitReport>& reports)
    {
        writeFile(path, "self-hit report", [&](std::ostream& os) { writeSelfHitTable(os, reports); });
    }

    void writeExclusionList(const FilePath& path, const std::set<std::string>& exclusion)
    {
        writeFile(path, "exclusion list", [&](std::ostream& os) {
            for (const auto& name : exclusion) os << name << '\n';
        });
    }

    void writeCoverageJson(std::ostream& os, const coverage::CoverageProfile& profile)
    {
        coverage::CoverageJson cj = coverage::toJson(profile);
        // archive 析构时才写出结尾的 '}'，因此放在独立作用域里
        {
            cereal::JSONOutputArchive ar(os);
            ar(cereal::make_nvp("mtcoverage", cj));
        }
        os << '\n';
    }

    void writeCoverageJson(const FilePath& path, const coverage::CoverageProfile& profile)
    {
        writeFile(path, "mtDNA coverage JSON", [&](std::ostream& os) { writeCoverageJson(os, profile); });
    }

    void writeCoverageTsv(std::ostream& os, const coverage::CoverageProfile& profile)
    {
        os << "Pos\tDepth\n";
        for (std::size_t i = 0; i < profile.depth.size(); ++i) {
            os << (i + 1) << '\t' << profile.depth[i] << '\n';
        }
    }

    void writeCoverageTsv(const FilePath& path, const coverage::CoverageProfile& profile)
    {
        writeFile(path, "mtDNA coverage table", [&](std::ostream& os) { writeCoverageTsv(os, profile); });
    }

} // namespace report
