#ifndef NUMTFINDER_REPORT_H
#define NUMTFINDER_REPORT_H

#include <cstddef>
#include <ostream>
#include <set>
#include <string>
#include <vector>

#include "block.h"
#include "config.hpp"
#include "coverage.h"
#include "fragment.h"
#include "selfhit.h"
#include "utils.h"

// ================================================================
// report 命名空间：结果表格与序列输出
// ================================================================
// 表格均为 TAB 分隔、带表头；浮点列使用固定精度，Expect 使用科学计数法。
// 每个表格都有 ostream 与文件路径两个版本：前者便于测试，后者负责创建父目录与错误检查。
// ================================================================
namespace report
{
    // 表头（同时作为测试中的列定义）
    extern const std::vector<std::string> FRAG_COLUMNS;
    extern const std::vector<std::string> BLOCK_COLUMNS;
    extern const std::vector<std::string> SELFHIT_COLUMNS;

    // Expect 值的文本形式（例如 "1.2e-45"、"0"）
    std::string formatExpect(double e);

    void writeFragmentTable(std::ostream& os, const fragment::FragmentTable& frags);
    void writeFragmentTable(const FilePath& path, const fragment::FragmentTable& frags);

    void writeBlockTable(std::ostream& os, const block::Blocks& blocks);
    void writeBlockTable(const FilePath& path, const block::Blocks& blocks);

    void writeSelfHitTable(std::ostream& os, const std::vector<selfhit::SelfHitReport>& reports);
    void writeSelfHitTable(const FilePath& path, const std::vector<selfhit::SelfHitReport>& reports);

    // 每行一个序列名
    void writeExclusionList(const FilePath& path, const std::set<std::string>& exclusion);

    // 覆盖度：cereal JSON（profile + summary）与 "Pos Depth" TSV
    void writeCoverageJson(std::ostream& os, const coverage::CoverageProfile& profile);
    void writeCoverageJson(const FilePath& path, const coverage::CoverageProfile& profile);
    void writeCoverageTsv(std::ostream& os, const coverage::CoverageProfile& profile);
    void writeCoverageTsv(const FilePath& path, const coverage::CoverageProfile& profile);

    // ------------------------------------------------------------------
    // 序列输出（SequenceExporter）
    // ------------------------------------------------------------------
    struct ExportParams
    {
        bool fragfas = false;           // 输出片段序列
        bool fragrevcomp = true;        // 负链片段反向互补
        bool blockfas = true;           // 输出 block 区域（正链）
    };

    struct ExportStats
    {
        std::size_t fragments = 0;      // 写出的片段序列数
        std::size_t blocks = 0;         // 写出的 block 序列数
    };

    // 1-based 闭区间截取；越界抛出 std::out_of_range
    std::string extractRegion(const std::string& seq, int_t start, int_t end);

    // 片段/Block 的 FASTA 记录
    seq_io::SeqRecord fragmentRecord(const fragment::Fragment& f, const std::string& seq, bool revcomp);
    seq_io::SeqRecord blockRecord(const block::Block& b, std::size_t block_num, const std::string& seq);

    // 只顺序读取一遍组装文件，同时写出片段与 block 序列（按组装中的序列顺序）。
    // 片段或 block 所在序列不在组装中、或坐标超出序列长度时抛出 std::runtime_error。
    ExportStats exportSequences(const FilePath& assembly,
                                const fragment::FragmentTable& frags,
                                const block::Blocks& blocks,
                                const ExportParams& params,
                                const FilePath& frag_fasta,
                                const FilePath& block_fasta);

} // namespace report

#endif //NUMTFINDER_REPORT_H
