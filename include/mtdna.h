#ifndef NUMTFINDER_MTDNA_H
#define NUMTFINDER_MTDNA_H

#include <cstddef>
#include <string>
#include <vector>

#include "config.hpp"
#include "coords.h"
#include "utils.h"

// ================================================================
// mtdna 命名空间：线粒体参考序列的载入与加倍（SequenceCircularizer）
// ================================================================
// 环状 mtDNA 的比对若跨越序列首尾（原点），在线性参考上会被截断成两段。
// 做法：把序列与自身拼接成长度 2L 的线性序列作为搜索 query，搜索结束后
// 再由 coords::RefSpace 把 query 坐标投影回 [1, L]。
// ================================================================
namespace mtdna
{
    struct Reference
    {
        seq_io::SeqRecord record;   // 实际使用的参考序列（文件中的第一条）
        std::size_t num_seqs{0};    // 文件中的序列总数
        bool circular{true};

        int_t length() const noexcept { return static_cast<int_t>(record.seq.size()); }
        const std::string& id() const noexcept { return record.id; }

        // 与参考对应的坐标空间（环状：加倍空间 2L；线性：恒等）
        coords::RefSpace space() const;
    };

    // 读取 mtDNA FASTA（可为 .gz），只使用第一条序列。
    // - 文件缺失、无序列或首条序列长度为 0：抛出 std::runtime_error；
    // - 环状模式下文件含多条序列：记录警告。
    Reference loadReference(const FilePath& path, bool circular);

    // 加倍：id 追加 "2X"，序列与自身拼接，desc/qual 丢弃
    seq_io::SeqRecord circularize(const seq_io::SeqRecord& rec);

    // 加倍参考的文件名："<mtDNA 文件 basename（去扩展名）>2X.fasta"，位于 outdir 下
    FilePath doubledQueryPath(const FilePath& mtdna_path, const FilePath& outdir);

    // 准备搜索用的 mtDNA query 文件并返回其路径：
    // - 线性参考：直接返回原始 mtDNA 文件；
    // - 环状参考：写出加倍序列；已存在且 force == false 时复用已有文件。
    FilePath writeSearchQuery(const Reference& ref,
                              const FilePath& mtdna_path,
                              const FilePath& outdir,
                              bool force);

    // 外部搜索报告的 query 名称中，哪些属于参考（原始 id 与加倍后的 id）
    std::vector<std::string> queryNames(const Reference& ref);

} // namespace mtdna

#endif //NUMTFINDER_MTDNA_H
