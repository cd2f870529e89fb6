#ifndef NUMTFINDER_HITS_H
#define NUMTFINDER_HITS_H

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"
#include "utils.h"

// ================================================================
// hits 命名空间：外部比对工具产生的原始命中（AlignmentHit）
// ================================================================
// 输入格式：BLAST+ tabular（-outfmt 6），12 列、TAB 分隔：
//   qseqid sseqid pident length mismatch gapopen qstart qend sstart send evalue bitscore
// 约定：
// - query 为（加倍后的）mtDNA，qstart/qend 是加倍参考空间坐标；
// - subject 为基因组组装，sstart > send 表示命中位于负链，读入时交换使 start <= end；
// - identity 记录“一致碱基数”而不是百分比：round(pident * length / 100)；
// - 以 '#' 开头的行与空行被跳过。
//
// 读入后的命中不可再修改；hit_index 记录在文件中的行序，用于排序时的稳定 tie-break。
// ================================================================
namespace hits
{
    struct AlignmentHit
    {
        std::string query_name;     // mtDNA query 名称（qseqid）
        std::string seq_name;       // 组装序列名称（sseqid）
        int_t start{0};             // 组装坐标（1-based，start <= end）
        int_t end{0};
        bool is_rev{false};         // 是否为负链命中
        double bit_score{0.0};
        double expect{0.0};
        int_t length{0};            // 比对长度（含 gap）
        int_t identity{0};          // 一致碱基数
        int_t ref_start{0};         // 加倍参考空间坐标（qstart）
        int_t ref_end{0};           // 加倍参考空间坐标（qend）
        std::size_t hit_index{0};   // 输入顺序

        int_t span() const noexcept { return end - start + 1; }
        char strand() const noexcept { return is_rev ? '-' : '+'; }
    };

    using AlignmentHits = std::vector<AlignmentHit>;

    // 解析一行 BLAST tabular；格式错误时抛出 std::invalid_argument（消息不含文件名/行号，由调用方补充）
    AlignmentHit parseBlastLine(std::string_view line, std::size_t hit_index);

    // 读取整个命中表。
    // 异常：
    // - 文件不存在或不是常规文件：std::runtime_error
    // - 文件为空：std::runtime_error（空命中表属于输入错误；没有任何数据行的非空文件则返回空集合）
    // - 任一数据行格式错误：std::runtime_error，消息形如 "path:line: reason"
    AlignmentHits readBlastTable(const FilePath& path);

    // 命中预过滤参数（对应原始工具的 blaste 与 localmin）
    struct HitFilterParams
    {
        double max_expect = 1e-4;   // expect > max_expect 的命中被丢弃
        int_t min_length = 0;       // length < min_length 的命中被丢弃
    };

    // 丢弃 E-value 或比对长度不满足要求的命中；保持原有顺序
    AlignmentHits filterHits(AlignmentHits hits, const HitFilterParams& params);

    // 只保留 query 名称属于 query_names 的命中（mtDNA 文件含多条序列时只使用第一条）
    AlignmentHits keepQueries(AlignmentHits hits, const std::vector<std::string>& query_names);

} // namespace hits

#endif //NUMTFINDER_HITS_H
