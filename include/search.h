#ifndef NUMTFINDER_SEARCH_H
#define NUMTFINDER_SEARCH_H

#include <string>

#include "config.hpp"
#include "utils.h"

// ================================================================
// search 命名空间：调用外部比对工具（默认 BLAST+ blastn）得到命中表
// ================================================================
// 命令模板占位符：
//   {input}  mtDNA query（环状时为加倍序列）
//   {db}     基因组组装
//   {output} 命中表输出路径（BLAST -outfmt 6）
//   {thread} 线程数（可选）
//   {evalue} E-value 上限（可选）
// ================================================================
namespace search
{
    struct SearchParams
    {
        FilePath query;                 // {input}
        FilePath db;                    // {db}
        FilePath output;                // {output}
        std::string cmd_template;       // 为空时使用 DEFAULT_SEARCH_CMD
        int threads = 1;                // {thread}
        double evalue = 1e-4;           // {evalue}
        bool force = false;             // 忽略已有输出重新搜索
    };

    // 按参数展开命令模板（不执行）
    std::string buildSearchCommand(const SearchParams& params);

    // 运行搜索并返回命中表路径：
    // - output 已存在且非空、且 force == false 时直接复用；
    // - 命令退出码非 0 或没有产生输出文件时抛出 std::runtime_error。
    FilePath runSearch(const SearchParams& params);

} // namespace search

#endif //NUMTFINDER_SEARCH_H
