#ifndef NUMTFINDER_UTILS_H
#define NUMTFINDER_UTILS_H

#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;
using FilePath = std::filesystem::path;


// ================================================================
// file_io：输入检查与输出准备
// 所有失败都抛出 std::runtime_error，消息格式为 "msg: path (ec.message)"
// ================================================================
namespace file_io
{
    std::string formatFsError(std::string_view msg,
                              const FilePath& p,
                              const std::error_code& ec);

    void requireExists(const FilePath& p, std::string_view what);
    void requireRegularFile(const FilePath& p, std::string_view what);
    void requireDirectory(const FilePath& p, std::string_view what);

    // 目录不存在则创建；存在则要求为目录
    void ensureDirectoryExists(const FilePath& p, std::string_view what = "directory");

    // 写文件前调用：确保输出文件的父目录存在
    void ensureParentDirExists(const FilePath& out_file);

    // 常规文件且大小 > 0；不存在时返回 false
    bool hasContent(const FilePath& p);

    // 删除单个文件；文件不存在返回 false，删除失败抛出异常
    bool removeFile(const FilePath& p);

    // 打开文本输出文件（会先创建父目录），失败时抛出异常
    std::ofstream openOutput(const FilePath& p, std::string_view what);

    // 序列文件名去掉压缩后缀和扩展名：/data/mito.fa.gz -> mito
    std::string fastaStem(const FilePath& p);

} // namespace file_io


// ================================================================
// seq_io：FASTA/FASTQ 读取（kseq + zlib，.gz 透明）与 FASTA 写出
// ================================================================
namespace seq_io
{
    struct SeqRecord
    {
        std::string id;     // header 第一个空白前的部分
        std::string desc;   // header 其余部分
        std::string seq;
    };

    // 互补碱基表：大小写保持，未知字符统一为 N
    constexpr std::array<std::uint8_t, 256> makeComplementTable()
    {
        std::array<std::uint8_t, 256> table{};

        for (std::size_t i = 0; i < table.size(); ++i) {
            table[i] = static_cast<std::uint8_t>('N');
        }

        table[static_cast<unsigned char>('A')] = 'T';
        table[static_cast<unsigned char>('C')] = 'G';
        table[static_cast<unsigned char>('G')] = 'C';
        table[static_cast<unsigned char>('T')] = 'A';
        table[static_cast<unsigned char>('U')] = 'A';
        table[static_cast<unsigned char>('a')] = 't';
        table[static_cast<unsigned char>('c')] = 'g';
        table[static_cast<unsigned char>('g')] = 'c';
        table[static_cast<unsigned char>('t')] = 'a';
        table[static_cast<unsigned char>('u')] = 'a';
        table[static_cast<unsigned char>('n')] = 'n';
        table[static_cast<unsigned char>('-')] = '-';

        return table;
    }

    inline constexpr auto complement_table = makeComplementTable();

    // 原地反向互补（负链 NUMT 片段输出用）
    inline void reverseComplement(std::string& seq)
    {
        std::size_t i = 0;
        std::size_t j = seq.size();
        while (i < j) {
            --j;
            const char a = static_cast<char>(complement_table[static_cast<unsigned char>(seq[i])]);
            const char b = static_cast<char>(complement_table[static_cast<unsigned char>(seq[j])]);
            seq[i] = b;
            seq[j] = a;
            ++i;
        }
    }

    // 顺序读取；组装文件可能是 GB 级的 .fa.gz，只保留当前记录
    class KseqReader
    {
    public:
        explicit KseqReader(const FilePath& file_path);
        ~KseqReader();

        KseqReader(const KseqReader&) = delete;
        KseqReader& operator=(const KseqReader&) = delete;

        KseqReader(KseqReader&&) noexcept;
        KseqReader& operator=(KseqReader&&) noexcept;

        // 读到记录返回 true，EOF 返回 false，格式错误抛出异常
        bool next(SeqRecord& rec);

        // 已读出的记录数
        std::size_t count() const { return count_; }

    private:
        struct Impl;
        std::unique_ptr<Impl> impl_;
        std::size_t count_{0};
    };

    // FASTA 写出：记录先拼进缓冲区，超过阈值再写到底层流
    class SeqWriter
    {
    public:
        explicit SeqWriter(const FilePath& file_path, std::size_t line_width = 80);
        ~SeqWriter();

        SeqWriter(const SeqWriter&) = delete;
        SeqWriter& operator=(const SeqWriter&) = delete;

        void writeFasta(const SeqRecord& rec);

        // 显式 flush 才能感知写入错误；析构只做 best-effort
        void flush();

        std::size_t written() const { return written_; }

    private:
        static constexpr std::size_t kFlushBytes = 4ULL << 20;

        FilePath path_;
        std::ofstream out_;
        std::size_t line_width_{80};
        std::string buffer_;
        std::size_t written_{0};

        void drain_();
    };

} // namespace seq_io


// ================================================================
// cmd：外部命令模板展开与执行（Linux / sh）
// ================================================================
namespace cmd
{
    // 占位符表：键为不带花括号的名字（例如 "input" 对应模板中的 {input}）
    using Placeholders = std::map<std::string, std::string>;

    struct BuildOptions
    {
        bool quiet = true;          // 丢弃工具自身的 stdout/stderr 输出
        bool close_stdin = true;    // 追加 "< /dev/null"
        std::vector<std::string> required{"input", "output"};
    };

    // 返回模板中缺失的占位符名字（保持 required 的顺序）
    std::vector<std::string> missingPlaceholders(std::string_view cmd_template,
                                                 const std::vector<std::string>& required);

    // 展开模板：
    // - 缺少 required 中任一占位符时抛出 std::runtime_error；
    // - values 中没有的 {name} 保持原样；
    // - quiet：模板里已有 '>' 时只追加 "2>/dev/null"，否则追加 "> /dev/null 2>&1"。
    std::string buildCommand(std::string_view cmd_template,
                             const Placeholders& values,
                             const BuildOptions& opt = BuildOptions{});

    // 通过 sh 执行：正常退出返回 exit code；被信号终止返回 128 + signo；system() 失败返回 -1
    int runCommand(const std::string& command);

} // namespace cmd

#endif //NUMTFINDER_UTILS_H
