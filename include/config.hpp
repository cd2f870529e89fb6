#ifndef CONFIG_HPP
#define CONFIG_HPP

// ------------------------------------------------------------------
// config.hpp
// 说明（详细中文注释）
//
// 本文件集中定义了全局配置常量、运行参数结构体 Options、日志初始化函数、以及与命令行解析（CLI11）
// 相关的辅助类型与工具（例如自定义格式器与 validator）。
//
// 目的：
// - 为项目提供单一入口的“配置库”，便于在代码各处引用一致的符号（输出文件后缀、默认搜索命令模板、日志文件名等）；
// - 提供便捷的日志初始化函数 `setupLogger` / `setupLoggerWithFile`，方便在 main 中统一配置日志输出到控制台与文件；
// - 提供 CLI 美化与输入修剪（trim_whitespace），提高命令行体验与容错性。
//
// 注意事项：
// - 默认搜索命令模板（DEFAULT_SEARCH_CMD）假定 BLAST+ 的 blastn 已在 PATH 中；
//   用户可通过 --search-cmd 替换为任意能输出 BLAST tabular（-outfmt 6）的工具。
// - 所有文件名常量均为后缀，使用时与 outdir / basefile 拼接。
// ------------------------------------------------------------------

#include <CLI/CLI.hpp>                       // CLI11 命令行解析库
#include "spdlog/spdlog.h"                       // spdlog 主头文件
#include "spdlog/sinks/stdout_color_sinks.h"     // 控制台彩色输出 sink
#include "spdlog/sinks/basic_file_sink.h"        // 文件输出 sink
#include "spdlog/async.h"                        // 异步日志支持

#include <filesystem>
#include <chrono>
#include <memory>
#include <cstdint>
#include <string>
#include <vector>

// ------------------------------------------------------------------
// 通用配置常量
// ------------------------------------------------------------------
#define VERSION "0.1.0"                   // 版本号，程序启动时可打印以便追踪
#define LOGGER_NAME "logger"              // 默认日志器名称（用于 spdlog 注册）
#define LOGGER_FILE "numtfinder.log"      // 默认日志文件名（相对于输出目录）

// 默认搜索命令模板：{input}=双倍长 mtDNA query，{db}=基因组组装，{output}=命中表，{evalue}=blaste
const std::string DEFAULT_SEARCH_CMD =
    "blastn -task blastn -query {input} -subject {db} -evalue {evalue} -outfmt 6 > {output}";

// 输出文件后缀（相对于 outdir/basefile）
const std::string SUFFIX_MT2X = "2X.fasta";                 // 双倍长 mtDNA（接在 mtDNA 文件名 basename 后）
const std::string SUFFIX_SEARCH = ".numtsearch.blast.tsv";  // 外部搜索输出的命中表
const std::string SUFFIX_FRAG_TSV = ".numtfrag.tsv";        // NUMT 片段表
const std::string SUFFIX_BLOCK_TSV = ".numtblock.tsv";      // NUMT block 表
const std::string SUFFIX_SELFHIT_TSV = ".selfhits.tsv";     // 自身命中（mtDNA 拷贝）报告
const std::string SUFFIX_EXCLUDE = ".exclude.txt";          // 最终排除序列列表
const std::string SUFFIX_COV_JSON = ".mtcoverage.json";     // mtDNA 覆盖深度（JSON）
const std::string SUFFIX_COV_TSV = ".mtcoverage.tsv";       // mtDNA 覆盖深度（TSV，供绘图）
const std::string SUFFIX_FRAG_FASTA = ".numtfrag.fasta";    // 片段序列
const std::string SUFFIX_BLOCK_FASTA = ".numtblock.fasta";  // block 区域序列

// ------------------------------------------------------------------
// 调试与整数精度配置
// ------------------------------------------------------------------
#ifndef DEBUG
#define DEBUG 0
#endif

// 基因组坐标默认使用 64 位：部分植物染色体长度超过 2^31
#ifndef M64
#define M64 1
#endif

#if M64
typedef int64_t	int_t;
#else
typedef int32_t int_t;
#endif

// ------------------------------------------------------------------
// Options：命令行参数绑定的运行配置
// 字段默认值即为 CLI 的默认值；setupCli 负责把每个字段注册为一个选项。
// ------------------------------------------------------------------
struct Options
{
    // 输入输出
    std::string seqin;                         // 基因组组装 FASTA（可为 .gz）
    std::string mtdna;                         // mtDNA 参考 FASTA
    std::string outdir = ".";                  // 输出目录
    std::string basefile = "numtfinder";       // 输出文件前缀
    std::string hits;                          // 预先计算好的命中表（BLAST -outfmt 6）；为空则运行 search_cmd
    std::string search_cmd;                    // 搜索命令模板；为空使用 DEFAULT_SEARCH_CMD
    int threads = 1;                           // 传给外部搜索的线程数（{thread}）

    // 搜索与片段
    bool circle = true;                        // mtDNA 是否为环状
    double blaste = 1e-4;                      // E-value 上限
    int_t minfraglen = 0;                      // 片段最小比对长度

    // block 合并
    int_t fragmerge = 8000;                    // 合并相邻片段的最大间隔（bp）
    bool stranded = false;                     // 是否只合并同链片段

    // 自身命中过滤
    double mtmaxcov = 99.0;                    // 覆盖度阈值（%）
    double mtmaxid = 99.0;                     // 一致性阈值（%）
    bool mtmaxexclude = true;                  // 是否自动把自身命中序列加入排除列表
    std::vector<std::string> exclude;          // 用户显式给出的排除序列

    // 序列输出
    bool fragfas = false;                      // 输出片段 FASTA
    bool fragrevcomp = true;                   // 负链片段反向互补
    bool blockfas = true;                      // 输出 block 区域 FASTA（正链）
    std::string fasdir = "numtfasta";          // FASTA 输出目录（相对 outdir）

    // 运行控制
    bool keepblast = true;                     // 是否保留搜索输出
    bool force = false;                        // 忽略已有的中间文件并重新生成
};

// ------------------------------------------------------------------
// CLI11 帮助输出：选项后附带类型与默认值，usage 给出两种典型用法
// ------------------------------------------------------------------
class CustomFormatter : public CLI::Formatter {
public:
	CustomFormatter() : Formatter() { column_width(36); }

	std::string make_option_opts(const CLI::Option* opt) const override {
		if (opt->get_type_size() == 0) return "";
		std::string out = " " + opt->get_type_name();
		if (!opt->get_default_str().empty()) out += " [" + opt->get_default_str() + "]";
		if (opt->get_required()) out += " (required)";
		return out;
	}

	std::string make_usage(const CLI::App*, std::string) const override {
		return "Usage:\n"
		       "  numtfinder -i <assembly.fa[.gz]> -m <mtdna.fa> [-o outdir] [-b basefile] [options]\n\n"
		       "Examples:\n"
		       "  # run blastn and merge fragments within 8 kb\n"
		       "  numtfinder -i genome.fa.gz -m mito.fa -o numt -b sample --fragmerge 8000\n"
		       "  # re-use an existing hit table (BLAST -outfmt 6, query MT2X vs assembly)\n"
		       "  numtfinder -i genome.fa -m mito.fa --hits sample.numtsearch.blast.tsv --stranded true\n\n";
	}
};

// ------------------------------------------------------------------
// CLI11 transform：去除参数两侧空白（复制粘贴的路径常带尾随空格）
// ------------------------------------------------------------------
inline std::string trimmed(const std::string& s) {
	const auto first = s.find_first_not_of(" \t\n\r");
	if (first == std::string::npos) return "";
	const auto last = s.find_last_not_of(" \t\n\r");
	return s.substr(first, last - first + 1);
}

inline CLI::Validator trim_whitespace = CLI::Validator(
	[](std::string& s) {
		s = trimmed(s);
		return std::string();
	}, "", "TRIM"
);

// 注册全部命令行选项（实现见 src/utils/options.cpp）
void setupCli(CLI::App& app, Options& opt);

// 打印解析后的参数，便于日志中复现运行
void logParsedOptions(const Options& opt);

// 校验参数取值范围与输入文件；非法时抛出 std::runtime_error
void checkOptions(const Options& opt);

// ------------------------------------------------------------------
// 日志：spdlog 异步日志器（调用前需 spdlog::init_thread_pool）
// - setupLogger()：仅控制台，用于参数解析阶段（此时输出目录尚未准备好）；
// - setupLoggerWithFile(dir)：控制台 + dir/numtfinder.log，替换之前的默认日志器。
// ------------------------------------------------------------------
inline void installLogger(std::vector<spdlog::sink_ptr> sinks) {
	auto logger = std::make_shared<spdlog::async_logger>(
		LOGGER_NAME, sinks.begin(), sinks.end(), spdlog::thread_pool(), spdlog::async_overflow_policy::block);
	spdlog::set_default_logger(logger);
#if DEBUG
	spdlog::set_level(spdlog::level::debug);
#else
	spdlog::set_level(spdlog::level::info);
#endif
	spdlog::flush_every(std::chrono::seconds(3));
}

inline spdlog::sink_ptr makeConsoleSink() {
	auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
	sink->set_pattern("%^[%Y-%m-%d %H:%M:%S.%e] [%l] %v%$");
	return sink;
}

inline void setupLogger() {
	installLogger({ makeConsoleSink() });
}

inline void setupLoggerWithFile(const std::filesystem::path& log_dir) {
	const std::filesystem::path log_file = log_dir / LOGGER_FILE;
	auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string(), true);
	file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
	installLogger({ makeConsoleSink(), file_sink });
}

// 重建命令行字符串写入日志；含空白的参数加引号，便于直接复制重跑
inline std::string getCommandLine(int argc, char** argv) {
	std::string line;
	for (int i = 0; i < argc; ++i) {
		const std::string arg = argv[i];
		if (i > 0) line += ' ';
		if (arg.find_first_of(" \t") != std::string::npos) line += "'" + arg + "'";
		else line += arg;
	}
	return line;
}

#endif // CONFIG_HPP
