#include "config.hpp"
#include "utils.h"

#include <stdexcept>

// 命令行选项注册、打印与校验。
// 选项名沿用原始工具（seqin/mtdna/fragmerge/mtmaxcov 等），布尔选项接受 true/false 取值，
// 例如 --circle false、--keepblast false。

void setupCli(CLI::App& app, Options& opt)
{
    app.formatter(std::make_shared<CustomFormatter>());
    app.set_version_flag("-v,--version", std::string("numtfinder ") + VERSION);

    // ---------------- 输入输出 ----------------
    app.add_option("-i,--seqin", opt.seqin, "Genome assembly FASTA to search for NUMTs (plain or .gz)")
        ->required()->transform(trim_whitespace);
    app.add_option("-m,--mtdna", opt.mtdna, "Mitochondrial genome FASTA (first sequence is used)")
        ->required()->transform(trim_whitespace);
    app.add_option("-o,--outdir", opt.outdir, "Output directory")
        ->capture_default_str()->transform(trim_whitespace);
    app.add_option("-b,--basefile", opt.basefile, "Prefix for output files")
        ->capture_default_str()->transform(trim_whitespace);
    app.add_option("--hits", opt.hits, "Pre-computed hit table (BLAST -outfmt 6, mtDNA query vs assembly); skips the search")
        ->transform(trim_whitespace);
    app.add_option("--search-cmd", opt.search_cmd,
                   "Search command template with {input} {db} {output} and optional {thread} {evalue} placeholders")
        ->transform(trim_whitespace);
    app.add_option("-t,--threads", opt.threads, "Threads passed to the search command ({thread})")
        ->capture_default_str();

    // ---------------- 搜索与片段 ----------------
    app.add_option("--circle", opt.circle, "Whether the mtDNA is circular")->capture_default_str();
    app.add_option("--blaste", opt.blaste, "E-value cutoff for search hits")->capture_default_str();
    app.add_option("--minfraglen", opt.minfraglen, "Minimum aligned length for NUMT fragments")
        ->capture_default_str();

    // ---------------- block 合并 ----------------
    app.add_option("--fragmerge", opt.fragmerge, "Max gap (bp) for merging NUMT fragments into blocks")
        ->capture_default_str();
    app.add_option("--stranded", opt.stranded, "Only merge fragments on the same strand")->capture_default_str();

    // ---------------- 自身命中过滤 ----------------
    app.add_option("--mtmaxcov", opt.mtmaxcov, "Coverage (%) of mtDNA at which a sequence is treated as an mtDNA copy")
        ->capture_default_str();
    app.add_option("--mtmaxid", opt.mtmaxid, "Identity (%) at which a sequence is treated as an mtDNA copy")
        ->capture_default_str();
    app.add_option("--mtmaxexclude", opt.mtmaxexclude, "Add mtDNA copies to the exclusion list automatically")
        ->capture_default_str();
    app.add_option("--exclude", opt.exclude, "Assembly sequences to exclude from NUMT output (comma separated)")
        ->delimiter(',');

    // ---------------- 序列输出 ----------------
    app.add_option("--fragfas", opt.fragfas, "Output NUMT fragment sequences")->capture_default_str();
    app.add_option("--fragrevcomp", opt.fragrevcomp, "Reverse-complement minus-strand fragment sequences")
        ->capture_default_str();
    app.add_option("--blockfas", opt.blockfas, "Output NUMT block sequences (positive strand)")
        ->capture_default_str();
    app.add_option("--fasdir", opt.fasdir, "Directory (inside outdir) for fasta output")
        ->capture_default_str()->transform(trim_whitespace);

    // ---------------- 运行控制 ----------------
    app.add_option("--keepblast", opt.keepblast, "Keep the search output after processing")->capture_default_str();
    app.add_flag("-f,--force", opt.force, "Regenerate intermediate files even if they exist");
}

void logParsedOptions(const Options& opt)
{
    spdlog::info("Parsed options:");
    spdlog::info("  seqin        : {}", opt.seqin);
    spdlog::info("  mtdna        : {}", opt.mtdna);
    spdlog::info("  outdir       : {}", opt.outdir);
    spdlog::info("  basefile     : {}", opt.basefile);
    spdlog::info("  hits         : {}", opt.hits.empty() ? "(run search)" : opt.hits);
    spdlog::info("  search_cmd   : {}", opt.search_cmd.empty() ? DEFAULT_SEARCH_CMD : opt.search_cmd);
    spdlog::info("  threads      : {}", opt.threads);
    spdlog::info("  circle       : {}", opt.circle);
    spdlog::info("  blaste       : {:g}", opt.blaste);
    spdlog::info("  minfraglen   : {}", opt.minfraglen);
    spdlog::info("  fragmerge    : {}", opt.fragmerge);
    spdlog::info("  stranded     : {}", opt.stranded);
    spdlog::info("  mtmaxcov     : {}", opt.mtmaxcov);
    spdlog::info("  mtmaxid      : {}", opt.mtmaxid);
    spdlog::info("  mtmaxexclude : {}", opt.mtmaxexclude);
    spdlog::info("  exclude      : {} sequences", opt.exclude.size());
    spdlog::info("  fragfas      : {}", opt.fragfas);
    spdlog::info("  fragrevcomp  : {}", opt.fragrevcomp);
    spdlog::info("  blockfas     : {}", opt.blockfas);
    spdlog::info("  fasdir       : {}", opt.fasdir);
    spdlog::info("  keepblast    : {}", opt.keepblast);
    spdlog::info("  force        : {}", opt.force);
}

static void requirePercent(double v, const char* name)
{
    // 写成取反形式以拒绝 NaN
    if (!(v >= 0.0 && v <= 100.0)) {
        throw std::runtime_error(std::string(name) + " must be within [0, 100], got " + std::to_string(v));
    }
}

void checkOptions(const Options& opt)
{
    // 文件相关：统一调用 file_io
    file_io::requireRegularFile(opt.seqin, "seqin");
    file_io::requireRegularFile(opt.mtdna, "mtdna");
    if (!opt.hits.empty()) {
        file_io::requireRegularFile(opt.hits, "hits");
    }

    if (opt.outdir.empty()) throw std::runtime_error("outdir must not be empty");
    if (opt.basefile.empty()) throw std::runtime_error("basefile must not be empty");
    if ((opt.fragfas || opt.blockfas) && opt.fasdir.empty()) {
        throw std::runtime_error("fasdir must not be empty when fasta output is enabled");
    }

    // 数值参数
    if (opt.threads <= 0) throw std::runtime_error("threads must be > 0");
    if (!(opt.blaste > 0.0)) throw std::runtime_error("blaste must be > 0");
    if (opt.minfraglen < 0) throw std::runtime_error("minfraglen must be >= 0");
    if (opt.fragmerge < 0) throw std::runtime_error("fragmerge must be >= 0");
    requirePercent(opt.mtmaxcov, "mtmaxcov");
    requirePercent(opt.mtmaxid, "mtmaxid");

    // 搜索命令模板只在需要运行搜索时检查
    if (opt.hits.empty() && !opt.search_cmd.empty()) {
        const auto missing = cmd::missingPlaceholders(opt.search_cmd, {"input", "db", "output"});
        if (!missing.empty()) {
            throw std::runtime_error("search_cmd template missing {" + missing.front() + "}");
        }
    }

    if (!opt.mtmaxexclude && opt.exclude.empty()) {
        spdlog::warn("mtmaxexclude=false: mtDNA copies in the assembly will be reported as NUMTs");
    }
}
