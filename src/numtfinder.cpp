#include <config.hpp>
#include <utils.h>

#include "pipeline.h"

// 程序入口（main）：
// 1) 解析命令行参数（CLI11）并绑定到 Options；
// 2) 打印并校验参数（输入文件存在性、数值范围、搜索命令模板）；
// 3) 准备输出目录，并把日志同时写到 outdir/numtfinder.log；
// 4) 运行 pipeline::runNumtFinder：mtDNA 加倍 -> 外部搜索 -> 片段/ block / 覆盖度 -> 写出结果。
// 所有输入/配置错误都以异常形式传到这里，记录后返回 1。

int main(int argc, char** argv) {
    try
    {
        spdlog::init_thread_pool(8192, 1);
        setupLogger();

        Options opt;
        CLI::App app{"numtfinder: find nuclear-mitochondrial DNA fragments (NUMTs) in a genome assembly"};

        setupCli(app, opt);

        // CLI11 的解析必须在 main 中进行，以便直接处理 argc/argv
        CLI11_PARSE(app, argc, argv);

        spdlog::info("Starting numtfinder {}...", VERSION);
        spdlog::info("Command line: {}", getCommandLine(argc, argv));
        logParsedOptions(opt);

        checkOptions(opt);

        // 输出目录准备好之后再把日志写入文件
        file_io::ensureDirectoryExists(opt.outdir, "output directory");
        setupLoggerWithFile(opt.outdir);

        pipeline::runNumtFinder(opt);

        spdlog::info("numtfinder End!");
        spdlog::shutdown();
        return 0;
    } catch (const std::exception &e) {
        spdlog::error("Fatal error: {}", e.what());
        spdlog::error("numtfinder End!");
        spdlog::shutdown();
        return 1;
    }
}
