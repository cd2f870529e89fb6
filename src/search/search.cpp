#include "search.h"

#include <chrono>
#include <sstream>
#include <stdexcept>

namespace search
{
    static std::string formatEvalue(double e)
    {
        std::ostringstream oss;
        oss << e;
        return oss.str();
    }

    std::string buildSearchCommand(const SearchParams& params)
    {
        const std::string tmpl = params.cmd_template.empty() ? DEFAULT_SEARCH_CMD : params.cmd_template;

        cmd::Placeholders values;
        values["input"] = params.query.string();
        values["db"] = params.db.string();
        values["output"] = params.output.string();
        values["thread"] = std::to_string(params.threads);
        values["evalue"] = formatEvalue(params.evalue);

        cmd::BuildOptions bo;
        bo.required = {"input", "db", "output"};
        return cmd::buildCommand(tmpl, values, bo);
    }

    FilePath runSearch(const SearchParams& params)
    {
        file_io::requireRegularFile(params.query, "mtDNA query");
        file_io::requireRegularFile(params.db, "genome assembly");

        if (!params.force && file_io::hasContent(params.output)) {
            spdlog::info("NUMT search results found ({}); will re-use (force=false)", params.output.string());
            return params.output;
        }

        file_io::ensureParentDirExists(params.output);
        const std::string command = buildSearchCommand(params);
        spdlog::info("Running NUMT search: {}", command);

        const auto t0 = std::chrono::steady_clock::now();
        const int rc = cmd::runCommand(command);
        const auto t1 = std::chrono::steady_clock::now();

        if (rc != 0) {
            throw std::runtime_error("NUMT search command failed with exit code " + std::to_string(rc) +
                                     ": " + command);
        }
        file_io::requireExists(params.output, "NUMT search output");

        spdlog::info("NUMT search finished in {:.1f}s: {}",
                     std::chrono::duration<double>(t1 - t0).count(), params.output.string());
        return params.output;
    }

} // namespace search
