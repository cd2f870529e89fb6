#include "pipeline.h"

#include <chrono>
#include <stdexcept>

#include "mtdna.h"
#include "report.h"
#include "search.h"

namespace pipeline
{
    // 记录单个阶段耗时
    class StageTimer
    {
    public:
        explicit StageTimer(std::string name)
            : name_(std::move(name)), t0_(std::chrono::steady_clock::now())
        {}

        ~StageTimer()
        {
            const auto t1 = std::chrono::steady_clock::now();
            spdlog::debug("{} took {:.3f}s", name_, std::chrono::duration<double>(t1 - t0_).count());
        }

    private:
        std::string name_;
        std::chrono::steady_clock::time_point t0_;
    };

    CoreResult processHits(hits::AlignmentHits hits,
                           const coords::RefSpace& space,
                           const CoreParams& params,
                           const std::string& ref_id)
    {
        CoreResult res;
        res.hits_in = hits.size();

        hits = hits::filterHits(std::move(hits), params.filter);
        res.hits_filtered = hits.size();

        hits = fragment::uniquifyHits(std::move(hits));
        res.hits_unique = hits.size();

        fragment::FragmentTable frags = fragment::projectHits(std::move(hits), space);

        selfhit::SelfHitResult sh = selfhit::filterSelfHits(std::move(frags), space, params.selfhit, params.exclude);
        res.selfhits = std::move(sh.reports);
        res.exclusion = std::move(sh.exclusion);

        frags = fragment::numberFragments(std::move(sh.fragments));
        if (frags.empty()) {
            spdlog::warn("No NUMT fragments remain after filtering");
        }

        res.blocks = block::mergeBlocks(frags, params.merge);
        res.fragments = block::assignBlocks(std::move(frags), res.blocks);
        res.coverage = coverage::aggregateCoverage(res.fragments, space, ref_id);
        return res;
    }

    CoreParams makeCoreParams(const Options& opt)
    {
        CoreParams p;
        p.filter.max_expect = opt.blaste;
        p.filter.min_length = opt.minfraglen;
        p.selfhit.min_coverage = opt.mtmaxcov;
        p.selfhit.min_identity = opt.mtmaxid;
        p.selfhit.auto_exclude = opt.mtmaxexclude;
        p.merge.fragmerge = opt.fragmerge;
        p.merge.stranded = opt.stranded;
        p.exclude.insert(opt.exclude.begin(), opt.exclude.end());
        return p;
    }

    FilePath outputPath(const Options& opt, const std::string& suffix)
    {
        return FilePath(opt.outdir) / (opt.basefile + suffix);
    }

    CoreResult runNumtFinder(const Options& opt)
    {
        const FilePath outdir(opt.outdir);
        file_io::ensureDirectoryExists(outdir, "output directory");

        // ---------------- mtDNA 参考与加倍 ----------------
        mtdna::Reference ref = mtdna::loadReference(opt.mtdna, opt.circle);
        const coords::RefSpace space = ref.space();

        // ---------------- 外部搜索或读取已有命中表 ----------------
        FilePath hit_table;
        bool searched = false;
        if (!opt.hits.empty()) {
            hit_table = opt.hits;
            spdlog::info("Using pre-computed hit table {}", hit_table.string());
        } else {
            StageTimer timer("NUMT search");
            search::SearchParams sp;
            sp.query = mtdna::writeSearchQuery(ref, opt.mtdna, outdir, opt.force);
            sp.db = opt.seqin;
            sp.output = outputPath(opt, SUFFIX_SEARCH);
            sp.cmd_template = opt.search_cmd;
            sp.threads = opt.threads;
            sp.evalue = opt.blaste;
            sp.force = opt.force;
            hit_table = search::runSearch(sp);
            searched = true;
        }

        hits::AlignmentHits hits = hits::readBlastTable(hit_table);
        hits = hits::keepQueries(std::move(hits), mtdna::queryNames(ref));

        // ---------------- 片段 / block / 覆盖度 ----------------
        CoreResult res;
        {
            StageTimer timer("NUMT fragment processing");
            res = processHits(std::move(hits), space, makeCoreParams(opt), ref.id());
        }

        // ---------------- 写出结果 ----------------
        report::writeFragmentTable(outputPath(opt, SUFFIX_FRAG_TSV), res.fragments);
        report::writeBlockTable(outputPath(opt, SUFFIX_BLOCK_TSV), res.blocks);
        report::writeSelfHitTable(outputPath(opt, SUFFIX_SELFHIT_TSV), res.selfhits);
        report::writeExclusionList(outputPath(opt, SUFFIX_EXCLUDE), res.exclusion);
        report::writeCoverageJson(outputPath(opt, SUFFIX_COV_JSON), res.coverage);
        report::writeCoverageTsv(outputPath(opt, SUFFIX_COV_TSV), res.coverage);

        // ---------------- 序列输出 ----------------
        report::ExportParams ep;
        ep.fragfas = opt.fragfas;
        ep.fragrevcomp = opt.fragrevcomp;
        ep.blockfas = opt.blockfas;
        if (ep.fragfas || ep.blockfas) {
            StageTimer timer("NUMT sequence output");
            const FilePath fasdir = outdir / opt.fasdir;
            file_io::ensureDirectoryExists(fasdir, "fasta output directory");
            report::exportSequences(opt.seqin, res.fragments, res.blocks, ep,
                                    fasdir / (opt.basefile + SUFFIX_FRAG_FASTA),
                                    fasdir / (opt.basefile + SUFFIX_BLOCK_FASTA));
        }

        if (searched && !opt.keepblast) {
            if (file_io::removeFile(hit_table)) {
                spdlog::info("Removed NUMT search output {} (keepblast=false)", hit_table.string());
            }
        }

        spdlog::info("NUMT search complete: {} hits -> {} fragments -> {} blocks; {} sequences excluded",
                     res.hits_in, res.fragments.size(), res.blocks.size(), res.exclusion.size());
        return res;
    }

} // namespace pipeline
