#include "mtdna.h"

#include <stdexcept>

namespace mtdna
{
    coords::RefSpace Reference::space() const
    {
        return circular ? coords::RefSpace::circular(length()) : coords::RefSpace::linear(length());
    }

    Reference loadReference(const FilePath& path, bool circular)
    {
        file_io::requireRegularFile(path, "mtDNA reference");

        Reference ref;
        ref.circular = circular;

        seq_io::KseqReader reader(path);
        seq_io::SeqRecord rec;
        if (reader.next(rec)) {
            ref.record = std::move(rec);
            // 其余记录只计数
            while (reader.next(rec)) {}
        }
        ref.num_seqs = reader.count();

        if (ref.num_seqs == 0) {
            throw std::runtime_error("failed to load sequences from mtDNA reference: " + path.string());
        }
        if (ref.record.seq.empty()) {
            throw std::runtime_error("mtDNA reference sequence " + ref.record.id + " has zero length: " + path.string());
        }
        if (ref.num_seqs > 1) {
            if (circular) {
                spdlog::warn("{} sequences loaded from {} with circular mtDNA: will use first sequence ({}) only",
                             ref.num_seqs, path.string(), ref.record.id);
            } else {
                spdlog::warn("{} sequences loaded from {}: hits are projected onto the first sequence ({}) only",
                             ref.num_seqs, path.string(), ref.record.id);
            }
        }

        spdlog::info("Mitochondrial DNA {}: length {} bp ({})", ref.id(), ref.length(),
                     circular ? "circular" : "linear");
        return ref;
    }

    seq_io::SeqRecord circularize(const seq_io::SeqRecord& rec)
    {
        seq_io::SeqRecord out;
        out.id = rec.id + "2X";
        out.seq.reserve(rec.seq.size() * 2);
        out.seq.append(rec.seq);
        out.seq.append(rec.seq);
        return out;
    }

    FilePath doubledQueryPath(const FilePath& mtdna_path, const FilePath& outdir)
    {
        // mito.fa.gz -> mito2X.fasta
        return outdir / (file_io::fastaStem(mtdna_path) + SUFFIX_MT2X);
    }

    FilePath writeSearchQuery(const Reference& ref,
                              const FilePath& mtdna_path,
                              const FilePath& outdir,
                              bool force)
    {
        if (!ref.circular) {
            spdlog::info("Using mtDNA input {} for mtDNA query (linear)", mtdna_path.string());
            return mtdna_path;
        }

        const FilePath mt2x = doubledQueryPath(mtdna_path, outdir);
        if (std::filesystem::exists(mt2x) && !force) {
            spdlog::info("Using existing {} file for mtDNA query (force=false)", mt2x.string());
            return mt2x;
        }

        file_io::ensureParentDirExists(mt2x);
        {
            seq_io::SeqWriter writer(mt2x);
            writer.writeFasta(circularize(ref.record));
            writer.flush();
        }
        spdlog::info("Output double sequence to {} for mtDNA query (circular)", mt2x.string());
        return mt2x;
    }

    std::vector<std::string> queryNames(const Reference& ref)
    {
        return {ref.id(), ref.id() + "2X"};
    }

} // namespace mtdna
