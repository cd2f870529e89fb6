// 片段 / block 序列输出。
// 组装文件可能是 GB 级，且片段数通常远少于序列数：只顺序读取一遍，
// 先按序列名把需要输出的片段与 block 分组，读到对应序列时再截取写出。

#include "report.h"

#include <map>
#include <memory>
#include <stdexcept>

namespace report
{
    std::string extractRegion(const std::string& seq, int_t start, int_t end)
    {
        if (start < 1 || end < start || static_cast<std::size_t>(end) > seq.size()) {
            throw std::out_of_range("region " + std::to_string(start) + "-" + std::to_string(end) +
                                    " outside sequence of length " + std::to_string(seq.size()));
        }
        return seq.substr(static_cast<std::size_t>(start - 1), static_cast<std::size_t>(end - start + 1));
    }

    static std::string regionId(const std::string& seq_name, int_t start, int_t end)
    {
        return seq_name + "." + std::to_string(start) + "-" + std::to_string(end);
    }

    seq_io::SeqRecord fragmentRecord(const fragment::Fragment& f, const std::string& seq, bool revcomp)
    {
        seq_io::SeqRecord rec;
        rec.id = regionId(f.seq_name, f.start, f.end);
        rec.desc = std::string(1, f.strand()) + " mt:" + std::to_string(f.ref.start.value) + "-" +
                   std::to_string(f.ref.end.value) + " frag:" + std::to_string(f.frag_num);
        rec.seq = extractRegion(seq, f.start, f.end);
        if (revcomp && f.is_rev) {
            seq_io::reverseComplement(rec.seq);
        }
        return rec;
    }

    seq_io::SeqRecord blockRecord(const block::Block& b, std::size_t block_num, const std::string& seq)
    {
        seq_io::SeqRecord rec;
        rec.id = regionId(b.seq_name, b.start, b.end);
        rec.desc = std::string(block::toString(b.strand)) + " frags:" + std::to_string(b.fragCount()) +
                   " block:" + std::to_string(block_num);
        rec.seq = extractRegion(seq, b.start, b.end);
        return rec;
    }

    ExportStats exportSequences(const FilePath& assembly,
                                const fragment::FragmentTable& frags,
                                const block::Blocks& blocks,
                                const ExportParams& params,
                                const FilePath& frag_fasta,
                                const FilePath& block_fasta)
    {
        ExportStats stats;
        if (!params.fragfas && !params.blockfas) return stats;

        std::map<std::string, std::vector<const fragment::Fragment*>> frags_by_seq;
        std::map<std::string, std::vector<std::size_t>> blocks_by_seq;
        if (params.fragfas) {
            for (const auto& f : frags) frags_by_seq[f.seq_name].push_back(&f);
        }
        if (params.blockfas) {
            for (std::size_t i = 0; i < blocks.size(); ++i) blocks_by_seq[blocks[i].seq_name].push_back(i);
        }

        std::unique_ptr<seq_io::SeqWriter> frag_writer;
        std::unique_ptr<seq_io::SeqWriter> block_writer;
        if (params.fragfas) {
            file_io::ensureParentDirExists(frag_fasta);
            frag_writer = std::make_unique<seq_io::SeqWriter>(frag_fasta);
        }
        if (params.blockfas) {
            file_io::ensureParentDirExists(block_fasta);
            block_writer = std::make_unique<seq_io::SeqWriter>(block_fasta);
        }

        std::size_t pending = frags_by_seq.size() + blocks_by_seq.size();
        seq_io::KseqReader reader(assembly);
        seq_io::SeqRecord rec;
        while (pending > 0 && reader.next(rec)) {
            auto fit = frags_by_seq.find(rec.id);
            auto bit = blocks_by_seq.find(rec.id);
            if (fit == frags_by_seq.end() && bit == blocks_by_seq.end()) continue;

            try {
                if (fit != frags_by_seq.end()) {
                    for (const auto* f : fit->second) {
                        frag_writer->writeFasta(fragmentRecord(*f, rec.seq, params.fragrevcomp));
                        ++stats.fragments;
                    }
                    frags_by_seq.erase(fit);
                    --pending;
                }
                if (bit != blocks_by_seq.end()) {
                    for (const auto i : bit->second) {
                        block_writer->writeFasta(blockRecord(blocks[i], i + 1, rec.seq));
                        ++stats.blocks;
                    }
                    blocks_by_seq.erase(bit);
                    --pending;
                }
            } catch (const std::out_of_range& e) {
                throw std::runtime_error("assembly sequence " + rec.id + " in " + assembly.string() +
                                         " is inconsistent with the hit table: " + e.what());
            }
        }

        // 剩余的序列名在组装中不存在
        if (!frags_by_seq.empty() || !blocks_by_seq.empty()) {
            const std::string missing = !frags_by_seq.empty() ? frags_by_seq.begin()->first
                                                              : blocks_by_seq.begin()->first;
            throw std::runtime_error("sequence " + missing + " from the hit table was not found in assembly " +
                                     assembly.string());
        }

        if (frag_writer) {
            frag_writer->flush();
            spdlog::info("Output {} NUMT fragment sequences to {}", stats.fragments, frag_fasta.string());
        }
        if (block_writer) {
            block_writer->flush();
            spdlog::info("Output {} NUMT block sequences to {}", stats.blocks, block_fasta.string());
        }
        return stats;
    }

} // namespace report
