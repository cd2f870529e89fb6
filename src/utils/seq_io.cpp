// FASTA/FASTQ 读取基于 kseq + zlib，写出使用自建缓冲的 SeqWriter。
// 基因组组装通常是 GB 级的 .fa/.fa.gz，读端通过 gzbuffer 放大 zlib 内部缓冲以减少系统调用。

#include "utils.h"

#include <zlib.h>
#include "kseq.h"

// gzFile + gzread：普通文本与 .gz 输入对上层透明
KSEQ_INIT(gzFile, gzread)

namespace seq_io
{
    // 释放顺序：先 kseq_destroy 再 gzclose
    struct KseqReader::Impl
    {
        gzFile fp{nullptr};
        kseq_t* seq{nullptr};
        FilePath file_path;

        explicit Impl(const FilePath& p) : file_path(p)
        {
            fp = gzopen(p.string().c_str(), "rb");
            if (!fp) {
                throw std::runtime_error("failed to open sequence file: " + p.string());
            }
            // 8 MiB；gzbuffer 失败只影响吞吐
            gzbuffer(fp, 8U << 20);

            seq = kseq_init(fp);
            if (!seq) {
                gzclose(fp);
                throw std::runtime_error("failed to init kseq for: " + p.string());
            }
        }

        ~Impl()
        {
            kseq_destroy(seq);
            gzclose(fp);
        }

        Impl(const Impl&) = delete;
        Impl& operator=(const Impl&) = delete;
    };

    static void assignKstring(std::string& dst, const kstring_t& ks)
    {
        if (ks.s && ks.l > 0) dst.assign(ks.s, ks.l);
        else dst.clear();
    }

    KseqReader::KseqReader(const FilePath& file_path)
        : impl_(std::make_unique<Impl>(file_path))
    {}

    KseqReader::~KseqReader() = default;
    KseqReader::KseqReader(KseqReader&&) noexcept = default;
    KseqReader& KseqReader::operator=(KseqReader&&) noexcept = default;

    bool KseqReader::next(SeqRecord& rec)
    {
        if (!impl_) {
            throw std::runtime_error("KseqReader used after move");
        }

        // kseq_read: >= 0 成功；-1 EOF；-2 质量串截断；-3 gz 读取错误
        const int ret = kseq_read(impl_->seq);
        if (ret == -1) {
            return false;
        }
        if (ret < -1) {
            throw std::runtime_error("malformed sequence record #" + std::to_string(count_ + 1) + " (kseq code " +
                                     std::to_string(ret) + ") in " + impl_->file_path.string());
        }

        assignKstring(rec.id,   impl_->seq->name);
        assignKstring(rec.desc, impl_->seq->comment);
        assignKstring(rec.seq,  impl_->seq->seq);
        ++count_;
        return true;
    }

    // ------------------------- SeqWriter -------------------------

    SeqWriter::SeqWriter(const FilePath& file_path, std::size_t line_width)
        : path_(file_path),
          out_(file_path, std::ios::binary | std::ios::trunc),
          line_width_(line_width == 0 ? 80 : line_width)
    {
        if (!out_) {
            throw std::runtime_error("failed to open FASTA output: " + file_path.string());
        }
        buffer_.reserve(kFlushBytes + 4096);
    }

    SeqWriter::~SeqWriter()
    {
        if (out_ && !buffer_.empty()) {
            out_.write(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
        }
    }

    void SeqWriter::drain_()
    {
        out_.write(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
        buffer_.clear();
        if (!out_) {
            throw std::runtime_error("failed to write FASTA output: " + path_.string());
        }
    }

    // >{id}[ {desc}]，序列按 line_width 换行；空序列写一个空行
    void SeqWriter::writeFasta(const SeqRecord& rec)
    {
        buffer_ += '>';
        buffer_ += rec.id;
        if (!rec.desc.empty()) {
            buffer_ += ' ';
            buffer_ += rec.desc;
        }
        buffer_ += '\n';

        if (rec.seq.empty()) {
            buffer_ += '\n';
        }
        for (std::size_t i = 0; i < rec.seq.size(); i += line_width_) {
            buffer_.append(rec.seq, i, line_width_);
            buffer_ += '\n';
        }

        ++written_;
        if (buffer_.size() >= kFlushBytes) {
            drain_();
        }
    }

    void SeqWriter::flush()
    {
        drain_();
        out_.flush();
        if (!out_) {
            throw std::runtime_error("failed to flush FASTA output: " + path_.string());
        }
    }

} // namespace seq_io
