#include "hits.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace hits
{
    // 按 TAB 切分（不合并连续分隔符：空字段也算一列，便于发现截断的行）
    static std::vector<std::string_view> splitTabs(std::string_view line)
    {
        std::vector<std::string_view> fields;
        std::size_t pos = 0;
        while (true) {
            const std::size_t next = line.find('\t', pos);
            if (next == std::string_view::npos) {
                fields.push_back(line.substr(pos));
                break;
            }
            fields.push_back(line.substr(pos, next - pos));
            pos = next + 1;
        }
        return fields;
    }

    static int_t parseInt(std::string_view s, const char* field)
    {
        int_t v = 0;
        const auto res = std::from_chars(s.data(), s.data() + s.size(), v);
        if (res.ec != std::errc() || res.ptr != s.data() + s.size()) {
            throw std::invalid_argument(std::string("invalid integer in column ") + field + ": '" +
                                        std::string(s) + "'");
        }
        return v;
    }

    // from_chars(double) 在部分标准库实现中缺失，这里使用 stod 并检查是否完整消费
    static double parseDouble(std::string_view s, const char* field)
    {
        const std::string tmp(s);
        std::size_t used = 0;
        double v = 0.0;
        try {
            v = std::stod(tmp, &used);
        } catch (const std::exception&) {
            used = 0;
        }
        if (tmp.empty() || used != tmp.size()) {
            throw std::invalid_argument(std::string("invalid number in column ") + field + ": '" + tmp + "'");
        }
        return v;
    }

    AlignmentHit parseBlastLine(std::string_view line, std::size_t hit_index)
    {
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

        const auto f = splitTabs(line);
        if (f.size() < 12) {
            throw std::invalid_argument("expected 12 tab-separated columns, got " + std::to_string(f.size()));
        }

        AlignmentHit h;
        h.hit_index = hit_index;
        h.query_name = std::string(f[0]);
        h.seq_name = std::string(f[1]);
        if (h.query_name.empty() || h.seq_name.empty()) {
            throw std::invalid_argument("empty query or subject name");
        }

        const double pident = parseDouble(f[2], "pident");
        h.length = parseInt(f[3], "length");
        h.ref_start = parseInt(f[6], "qstart");
        h.ref_end = parseInt(f[7], "qend");
        const int_t sstart = parseInt(f[8], "sstart");
        const int_t send = parseInt(f[9], "send");
        h.expect = parseDouble(f[10], "evalue");
        h.bit_score = parseDouble(f[11], "bitscore");

        if (pident < 0.0 || pident > 100.0) {
            throw std::invalid_argument("pident outside [0,100]: " + std::string(f[2]));
        }
        if (h.length <= 0) {
            throw std::invalid_argument("alignment length must be > 0");
        }
        if (h.ref_start <= 0 || h.ref_end <= 0 || sstart <= 0 || send <= 0) {
            throw std::invalid_argument("coordinates must be 1-based positive integers");
        }
        if (h.ref_end < h.ref_start) {
            throw std::invalid_argument("query coordinates must be ascending (qstart <= qend)");
        }

        // 负链：subject 坐标降序，交换后记为 '-'
        if (send < sstart) {
            h.is_rev = true;
            h.start = send;
            h.end = sstart;
        } else {
            h.start = sstart;
            h.end = send;
        }

        h.identity = static_cast<int_t>(std::llround(pident * static_cast<double>(h.length) / 100.0));
        return h;
    }

    AlignmentHits readBlastTable(const FilePath& path)
    {
        file_io::requireRegularFile(path, "alignment hit table");
        if (!file_io::hasContent(path)) {
            throw std::runtime_error("alignment hit table is empty: " + path.string());
        }

        std::ifstream in(path, std::ios::binary);
        if (!in) {
            throw std::runtime_error("failed to open alignment hit table: " + path.string());
        }

        AlignmentHits out;
        std::string line;
        std::size_t line_no = 0;
        while (std::getline(in, line)) {
            ++line_no;
            if (line.empty() || line[0] == '#' || line == "\r") continue;
            try {
                out.push_back(parseBlastLine(line, out.size()));
            } catch (const std::invalid_argument& e) {
                throw std::runtime_error(path.string() + ":" + std::to_string(line_no) + ": " + e.what());
            }
        }
        if (in.bad()) {
            throw std::runtime_error("I/O error while reading alignment hit table: " + path.string());
        }

        spdlog::info("Loaded {} alignment hits from {}", out.size(), path.string());
        return out;
    }

    AlignmentHits filterHits(AlignmentHits hits, const HitFilterParams& params)
    {
        const std::size_t before = hits.size();
        auto new_end = std::remove_if(hits.begin(), hits.end(),
            [&params](const AlignmentHit& h) {
                return h.expect > params.max_expect || h.length < params.min_length;
            });
        hits.erase(new_end, hits.end());

        if (hits.size() != before) {
            spdlog::info("Hit filter (expect <= {:g}, length >= {}): {} -> {} hits",
                         params.max_expect, params.min_length, before, hits.size());
        }
        return hits;
    }

    AlignmentHits keepQueries(AlignmentHits hits, const std::vector<std::string>& query_names)
    {
        const std::size_t before = hits.size();
        auto new_end = std::remove_if(hits.begin(), hits.end(),
            [&query_names](const AlignmentHit& h) {
                return std::find(query_names.begin(), query_names.end(), h.query_name) == query_names.end();
            });
        hits.erase(new_end, hits.end());

        if (hits.size() != before) {
            spdlog::warn("Dropped {} hits against mtDNA sequences other than the reference", before - hits.size());
        }
        return hits;
    }

} // namespace hits
