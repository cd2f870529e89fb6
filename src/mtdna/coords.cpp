#include "coords.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace coords
{
    RefSpace::RefSpace(int_t true_len, bool circular)
        : true_len_(true_len), circular_(circular)
    {
        if (true_len_ <= 0) {
            throw std::invalid_argument("reference length must be > 0, got " + std::to_string(true_len_));
        }
    }

    RefSpace RefSpace::circular(int_t true_len)
    {
        return RefSpace(true_len, true);
    }

    RefSpace RefSpace::linear(int_t true_len)
    {
        return RefSpace(true_len, false);
    }

    TruePos RefSpace::toTrue(DoubledPos p) const
    {
        if (p.value < 1 || p.value > doubledLength()) {
            throw std::out_of_range("reference position " + std::to_string(p.value) +
                                    " outside [1, " + std::to_string(doubledLength()) + "]");
        }
        return TruePos{((p.value - 1) % true_len_) + 1};
    }

    DoubledPos RefSpace::toDoubled(TruePos p) const
    {
        if (p.value < 1 || p.value > true_len_) {
            throw std::out_of_range("true reference position " + std::to_string(p.value) +
                                    " outside [1, " + std::to_string(true_len_) + "]");
        }
        return DoubledPos{p.value};
    }

    RefInterval RefSpace::project(DoubledPos start, DoubledPos end) const
    {
        if (end.value < start.value) {
            throw std::out_of_range("reference interval " + std::to_string(start.value) + "-" +
                                    std::to_string(end.value) + " has end < start");
        }

        RefInterval iv;
        iv.start = toTrue(start);
        iv.end = toTrue(end);

        // 覆盖整个环（或更多）：统一表示为从 start 开始绕一圈
        if (end.value - start.value + 1 >= true_len_) {
            if (iv.start.value == 1) {
                iv.end = TruePos{true_len_};
                iv.wraps = false;
            } else {
                iv.end = TruePos{iv.start.value - 1};
                iv.wraps = true;
            }
            return iv;
        }

        iv.wraps = iv.end.value < iv.start.value;
        return iv;
    }

    int_t RefSpace::span(const RefInterval& iv) const noexcept
    {
        if (!iv.wraps) {
            return iv.end.value - iv.start.value + 1;
        }
        return (true_len_ - iv.start.value + 1) + iv.end.value;
    }

    std::vector<RefPiece> RefSpace::split(const RefInterval& iv) const
    {
        std::vector<RefPiece> pieces;
        if (!iv.wraps) {
            pieces.emplace_back(iv.start.value, iv.end.value);
        } else {
            pieces.emplace_back(iv.start.value, true_len_);
            pieces.emplace_back(1, iv.end.value);
        }
        return pieces;
    }

    int_t unionLength(std::vector<RefPiece>& pieces)
    {
        if (pieces.empty()) return 0;

        std::sort(pieces.begin(), pieces.end());

        int_t total = 0;
        int_t cur_start = pieces.front().first;
        int_t cur_end = pieces.front().second;
        for (std::size_t i = 1; i < pieces.size(); ++i) {
            const auto& p = pieces[i];
            if (p.first <= cur_end + 1) {
                cur_end = std::max(cur_end, p.second);
            } else {
                total += cur_end - cur_start + 1;
                cur_start = p.first;
                cur_end = p.second;
            }
        }
        total += cur_end - cur_start + 1;
        return total;
    }

} // namespace coords
