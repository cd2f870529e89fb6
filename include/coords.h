#ifndef NUMTFINDER_COORDS_H
#define NUMTFINDER_COORDS_H

#include <cstddef>
#include <utility>
#include <vector>

#include "config.hpp"

// ================================================================
// coords 命名空间：mtDNA 参考序列上的坐标空间
// ================================================================
// 环状 mtDNA 在搜索前被“加倍”（序列自身拼接一次，长度 2L），以避免跨越原点的比对被人为截断。
// 外部比对工具报告的 query 坐标因此位于加倍空间 [1, 2L]；下游（自身命中过滤、覆盖度统计、输出表格）
// 只允许使用真实空间 [1, L] 的坐标。
//
// 为了防止两种坐标在代码中被混用：
// - DoubledPos / TruePos 是两个互不隐式转换的位置类型；
// - 唯一的转换入口是 RefSpace::toTrue / RefSpace::project；
// - 线性参考（circle=false）下 RefSpace 的加倍长度等于真实长度，投影退化为恒等映射。
//
// 所有坐标都是 1-based 闭区间。
// ================================================================
namespace coords
{
    // 加倍参考空间中的位置（外部比对工具的 query 坐标）
    struct DoubledPos
    {
        int_t value{0};
    };

    // 真实参考空间中的位置，取值范围 [1, L]
    struct TruePos
    {
        int_t value{0};
    };

    inline bool operator==(TruePos a, TruePos b) noexcept { return a.value == b.value; }
    inline bool operator!=(TruePos a, TruePos b) noexcept { return a.value != b.value; }
    inline bool operator<(TruePos a, TruePos b) noexcept { return a.value < b.value; }

    // ------------------------------------------------------------------
    // RefInterval：投影到真实空间后的参考区间
    // wraps == true 表示区间跨越环状原点（end < start），这是合法的终态而不是错误。
    // ------------------------------------------------------------------
    struct RefInterval
    {
        TruePos start;
        TruePos end;
        bool wraps{false};
    };

    // 参考区间按原点拆分后的一段（闭区间，保证 first <= second）
    using RefPiece = std::pair<int_t, int_t>;

    class RefSpace
    {
    public:
        // 环状参考：加倍空间长度 2L
        static RefSpace circular(int_t true_len);

        // 线性参考：不加倍，投影为恒等映射
        static RefSpace linear(int_t true_len);

        int_t trueLength() const noexcept { return true_len_; }
        int_t doubledLength() const noexcept { return circular_ ? 2 * true_len_ : true_len_; }
        bool isCircular() const noexcept { return circular_; }

        // 单点投影：((c - 1) mod L) + 1；c 超出 [1, doubledLength()] 时抛出 std::out_of_range
        TruePos toTrue(DoubledPos p) const;

        // 真实坐标映射回加倍空间的第一份拷贝（恒等数值，仅做类型转换与范围检查）
        DoubledPos toDoubled(TruePos p) const;

        // 区间投影（CoordinateProjector）：
        // - start/end 必须满足 1 <= start <= end <= doubledLength()，否则抛出 std::out_of_range；
        // - 加倍空间中跨度 >= L 的区间覆盖整个环：结果为 [s, s-1]（s==1 时为 [1, L]），保证覆盖恰好 L 个位置；
        // - 其余情况分别投影两端，end < start 即标记为跨原点。
        RefInterval project(DoubledPos start, DoubledPos end) const;

        // 区间在真实参考上覆盖的位置数（跨原点区间按两段之和计）
        int_t span(const RefInterval& iv) const noexcept;

        // 按原点拆分：非跨原点区间返回一段，跨原点区间返回 [start, L] 与 [1, end] 两段
        std::vector<RefPiece> split(const RefInterval& iv) const;

    private:
        RefSpace(int_t true_len, bool circular);

        int_t true_len_{0};
        bool circular_{false};
    };

    // 多段区间并集覆盖的位置数（用于覆盖度百分比计算）；pieces 会被排序
    int_t unionLength(std::vector<RefPiece>& pieces);

} // namespace coords

#endif //NUMTFINDER_COORDS_H
