#ifndef RACETRACK_CORE_GRID_HPP_
#define RACETRACK_CORE_GRID_HPP_

#include "racetrack/core/types.hpp"
#include <vector>

namespace racetrack {

/**
 * @brief レーストラックの不変グリッド
 *
 * 行優先でセル種別を保持する。範囲外の問い合わせは壁として扱う。
 */
class Grid {
public:
    /**
     * @brief コンストラクタ
     * @param width 幅（セル数、正）
     * @param height 高さ（セル数、正）
     * @param cells 行優先のセル配列（width * height 要素）
     */
    Grid(int width, int height, std::vector<CellKind> cells);

    int width() const { return width_; }
    int height() const { return height_; }

    bool in_bounds(const Vector& position) const;

    /**
     * @brief 指定位置のセル種別を取得
     * @param position グリッド座標
     * @return セル種別（範囲外はWall）
     */
    CellKind kind_at(const Vector& position) const;

private:
    int width_;
    int height_;
    std::vector<CellKind> cells_;
};

} // namespace racetrack

#endif // RACETRACK_CORE_GRID_HPP_
