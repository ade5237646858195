// include/racetrack/core/rasterizer.hpp

#ifndef RACETRACK_CORE_RASTERIZER_HPP_
#define RACETRACK_CORE_RASTERIZER_HPP_

#include "racetrack/core/types.hpp"
#include <vector>

namespace racetrack {

/**
 * @brief 2点間の直線移動が通過するセル列を計算（整数Bresenham）
 *
 * 距離の大きい軸を高速軸として毎ステップ進め、低速軸は誤差項が負になった時のみ進める。
 * 誤差項の初期値は低速軸の進行方向で決まるため、逆方向の結果は順序を反転した同一セル列になる。
 *
 * @param start 開始位置
 * @param end 終了位置
 * @return 両端を含むセル列（長さ max(|dx|,|dy|)+1）
 */
std::vector<Vector> rasterize(const Vector& start, const Vector& end);

}  // namespace racetrack

#endif  // RACETRACK_CORE_RASTERIZER_HPP_
