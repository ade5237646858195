#ifndef RACETRACK_CORE_TYPES_HPP_
#define RACETRACK_CORE_TYPES_HPP_

#include <array>
#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace racetrack {

/**
 * @brief 2D整数ベクトルクラス（位置・速度・加速度で共用）
 *
 * 座標系は左上原点、x軸は右向き、y軸は下向き。
 */
struct Vector {
    int x, y;

    Vector() : x(0), y(0) {}
    Vector(int x, int y) : x(x), y(y) {}

    Vector operator+(const Vector& other) const;
    Vector operator-(const Vector& other) const;
    Vector abs() const;
    Vector signum() const;
    int dot(const Vector& other) const;

    bool operator==(const Vector& other) const;
    bool operator!=(const Vector& other) const;
    bool operator<(const Vector& other) const;

    std::string to_string() const;
};

std::ostream& operator<<(std::ostream& os, const Vector& v);

/**
 * @brief Vectorのハッシュ関数
 */
struct VectorHash {
    std::size_t operator()(const Vector& v) const {
        return std::hash<int>()(v.x) ^ (std::hash<int>()(v.y) << 1);
    }
};

/**
 * @brief セル種別
 *
 * ゴール種別は正しい通過方向の速度符号を表す。
 */
enum class CellKind : char {
    Wall = '#',
    Open = ' ',
    FinishLeft = '<',
    FinishRight = '>',
    FinishUp = '^',
    FinishDown = 'v'
};

/**
 * @brief 文字からセル種別を取得
 * @param c トラック文字
 * @return セル種別（車両スタート記号の場合はstd::nullopt）
 */
std::optional<CellKind> cell_kind_from_char(char c);

char to_char(CellKind kind);

bool is_finish(CellKind kind);

/**
 * @brief ゴール通過方向の判定
 * @param kind ゴールセル種別
 * @param velocity 通過時の速度
 * @return 正しい方向の通過ならtrue（ゴール以外は常にfalse）
 */
bool is_correct_crossing(CellKind kind, const Vector& velocity);

// 加速度候補（各成分 -1, 0, 1 の9通り、探索順）
const std::array<Vector, 9> ACCELERATIONS = {{
    Vector(-1, 1), Vector(0, 1), Vector(1, 1),
    Vector(-1, 0), Vector(0, 0), Vector(1, 0),
    Vector(-1, -1), Vector(0, -1), Vector(1, -1)
}};

// 加速度列（1ターン1要素）
using Plan = std::vector<Vector>;

/**
 * @brief 経路探索の打ち切り条件
 */
struct SearchLimits {
    int max_depth;               // 最大探索深さ（加速回数）
    std::size_t max_states;      // 最大展開状態数

    SearchLimits() : max_depth(500), max_states(50000) {}
    SearchLimits(int depth, std::size_t states) : max_depth(depth), max_states(states) {}
};

/**
 * @brief レース実行設定
 */
struct RaceConfig {
    std::string track_file;
    SearchLimits search;
    int max_turns;
    std::string log_level;
    std::string log_file;

    RaceConfig() : max_turns(1000), log_level("info") {}
};

} // namespace racetrack

#endif // RACETRACK_CORE_TYPES_HPP_
