#ifndef RACETRACK_CORE_TRACK_LOADER_HPP_
#define RACETRACK_CORE_TRACK_LOADER_HPP_

#include "racetrack/core/grid.hpp"
#include "racetrack/core/vehicle.hpp"
#include <cstddef>
#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

namespace racetrack {

// トラック上の最大車両数
constexpr std::size_t MAX_VEHICLES = 9;

// 描画時のクラッシュ車両表示
constexpr char CRASH_INDICATOR = 'X';

/**
 * @brief トラック書式エラーの分類
 */
enum class TrackFormatErrorType {
    EmptyInput,
    InconsistentLineLength,
    NoVehicles,
    TooManyVehicles,
    DuplicateVehicleId,
    InvalidVehicleId      // 印字可能な1文字でないスタート記号
};

/**
 * @brief トラック書式エラー
 */
class TrackFormatError : public std::runtime_error {
public:
    TrackFormatError(TrackFormatErrorType type, const std::string& message);

    TrackFormatErrorType type() const { return type_; }

private:
    TrackFormatErrorType type_;
};

const char* to_string(TrackFormatErrorType type);

/**
 * @brief 読み込み済みトラック（グリッドとスタート記号から生成した車両）
 */
struct TrackLayout {
    Grid grid;
    std::vector<Vehicle> vehicles;
};

/**
 * @brief テキスト行からトラックを構築
 *
 * 先頭の空行は無視し、最初の空行または入力終端でブロックを終える。
 * 空白のみの行も空行として扱う。
 *
 * @param lines トラックテキストの行
 * @return トラック
 * @throws TrackFormatError 書式エラー時
 */
TrackLayout parse_track_lines(const std::vector<std::string>& lines);

/**
 * @brief ストリームからトラックを読み込み
 */
TrackLayout parse_track(std::istream& input);

/**
 * @brief ファイルからトラックを読み込み
 * @param path トラックファイルパス
 * @throws std::runtime_error ファイルを開けない場合
 * @throws TrackFormatError 書式エラー時
 */
TrackLayout load_track_file(const std::string& path);

/**
 * @brief レース状態をトラック書式で描画
 *
 * クラッシュ車両はXで表示し、同じセルに停止中の車両がいてもXを優先する。
 */
std::string render_race(const Grid& grid, const std::vector<Vehicle>& vehicles);

} // namespace racetrack

#endif // RACETRACK_CORE_TRACK_LOADER_HPP_
