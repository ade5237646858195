#ifndef RACETRACK_UTILS_TIME_UTILS_HPP_
#define RACETRACK_UTILS_TIME_UTILS_HPP_

#include <chrono>
#include <string>

namespace racetrack {
namespace time_utils {

using Clock = std::chrono::steady_clock;
using TimePoint = std::chrono::time_point<Clock>;

/**
 * @brief 2つのタイムポイント間の経過時間を計算
 * @param start 開始時刻
 * @param end 終了時刻
 * @return 経過時間（秒）
 */
double get_elapsed_time(const TimePoint& start, const TimePoint& end);

/**
 * @brief 現在時刻までの経過時間を計算
 * @param start 開始時刻
 * @return 経過時間（秒）
 */
double get_elapsed_time_since(const TimePoint& start);

/**
 * @brief 時間をフォーマットされた文字列に変換
 * @param seconds 時間（秒）
 * @return フォーマット済み文字列
 */
std::string format_duration(double seconds);

/**
 * @brief 現在時刻をタイムスタンプ文字列に変換
 * @return タイムスタンプ文字列
 */
std::string get_timestamp_string();

/**
 * @brief 高精度タイマークラス
 */
class Timer {
public:
    Timer();

    /**
     * @brief タイマーを開始
     */
    void start();

    /**
     * @brief タイマーを停止して経過時間を取得
     * @return 経過時間（秒）
     */
    double stop();

    /**
     * @brief 現在の経過時間を取得（タイマーは継続）
     * @return 経過時間（秒）
     */
    double elapsed() const;

    bool is_running() const;

private:
    TimePoint start_time_;
    bool running_;
};

} // namespace time_utils
} // namespace racetrack

#endif // RACETRACK_UTILS_TIME_UTILS_HPP_
