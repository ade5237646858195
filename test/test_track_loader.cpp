// test/test_track_loader.cpp

#include <gtest/gtest.h>
#include "racetrack/core/track_loader.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>

using namespace racetrack;

class TrackLoaderTest : public ::testing::Test {
protected:
    std::vector<std::string> simple_track;

    void SetUp() override {
        simple_track = {
            "#######",
            "#a < b#",
            "#  ^  #",
            "#######"
        };
    }

    // 指定種別のエラーが送出されることを確認
    static void expect_format_error(const std::vector<std::string>& lines,
                                    TrackFormatErrorType expected) {
        try {
            parse_track_lines(lines);
            FAIL() << "TrackFormatError was not thrown";
        } catch (const TrackFormatError& e) {
            EXPECT_EQ(e.type(), expected) << "actual: " << to_string(e.type());
        }
    }
};

// TEST 1: 基本的なトラックの読み込み
TEST_F(TrackLoaderTest, ParseSimpleTrack) {
    // Given: 2台の車両を含むトラック
    // When: 読み込み
    auto layout = parse_track_lines(simple_track);

    // Then: サイズとセル種別が正しい
    EXPECT_EQ(layout.grid.width(), 7);
    EXPECT_EQ(layout.grid.height(), 4);
    EXPECT_EQ(layout.grid.kind_at(Vector(0, 0)), CellKind::Wall);
    EXPECT_EQ(layout.grid.kind_at(Vector(3, 1)), CellKind::FinishLeft);
    EXPECT_EQ(layout.grid.kind_at(Vector(3, 2)), CellKind::FinishUp);
    EXPECT_EQ(layout.grid.kind_at(Vector(2, 2)), CellKind::Open);

    // スタート記号は通常セルとして格納
    EXPECT_EQ(layout.grid.kind_at(Vector(1, 1)), CellKind::Open);
    EXPECT_EQ(layout.grid.kind_at(Vector(5, 1)), CellKind::Open);
}

// TEST 2: 車両は行優先の出現順
TEST_F(TrackLoaderTest, VehiclesInRowMajorOrder) {
    // Given: 複数行に車両があるトラック
    std::vector<std::string> lines = {
        "#####",
        "#  z#",
        "#a  #",
        "#####"
    };

    // When: 読み込み
    auto layout = parse_track_lines(lines);

    // Then: 出現順に並び、初期状態は静止
    ASSERT_EQ(layout.vehicles.size(), 2u);
    EXPECT_EQ(layout.vehicles[0].id(), 'z');
    EXPECT_EQ(layout.vehicles[0].position(), Vector(3, 1));
    EXPECT_EQ(layout.vehicles[1].id(), 'a');
    EXPECT_EQ(layout.vehicles[1].position(), Vector(1, 2));
    EXPECT_EQ(layout.vehicles[1].velocity(), Vector(0, 0));
    EXPECT_FALSE(layout.vehicles[1].is_crashed());
    EXPECT_EQ(layout.vehicles[1].move_count(), 0);
}

// TEST 3: 先頭の空行と末尾以降の行
TEST_F(TrackLoaderTest, LeadingBlankLinesAndTrailingContent) {
    // Given: 先頭に空行（空白のみの行を含む）、ブロック後に別の内容
    std::vector<std::string> lines = {
        "",
        "   ",
        "####",
        "#ab#",
        "####",
        "",
        "this line is ignored"
    };

    // When: 読み込み
    auto layout = parse_track_lines(lines);

    // Then: 最初のブロックのみ読み込まれる
    EXPECT_EQ(layout.grid.width(), 4);
    EXPECT_EQ(layout.grid.height(), 3);
    EXPECT_EQ(layout.vehicles.size(), 2u);
}

// TEST 4: CRLF改行の入力
TEST_F(TrackLoaderTest, CarriageReturnIsStripped) {
    // Given: CRLF改行のストリーム
    std::istringstream input("####\r\n#a>#\r\n####\r\n");

    // When: 読み込み
    auto layout = parse_track(input);

    // Then: 行末のCRは幅に含まれない
    EXPECT_EQ(layout.grid.width(), 4);
    EXPECT_EQ(layout.grid.kind_at(Vector(2, 1)), CellKind::FinishRight);
}

// TEST 5: 空の入力
TEST_F(TrackLoaderTest, EmptyInput) {
    expect_format_error({}, TrackFormatErrorType::EmptyInput);
    expect_format_error({"", "  ", ""}, TrackFormatErrorType::EmptyInput);
}

// TEST 6: 行の長さが不一致
TEST_F(TrackLoaderTest, InconsistentLineLength) {
    expect_format_error({"#####", "#a #", "#####"},
                        TrackFormatErrorType::InconsistentLineLength);
}

// TEST 7: 車両なし
TEST_F(TrackLoaderTest, NoVehicles) {
    expect_format_error({"####", "# >#", "####"}, TrackFormatErrorType::NoVehicles);
}

// TEST 8: 車両数の上限
TEST_F(TrackLoaderTest, TooManyVehicles) {
    // Given: 9台はOK、10台はエラー
    EXPECT_NO_THROW(parse_track_lines({"###########", "#123456789#", "###########"}));
    expect_format_error({"############", "#123456789A#", "############"},
                        TrackFormatErrorType::TooManyVehicles);
}

// TEST 9: 車両IDの重複
TEST_F(TrackLoaderTest, DuplicateVehicleId) {
    expect_format_error({"#####", "#a a#", "#####"}, TrackFormatErrorType::DuplicateVehicleId);
}

// TEST 10: 重複は走査中に検出される
TEST_F(TrackLoaderTest, DuplicateDetectedBeforeCountCheck) {
    // Given: 上限を超え、かつ重複もあるトラック
    // When/Then: 重複が先に報告される
    expect_format_error({"#############", "#aa123456789#", "#############"},
                        TrackFormatErrorType::DuplicateVehicleId);
}

// TEST 11: 存在しないファイル
TEST_F(TrackLoaderTest, MissingFileThrowsRuntimeError) {
    EXPECT_THROW(load_track_file("/nonexistent/racetrack/track.txt"), std::runtime_error);
}

// TEST 12: ファイルからの読み込み
TEST_F(TrackLoaderTest, LoadFromFile) {
    // Given: 一時ファイルに書き出したトラック
    const std::string path = ::testing::TempDir() + "racetrack_loader_test.txt";
    {
        std::ofstream file(path);
        for (const auto& line : simple_track) {
            file << line << '\n';
        }
    }

    // When: ファイルから読み込み
    auto layout = load_track_file(path);
    std::remove(path.c_str());

    // Then: 内容が正しい
    EXPECT_EQ(layout.grid.width(), 7);
    EXPECT_EQ(layout.vehicles.size(), 2u);
}

// TEST 13: レース状態の描画
TEST_F(TrackLoaderTest, RenderRaceShowsVehiclesAndCrashes) {
    // Given: 1台がクラッシュしたレース状態
    auto layout = parse_track_lines(simple_track);
    layout.vehicles[1].crash(Vector(5, 2));

    // When: 描画
    const std::string board = render_race(layout.grid, layout.vehicles);

    // Then: 車両IDとクラッシュ表示
    const std::string expected =
        "#######\n"
        "#a <  #\n"
        "#  ^ X#\n"
        "#######\n";
    EXPECT_EQ(board, expected);
}

// TEST 14: 停止車両に衝突したクラッシュの描画
TEST_F(TrackLoaderTest, RenderRaceShowsCrashOverLiveVehicle) {
    // Given: 車両bが車両aのセルでクラッシュ
    auto layout = parse_track_lines(simple_track);
    layout.vehicles[1].crash(Vector(1, 1));

    // When: 描画（aがbより先に並んでいる）
    const std::string board = render_race(layout.grid, layout.vehicles);

    // Then: クラッシュ表示が優先される
    const std::string expected =
        "#######\n"
        "#X <  #\n"
        "#  ^  #\n"
        "#######\n";
    EXPECT_EQ(board, expected);
}

// TEST 15: 制御文字のスタート記号
TEST_F(TrackLoaderTest, ControlCharacterIsRejected) {
    // Given: タブ文字を含むトラック
    // When/Then: InvalidVehicleIdエラー
    expect_format_error({"#####", "#a\t #", "#####"}, TrackFormatErrorType::InvalidVehicleId);
}

// TEST 16: マルチバイト文字のスタート記号
TEST_F(TrackLoaderTest, NonAsciiByteIsRejected) {
    // Given: UTF-8の「é」(0xC3 0xA9) を含むトラック
    // When/Then: InvalidVehicleIdエラー
    expect_format_error({"######", "#a\xC3\xA9 #", "######"},
                        TrackFormatErrorType::InvalidVehicleId);
}

// メイン関数
int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
