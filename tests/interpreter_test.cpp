//! # Command Interpreter Tests
//!
//! Every rule, its clamping behaviour and the guarantee that a failed
//! command leaves the configuration untouched.

#include "card/interpreter.hpp"
#include "card/layout.hpp"

#include <algorithm>
#include <gtest/gtest.h>

using namespace pjsk;
using namespace pjsk::card;

class InterpreterTest : public ::testing::Test {
protected:
    void SetUp() override {
        interpreter = make_box<CommandInterpreter>(
            make_rc<const CommandVocabulary>(CommandVocabulary::builtin()),
            make_rc<const PersonaCatalog>(PersonaCatalog::builtin()), limits, 42u);
        config = RenderConfig::make_default(CardDefaults{}, limits);
        config.text = "hello";
    }

    auto run(std::string_view message) -> Result<std::string, AdjustError> {
        return interpreter->apply_message(config, message);
    }

    auto run_ok(std::string_view message) -> std::string {
        auto result = run(message);
        if (is_err(result)) {
            ADD_FAILURE() << "'" << message << "' failed: " << unwrap_err(result).message;
            return "";
        }
        return unwrap(result);
    }

    auto run_err(std::string_view message) -> AdjustError {
        auto before = config;
        auto result = run(message);
        if (is_ok(result)) {
            ADD_FAILURE() << "'" << message << "' unexpectedly succeeded";
            return AdjustError::validation("");
        }
        EXPECT_EQ(config, before) << "failed command mutated the card";
        return unwrap_err(result);
    }

    CardLimits limits;
    Box<CommandInterpreter> interpreter;
    RenderConfig config;
};

// ============================================================================
// Dispatch
// ============================================================================

TEST_F(InterpreterTest, UnknownSubcommand) {
    auto error = run_err("跳舞 1");
    EXPECT_EQ(error.kind, AdjustErrorKind::Validation);
    EXPECT_NE(error.message.find("跳舞"), std::string::npos);
}

TEST_F(InterpreterTest, DotsOnlyIsUnknown) {
    auto error = run_err("...");
    EXPECT_EQ(error.kind, AdjustErrorKind::Validation);
}

// ============================================================================
// Text
// ============================================================================

TEST_F(InterpreterTest, TextCollapsesWhitespace) {
    EXPECT_EQ(run_ok("文本   new   words  "), "text updated");
    EXPECT_EQ(config.text, "new words");
}

TEST_F(InterpreterTest, TextRejectsEmptyAndTooLong) {
    run_err("文本");
    run_err("文本 " + std::string(limits.max_text_length + 1, 'a'));

    std::string exact(limits.max_text_length, 'b');
    run_ok("text " + exact);
    EXPECT_EQ(config.text, exact);
}

// ============================================================================
// Font Size
// ============================================================================

TEST_F(InterpreterTest, FontSizeVariants) {
    EXPECT_EQ(run_ok("字号.大"), "font size increased to 46px");
    EXPECT_EQ(run_ok("font.down"), "font size decreased to 42px");
}

TEST_F(InterpreterTest, FontSizeStepAtBoundReportsIt) {
    config.font_size = limits.font_size_max;
    auto message = run_ok("字号.大");
    EXPECT_EQ(config.font_size, limits.font_size_max);
    EXPECT_NE(message.find("upper bound"), std::string::npos);
}

TEST_F(InterpreterTest, FontSizeAbsoluteClamps) {
    auto message = run_ok("字号 999");
    EXPECT_EQ(config.font_size, 84);
    EXPECT_NE(message.find("clamped"), std::string::npos);

    EXPECT_EQ(run_ok("字号 30px"), "font size set to 30px");
    EXPECT_EQ(config.font_size, 30);
}

TEST_F(InterpreterTest, FontSizeOversizedInputStillClamps) {
    auto message = run_ok("字号 99999999999999999999");
    EXPECT_EQ(config.font_size, 84);
    EXPECT_EQ(message, "font size set to 84px (clamped to range 18-84)");

    run_ok("字号 -99999999999999999999");
    EXPECT_EQ(config.font_size, 18);
}

TEST_F(InterpreterTest, FontSizeErrors) {
    run_err("字号");
    run_err("字号 huge");
    auto error = run_err("字号.巨");
    EXPECT_NE(error.message.find("巨"), std::string::npos);
}

// ============================================================================
// Line Spacing
// ============================================================================

TEST_F(InterpreterTest, LineSpacingVariantsRoundToTwoDecimals) {
    EXPECT_EQ(run_ok("行距.大"), "line spacing increased to 1.30");
    EXPECT_DOUBLE_EQ(config.line_spacing, 1.3);
    run_ok("行距.小");
    run_ok("行距.小");
    EXPECT_DOUBLE_EQ(config.line_spacing, 1.1);
}

TEST_F(InterpreterTest, LineSpacingAbsolute) {
    EXPECT_EQ(run_ok("行距 1.85"), "line spacing set to 1.85");
    auto message = run_ok("spacing 9");
    EXPECT_DOUBLE_EQ(config.line_spacing, 3.0);
    EXPECT_NE(message.find("clamped"), std::string::npos);
    run_err("行距 wide");
}

TEST_F(InterpreterTest, LineSpacingRoundingIsReportedAsClamped) {
    auto message = run_ok("行距 1.234");
    EXPECT_DOUBLE_EQ(config.line_spacing, 1.23);
    EXPECT_NE(message.find("clamped"), std::string::npos);

    EXPECT_EQ(run_ok("行距 1.2"), "line spacing set to 1.20");
}

TEST_F(InterpreterTest, LineSpacingLowerBound) {
    config.line_spacing = limits.line_spacing_min;
    auto message = run_ok("行距.小");
    EXPECT_NE(message.find("lower bound"), std::string::npos);
}

// ============================================================================
// Curve
// ============================================================================

TEST_F(InterpreterTest, CurveToggleAndExplicit) {
    EXPECT_EQ(run_ok("曲线"), "curve enabled");
    EXPECT_EQ(run_ok("曲线 切换"), "curve disabled");
    EXPECT_EQ(run_ok("曲线.开"), "curve enabled");
    EXPECT_EQ(run_ok("曲线.开"), "curve enabled");
    EXPECT_EQ(run_ok("curve off"), "curve disabled");
    EXPECT_FALSE(config.curve_enabled);
}

TEST_F(InterpreterTest, CurveUnknownArgumentToggles) {
    run_ok("曲线 banana");
    EXPECT_TRUE(config.curve_enabled);
}

// ============================================================================
// Position
// ============================================================================

TEST_F(InterpreterTest, PositionDefaultStep) {
    EXPECT_EQ(run_ok("位置.上"), "moved up by 12, now Y=-12");
    run_ok("位置 下");
    run_ok("位置 右 30");
    EXPECT_EQ(config.offset_y, 0);
    EXPECT_EQ(config.offset_x, 30);
}

TEST_F(InterpreterTest, PositionClampsAtBoundary) {
    config.offset_x = -235;
    EXPECT_EQ(run_ok("位置.左"), "moved left by 5, now X=-240");
    EXPECT_EQ(run_ok("位置.左"), "boundary reached moving left (X=-240)");
}

TEST_F(InterpreterTest, PositionRightWalksFromOriginToBound) {
    ASSERT_EQ(config.offset_x, 0);
    EXPECT_EQ(run_ok("位置 右"), "moved right by 12, now X=12");

    int moves = 1;
    while (config.offset_x < limits.offset_max) {
        int before = config.offset_x;
        run_ok("位置 右");
        ASSERT_EQ(config.offset_x, std::min(before + limits.offset_step, limits.offset_max));
        ASSERT_LT(++moves, 100);
    }
    EXPECT_EQ(moves, limits.offset_max / limits.offset_step);

    EXPECT_EQ(run_ok("位置 右"), "boundary reached moving right (X=240)");
    EXPECT_EQ(config.offset_x, limits.offset_max);
}

TEST_F(InterpreterTest, PositionOversizedStepClamps) {
    EXPECT_EQ(run_ok("位置 右 99999999999999999999"), "moved right by 240, now X=240");
}

TEST_F(InterpreterTest, PositionErrors) {
    run_err("位置");
    run_err("位置 斜");
    run_err("位置 上 0");
    run_err("位置 上 -3");
    run_err("位置 上 far");
}

// ============================================================================
// Role
// ============================================================================

TEST_F(InterpreterTest, RoleByAlias) {
    EXPECT_EQ(run_ok("角色 ichika"), "persona switched to 星乃一歌");
    EXPECT_EQ(config.role, "星乃一歌");
    run_ok("角色 hatsune miku");
    EXPECT_EQ(config.role, "初音未来");
}

TEST_F(InterpreterTest, RoleRandomNeverRepeats) {
    for (int i = 0; i < 20; ++i) {
        std::string previous = config.role;
        auto message = run_ok("角色 -r");
        EXPECT_NE(config.role, previous);
        EXPECT_NE(message.find(config.role), std::string::npos);
    }
}

TEST_F(InterpreterTest, RoleErrors) {
    run_err("角色");
    auto error = run_err("角色 not-a-real-persona");
    EXPECT_NE(error.message.find("not-a-real-persona"), std::string::npos);
    EXPECT_EQ(config.role, "初音未来");
}

// ============================================================================
// End to End
// ============================================================================

TEST_F(InterpreterTest, AdjustmentSequence) {
    run_ok("字号 999");
    EXPECT_EQ(config.font_size, limits.font_size_max);

    run_ok("位置.上");
    run_ok("位置.上");
    EXPECT_EQ(config.offset_y, -2 * limits.offset_step);

    run_ok("角色 miku");
    EXPECT_EQ(config.role, "初音未来");
}

// ============================================================================
// Layout Heuristics
// ============================================================================

TEST(LayoutTest, LongestLineSkipsBlankLines) {
    EXPECT_EQ(find_longest_line("ab\n   \n初音未来ab\nxyz"), "初音未来ab");
    EXPECT_EQ(find_longest_line("\n \n"), "");
}

TEST(LayoutTest, TextDimensions) {
    auto dims = calculate_text_dimensions("hello\nhi", 40, 1.5);
    EXPECT_EQ(dims.width, 120);
    EXPECT_EQ(dims.height, 120);
    auto empty = calculate_text_dimensions("", 40, 1.5);
    EXPECT_EQ(empty.width, 0);
}

TEST(LayoutTest, AdaptiveFontSize) {
    EXPECT_EQ(calculate_font_size("hello", 400, 18, 42), 42);
    EXPECT_EQ(calculate_font_size(std::string(20, 'a'), 400, 18, 42), 33);
    EXPECT_EQ(calculate_font_size(std::string(100, 'a'), 400, 18, 42), 18);
    EXPECT_EQ(calculate_font_size("", 400, 18, 42), 42);
}

TEST(LayoutTest, OffsetsCentreAndClamp) {
    auto single = calculate_offsets("a", 40, 1.2);
    EXPECT_EQ(single.x, 10);
    EXPECT_EQ(single.y, 240);

    std::string tall;
    for (int i = 0; i < 9; ++i) {
        tall += "line\n";
    }
    tall += "line";
    auto centred = calculate_offsets(tall, 40, 1.2);
    EXPECT_EQ(centred.y, 60);
}

TEST(LayoutTest, CurveIntensityClamp) {
    EXPECT_DOUBLE_EQ(clamp_curve_intensity(1.7), 1.0);
    EXPECT_DOUBLE_EQ(clamp_curve_intensity(-0.2), 0.0);
    EXPECT_DOUBLE_EQ(clamp_curve_intensity(0.4), 0.4);
}
