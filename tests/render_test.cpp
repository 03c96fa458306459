//! # Renderer Handle and Reply Tests

#include "render/renderer.hpp"
#include "render/reply.hpp"

#include <atomic>
#include <gtest/gtest.h>
#include <stdexcept>

using namespace pjsk;
using namespace pjsk::render;

namespace {

/// Backend that counts lifecycle calls and can be told to fail.
class CountingRenderer : public Renderer {
public:
    CountingRenderer(std::atomic<int>& inits, std::atomic<int>& closes)
        : inits_(inits), closes_(closes) {}

    bool fail_init = false;
    bool throw_on_render = false;
    bool throw_non_standard = false;

    auto initialize() -> Result<bool, RenderError> override {
        ++inits_;
        if (fail_init) {
            return RenderError{"fonts missing"};
        }
        return true;
    }

    auto render(const RenderRequest& request) -> Result<ImageBytes, RenderError> override {
        if (throw_non_standard) {
            throw 42;
        }
        if (throw_on_render) {
            throw std::runtime_error("backend crashed");
        }
        if (request.text.empty()) {
            return RenderError{"nothing to draw"};
        }
        return ImageBytes(request.text.begin(), request.text.end());
    }

    void close() override {
        ++closes_;
    }

private:
    std::atomic<int>& inits_;
    std::atomic<int>& closes_;
};

auto request_with_text(std::string text) -> RenderRequest {
    RenderRequest request;
    request.text = std::move(text);
    request.persona = "初音未来";
    return request;
}

} // namespace

// ============================================================================
// RendererHandle
// ============================================================================

class RendererHandleTest : public ::testing::Test {
protected:
    std::atomic<int> inits{0};
    std::atomic<int> closes{0};
};

TEST_F(RendererHandleTest, InitializesLazilyOnce) {
    RendererHandle handle(make_box<CountingRenderer>(inits, closes));
    EXPECT_EQ(handle.state(), RendererState::Uninitialized);
    EXPECT_EQ(inits, 0);

    auto first = handle.render(request_with_text("abc")).get();
    ASSERT_TRUE(is_ok(first));
    EXPECT_EQ(unwrap(first).size(), 3u);

    auto second = handle.render(request_with_text("de")).get();
    ASSERT_TRUE(is_ok(second));
    EXPECT_EQ(inits, 1);
    EXPECT_EQ(handle.state(), RendererState::Ready);
    EXPECT_EQ(handle.users(), 0);
}

TEST_F(RendererHandleTest, AcquireAndRelease) {
    RendererHandle handle(make_box<CountingRenderer>(inits, closes));
    ASSERT_TRUE(is_ok(handle.acquire()));
    ASSERT_TRUE(is_ok(handle.acquire()));
    EXPECT_EQ(handle.users(), 2);
    handle.release();
    handle.release();
    handle.release();
    EXPECT_EQ(handle.users(), 0);
}

TEST_F(RendererHandleTest, FailedInitializationIsRetried) {
    auto backend = make_box<CountingRenderer>(inits, closes);
    auto* raw = backend.get();
    raw->fail_init = true;
    RendererHandle handle(std::move(backend));

    auto failed = handle.acquire();
    ASSERT_TRUE(is_err(failed));
    EXPECT_EQ(unwrap_err(failed).message, "fonts missing");
    EXPECT_EQ(handle.state(), RendererState::Uninitialized);

    raw->fail_init = false;
    EXPECT_TRUE(is_ok(handle.acquire()));
    EXPECT_EQ(handle.state(), RendererState::Ready);
    EXPECT_EQ(inits, 2);
}

TEST_F(RendererHandleTest, CloseIsIdempotentAndFinal) {
    {
        RendererHandle handle(make_box<CountingRenderer>(inits, closes));
        ASSERT_TRUE(is_ok(handle.acquire()));
        handle.close();
        handle.close();
        EXPECT_EQ(handle.state(), RendererState::Closed);
        EXPECT_TRUE(is_err(handle.acquire()));

        auto rendered = handle.render(request_with_text("x")).get();
        ASSERT_TRUE(is_err(rendered));
        EXPECT_EQ(unwrap_err(rendered).message, "renderer is closed");
    }
    EXPECT_EQ(closes, 1);
}

TEST_F(RendererHandleTest, CloseBeforeInitSkipsBackend) {
    {
        RendererHandle handle(make_box<CountingRenderer>(inits, closes));
    }
    EXPECT_EQ(inits, 0);
    EXPECT_EQ(closes, 0);
}

TEST_F(RendererHandleTest, BackendErrorsAndExceptionsArriveAsRenderError) {
    auto backend = make_box<CountingRenderer>(inits, closes);
    auto* raw = backend.get();
    RendererHandle handle(std::move(backend));

    auto empty = handle.render(request_with_text("")).get();
    ASSERT_TRUE(is_err(empty));
    EXPECT_EQ(unwrap_err(empty).message, "nothing to draw");

    raw->throw_on_render = true;
    auto thrown = handle.render(request_with_text("x")).get();
    ASSERT_TRUE(is_err(thrown));
    EXPECT_EQ(unwrap_err(thrown).message, "backend crashed");
    EXPECT_EQ(handle.state(), RendererState::Ready);
}

TEST_F(RendererHandleTest, NonStandardExceptionArrivesAsRenderError) {
    auto backend = make_box<CountingRenderer>(inits, closes);
    backend->throw_non_standard = true;
    RendererHandle handle(std::move(backend));

    auto thrown = handle.render(request_with_text("x")).get();
    ASSERT_TRUE(is_err(thrown));
    EXPECT_EQ(unwrap_err(thrown).message, "unknown renderer exception");
    EXPECT_EQ(handle.users(), 0);
}

TEST(RendererStateTest, Names) {
    EXPECT_STREQ(renderer_state_name(RendererState::Ready), "ready");
    EXPECT_STREQ(renderer_state_name(RendererState::Closed), "closed");
}

// ============================================================================
// Replies
// ============================================================================

TEST(ReplyTest, AdjustmentButtonsCoverEveryQuickAction) {
    auto buttons = adjustment_buttons();
    EXPECT_EQ(buttons.rows.size(), 4u);
    auto flat = buttons.flatten();
    ASSERT_EQ(flat.size(), 9u);
    EXPECT_EQ(flat.front().command, "/pjsk.调整 字号.大");
    EXPECT_EQ(flat.back().command, "/pjsk.调整 曲线 切换");
}

TEST(ReplyTest, EncodeButtonText) {
    ButtonMatrix matrix{"Pick", {{{"A", "/a", "🅰"}, {"B", "/b", ""}}, {{"C", "/c", ""}}}};
    EXPECT_EQ(encode_button_text(matrix), "【Pick】\n🅰 A ｜ B\nC");

    ButtonMatrix untitled{"", {{{"A", "/a", ""}}}};
    EXPECT_EQ(encode_button_text(untitled), "A");
}

TEST(ReplyTest, StateLinesAndSummary) {
    card::RenderConfig config{"hello", 48, 1.5, true, 12, -24, "星乃一歌"};
    auto lines = format_state_lines(config);
    ASSERT_EQ(lines.size(), 6u);
    EXPECT_EQ(lines[0], "Text: hello");
    EXPECT_EQ(lines[1], "Font size: 48px");
    EXPECT_EQ(lines[2], "Line spacing: 1.50");
    EXPECT_EQ(lines[3], "Curve: on");
    EXPECT_EQ(lines[4], "Position: X 12 / Y -24");
    EXPECT_EQ(lines[5], "Persona: 星乃一歌");

    auto summary = format_summary(config, "done");
    EXPECT_EQ(summary.rfind("done\n\nText: hello\n", 0), 0u);
    EXPECT_NE(summary.find(QUICK_ACTION_LINE), std::string::npos);
}

TEST(ReplyTest, ErrorAndGuidance) {
    auto error = Reply::error("bad input");
    EXPECT_TRUE(error.is_error);
    EXPECT_EQ(error.text.rfind("⚠️ bad input\n\n", 0), 0u);
    EXPECT_NE(error.text.find("/pjsk.draw"), std::string::npos);

    EXPECT_EQ(format_guidance().rfind("pjsk.调整 usage:", 0), 0u);
}

TEST(ReplyTest, Mention) {
    EXPECT_EQ(with_mention("hi", "alice"), "@alice hi");
    EXPECT_EQ(with_mention("hi", ""), "hi");
}

TEST(ReplyTest, PlainTextFlattening) {
    auto reply = Reply::ok("summary");
    EXPECT_EQ(reply.to_plain_text(), "summary");

    reply.image = ImageBytes{1, 2, 3};
    reply.buttons = ButtonMatrix{"", {{{"A", "/a", ""}}}};
    EXPECT_EQ(reply.to_plain_text(), "summary\n[Image: 3 bytes]\n\nA");

    Reply image_only;
    image_only.image = ImageBytes{9};
    EXPECT_EQ(image_only.to_plain_text(), "[Image: 1 bytes]");
}
