//! # Renderer Contract
//!
//! The card image itself is produced by an external renderer. This module
//! defines what the engine hands it and owns its lifecycle.
//!
//! ## Lifecycle
//!
//! ```text
//! Uninitialized --acquire()--> Ready --close()--> Closed
//!       |                                           ^
//!       +-------------------close()-----------------+
//! ```
//!
//! `acquire()` initializes lazily on first use. `close()` is idempotent,
//! waits for renders in flight, and makes every later `acquire()` fail.
//! The handle belongs to the long-lived host, never to a single command.

#ifndef PJSK_RENDER_RENDERER_HPP
#define PJSK_RENDER_RENDERER_HPP

#include "common.hpp"

#include <condition_variable>
#include <cstdint>
#include <future>
#include <mutex>
#include <string>
#include <vector>

namespace pjsk::render {

/// Everything a renderer needs to draw one card.
struct RenderRequest {
    std::string text;
    std::string persona;
    int font_size = 42;
    double line_spacing = 1.20;
    bool curve_enabled = false;
    int offset_x = 0;
    int offset_y = 0;
    double curve_intensity = 0.5;
    bool shadow_enabled = true;
    std::string emoji_set = "apple";
    /// Render with the renderer's default font face.
    bool default_font = false;
};

/// Encoded image data.
using ImageBytes = std::vector<uint8_t>;

/// A failed render, with a short description safe to show to users.
struct RenderError {
    std::string message;

    [[nodiscard]] auto to_string() const -> std::string {
        return message;
    }
};

/// Abstract renderer backend.
class Renderer {
public:
    virtual ~Renderer() = default;

    /// Loads fonts and assets. Called once, before the first render.
    virtual auto initialize() -> Result<bool, RenderError> = 0;

    /// Draws one card. May block; may throw.
    virtual auto render(const RenderRequest& request) -> Result<ImageBytes, RenderError> = 0;

    /// Releases backend resources.
    virtual void close() = 0;
};

/// Renderer that accepts every request and produces no image data.
class NullRenderer : public Renderer {
public:
    auto initialize() -> Result<bool, RenderError> override {
        return true;
    }
    auto render(const RenderRequest& /*request*/) -> Result<ImageBytes, RenderError> override {
        return ImageBytes{};
    }
    void close() override {}
};

enum class RendererState { Uninitialized, Ready, Closed };

/// Returns the lowercase name of a renderer state.
[[nodiscard]] auto renderer_state_name(RendererState state) -> const char*;

/// Owning, thread-safe handle around a `Renderer`.
class RendererHandle {
public:
    explicit RendererHandle(Box<Renderer> renderer);

    /// Closes the renderer if it is still open.
    ~RendererHandle();

    RendererHandle(const RendererHandle&) = delete;
    auto operator=(const RendererHandle&) -> RendererHandle& = delete;

    /// Registers a user, initializing the renderer on first use.
    ///
    /// # Returns
    ///
    /// `true`, or an error if the handle is closed or initialization failed.
    /// A failed initialization leaves the handle `Uninitialized` so a later
    /// call retries.
    auto acquire() -> Result<bool, RenderError>;

    /// Drops a user registered by `acquire()`.
    void release();

    /// Closes the renderer. Safe to call more than once.
    void close();

    /// Renders on a worker thread.
    ///
    /// Errors returned by the backend and exceptions it throws both arrive
    /// as `RenderError` through the future.
    [[nodiscard]] auto render(RenderRequest request)
        -> std::future<Result<ImageBytes, RenderError>>;

    [[nodiscard]] auto state() const -> RendererState;

    [[nodiscard]] auto users() const -> int;

private:
    Box<Renderer> renderer_;
    RendererState state_ = RendererState::Uninitialized;
    int users_ = 0;
    int in_flight_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable idle_;

    auto acquire_locked() -> Result<bool, RenderError>;
};

} // namespace pjsk::render

#endif // PJSK_RENDER_RENDERER_HPP
