#include "render/renderer.hpp"

#include "log/log.hpp"

#include <exception>

namespace pjsk::render {

auto renderer_state_name(RendererState state) -> const char* {
    switch (state) {
    case RendererState::Uninitialized:
        return "uninitialized";
    case RendererState::Ready:
        return "ready";
    case RendererState::Closed:
        return "closed";
    }
    return "unknown";
}

RendererHandle::RendererHandle(Box<Renderer> renderer) : renderer_(std::move(renderer)) {}

RendererHandle::~RendererHandle() {
    close();
}

auto RendererHandle::acquire_locked() -> Result<bool, RenderError> {
    if (state_ == RendererState::Closed) {
        return RenderError{"renderer is closed"};
    }
    if (state_ == RendererState::Uninitialized) {
        PJSK_LOG_INFO("render", "Initializing renderer");
        auto init = renderer_->initialize();
        if (is_err(init)) {
            PJSK_LOG_ERROR("render", "Renderer initialization failed: "
                                         << unwrap_err(init).to_string());
            return unwrap_err(init);
        }
        state_ = RendererState::Ready;
    }
    ++users_;
    return true;
}

auto RendererHandle::acquire() -> Result<bool, RenderError> {
    std::lock_guard<std::mutex> lock(mutex_);
    return acquire_locked();
}

void RendererHandle::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (users_ > 0) {
        --users_;
    }
}

void RendererHandle::close() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (state_ == RendererState::Closed) {
        return;
    }
    idle_.wait(lock, [this] { return in_flight_ == 0; });
    if (state_ == RendererState::Ready) {
        renderer_->close();
        PJSK_LOG_INFO("render", "Renderer closed");
    }
    state_ = RendererState::Closed;
    users_ = 0;
}

auto RendererHandle::render(RenderRequest request)
    -> std::future<Result<ImageBytes, RenderError>> {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto acquired = acquire_locked();
        if (is_err(acquired)) {
            std::promise<Result<ImageBytes, RenderError>> failed;
            failed.set_value(unwrap_err(acquired));
            return failed.get_future();
        }
        ++in_flight_;
    }

    return std::async(std::launch::async, [this, request = std::move(request)]() {
        // Decrements the in-flight count however the backend exits
        struct InFlight {
            RendererHandle* handle;
            ~InFlight() {
                std::lock_guard<std::mutex> lock(handle->mutex_);
                --handle->in_flight_;
                if (handle->users_ > 0) {
                    --handle->users_;
                }
                handle->idle_.notify_all();
            }
        } in_flight{this};

        try {
            return renderer_->render(request);
        } catch (const std::exception& e) {
            PJSK_LOG_ERROR("render", "Renderer threw: " << e.what());
            return Result<ImageBytes, RenderError>(RenderError{e.what()});
        } catch (...) {
            PJSK_LOG_ERROR("render", "Renderer threw a non-standard exception");
            return Result<ImageBytes, RenderError>(RenderError{"unknown renderer exception"});
        }
    });
}

auto RendererHandle::state() const -> RendererState {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

auto RendererHandle::users() const -> int {
    std::lock_guard<std::mutex> lock(mutex_);
    return users_;
}

} // namespace pjsk::render
