#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace cvpipe::core {

/**
 * @brief Shared cancellation flag observed between units of work.
 *
 * Copies share the same underlying flag, so a token handed to a pipeline run can be
 * cancelled from another thread (e.g. a signal handler polling loop).
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { flag_->store(true, std::memory_order_release); }

    [[nodiscard]] bool isCancelled() const noexcept {
        return flag_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

/**
 * @brief Cooperative stop condition: a cancellation token plus an optional deadline.
 */
struct StopCondition {
    CancellationToken token;
    std::optional<std::chrono::steady_clock::time_point> deadline;

    [[nodiscard]] bool cancelled() const noexcept { return token.isCancelled(); }

    [[nodiscard]] bool expired() const noexcept {
        return deadline && std::chrono::steady_clock::now() >= *deadline;
    }

    [[nodiscard]] bool shouldStop() const noexcept { return cancelled() || expired(); }
};

} // namespace cvpipe::core
