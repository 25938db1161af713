#pragma once

#include <atomic>

namespace photomosaic::core {

// Stop request shared between a driver and the engine. The engine polls it
// between cells; nothing is unwound.
class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void request_stop() { stop_.store(true, std::memory_order_relaxed); }
    bool stop_requested() const { return stop_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> stop_{false};
};

inline bool stop_requested(const CancellationToken* token) {
    return token != nullptr && token->stop_requested();
}

// Route SIGINT / SIGTERM to token.request_stop(). The token must outlive the
// process' signal handling (use a static or main-scoped token).
void install_interrupt_handler(CancellationToken& token);

} // namespace photomosaic::core
