#include "photomosaic/core/cancellation.hpp"

#include <csignal>

namespace photomosaic::core {

namespace {

std::atomic<CancellationToken*> g_interrupt_token{nullptr};

void handle_interrupt(int) {
    CancellationToken* token = g_interrupt_token.load();
    if (token) {
        token->request_stop();
    }
}

} // namespace

void install_interrupt_handler(CancellationToken& token) {
    g_interrupt_token.store(&token);
    std::signal(SIGINT, handle_interrupt);
    std::signal(SIGTERM, handle_interrupt);
}

} // namespace photomosaic::core
