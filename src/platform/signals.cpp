#include "signals.hpp"

#include <signal.h>

namespace platform {

static volatile sig_atomic_t g_term_signal = 0;
static struct sigaction g_old_term;
static struct sigaction g_old_int;
static struct sigaction g_old_hup;
static struct sigaction g_old_pipe;
static bool g_installed = false;

static void termination_handler(int sig) {
    g_term_signal = sig;
}

void install_termination_handlers() {
    if (g_installed) return;

    struct sigaction sa;
    sa.sa_handler = termination_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;  // no SA_RESTART: let poll()/sleep wake up
    sigaction(SIGTERM, &sa, &g_old_term);
    sigaction(SIGINT, &sa, &g_old_int);
    sigaction(SIGHUP, &sa, &g_old_hup);

    struct sigaction ign;
    ign.sa_handler = SIG_IGN;
    sigemptyset(&ign.sa_mask);
    ign.sa_flags = 0;
    sigaction(SIGPIPE, &ign, &g_old_pipe);

    g_installed = true;
}

void remove_termination_handlers() {
    if (!g_installed) return;
    sigaction(SIGTERM, &g_old_term, nullptr);
    sigaction(SIGINT, &g_old_int, nullptr);
    sigaction(SIGHUP, &g_old_hup, nullptr);
    sigaction(SIGPIPE, &g_old_pipe, nullptr);
    g_installed = false;
}

bool termination_requested() {
    return g_term_signal != 0;
}

int termination_signal() {
    return static_cast<int>(g_term_signal);
}

void request_termination(int sig) {
    g_term_signal = sig;
}

void clear_termination() {
    g_term_signal = 0;
}

} // namespace platform
