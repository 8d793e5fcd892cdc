#include "config.hpp"
#include "capture_server.hpp"
#include "log.hpp"
#include "settings.hpp"
#include "utils.hpp"
#include <csignal>
#include <pthread.h>
#include <string>

int main(){
    signal(SIGPIPE, SIG_IGN);

    // Handled synchronously below; block before any thread is spawned.
    sigset_t sigs;
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGUSR1);
    sigaddset(&sigs, SIGINT);
    sigaddset(&sigs, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &sigs, nullptr);

    Logger log(console_sink());
    Settings settings = Settings::load(default_settings_path());

    log.info(std::string(">>> ") + cfg::APP_NAME + " " + cfg::APP_VERSION);
    log.info(std::string("Discard received files: ") + (settings.discard_flag() ? "true" : "false"));

    CaptureServer srv(executable_dir(), settings.policy(), log);
    if (!srv.start(cfg::LISTEN_PORT)) {
        log.error("Failed to start listener");
        return 1;
    }

    // SIGUSR1 toggles the discard flag, SIGINT/SIGTERM exit.
    for (;;) {
        int sig = 0;
        if (sigwait(&sigs, &sig) != 0) continue;
        if (sig != SIGUSR1) break;

        bool flag = !settings.discard_flag();
        settings.set_discard_flag(flag);
        log.info(std::string("Discard received files: ") + (flag ? "true" : "false"));
        if (!settings.store()) log.warn("Cannot store settings to " + settings.path());
    }

    log.info("Shutting down");
    srv.stop();
    return 0;
}
