#include "frogworks_tray/daemon_app.h"
#include <frogworks/backend_client.h>
#include <frogworks/error_types.h>
#include <frogworks/relay_client.h>

#include <iostream>
#include <csignal>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>
#include <cstring>     // for strerror
#include <fcntl.h>
#include <unistd.h>
#endif

namespace frogworks_tray {

// Helper macro for debug logging
#define DEBUG_LOG(app, msg) \
    if ((app)->config_.log_level == "debug") { \
        std::cout << "DEBUG: [Daemon] " << msg << std::endl; \
    }

// Global pointer to the current DaemonApp instance for signal handling
static DaemonApp* g_daemon_app_instance = nullptr;

#ifdef _WIN32
// Windows Ctrl+C / console close handler
BOOL WINAPI console_ctrl_handler(DWORD ctrl_type) {
    if (ctrl_type == CTRL_C_EVENT || ctrl_type == CTRL_CLOSE_EVENT || ctrl_type == CTRL_BREAK_EVENT) {
        if (g_daemon_app_instance) {
            g_daemon_app_instance->shutdown();
        }
        return TRUE;
    }
    return FALSE;
}
#else
// Self-pipe: the handler only writes the signal number, the monitor thread acts on it
static int g_signal_pipe[2] = {-1, -1};

static void signal_handler(int signal) {
    if (g_signal_pipe[1] != -1) {
        char sig = static_cast<char>(signal);
        ssize_t written = write(g_signal_pipe[1], &sig, 1);
        (void)written;  // Nothing useful to do in signal context
    }
}
#endif

DaemonApp::DaemonApp(const frogworks::DaemonConfig& config, std::vector<std::string> args)
    : config_(config)
    , args_(std::move(args))
    , tray_factory_(create_tray)
{
}

DaemonApp::~DaemonApp() {
    shutdown();

    if (presence_thread_.joinable()) {
        presence_thread_.join();
    }
    if (server_) {
        server_->stop();
    }
    remove_signal_handlers();
}

void DaemonApp::set_open_callback(std::function<void(const frogworks::OpenTarget&)> callback) {
    open_callback_ = std::move(callback);
}

void DaemonApp::set_ready_callback(std::function<void()> callback) {
    ready_callback_ = std::move(callback);
}

void DaemonApp::set_tray_factory(TrayFactory factory) {
    tray_factory_ = std::move(factory);
}

void DaemonApp::shutdown() {
    if (shutdown_.signal()) {
        DEBUG_LOG(this, "Shutdown signaled");
    }
}

int DaemonApp::run() {
    DEBUG_LOG(this, "Acquiring instance lock '" << config_.lock_name << "'...");

    try {
        lock_ = frogworks::InstanceLock::acquire(config_.lock_name, config_.lock_directory);
    } catch (const frogworks::FrogworksException& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        state_ = DaemonState::TERMINATED;
        return ExitCode::FATAL;
    }

    if (!lock_) {
        state_ = DaemonState::RELAYING;
        int result = run_relay();
        state_ = DaemonState::TERMINATED;
        return result;
    }

    DEBUG_LOG(this, "Instance lock acquired at " << lock_->path());

    int result;
    try {
        result = run_primary();
    } catch (const frogworks::FrogworksException& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        shutdown();
        if (server_) {
            server_->stop();
        }
        result = ExitCode::FATAL;
    }

    lock_.reset();
    state_ = DaemonState::TERMINATED;
    return result;
}

int DaemonApp::run_relay() {
    DEBUG_LOG(this, "Another instance holds the lock, relaying " << args_.size() << " argument(s)");

    frogworks::RelayClient client(config_.relay_host, config_.relay_port,
                                  config_.connect_timeout_ms, config_.log_level);
    try {
        client.relay(args_);
    } catch (const frogworks::RelayException& e) {
        std::cerr << "Error: Could not reach the running Frogworks instance.\n"
                  << "Details: " << e.what() << std::endl;
        return ExitCode::RELAY_FAILED;
    } catch (const frogworks::InvalidArgumentsException& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return ExitCode::RELAY_FAILED;
    }

    DEBUG_LOG(this, "Arguments relayed to the running instance");
    return ExitCode::OK;
}

int DaemonApp::run_primary() {
    std::cout << "[Daemon] Starting Frogworks daemon (primary instance)" << std::endl;

    frogworks::ArgumentHandler::Actions actions;
    actions.open = [this](const frogworks::OpenTarget& target) {
        if (open_callback_) {
            open_callback_(target);
        }
    };
    actions.ping = [this]() { ping_backend(); };
    actions.quit = [this]() { shutdown(); };
    argument_handler_ = std::make_unique<frogworks::ArgumentHandler>(actions, config_.log_level);

    dispatcher_ = std::make_shared<frogworks::MessageDispatcher>(config_.log_level);
    dispatcher_->on_args([this](const std::vector<std::string>& args) {
        handle_invocation(args, "relayed");
    });

    // Bind before anything else is started: failure here is fatal
    server_ = std::make_unique<frogworks::RelayServer>(
        dispatcher_, config_.relay_host, config_.relay_port,
        config_.read_timeout_ms, config_.log_level);
    server_->bind();
    bound_port_ = server_->port();

    // Without a listener no secondary can reach us, and none can take over while we hold the lock
    server_->set_failure_callback([this](const std::string& reason) {
        std::cerr << "Error: Relay server stopped unexpectedly: " << reason << std::endl;
        relay_failed_ = true;
        shutdown();
    });

    if (config_.install_signal_handlers) {
        install_signal_handlers();
    }

    server_->start();

    if (!config_.no_tray) {
        presence_ = std::make_unique<PresenceTask>(tray_factory_(), config_.log_level);
        presence_->set_ping_callback([this]() { return ping_backend(); });

        DEBUG_LOG(this, "Starting presence task...");
        presence_thread_ = std::thread([this]() {
            try {
                presence_->run(shutdown_);
            } catch (const frogworks::FrogworksException& e) {
                std::cerr << "Error: " << e.what() << std::endl;
                presence_failed_ = true;
                shutdown();
            }
        });
    } else {
        std::cout << "[Daemon] Running without tray. Press Ctrl+C to stop" << std::endl;
    }

    // The invocation that started the primary is handled like a relayed one
    handle_invocation(args_, "startup");

    state_ = DaemonState::PRIMARY;
    if (ready_callback_) {
        ready_callback_();
    }

    shutdown_.wait();

    state_ = DaemonState::SHUTTING_DOWN;
    std::cout << "[Daemon] Shutting down..." << std::endl;

    if (presence_thread_.joinable()) {
        presence_thread_.join();
    }
    server_->stop();
    remove_signal_handlers();

    return (presence_failed_ || relay_failed_) ? ExitCode::FATAL : ExitCode::OK;
}

void DaemonApp::handle_invocation(const std::vector<std::string>& args, const char* source) {
    DEBUG_LOG(this, "Handling " << source << " invocation with " << args.size() << " argument(s)");
    try {
        argument_handler_->handle(args);
    } catch (const frogworks::InvalidArgumentsException& e) {
        std::cerr << "[Daemon] Rejected " << source << " invocation: " << e.what() << std::endl;
    }
}

std::string DaemonApp::ping_backend() {
    frogworks::BackendClient client(config_.api_url, config_.log_level);
    try {
        auto response = client.ping();
        std::cout << "[Daemon] Backend ping OK: " << response.dump() << std::endl;
        return "Frogworks server is reachable";
    } catch (const frogworks::BackendException& e) {
        std::cerr << "[Daemon] Backend ping failed: " << e.what() << std::endl;
        return std::string("Ping failed: ") + e.what();
    }
}

void DaemonApp::install_signal_handlers() {
    g_daemon_app_instance = this;

#ifdef _WIN32
    SetConsoleCtrlHandler(console_ctrl_handler, TRUE);
#else
    if (pipe(g_signal_pipe) == -1) {
        throw frogworks::FrogworksException(std::string("Failed to create signal pipe: ") + strerror(errno));
    }

    // Set write end to non-blocking to prevent signal handler from blocking
    int flags = fcntl(g_signal_pipe[1], F_GETFL);
    if (flags != -1) {
        fcntl(g_signal_pipe[1], F_SETFL, flags | O_NONBLOCK);
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    // Blocks on the pipe; a zero byte from remove_signal_handlers() ends it
    signal_monitor_thread_ = std::thread([this]() {
        char sig = 0;
        ssize_t n;
        do {
            n = read(g_signal_pipe[0], &sig, 1);
        } while (n < 0 && errno == EINTR);

        if (n > 0 && sig != 0) {
            std::cout << "\nReceived termination signal, shutting down..." << std::endl;
            shutdown();
        }
    });
#endif

    signal_handlers_installed_ = true;
    DEBUG_LOG(this, "Signal handlers installed");
}

void DaemonApp::remove_signal_handlers() {
    if (!signal_handlers_installed_) {
        return;
    }

#ifdef _WIN32
    SetConsoleCtrlHandler(console_ctrl_handler, FALSE);
#else
    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);

    char wake = 0;
    ssize_t written = write(g_signal_pipe[1], &wake, 1);
    (void)written;  // Monitor also exits if the pipe is closed under it
    if (signal_monitor_thread_.joinable()) {
        signal_monitor_thread_.join();
    }

    close(g_signal_pipe[0]);
    close(g_signal_pipe[1]);
    g_signal_pipe[0] = g_signal_pipe[1] = -1;
#endif

    g_daemon_app_instance = nullptr;
    signal_handlers_installed_ = false;
}

} // namespace frogworks_tray
