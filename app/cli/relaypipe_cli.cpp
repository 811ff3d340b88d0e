#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <iterator>
#include <string>
#include <thread>
#include <unistd.h>
#include "ClientConfig.h"
#include "HttpClient.h"
#include "Logger.h"
#include "TransferSession.h"
#include "Version.h"

using namespace RelayPipe;

namespace {
    volatile sig_atomic_t signalReceived = 0;

    void signalHandler(int) {
        signalReceived = 1;
    }

    void printUsage(const char* prog) {
        std::cout << "RelayPipe - pipe data through a relay server" << std::endl;
        std::cout << "\nUsage: " << prog << " <COMMAND> [OPTIONS] [CHANNEL]" << std::endl;
        std::cout << "\nCommands:" << std::endl;
        std::cout << "  send      Read stdin and push it to the channel" << std::endl;
        std::cout << "  recv      Consume the channel and write it to stdout" << std::endl;
        std::cout << "  peek      Copy the channel to stdout without consuming it" << std::endl;
        std::cout << "  delete    Delete the channel and everything queued in it" << std::endl;
        std::cout << "  query     Print the channel's state" << std::endl;
        std::cout << "  config    Write the given options to the config file and exit" << std::endl;
        std::cout << "\nOptions:" << std::endl;
        std::cout << "  --url <URL>             Relay url (http://host[:port][/base])" << std::endl;
        std::cout << "  --channel <NAME>        Channel name" << std::endl;
        std::cout << "  --password <PW>         Encrypt with this password (or RELAYPIPE_PASSWORD)" << std::endl;
        std::cout << "  --compress              Compress chunks before sending" << std::endl;
        std::cout << "  --ttl <SEC>             Channel time-to-live requested by the sender" << std::endl;
        std::cout << "  --timeout <MS>          Per-request timeout" << std::endl;
        std::cout << "  --idle-timeout <MS>     Give up after this long without progress" << std::endl;
        std::cout << "  --config <PATH>         Config file (default: ~/.config/relaypipe/relaypipe.conf)" << std::endl;
        std::cout << "  --log-level <LEVEL>     debug, info, warn, error or critical (default: warn)" << std::endl;
        std::cout << "  --version               Print the version and exit" << std::endl;
        std::cout << "  --help                  Show this help message" << std::endl;
    }

    std::vector<uint8_t> readAll(std::istream& in) {
        return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    bool writeAll(const std::vector<uint8_t>& data) {
        if (data.empty()) {
            return true;
        }
        std::cout.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        std::cout.flush();
        return static_cast<bool>(std::cout);
    }

    int exitCodeFor(const Error& error) {
        switch (error.code) {
            case ErrorCode::AuthError: return 3;
            case ErrorCode::Locked: return 4;
            case ErrorCode::Timeout:
            case ErrorCode::Empty: return 5;
            case ErrorCode::IntegrityError: return 6;
            case ErrorCode::Cancelled: return 130;
            default: return 1;
        }
    }

    void printInfo(const ChannelInfo& info) {
        std::cout << "channel:            " << info.name << std::endl;
        std::cout << "channel id:         " << info.channelId << std::endl;
        std::cout << "queued chunks:      " << info.chunkCount << std::endl;
        std::cout << "queued bytes:       " << info.queuedBytes << std::endl;
        std::cout << "established:        " << (info.established ? "yes" : "no") << std::endl;
        std::cout << "password protected: " << (info.passwordProtected ? "yes" : "no") << std::endl;
        std::cout << "encrypted:          " << (info.encrypted ? "yes" : "no") << std::endl;
        std::cout << "locked:             " << (info.locked ? "yes" : "no") << std::endl;
        std::cout << "complete:           " << (info.complete ? "yes" : "no") << std::endl;
        std::cout << "age:                " << info.ageSec << "s" << std::endl;
        std::cout << "idle:               " << info.idleSec << "s (ttl " << info.ttlSec << "s)" << std::endl;
        std::cout << "pushes / pops:      " << info.pushes << " / " << info.pops << std::endl;
    }
}

int main(int argc, char* argv[]) {
    auto& logger = Logger::instance();
    logger.setComponent("CLI");
    logger.setLevel(LogLevel::WARN);

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string command;
    std::string configPath;
    std::string channelArg;
    std::string url, channel, password, ttl, timeout, idleTimeout;
    bool compress = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--url" && i + 1 < argc) {
            url = argv[++i];
        }
        else if (arg == "--channel" && i + 1 < argc) {
            channel = argv[++i];
        }
        else if (arg == "--password" && i + 1 < argc) {
            password = argv[++i];
        }
        else if (arg == "--compress") {
            compress = true;
        }
        else if (arg == "--ttl" && i + 1 < argc) {
            ttl = argv[++i];
        }
        else if (arg == "--timeout" && i + 1 < argc) {
            timeout = argv[++i];
        }
        else if (arg == "--idle-timeout" && i + 1 < argc) {
            idleTimeout = argv[++i];
        }
        else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        }
        else if (arg == "--log-level" && i + 1 < argc) {
            logger.setLevel(Logger::parseLevel(argv[++i], LogLevel::WARN));
        }
        else if (arg == "--version") {
            std::cout << "relaypipe " << Version::toString() << std::endl;
            return 0;
        }
        else if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        else if (!arg.empty() && arg[0] != '-' && command.empty()) {
            command = arg;
        }
        else if (!arg.empty() && arg[0] != '-' && channelArg.empty()) {
            channelArg = arg;
        }
        else {
            std::cerr << "Error: Unknown or incomplete option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    auto loaded = ClientConfig::load(configPath);
    if (!loaded) {
        std::cerr << "Error: " << loaded.error().message << std::endl;
        return 2;
    }
    ClientConfig cfg = *loaded;

    try {
        if (!url.empty()) cfg.url = url;
        if (!channel.empty()) cfg.channel = channel;
        if (!channelArg.empty()) cfg.channel = channelArg;
        if (!password.empty()) cfg.password = password;
        if (compress) cfg.compress = true;
        if (!ttl.empty()) cfg.ttlSec = std::stoi(ttl);
        if (!timeout.empty()) cfg.timeoutMs = std::stoi(timeout);
        if (!idleTimeout.empty()) cfg.idleTimeoutMs = std::stoi(idleTimeout);
    } catch (const std::exception&) {
        std::cerr << "Error: numeric option expected" << std::endl;
        return 2;
    }

    // A short per-request timeout needs a shorter long-poll
    if (cfg.pollWaitMs >= cfg.timeoutMs) {
        cfg.pollWaitMs = cfg.timeoutMs / 2;
    }

    auto valid = cfg.validate();
    if (!valid) {
        std::cerr << "Error: " << valid.error().message << std::endl;
        return 2;
    }

    if (command == "config") {
        auto saved = cfg.save(configPath);
        if (!saved) {
            std::cerr << "Error: " << saved.error().message << std::endl;
            return 2;
        }
        return 0;
    }

    auto relayUrl = RelayUrl::parse(cfg.url);
    if (!relayUrl) {
        std::cerr << "Error: " << relayUrl.error().message << std::endl;
        return 2;
    }
    HttpClient transport(*relayUrl);
    if (command == "recv" || command == "peek") {
        // A relay with a raised max_channel_bytes can answer a peek larger than the default cap
        auto cap = transport.adoptServerLimits(std::chrono::milliseconds(cfg.timeoutMs));
        if (!cap) {
            logger.warn("Keeping the default response size limit: " + cap.error().message);
        }
    }

    SessionOptions options;
    options.requestTimeout = std::chrono::milliseconds(cfg.timeoutMs);
    options.idleTimeout = std::chrono::milliseconds(cfg.idleTimeoutMs);
    options.pollWait = std::chrono::milliseconds(cfg.pollWaitMs);
    options.maxRetries = cfg.maxRetries;
    options.ttlSec = cfg.ttlSec;
    options.compress = cfg.compress;

    TransferSession session(transport, cfg.channel, cfg.password, options);

    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::atomic<bool> finished{false};
    std::thread watcher([&session, &finished]() {
        while (!finished) {
            if (signalReceived) {
                session.cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    int status = 0;
    if (command == "send") {
        if (isatty(STDIN_FILENO)) {
            logger.info("Reading from the terminal; end with Ctrl+D");
        }
        auto data = readAll(std::cin);
        auto sent = session.send(data);
        if (!sent) {
            std::cerr << "Error: " << sent.error().toString() << std::endl;
            status = exitCodeFor(sent.error());
        }
    }
    else if (command == "recv" || command == "peek") {
        ReceiveResult result = command == "recv" ? session.receive() : session.peek();
        // Whatever arrived before a failure is still written out
        if (!writeAll(result.data)) {
            std::cerr << "Error: cannot write to stdout" << std::endl;
            status = 1;
        }
        if (result.error) {
            std::cerr << "Error: " << result.error->toString() << std::endl;
            status = exitCodeFor(*result.error);
        }
    }
    else if (command == "delete") {
        auto cleared = session.clear();
        if (!cleared) {
            std::cerr << "Error: " << cleared.error().toString() << std::endl;
            status = exitCodeFor(cleared.error());
        }
    }
    else if (command == "query") {
        auto info = session.query();
        if (!info) {
            std::cerr << "Error: " << info.error().toString() << std::endl;
            status = exitCodeFor(info.error());
        } else {
            printInfo(*info);
        }
    }
    else {
        std::cerr << "Error: Unknown command: " << (command.empty() ? "(none)" : command) << std::endl;
        printUsage(argv[0]);
        status = 1;
    }

    finished = true;
    watcher.join();
    return status;
}
