#include "config.hpp"
#include "http.hpp"
#include "interrupt.hpp"
#include "log.hpp"
#include "query_client.hpp"
#include "util.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <cstring>
#include <cstdlib>
#include <thread>
#include <atomic>
#include <mutex>
#include <chrono>
#include <unistd.h>

// Relays SIGINT to whichever stream is currently being read.
class InterruptRelay {
public:
    InterruptRelay() : thread_([this] { run(); }) {}
    ~InterruptRelay() {
        stop_.store(true);
        thread_.join();
    }

    void watch(const qwstream::CancellationToken& token) {
        std::lock_guard<std::mutex> lock(mutex_);
        token_ = token;
        watching_ = true;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        watching_ = false;
    }

private:
    void run() {
        while (!stop_.load()) {
            if (qwstream::interrupted()) {
                std::lock_guard<std::mutex> lock(mutex_);
                if (watching_) token_.cancel();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    std::mutex mutex_;
    qwstream::CancellationToken token_;
    bool watching_ = false;
    std::atomic<bool> stop_{false};
    std::thread thread_;
};

static void print_usage() {
    std::cout << "Usage: qwstream [options] <database> [question...]\n"
              << "\n"
              << "Streams the answer to a natural-language question about a graph.\n"
              << "Without a question, starts an interactive session on <database>.\n"
              << "\n"
              << "Options:\n"
              << "  --base-url URL       Query service URL (default: http://localhost:5000)\n"
              << "  --token TOKEN        API token (sent as Authorization: Bearer)\n"
              << "  --timeout SECONDS    Initiation timeout (default: 30)\n"
              << "  --boundary STR       Message boundary marker\n"
              << "  --json               Print raw messages, one JSON object per line\n"
              << "  -v, --verbose        Debug logging\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Interactive commands:\n"
              << "  /clear               Forget the conversation so far\n"
              << "  /help                Show available commands\n"
              << "  /quit, /exit         Exit\n"
              << "\n"
              << "Environment variables:\n"
              << "  QWSTREAM_BASE_URL    Query service URL\n"
              << "  QWSTREAM_API_TOKEN   API token\n"
              << "  QWSTREAM_COOKIE      Cookie header value (e.g. api_token=...)\n"
              << "  QWSTREAM_LOG_LEVEL   debug, info, warn or error\n";
}

struct Conversation {
    std::string database;
    std::vector<qwstream::ConversationTurn> history;
    std::vector<std::string> results;
};

struct Outcome {
    bool error = false;
    bool interrupted = false;
    std::string answer; // last final response, if any
};

struct Display {
    bool json = false;
    bool dim = false;
};

static void show(const qwstream::StreamMessage& msg, const Display& display) {
    using qwstream::MessageKind;
    if (display.json) {
        std::cout << msg.payload.dump() << '\n' << std::flush;
        return;
    }
    switch (msg.kind) {
        case MessageKind::Status:
            if (msg.content.empty()) break;
            if (display.dim)
                std::cout << "\033[2m… " << msg.content << "\033[0m\n";
            else
                std::cout << "… " << msg.content << '\n';
            break;
        case MessageKind::Error:
            std::cerr << "Error: " << msg.content << '\n';
            break;
        case MessageKind::ConfirmationRequired:
            std::cout << (msg.content.empty() ? "This operation modifies the graph." : msg.content)
                      << '\n';
            if (msg.operation_id) std::cout << "  " << *msg.operation_id << '\n';
            break;
        case MessageKind::Done:
            break;
        case MessageKind::Content:
        case MessageKind::Other:
            if (msg.type == "sql_query") {
                std::cout << "SQL: " << msg.content << '\n';
            } else if (msg.payload.contains("data")) {
                const auto& data = msg.payload["data"];
                std::cout << (data.is_string() ? data.get<std::string>() : data.dump(2)) << '\n';
            } else if (!msg.content.empty()) {
                std::cout << msg.content << '\n';
            }
            break;
    }
    std::cout << std::flush;
}

static Outcome run_stream(qwstream::MessageStream stream, qwstream::QueryClient& client,
                          const Conversation& convo, const std::string& question,
                          const Display& display, InterruptRelay& relay);

// Ask on the terminal, then send CONFIRM. Anything else is answered locally.
static Outcome confirm(const qwstream::StreamMessage& msg, qwstream::QueryClient& client,
                       const Conversation& convo, const std::string& question,
                       const Display& display, InterruptRelay& relay) {
    Outcome outcome;
    if (!msg.operation_id) {
        std::cerr << "Error: confirmation request carries no operation\n";
        outcome.error = true;
        return outcome;
    }

    std::cout << "Type CONFIRM to execute: " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer) || qwstream::trim(answer) != "CONFIRM" ||
        qwstream::interrupted()) {
        std::cout << "Operation cancelled. The destructive SQL query was not executed.\n";
        return outcome;
    }

    qwstream::ConfirmRequest req;
    req.sql_query = *msg.operation_id;
    req.confirmation = "CONFIRM";
    for (const auto& turn : convo.history) req.chat.push_back(turn.content);
    req.chat.push_back(question);
    return run_stream(client.confirm_operation(convo.database, req), client, convo, question,
                      display, relay);
}

static Outcome run_stream(qwstream::MessageStream stream, qwstream::QueryClient& client,
                          const Conversation& convo, const std::string& question,
                          const Display& display, InterruptRelay& relay) {
    Outcome outcome;
    std::optional<qwstream::StreamMessage> pending_confirmation;

    relay.watch(stream.cancellation_token());
    try {
        while (auto msg = stream.next()) {
            show(*msg, display);
            if (msg->is_error()) outcome.error = true;
            if (msg->final_response && msg->kind == qwstream::MessageKind::Content)
                outcome.answer = msg->content;
            if (msg->kind == qwstream::MessageKind::ConfirmationRequired)
                pending_confirmation = std::move(*msg);
        }
    } catch (const qwstream::TransportError&) {
        // Already shown as a "Stream error" message
        outcome.error = true;
    }
    relay.clear();

    if (stream.cancelled()) {
        std::cerr << "\nInterrupted.\n";
        outcome.interrupted = true;
        return outcome;
    }
    if (pending_confirmation) {
        Outcome confirmed = confirm(*pending_confirmation, client, convo, question, display, relay);
        confirmed.error = confirmed.error || outcome.error;
        return confirmed;
    }
    return outcome;
}

static Outcome ask(qwstream::QueryClient& client, Conversation& convo, const std::string& question,
                   const Display& display, InterruptRelay& relay) {
    qwstream::QueryRequest req;
    req.database = convo.database;
    req.query = question;
    req.history = convo.history;
    req.results = convo.results;

    Outcome outcome = run_stream(client.begin_query(req), client, convo, question, display, relay);
    if (!outcome.interrupted) {
        convo.history.push_back({"user", question});
        if (!outcome.answer.empty()) {
            convo.history.push_back({"assistant", outcome.answer});
            convo.results.push_back(outcome.answer);
        }
    }
    return outcome;
}

static int run_interactive(qwstream::QueryClient& client, Conversation& convo,
                           const Display& display, InterruptRelay& relay) {
    std::cout << "qwstream: " << convo.database << "\n"
              << "Type /help for commands, /quit to exit.\n\n";

    std::string line;
    while (true) {
        std::cout << "qwstream> " << std::flush;
        if (!std::getline(std::cin, line)) {
            std::cout << "\n";
            // Ctrl+C at the prompt interrupts the read; Ctrl+D is EOF
            if (qwstream::interrupted()) return 130;
            break;
        }
        qwstream::clear_interrupt();

        line = qwstream::trim(line);
        if (line.empty()) continue;

        if (line[0] == '/') {
            if (line == "/quit" || line == "/exit") {
                break;
            } else if (line == "/clear") {
                convo.history.clear();
                convo.results.clear();
                std::cout << "Conversation cleared.\n";
            } else if (line == "/help") {
                std::cout << "Commands:\n"
                          << "  /clear    Forget the conversation so far\n"
                          << "  /quit     Exit\n"
                          << "  /exit     Exit\n"
                          << "  /help     Show this help\n";
            } else {
                std::cout << "Unknown command: " << line << "\n";
            }
            continue;
        }

        ask(client, convo, line, display, relay);
        std::cout << "\n";
        // Ctrl+C during an answer only stops that answer
        qwstream::clear_interrupt();
    }
    return 0;
}

int main(int argc, char* argv[]) try {
    // Parse arguments
    std::string base_url;
    std::string token;
    std::string boundary;
    long timeout = 0;
    bool verbose = false;
    Display display;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--base-url") == 0 && i + 1 < argc) {
            base_url = argv[++i];
        } else if (std::strcmp(argv[i], "--token") == 0 && i + 1 < argc) {
            token = argv[++i];
        } else if (std::strcmp(argv[i], "--boundary") == 0 && i + 1 < argc) {
            boundary = argv[++i];
        } else if (std::strcmp(argv[i], "--timeout") == 0 && i + 1 < argc) {
            timeout = std::strtol(argv[++i], nullptr, 10);
            if (timeout <= 0) {
                std::cerr << "Invalid timeout: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--json") == 0) {
            display.json = true;
        } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        } else {
            positional.emplace_back(argv[i]);
        }
    }

    if (positional.empty()) {
        print_usage();
        return 1;
    }

    // Initialize
    qwstream::StderrLogger logger;
    auto config = qwstream::Config::load(&logger);

    // Override config with CLI args
    if (!base_url.empty()) config.base_url = base_url;
    if (!token.empty()) config.api_token = token;
    if (!boundary.empty()) config.boundary = boundary;
    if (timeout > 0) config.initiation_timeout_seconds = static_cast<uint32_t>(timeout);
    logger.set_min_level(verbose ? qwstream::LogLevel::Debug
                                 : qwstream::parse_log_level(config.log_level));

    display.dim = !display.json && isatty(STDOUT_FILENO);

    qwstream::install_interrupt_handlers();

    qwstream::http_init();
    qwstream::PlatformHttpClient http_client;
    qwstream::QueryClient client(config, http_client, logger);

    Conversation convo;
    convo.database = positional[0];

    int rc = 0;
    {
        InterruptRelay relay;
        if (positional.size() == 1) {
            rc = run_interactive(client, convo, display, relay);
        } else {
            std::string question = positional[1];
            for (size_t i = 2; i < positional.size(); i++) question += " " + positional[i];
            Outcome outcome = ask(client, convo, question, display, relay);
            rc = outcome.interrupted ? 130 : (outcome.error ? 1 : 0);
        }
    }

    qwstream::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
