#include "typing_coach/operator_console.hpp"

#include <poll.h>

#include <chrono>
#include <iomanip>
#include <istream>
#include <ostream>
#include <sstream>
#include <thread>

#include <openssl/crypto.h>

#include "typing_coach/log.hpp"

namespace tc::core {

namespace {

constexpr const char* kComponent = "OperatorConsole";
constexpr std::chrono::milliseconds kPollInterval{200};

const char* listenerStateName(KeyListener::State state) {
    switch (state) {
        case KeyListener::State::Idle:
            return "idle";
        case KeyListener::State::Running:
            return "running";
        case KeyListener::State::Stopped:
            return "stopped";
        case KeyListener::State::NoDevices:
            return "no devices";
    }
    return "unknown";
}

// Waits up to kPollInterval for a line, so stop requests and device loss are
// seen even when nobody types. A negative fd reads without waiting.
bool inputReady(int fd, std::istream& in) {
    if (fd < 0 || in.rdbuf()->in_avail() > 0) return true;
    pollfd pfd{fd, POLLIN, 0};
    const int rc = ::poll(&pfd, 1, static_cast<int>(kPollInterval.count()));
    // POLLHUP and POLLERR count as ready; the read then reports end of input.
    return rc > 0;
}

}  // namespace

OperatorConsole::OperatorConsole(const SnapshotBoard& board,
                                 VisibilityFlag& visibility,
                                 PasswordContext& password_context,
                                 LayoutSource& layout,
                                 const KeyMap& key_map,
                                 IgnoredWordSet& ignored,
                                 const WordHasher& hasher,
                                 const KeyListener& listener)
    : board_(board),
      visibility_(visibility),
      password_context_(password_context),
      layout_(layout),
      key_map_(key_map),
      ignored_(ignored),
      hasher_(hasher),
      listener_(listener) {}

void OperatorConsole::printHelp(std::ostream& out) const {
    out << "Commands:" << '\n'
        << "  help                - show this help" << '\n'
        << "  stats               - print the latest statistics" << '\n'
        << "  show | hide         - statistics view visible or hidden" << '\n'
        << "  password on|off     - mark focus as a password field" << '\n'
        << "  layout <id>         - switch keyboard layout" << '\n'
        << "  ignore <word>       - never record statistics for a word" << '\n'
        << "  quit                - exit" << '\n';
}

void OperatorConsole::printStats(std::ostream& out) const {
    const auto snap = board_.latest();
    const auto& c = snap.counters;
    const auto& s = snap.session;

    auto keyLabel = [this](KeyCode code, const std::string& layout) {
        if (auto ch = key_map_.character(code, layout)) return *ch;
        return key_map_.safeName(code, layout);
    };

    out << std::fixed << std::setprecision(1);
    out << "Listener: " << listenerStateName(listener_.state()) << ", " << listener_.deviceCount()
        << " device(s), " << listener_.eventsForwarded() << " event(s)" << '\n';
    out << "Keystrokes: " << c.keystrokes << "  password-filtered: " << c.password_filtered
        << "  malformed: " << c.malformed_dropped << '\n';
    out << "Bursts: " << c.bursts_recorded << " recorded / " << c.bursts_closed << " closed";
    if (snap.burst_open) {
        out << "  (open: " << snap.open_key_count << " keys, " << snap.open_duration_ms << " ms)";
    }
    out << '\n';
    out << "Session: " << snap.sessionWpm() << " WPM over " << s.typing_time_ms / 1000 << " s, last burst "
        << s.last_burst_wpm << " WPM";
    if (s.personal_best_wpm) {
        out << ", best " << *s.personal_best_wpm << " WPM";
    }
    out << '\n';
    out << "Words: " << c.words_observed << " observed, " << c.words_ignored << " ignored, "
        << c.words_unlisted << " not in word list" << '\n';
    if (c.persistence_failures > 0) {
        out << "Persistence failures: " << c.persistence_failures << '\n';
    }

    if (!snap.slowest_keys.empty()) {
        out << "Slowest keys:";
        for (const auto& row : snap.slowest_keys) {
            out << "  " << keyLabel(row.key_code, row.layout) << '=' << row.stat.mean << "ms";
        }
        out << '\n';
    }
    if (!snap.fastest_keys.empty()) {
        out << "Fastest keys:";
        for (const auto& row : snap.fastest_keys) {
            out << "  " << keyLabel(row.key_code, row.layout) << '=' << row.stat.mean << "ms";
        }
        out << '\n';
    }
    if (!snap.slowest_digraphs.empty()) {
        out << "Slowest digraphs:";
        for (const auto& row : snap.slowest_digraphs) {
            out << "  " << keyLabel(row.first_key_code, row.layout) << keyLabel(row.second_key_code, row.layout)
                << '=' << row.stat.mean << "ms";
        }
        out << '\n';
    }
    if (!snap.slowest_words.empty()) {
        out << "Slowest words (ms/letter):";
        for (const auto& row : snap.slowest_words) {
            out << "  " << row.word_key << '=' << row.stat.mean;
        }
        out << '\n';
    }
    out << std::defaultfloat;
}

bool OperatorConsole::execute(const std::string& line, std::ostream& out) {
    std::istringstream iss(line);
    std::string cmd;
    if (!(iss >> cmd)) {
        return true;
    }

    if (cmd == "help") {
        printHelp(out);
    } else if (cmd == "stats") {
        printStats(out);
    } else if (cmd == "show") {
        visibility_.set(true);
        out << "Statistics view visible" << '\n';
    } else if (cmd == "hide") {
        visibility_.set(false);
        out << "Statistics view hidden" << '\n';
    } else if (cmd == "password") {
        std::string mode;
        if (!(iss >> mode) || (mode != "on" && mode != "off")) {
            out << "Usage: password on|off" << '\n';
        } else {
            password_context_.set(mode == "on");
            out << "Password context " << mode << '\n';
        }
    } else if (cmd == "layout") {
        std::string id;
        if (!(iss >> id)) {
            out << "Current layout: " << layout_.current() << '\n';
        } else if (!key_map_.hasLayout(id)) {
            out << "Unknown layout " << id << '\n';
        } else {
            layout_.set(id);
            out << "Layout set to " << id << '\n';
        }
    } else if (cmd == "ignore") {
        std::string word;
        if (!(iss >> word)) {
            out << "Usage: ignore <word>" << '\n';
        } else {
            ignored_.addWord(std::move(word), hasher_);
            out << "Word ignored (" << ignored_.size() << " total)" << '\n';
        }
    } else if (cmd == "quit" || cmd == "exit") {
        return false;
    } else {
        out << "Unknown command" << '\n';
    }
    return true;
}

void OperatorConsole::run(int in_fd, std::istream& in, std::ostream& out,
                          const std::atomic<bool>& stop_requested) {
    printHelp(out);
    out << "> " << std::flush;

    bool console_open = true;
    std::string line;
    while (!stop_requested.load()) {
        if (listener_.state() == KeyListener::State::NoDevices) {
            out << "All input devices are gone" << '\n';
            break;
        }
        if (!console_open) {
            std::this_thread::sleep_for(kPollInterval);
            continue;
        }
        if (!inputReady(in_fd, in)) {
            continue;
        }
        if (!std::getline(in, line)) {
            console_open = false;
            logInfo(kComponent, "Console input closed; running until interrupted");
            continue;
        }
        const bool keep_going = execute(line, out);
        // The line may hold a word passed to "ignore".
        OPENSSL_cleanse(line.data(), line.size());
        if (!keep_going) {
            break;
        }
        out << "> " << std::flush;
    }
    out << "Exiting typing coach" << '\n';
}

}  // namespace tc::core
