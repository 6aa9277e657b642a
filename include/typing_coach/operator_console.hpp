#pragma once

#include <atomic>
#include <iosfwd>
#include <string>

#include "typing_coach/collaborators.hpp"
#include "typing_coach/engine_snapshot.hpp"
#include "typing_coach/key_listener.hpp"
#include "typing_coach/key_map.hpp"
#include "typing_coach/privacy_filter.hpp"

namespace tc::core {

// Line-oriented control surface standing in for the tray UI and the
// accessibility and layout collaborators.
class OperatorConsole {
public:
    OperatorConsole(const SnapshotBoard& board,
                    VisibilityFlag& visibility,
                    PasswordContext& password_context,
                    LayoutSource& layout,
                    const KeyMap& key_map,
                    IgnoredWordSet& ignored,
                    const WordHasher& hasher,
                    const KeyListener& listener);

    // Reads commands from `in`, whose descriptor is in_fd, until "quit",
    // stop_requested or the listener losing every device. End of input only
    // closes the console; the daemon keeps running.
    void run(int in_fd, std::istream& in, std::ostream& out, const std::atomic<bool>& stop_requested);

    // Handles one command line; false means quit.
    bool execute(const std::string& line, std::ostream& out);

private:
    const SnapshotBoard& board_;
    VisibilityFlag& visibility_;
    PasswordContext& password_context_;
    LayoutSource& layout_;
    const KeyMap& key_map_;
    IgnoredWordSet& ignored_;
    const WordHasher& hasher_;
    const KeyListener& listener_;

    void printHelp(std::ostream& out) const;
    void printStats(std::ostream& out) const;
};

}  // namespace tc::core
