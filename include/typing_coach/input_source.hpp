#pragma once

#include <memory>
#include <string>
#include <vector>

#include "typing_coach/types.hpp"

struct libevdev;

namespace tc::core {

enum class ReadStatus {
    Ok,
    WouldBlock,
    Error,
};

// One readable keyboard handle. close() must be safe to call more than once.
class InputSource {
public:
    virtual ~InputSource() = default;

    [[nodiscard]] virtual DeviceId id() const = 0;
    [[nodiscard]] virtual const std::string& name() const = 0;
    [[nodiscard]] virtual int fd() const = 0;
    // Source-specific liveness on top of the descriptor check in validate().
    [[nodiscard]] virtual bool healthy() const = 0;
    // Appends every pending key event; stops at the first error.
    virtual ReadStatus read(std::vector<RawKeyEvent>& out) = 0;
    virtual void close() = 0;
    [[nodiscard]] virtual bool closed() const = 0;
};

using InputSourcePtr = std::unique_ptr<InputSource>;

class EvdevSource : public InputSource {
public:
    // Returns nullptr when the node cannot be opened as an evdev keyboard.
    static InputSourcePtr open(const std::string& path, DeviceId id);

    struct ConstructToken;
    EvdevSource(const ConstructToken&, DeviceId id, std::string name, int fd, libevdev* dev);
    ~EvdevSource() override;
    EvdevSource(const EvdevSource&) = delete;
    EvdevSource& operator=(const EvdevSource&) = delete;

    [[nodiscard]] DeviceId id() const override { return id_; }
    [[nodiscard]] const std::string& name() const override { return name_; }
    [[nodiscard]] int fd() const override { return fd_; }
    [[nodiscard]] bool healthy() const override;
    ReadStatus read(std::vector<RawKeyEvent>& out) override;
    void close() override;
    [[nodiscard]] bool closed() const override { return fd_ < 0; }

private:
    DeviceId id_;
    std::string name_;
    int fd_;
    libevdev* dev_;
    bool failed_{false};
};

}  // namespace tc::core
