#pragma once

#include <atomic>
#include <thread>

#include "pianoplayer/input/HotkeySource.h"

namespace pianoplayer::input {

// Must run before any other Xlib call when several threads talk to X.
bool initX11Threads();

// Grabs the bound keys on the X root window (any modifier state) and polls
// for presses on its own thread and display connection.
class X11HotkeyListener final : public HotkeySource {
    Q_OBJECT
public:
    static constexpr int kPollIntervalMs = 20;

    explicit X11HotkeyListener(QObject* parent = nullptr);
    ~X11HotkeyListener() override;

    bool start(QString* error = nullptr) override;
    void stop() override;

private:
    void run(void* display);

    std::thread m_thread;
    std::atomic<bool> m_running{false};
};

} // namespace pianoplayer::input
