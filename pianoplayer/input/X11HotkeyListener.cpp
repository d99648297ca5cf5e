#include "pianoplayer/input/X11HotkeyListener.h"

#include <QDebug>

#include <chrono>

#include <X11/Xlib.h>

namespace pianoplayer::input {

namespace {

static int g_grabErrors = 0;

static int onGrabError(Display*, XErrorEvent* ev) {
    if (ev->error_code == BadAccess) ++g_grabErrors;
    return 0;
}

} // namespace

bool initX11Threads() {
    return XInitThreads() != 0;
}

X11HotkeyListener::X11HotkeyListener(QObject* parent) : HotkeySource(parent) {}

X11HotkeyListener::~X11HotkeyListener() {
    stop();
}

bool X11HotkeyListener::start(QString* error) {
    if (m_thread.joinable()) return true;

    Display* display = XOpenDisplay(nullptr);
    if (!display) {
        if (error) *error = "cannot open X display for global hotkeys (is DISPLAY set?)";
        return false;
    }

    const Window root = DefaultRootWindow(display);
    g_grabErrors = 0;
    XErrorHandler previous = XSetErrorHandler(onGrabError);
    for (const auto& b : defaultHotkeyBindings()) {
        const KeySym sym = XStringToKeysym(b.keyName.toLatin1().constData());
        const KeyCode code = XKeysymToKeycode(display, sym);
        if (code == 0) {
            qWarning().noquote() << "X11HotkeyListener: no keycode for" << b.keyName;
            continue;
        }
        XGrabKey(display, code, AnyModifier, root, False, GrabModeAsync, GrabModeAsync);
    }
    XSelectInput(display, root, KeyPressMask);
    XSync(display, False);
    XSetErrorHandler(previous);

    if (g_grabErrors > 0) {
        qWarning().noquote() << QString("X11HotkeyListener: %1 hotkey(s) already grabbed by another client")
                                    .arg(g_grabErrors);
    }

    m_running.store(true);
    m_thread = std::thread(&X11HotkeyListener::run, this, static_cast<void*>(display));
    qInfo() << "X11HotkeyListener: listening for global hotkeys";
    return true;
}

void X11HotkeyListener::stop() {
    m_running.store(false);
    if (m_thread.joinable()) m_thread.join();
}

void X11HotkeyListener::run(void* handle) {
    Display* display = static_cast<Display*>(handle);

    while (m_running.load()) {
        while (XPending(display) > 0) {
            XEvent ev;
            XNextEvent(display, &ev);
            if (ev.type != KeyPress) continue;

            const KeySym sym = XLookupKeysym(&ev.xkey, 0);
            const char* name = XKeysymToString(sym);
            engine::ControlEvent event;
            if (name && controlEventForKey(QString::fromLatin1(name), event)) {
                emit controlEvent(event);
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMs));
    }

    XUngrabKey(display, AnyKey, AnyModifier, DefaultRootWindow(display));
    XCloseDisplay(display);
}

} // namespace pianoplayer::input
