#include "pianoplayer/backend/XTestKeyInjector.h"

#include <QDebug>

#include <X11/Xlib.h>
#include <X11/keysym.h>
#include <X11/extensions/XTest.h>

namespace pianoplayer::backend {

namespace {

static KeySym modifierKeysym(KeyModifier m) {
    switch (m) {
    case KeyModifier::Shift: return XK_Shift_L;
    case KeyModifier::Control: return XK_Control_L;
    default: break;
    }
    return NoSymbol;
}

} // namespace

XTestKeyInjector::~XTestKeyInjector() {
    close();
}

bool XTestKeyInjector::open(QString* error) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_display) return true;

    Display* display = XOpenDisplay(nullptr);
    if (!display) {
        if (error) *error = "cannot open X display (is DISPLAY set?)";
        return false;
    }

    int eventBase = 0, errorBase = 0, major = 0, minor = 0;
    if (!XTestQueryExtension(display, &eventBase, &errorBase, &major, &minor)) {
        XCloseDisplay(display);
        if (error) *error = "X server does not support the XTest extension";
        return false;
    }

    m_display = display;
    qDebug().noquote() << QString("XTestKeyInjector: XTest %1.%2 ready").arg(major).arg(minor);
    return true;
}

void XTestKeyInjector::close() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_display) return;
    XCloseDisplay(m_display);
    m_display = nullptr;
}

bool XTestKeyInjector::sendKey(unsigned long keysym, bool press, QString* error) {
    const KeyCode code = XKeysymToKeycode(m_display, KeySym(keysym));
    if (code == 0) {
        if (error) *error = QString("no keycode for keysym 0x%1").arg(keysym, 0, 16);
        return false;
    }
    if (!XTestFakeKeyEvent(m_display, code, press ? True : False, CurrentTime)) {
        if (error) *error = QString("XTestFakeKeyEvent failed for keycode %1").arg(code);
        return false;
    }
    return true;
}

bool XTestKeyInjector::tap(const KeyStroke& stroke, QString* error) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_display) {
        if (error) *error = "key injector is not open";
        return false;
    }

    const KeySym key = XStringToKeysym(QByteArray(1, stroke.key).constData());
    const KeySym mod = modifierKeysym(stroke.modifier);

    bool ok = true;
    if (mod != NoSymbol) ok = sendKey(mod, true, error);
    if (ok) ok = sendKey(key, true, error) && sendKey(key, false, error);
    // The modifier goes up even when the key failed.
    if (mod != NoSymbol) {
        QString modError;
        if (!sendKey(mod, false, &modError) && ok) {
            ok = false;
            if (error) *error = modError;
        }
    }
    XFlush(m_display);
    return ok;
}

bool XTestKeyInjector::releaseAll(QString* error) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_display) return true;

    const bool ok = sendKey(XK_Shift_L, false, error) && sendKey(XK_Control_L, false, error);
    XFlush(m_display);
    return ok;
}

} // namespace pianoplayer::backend
