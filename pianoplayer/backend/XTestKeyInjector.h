#pragma once

#include <mutex>

#include "pianoplayer/backend/KeyInjector.h"

typedef struct _XDisplay Display;

namespace pianoplayer::backend {

// KeyInjector backed by the X11 XTest extension.
class XTestKeyInjector final : public KeyInjector {
public:
    XTestKeyInjector() = default;
    ~XTestKeyInjector() override;

    XTestKeyInjector(const XTestKeyInjector&) = delete;
    XTestKeyInjector& operator=(const XTestKeyInjector&) = delete;

    bool open(QString* error = nullptr) override;
    void close() override;
    bool tap(const KeyStroke& stroke, QString* error = nullptr) override;
    bool releaseAll(QString* error = nullptr) override;

private:
    bool sendKey(unsigned long keysym, bool press, QString* error);

    std::mutex m_mutex;
    Display* m_display = nullptr;
};

} // namespace pianoplayer::backend
