#pragma once

#include <QObject>
#include <QString>
#include <QVector>

#include "pianoplayer/engine/PlaybackController.h"

namespace pianoplayer::input {

struct HotkeyBinding {
    QString keyName; // X keysym name, e.g. "F9", "Escape"
    engine::ControlEvent event;
};

// F7 previous, F8 next, F9 start/resume, F10 stop, F11 pause, Esc quit.
const QVector<HotkeyBinding>& defaultHotkeyBindings();

// false when `keyName` is not bound.
bool controlEventForKey(const QString& keyName, engine::ControlEvent& out);

// Produces control events from global key presses. controlEvent() may be
// emitted from a listener thread; connect it with Qt::QueuedConnection.
class HotkeySource : public QObject {
    Q_OBJECT
public:
    explicit HotkeySource(QObject* parent = nullptr) : QObject(parent) {}
    ~HotkeySource() override = default;

    virtual bool start(QString* error = nullptr) = 0;
    virtual void stop() = 0;

signals:
    void controlEvent(pianoplayer::engine::ControlEvent event);
};

} // namespace pianoplayer::input
