#include "pianoplayer/input/HotkeySource.h"

namespace pianoplayer::input {

const QVector<HotkeyBinding>& defaultHotkeyBindings() {
    static const QVector<HotkeyBinding> kBindings = {
        {"F7", engine::ControlEvent::SelectPrevious},
        {"F8", engine::ControlEvent::SelectNext},
        {"F9", engine::ControlEvent::StartOrResume},
        {"F10", engine::ControlEvent::Stop},
        {"F11", engine::ControlEvent::PauseToggle},
        {"Escape", engine::ControlEvent::Quit},
    };
    return kBindings;
}

bool controlEventForKey(const QString& keyName, engine::ControlEvent& out) {
    for (const auto& b : defaultHotkeyBindings()) {
        if (b.keyName.compare(keyName, Qt::CaseInsensitive) == 0) {
            out = b.event;
            return true;
        }
    }
    return false;
}

} // namespace pianoplayer::input
