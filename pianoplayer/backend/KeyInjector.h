#pragma once

#include <QString>

namespace pianoplayer::backend {

enum class KeyModifier {
    None,
    Shift,
    Control,
};

struct KeyStroke {
    char key = 0; // lowercase letter on the typing keyboard
    KeyModifier modifier = KeyModifier::None;

    bool operator==(const KeyStroke& o) const { return key == o.key && modifier == o.modifier; }
    bool operator!=(const KeyStroke& o) const { return !(*this == o); }
};

// Synthesizes keyboard input for whatever window has focus.
class KeyInjector {
public:
    virtual ~KeyInjector() = default;

    virtual bool open(QString* error = nullptr) = 0;
    virtual void close() = 0;

    // Press modifier, press key, release key, release modifier.
    virtual bool tap(const KeyStroke& stroke, QString* error = nullptr) = 0;

    // Releases every modifier that could still be held.
    virtual bool releaseAll(QString* error = nullptr) = 0;
};

} // namespace pianoplayer::backend
