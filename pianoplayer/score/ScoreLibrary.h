#pragma once

#include <QRandomGenerator>
#include <QString>
#include <QStringList>
#include <QVector>

namespace pianoplayer::score {

enum class SelectionMode {
    Sequential,
    Random,
};

QString selectionModeName(SelectionMode m);
bool parseSelectionMode(const QString& text, SelectionMode& out);

// Discovered score files plus the selection pointer / playback order policy.
//
// Sequential: fixed order, wrapping. Random: uniform draws without replacement
// until every score was played once, then a fresh shuffle (which never starts
// with the score that was just played, when there is more than one).
class ScoreLibrary final {
public:
    explicit ScoreLibrary(SelectionMode mode = SelectionMode::Random);

    // Lists *.musicxml, *.xml and *.mxl in `directory`, sorted by file name.
    // A missing directory is created and yields an empty list.
    static QStringList scan(const QString& directory);

    void setScores(const QStringList& paths);
    const QStringList& scores() const { return m_scores; }
    int size() const { return m_scores.size(); }
    bool isEmpty() const { return m_scores.isEmpty(); }
    QString pathAt(int index) const;

    SelectionMode mode() const { return m_mode; }
    void setMode(SelectionMode mode);
    void setSeed(quint32 seed) { m_rng.seed(seed); }

    // Index of the current / last chosen score, -1 before anything was chosen.
    int currentIndex() const { return m_current; }
    bool hasExplicitSelection() const { return m_explicit; }

    // Move the pointer without playing anything. Returns the new index (-1 when empty).
    int selectNext();
    int selectPrevious();

    // Next score according to the mode; becomes the current one.
    int advance();

    // Score a StartOrResume should play: the explicitly selected one if there
    // is one (consumed), otherwise advance(). -1 when the library is empty.
    int takeForStart();

private:
    void refillBag();

    QStringList m_scores;
    SelectionMode m_mode = SelectionMode::Random;
    int m_current = -1;
    bool m_explicit = false;
    QVector<int> m_bag; // random mode: indices not yet played in this round
    QRandomGenerator m_rng;
};

} // namespace pianoplayer::score
