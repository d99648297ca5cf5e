#include "pianoplayer/score/ScoreLibrary.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>

namespace pianoplayer::score {

QString selectionModeName(SelectionMode m) {
    return m == SelectionMode::Sequential ? "sequential" : "random";
}

bool parseSelectionMode(const QString& text, SelectionMode& out) {
    const QString t = text.trimmed().toLower();
    if (t == "sequential") {
        out = SelectionMode::Sequential;
        return true;
    }
    if (t == "random") {
        out = SelectionMode::Random;
        return true;
    }
    return false;
}

ScoreLibrary::ScoreLibrary(SelectionMode mode)
    : m_mode(mode), m_rng(QRandomGenerator::global()->generate()) {}

QStringList ScoreLibrary::scan(const QString& directory) {
    QDir dir(directory);
    if (!dir.exists()) {
        if (QDir().mkpath(directory)) {
            qInfo().noquote() << "ScoreLibrary: created scores directory" << dir.absolutePath();
        } else {
            qWarning().noquote() << "ScoreLibrary: could not create scores directory" << dir.absolutePath();
        }
        return {};
    }

    QStringList paths;
    const QFileInfoList files = dir.entryInfoList(QStringList() << "*.musicxml" << "*.xml" << "*.mxl",
                                                  QDir::Files | QDir::Readable, QDir::Name | QDir::IgnoreCase);
    for (const QFileInfo& fi : files) {
        paths.append(fi.absoluteFilePath());
    }

    if (paths.isEmpty()) {
        qInfo().noquote() << "ScoreLibrary: no scores found in" << dir.absolutePath()
                          << "- add .musicxml files";
    }
    return paths;
}

void ScoreLibrary::setScores(const QStringList& paths) {
    m_scores = paths;
    m_bag.clear();
    m_explicit = false;
    if (m_scores.isEmpty()) m_current = -1;
    else if (m_current >= m_scores.size()) m_current = m_scores.size() - 1;
}

QString ScoreLibrary::pathAt(int index) const {
    if (index < 0 || index >= m_scores.size()) return {};
    return m_scores.at(index);
}

void ScoreLibrary::setMode(SelectionMode mode) {
    m_mode = mode;
    m_bag.clear();
}

int ScoreLibrary::selectNext() {
    if (m_scores.isEmpty()) return -1;
    const int n = m_scores.size();
    m_current = m_current < 0 ? 0 : (m_current + 1) % n;
    m_explicit = true;
    return m_current;
}

int ScoreLibrary::selectPrevious() {
    if (m_scores.isEmpty()) return -1;
    const int n = m_scores.size();
    m_current = m_current < 0 ? n - 1 : (m_current - 1 + n) % n;
    m_explicit = true;
    return m_current;
}

void ScoreLibrary::refillBag() {
    const int n = m_scores.size();
    m_bag.clear();
    m_bag.reserve(n);
    for (int i = 0; i < n; ++i) m_bag.push_back(i);

    // Fisher-Yates; the bag is consumed from the back.
    for (int i = n - 1; i > 0; --i) {
        const int j = int(m_rng.bounded(quint32(i + 1)));
        std::swap(m_bag[i], m_bag[j]);
    }

    if (n > 1 && m_bag.last() == m_current) {
        std::swap(m_bag.last(), m_bag.first());
    }
}

int ScoreLibrary::advance() {
    if (m_scores.isEmpty()) return -1;
    m_explicit = false;

    if (m_mode == SelectionMode::Sequential) {
        m_current = (m_current + 1) % m_scores.size();
        return m_current;
    }

    if (m_bag.isEmpty()) refillBag();
    m_current = m_bag.takeLast();
    return m_current;
}

int ScoreLibrary::takeForStart() {
    if (m_scores.isEmpty()) return -1;
    if (m_explicit && m_current >= 0) {
        m_explicit = false;
        if (m_mode == SelectionMode::Random) {
            // An explicitly chosen score counts as drawn for this random round.
            if (m_bag.isEmpty()) refillBag();
            m_bag.removeAll(m_current);
        }
        return m_current;
    }
    return advance();
}

} // namespace pianoplayer::score
