#ifndef OFFSETMATCHER_H
#define OFFSETMATCHER_H

#include <QVector>
#include <QtGlobal>

struct OffsetMatch {
    bool valid = false;
    int score = 0;      // Rows whose hashes agree at this offset
    int offset = 0;     // Rows the current frame scrolled down by
};

/**
 * @brief Exhaustive vertical offset search between two row-hash sequences.
 *
 * Every offset o in [0, H) is scored by counting rows z where
 * current[z] == previous[z + o]. The winner maximizes (score, offset), so a
 * tie in score goes to the larger offset.
 */
class OffsetMatcher
{
public:
    static int scoreAt(const QVector<quint64> &previous,
                       const QVector<quint64> &current,
                       int offset);

    // Invalid when either sequence is empty.
    static OffsetMatch findBestOffset(const QVector<quint64> &previous,
                                      const QVector<quint64> &current);
};

#endif // OFFSETMATCHER_H
