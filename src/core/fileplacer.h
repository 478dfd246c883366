#ifndef FILEPLACER_H
#define FILEPLACER_H

#include "pipelinetypes.h"

#include <QString>

/**
 * @brief Makes prepared files visible at their final path.
 *
 * The data is first written (or moved) to a hidden sibling
 * `.<name>.partial` in the destination directory, then renamed over the
 * final path in one step. Readers of the destination directory never see a
 * partially written file under its final name.
 */
namespace FilePlacer {

bool place(const PlacementDecision &decision, QString *errorOut);

// Atomic replace within one filesystem. Overwrites `to` if it exists.
bool replaceFile(const QString &from, const QString &to, QString *errorOut);

bool copyFile(const QString &from, const QString &to, QString *errorOut);

QString partialPathFor(const QString &finalPath);

bool appendInfoLine(const QString &seasonDir, const QString &originalName, const QString &finalName,
                    QString *errorOut);

} // namespace FilePlacer

#endif // FILEPLACER_H
