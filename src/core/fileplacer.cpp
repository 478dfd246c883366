#include "fileplacer.h"

#include <QByteArray>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>
#include <filesystem>
#include <system_error>

namespace FilePlacer {

QString partialPathFor(const QString& finalPath)
{
    const QFileInfo info(finalPath);
    return QDir(info.absolutePath()).filePath("." + info.fileName() + ".partial");
}

bool replaceFile(const QString& from, const QString& to, QString* errorOut)
{
    // QFile::rename refuses to overwrite, std::filesystem::rename replaces atomically
    std::error_code ec;
    std::filesystem::rename(std::filesystem::path(QFile::encodeName(from).toStdString()),
                            std::filesystem::path(QFile::encodeName(to).toStdString()), ec);
    if (ec)
    {
        if (errorOut)
            *errorOut = QString("Cannot rename %1 to %2: %3").arg(from, to, QString::fromStdString(ec.message()));
        return false;
    }
    return true;
}

bool copyFile(const QString& from, const QString& to, QString* errorOut)
{
    QFile in(from);
    QFile out(to);
    if (!in.open(QIODevice::ReadOnly))
    {
        if (errorOut)
            *errorOut = QString("Failed to open %1: %2").arg(from, in.errorString());
        return false;
    }
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate))
    {
        if (errorOut)
            *errorOut = QString("Failed to write %1: %2").arg(to, out.errorString());
        return false;
    }

    QByteArray buf;
    buf.resize(4 * 1024 * 1024);
    qint64 copied = 0;
    while (!in.atEnd())
    {
        const qint64 r = in.read(buf.data(), buf.size());
        if (r < 0)
        {
            if (errorOut)
                *errorOut = QString("Read error %1: %2").arg(from, in.errorString());
            out.close();
            out.remove();
            return false;
        }
        if (r == 0)
            break;
        if (out.write(buf.constData(), r) != r)
        {
            if (errorOut)
                *errorOut = QString("Write error %1: %2").arg(to, out.errorString());
            out.close();
            out.remove();
            return false;
        }
        copied += r;
    }

    if (!out.flush() || copied != in.size())
    {
        if (errorOut)
            *errorOut = QString("Short copy %1: %2 of %3 bytes").arg(to).arg(copied).arg(in.size());
        out.close();
        out.remove();
        return false;
    }
    out.close();
    return true;
}

bool place(const PlacementDecision& decision, QString* errorOut)
{
    const QFileInfo source(decision.sourcePath);
    if (!source.exists() || !source.isFile())
    {
        if (errorOut)
            *errorOut = QString("Source file missing: %1").arg(decision.sourcePath);
        return false;
    }

    const QString destDir = QFileInfo(decision.finalPath).absolutePath();
    if (!QDir().mkpath(destDir))
    {
        if (errorOut)
            *errorOut = QString("Cannot create directory %1").arg(destDir);
        return false;
    }

    const QString partial = partialPathFor(decision.finalPath);
    QFile::remove(partial);

    bool sourceConsumed = false;
    if (decision.action == PlacementAction::Move)
    {
        // Same filesystem: a plain rename. Otherwise fall back to copy + delete.
        sourceConsumed = QFile::rename(decision.sourcePath, partial);
    }
    if (!sourceConsumed && !copyFile(decision.sourcePath, partial, errorOut))
    {
        QFile::remove(partial);
        return false;
    }

    if (!replaceFile(partial, decision.finalPath, errorOut))
    {
        if (sourceConsumed)
        {
            // Put the file back so the next run can retry the move
            QFile::rename(partial, decision.sourcePath);
        }
        QFile::remove(partial);
        return false;
    }

    if (!sourceConsumed && !QFile::remove(decision.sourcePath))
    {
        // The placed copy is complete; a leftover source only costs disk space.
        if (errorOut)
            *errorOut = QString("Placed, but could not delete source %1").arg(decision.sourcePath);
    }
    return true;
}

bool appendInfoLine(const QString& seasonDir, const QString& originalName, const QString& finalName, QString* errorOut)
{
    QFile file(QDir(seasonDir).filePath("info.txt"));
    if (!file.open(QIODevice::Append | QIODevice::Text))
    {
        if (errorOut)
            *errorOut = QString("Cannot append to %1: %2").arg(file.fileName(), file.errorString());
        return false;
    }
    QTextStream out(&file);
    out.setEncoding(QStringConverter::Utf8);
    out << originalName << " (" << finalName << ")\n";
    return true;
}

} // namespace FilePlacer
