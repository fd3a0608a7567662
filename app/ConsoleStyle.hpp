// ANSI styling for status lines. Colours are dropped when the stream is not a TTY.
#pragma once
#include <QString>
#include <QTextStream>

namespace quickscpapp {

enum class Tone { Plain, Info, Success, Warning, Error, Accent };

bool stdoutIsTty();
bool stderrIsTty();

QString styled(const QString &text, Tone tone, bool bold = false,
               bool colour = true);

QTextStream &out();
QTextStream &err();

void printBanner();
void status(Tone tone, const QString &text, bool bold = false);
void failure(const QString &text, bool bold = false);

} // namespace quickscpapp
