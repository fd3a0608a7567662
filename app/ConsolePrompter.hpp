// Line-oriented prompts on stdin. Secrets are read with terminal echo off.
#pragma once
#include <QString>
#include <QTextStream>
#include <cstdio>

namespace quickscpapp {

class ConsolePrompter {
public:
    explicit ConsolePrompter(FILE *input = stdin);

    // Returns false once stdin is exhausted. When allowEmpty is false the
    // prompt repeats until a non-empty answer is given.
    bool askLine(const QString &prompt, QString &answer, bool allowEmpty = false);

    // Masked input; an empty answer is not accepted.
    bool askSecret(const QString &prompt, QString &answer);

private:
    FILE *input_;
    QTextStream in_;

    bool readLine(QString &line);
};

// Overwrite the buffer before releasing it.
void secureClear(QString &s);

} // namespace quickscpapp
