#pragma once

#include <QString>
#include <QStringList>
#include <variant>

#include "vical/input/Action.hpp"
#include "vical/input/Key.hpp"
#include "vical/input/Mode.hpp"

namespace vical {
namespace input {

struct Resolved
{
    Action action;
};

struct Pending
{
    QString buffer;
};

struct Invalid
{
    QString sequence;
};

using GrammarResult = std::variant<Resolved, Pending, Invalid>;

struct CommandLineError
{
    QString message;
};

using CommandLineResult = std::variant<Action, CommandLineError>;

// Longest count accepted before a motion; eight digits spell MMDDYYYY for "gg".
constexpr int MAX_COUNT_DIGITS = 8;

/*
 * Normal mode keys are prefix-free: the prefixes g, c, d, z and Z are never
 * complete commands themselves, so a pending buffer is either a count, a
 * count followed by one prefix, or empty.
 */
GrammarResult resolve(Mode mode, const QString &pending, const Key &key);

// Parses a committed command line. An empty line resolves to CancelInput.
CommandLineResult parseCommandLine(const QString &line);

// Splits on whitespace; double quotes group words. Returns false on an
// unterminated quote.
bool tokenizeCommandLine(const QString &line, QStringList *tokens);

QString keyDisplayText(const Key &key);

} // namespace input
} // namespace vical
