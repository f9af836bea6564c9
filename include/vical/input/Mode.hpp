#pragma once

#include <QString>

namespace vical {
namespace input {

enum class Mode
{
    Normal,
    Insert,
    CommandLine,
};

QString modeName(Mode mode);

} // namespace input
} // namespace vical
