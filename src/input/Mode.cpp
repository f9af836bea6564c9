#include "vical/input/Mode.hpp"

namespace vical {
namespace input {

QString modeName(Mode mode)
{
    switch (mode) {
    case Mode::Insert:
        return QStringLiteral("INSERT");
    case Mode::CommandLine:
        return QStringLiteral("COMMAND");
    case Mode::Normal:
    default:
        return QStringLiteral("NORMAL");
    }
}

} // namespace input
} // namespace vical
