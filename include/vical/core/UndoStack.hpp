#pragma once

#include <QString>
#include <cstddef>
#include <memory>
#include <vector>

namespace vical {
namespace core {

class UndoCommand;

class UndoStack
{
public:
    explicit UndoStack(std::size_t limit = 50);
    ~UndoStack();

    void push(std::unique_ptr<UndoCommand> command);
    bool canUndo() const;
    bool canRedo() const;
    // Both return the text of the command they applied, or an empty string.
    QString undo();
    QString redo();
    void clear();
    std::size_t count() const;
    std::size_t limit() const;

private:
    std::vector<std::unique_ptr<UndoCommand>> m_commands;
    std::size_t m_index = 0;
    std::size_t m_limit = 0;
};

} // namespace core
} // namespace vical
