#include "rwdagt/common/task_context.hpp"

namespace rwdagt
{

void TaskContext::check_access(std::string_view name, Access access) const
{
    if (!m_validate_access)
    {
        return;
    }
    bool declared = access == Access::Read ? m_task.declares_read(name)
                                           : m_task.declares_write(name);
    if (!declared)
    {
        throw UndeclaredAccessError(m_task.name(), std::string{name}, access);
    }
}

} // namespace rwdagt
