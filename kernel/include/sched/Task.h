//
// Task.h - the scheduler state syscalls operate on
//

#ifndef HERONOS_TASK_H
#define HERONOS_TASK_H

#include <stdint.h>
#include <mem/AddressSpace.h>
#include <mem/MemTypes.h>
#include <fs/FileTable.h>

namespace kernel::sched{
    using TaskId = uint64_t;

    class Task{
    public:
        virtual ~Task() = default;

        [[nodiscard]] virtual TaskId id() const = 0;
        //User address cleared (and futex-woken) when the task exits
        virtual void setClearChildTid(mm::virt_addr address) = 0;
        virtual mm::AddressSpace& addressSpace() = 0;
        virtual fs::FileTable& files() = 0;
    };

    //Both provided by the scheduler
    Task& currentTask();
    [[noreturn]] void exitCurrentTask(int32_t status);
}

#endif //HERONOS_TASK_H
