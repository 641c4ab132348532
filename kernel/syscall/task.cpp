//
// task.cpp - task lifecycle syscalls
//

#include <kernel.h>
#include <syscall/handlers.h>

namespace kernel::syscall{
    Result<sched::TaskId, LinuxError> sys_set_tid_address(const mm::virt_addr tidAddress){
        auto& task = sched::currentTask();
        task.setClearChildTid(tidAddress);
        return task.id();
    }

    void sys_exit(const int32_t status){
        log(LoggingImportance::IMPORTANT) << "system is exiting (status " << status << ")\n";
        sched::exitCurrentTask(status);
    }
}
