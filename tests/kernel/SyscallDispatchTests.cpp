//
// Unit tests for syscall dispatch and the file and task syscalls
//

#include "../harness/TestHarness.h"
#include "ArchMocks.h"
#include "KernelMocks.h"
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include <kernel.h>
#include <core/ds/Result.h>
#include <fs/FileTable.h>
#include <syscall/LinuxError.h>
#include <syscall/handlers.h>
#include <syscall/syscall.h>

using namespace kernel;
using namespace kernel::syscall;
using kernel::testing::TaskFixture;
using kernel::testing::TaskExited;
using namespace HeronOSTest;

namespace {
    uint64_t userArg(const void* ptr) {
        return reinterpret_cast<uint64_t>(ptr);
    }

    uint64_t userArg(int64_t value) {
        return static_cast<uint64_t>(value);
    }

    bool logged(const char* text) {
        return arch::testing::serialOutput().find(text) != std::string::npos;
    }

    // Runs a frame that is expected to exit the task and returns the exit status
    int32_t exitStatusOf(const SyscallFrame& frame) {
        try {
            handleSyscall(frame);
        } catch (const TaskExited& exited) {
            return exited.status;
        }
        throw AssertionFailure("Assertion failed: syscall returned instead of exiting the task");
    }
}

// ============================================================================
// Dispatch
// ============================================================================

TEST(Dispatch_UnknownNumberIsNotImplemented) {
    TaskFixture fixture;
    ASSERT_EQ(-38l, handleSyscall({1000, {}}));
    ASSERT_TRUE(logged("Unimplemented syscall: 1000"));
}

TEST(Dispatch_DebugLogNamesHandler) {
    TaskFixture fixture;
    setLogThreshold(LoggingImportance::DEBUG);
    ASSERT_EQ(0l, handleSyscall({29, {1, 0x5401, 0}}));
    ASSERT_TRUE(logged("handle_syscall [29] ioctl"));
    ASSERT_TRUE(logged("Ignore SYS_IOCTL"));
    ASSERT_TRUE(logged("ioctl => 0"));
}

TEST(Dispatch_DebugLinesHiddenByDefault) {
    TaskFixture fixture;
    ASSERT_EQ(0l, handleSyscall({29, {1, 0x5401, 0}}));
    ASSERT_FALSE(logged("handle_syscall"));
    ASSERT_FALSE(logged("ioctl => 0"));
    // Ignored ioctls are always reported
    ASSERT_TRUE(logged("Ignore SYS_IOCTL"));
}

// ============================================================================
// File syscalls
// ============================================================================

TEST(Openat_RequiresCurrentDirectory) {
    TaskFixture fixture;
    const char* path = "hello";
    ASSERT_EQ(-22l, handleSyscall({56, {5, userArg(path), 0, 0}}));
    ASSERT_TRUE(logged("openat => Err(EINVAL)"));

    const int64_t fd = handleSyscall({56, {userArg(int64_t{fs::CURRENT_DIRECTORY_FD}), userArg(path), 0, 0}});
    ASSERT_EQ(3l, fd);
    ASSERT_EQ(std::string("hello"), fixture.files.find(static_cast<fs::Fd>(fd))->path);
}

TEST(Openat_NullPathIsFault) {
    TaskFixture fixture;
    ASSERT_EQ(-14l, handleSyscall({56, {userArg(int64_t{fs::CURRENT_DIRECTORY_FD}), 0, 0, 0}}));
}

TEST(Read_CopiesIntoUserBuffer) {
    TaskFixture fixture;
    const auto fd = fixture.files.addFile("/etc/motd", {'h', 'e', 'r', 'o', 'n'});
    char buffer[16] = {};
    ASSERT_EQ(5l, handleSyscall({63, {userArg(int64_t{fd}), userArg(buffer), sizeof(buffer)}}));
    ASSERT_EQ(0, std::strcmp(buffer, "heron"));
    ASSERT_EQ(0l, handleSyscall({63, {userArg(int64_t{fd}), userArg(buffer), sizeof(buffer)}}));
}

TEST(Read_BadDescriptor) {
    TaskFixture fixture;
    char buffer[4];
    ASSERT_EQ(-9l, handleSyscall({63, {9, userArg(buffer), sizeof(buffer)}}));
    ASSERT_TRUE(logged("read => Err(EBADF)"));
}

TEST(Write_ReachesFileTable) {
    TaskFixture fixture;
    const auto fd = fixture.files.addFile("/dev/console", {});
    const char message[] = "boot ok";
    ASSERT_EQ(7l, handleSyscall({64, {userArg(int64_t{fd}), userArg(message), 7}}));
    ASSERT_TRUE(std::vector<uint8_t>(message, message + 7) == fixture.files.written);
}

TEST(Writev_GathersVectors) {
    TaskFixture fixture;
    const auto fd = fixture.files.addFile("/dev/console", {});
    const char first[] = "abc";
    const char second[] = "defg";
    const fs::IoVec vectors[] = {{userArg(first), 3}, {userArg(second), 4}};
    ASSERT_EQ(7l, handleSyscall({66, {userArg(int64_t{fd}), userArg(vectors), 2}}));
    ASSERT_EQ(std::string("abcdefg"), std::string(fixture.files.written.begin(), fixture.files.written.end()));
}

TEST(Writev_NegativeCountIsInvalid) {
    TaskFixture fixture;
    const auto fd = fixture.files.addFile("/dev/console", {});
    ASSERT_EQ(-22l, handleSyscall({66, {userArg(int64_t{fd}), 0, 0xffffffff}}));
    ASSERT_TRUE(fixture.files.written.empty());
}

TEST(Close_SecondCloseFails) {
    TaskFixture fixture;
    const auto fd = fixture.files.addFile("/tmp/x", {});
    ASSERT_EQ(0l, handleSyscall({57, {userArg(int64_t{fd})}}));
    ASSERT_FALSE(fixture.files.isOpen(fd));
    ASSERT_EQ(-9l, handleSyscall({57, {userArg(int64_t{fd})}}));
}

TEST(Ioctl_AlwaysSucceeds) {
    TaskFixture fixture;
    ASSERT_EQ(0l, handleSyscall({29, {999, 0xdeadbeef, 0x1234}}));
    ASSERT_TRUE(sys_ioctl(-1, 0, mm::virt_addr()).ok());
}

// ============================================================================
// Task syscalls
// ============================================================================

TEST(SetTidAddress_RecordsAddressAndReturnsId) {
    TaskFixture fixture;
    ASSERT_EQ(42l, handleSyscall({96, {0x40001000}}));
    ASSERT_TRUE(fixture.task.clearChildTid.occupied());
    ASSERT_EQ(mm::virt_addr(0x40001000ul), *fixture.task.clearChildTid);
}

TEST(Exit_EndsTaskWithStatus) {
    TaskFixture fixture;
    ASSERT_EQ(3, exitStatusOf({93, {3}}));
    ASSERT_TRUE(logged("system is exiting (status 3)"));
}

TEST(ExitGroup_EndsTaskWithStatus) {
    TaskFixture fixture;
    ASSERT_EQ(-1, exitStatusOf({94, {0xffffffff}}));
}

// ============================================================================
// Result conversion and logging
// ============================================================================

TEST(SyscallBody_AgainOnlyLoggedAtDebug) {
    TaskFixture fixture;
    auto again = [] { return Result<size_t, LinuxError>(LinuxError::AGAIN); };
    auto denied = [] { return Result<size_t, LinuxError>(LinuxError::ACCES); };

    ASSERT_EQ(-11l, syscallBody("poll", again));
    ASSERT_FALSE(logged("poll"));
    ASSERT_EQ(-13l, syscallBody("open", denied));
    ASSERT_TRUE(logged("open => Err(EACCES)"));

    setLogThreshold(LoggingImportance::DEBUG);
    ASSERT_EQ(-11l, syscallBody("poll", again));
    ASSERT_TRUE(logged("poll => Err(EAGAIN)"));
}

TEST(SyscallBody_VoidSuccessReturnsZero) {
    TaskFixture fixture;
    ASSERT_EQ(0l, syscallBody("sync", [] { return Result<void, LinuxError>(); }));
    ASSERT_EQ(-5l, syscallBody("sync", [] { return Result<void, LinuxError>(LinuxError::IO); }));
}

TEST(SyscallBody_AddressesReturnedAsIntegers) {
    TaskFixture fixture;
    auto mapped = [] { return Result<mm::virt_addr, LinuxError>(mm::virt_addr(0x7f0000000000ul)); };
    ASSERT_EQ(0x7f0000000000l, syscallBody("mmap", mapped));
}

TEST(LinuxError_CodesAndNames) {
    ASSERT_EQ(9, code(LinuxError::BADF));
    ASSERT_EQ(12, code(LinuxError::NOMEM));
    ASSERT_EQ(22, code(LinuxError::INVAL));
    ASSERT_EQ(38, code(LinuxError::NOSYS));
    ASSERT_EQ(std::string("EINVAL"), std::string(name(LinuxError::INVAL)));
    ASSERT_EQ(std::string("E2BIG"), std::string(name(LinuxError::TOOBIG)));
    ASSERT_EQ(std::string("ELOOP"), std::string(name(LinuxError::LOOP)));
}

TEST(Log_ThresholdFiltersLowerImportance) {
    setLogThreshold(LoggingImportance::CRITICAL);
    log(LoggingImportance::IMPORTANT) << "hidden line\n";
    log(LoggingImportance::ERROR) << "shown line\n";
    ASSERT_FALSE(logged("hidden line"));
    ASSERT_TRUE(logged("shown line"));
    ASSERT_TRUE(logThreshold() == LoggingImportance::CRITICAL);

    emergencyLog() << "always shown\n";
    ASSERT_TRUE(logged("always shown"));
}

TEST(Log_FormatsIntegersPointersAndBools) {
    klog << "[" << int64_t{-42} << " " << uint8_t{7} << " " << uint16_t{65535} << " " << int32_t{0}
         << " " << int64_t{INT64_MIN} << " " << uint64_t{UINT64_MAX} << "]\n";
    ASSERT_TRUE(logged("[-42 7 65535 0 -9223372036854775808 18446744073709551615]"));

    klog << reinterpret_cast<const void*>(0x1f) << " " << true << " " << false << " " << 'x' << "\n";
    ASSERT_TRUE(logged("0x000000000000001f true false x"));

    klog << static_cast<const char*>(nullptr) << "\n";
    ASSERT_TRUE(logged("(null)"));
}
