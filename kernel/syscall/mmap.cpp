//
// mmap.cpp
//

#include <kernel.h>
#include <kconfig.h>
#include <core/atomic.h>
#include <core/math.h>
#include <core/mem.h>
#include <core/ds/Optional.h>
#include <sched/Task.h>
#include <syscall/mman.h>

namespace kernel::syscall{
    using mm::PageMappingPermissions;
    using mm::virt_addr;

    mm::MappingFlags toMappingPermissions(const Flags<MmapProt> prot){
        mm::MappingFlags perms = PageMappingPermissions::USER;
        if (prot.contains(MmapProt::READ)) {
            perms |= PageMappingPermissions::READ;
        }
        if (prot.contains(MmapProt::WRITE)) {
            perms |= PageMappingPermissions::WRITE;
        }
        if (prot.contains(MmapProt::EXEC)) {
            perms |= PageMappingPermissions::EXEC;
        }
        return perms;
    }

    LinuxError toLinuxError(const mm::AddressSpaceError error){
        switch (error) {
            case mm::AddressSpaceError::NO_MEMORY: return LinuxError::NOMEM;
            case mm::AddressSpaceError::INVALID_INPUT: return LinuxError::INVAL;
            case mm::AddressSpaceError::ALREADY_EXISTS:
            case mm::AddressSpaceError::BAD_STATE:
            case mm::AddressSpaceError::BAD_ADDRESS:
            case mm::AddressSpaceError::UNSUPPORTED:
                return LinuxError::AGAIN;
        }
        return LinuxError::AGAIN;
    }

    namespace {
        //Reads up to length bytes starting at offset (or the current cursor when offset is 0) into buffer.
        //The file cursor is left where it was found whenever an offset was given.
        Result<size_t, LinuxError> readFileContents(fs::FileTable& files, const fs::Fd fd, const uint64_t offset,
                                                    uint8_t* buffer, const size_t length){
            Optional<uint64_t> savedCursor;
            if (offset != 0) {
                auto cursor = files.lseek(fd, 0, fs::Whence::CUR);
                if (!cursor) {
                    return cursor.error();
                }
                auto seeked = files.lseek(fd, static_cast<int64_t>(offset), fs::Whence::SET);
                if (!seeked) {
                    return seeked.error();
                }
                savedCursor = *cursor;
            }

            size_t totalRead = 0;
            Optional<LinuxError> readError;
            while (totalRead < length) {
                auto got = files.read(fd, buffer + totalRead, length - totalRead);
                if (!got) {
                    readError = got.error();
                    break;
                }
                if (*got == 0) {
                    break;
                }
                totalRead += *got;
            }

            if (savedCursor) {
                auto restored = files.lseek(fd, static_cast<int64_t>(*savedCursor), fs::Whence::SET);
                if (!restored && !readError) {
                    return restored.error();
                }
            }
            if (readError) {
                return *readError;
            }
            return totalRead;
        }

        Result<void, LinuxError> populateFromFile(mm::AddressSpace& space, fs::FileTable& files, const virt_addr start,
                                                  const size_t length, const fs::Fd fd, const uint64_t offset){
            auto* buffer = static_cast<uint8_t*>(kmalloc(length));
            if (buffer == nullptr) {
                return LinuxError::NOMEM;
            }
            memset(buffer, 0, length);

            Result<void, LinuxError> outcome;
            auto readResult = readFileContents(files, fd, offset, buffer, length);
            if (!readResult) {
                outcome = readResult.error();
            } else {
                log(LoggingImportance::DEBUG) << "mmap: read " << *readResult << " bytes from fd " << fd << "\n";
                auto written = space.write(start, buffer, *readResult);
                if (!written) {
                    log(LoggingImportance::IMPORTANT) << "mmap: copying file contents to " << start
                                                      << " failed: " << written.error() << "\n";
                    outcome = LinuxError::FAULT;
                }
            }
            kfree(buffer);
            return outcome;
        }
    }

    Result<virt_addr, LinuxError> sys_mmap(const virt_addr addr, const size_t length, const uint32_t prot,
                                           const uint32_t flags, const fs::Fd fd, const uint64_t offset){
        auto protFlags = Flags<MmapProt>::fromBits(prot);
        auto mapFlags = Flags<MmapFlags>::fromBits(flags);
        if (!protFlags || !mapFlags) {
            log(LoggingImportance::IMPORTANT) << "mmap: unsupported prot " << prot << " or flags " << flags << "\n";
            return LinuxError::INVAL;
        }
        log(LoggingImportance::DEBUG) << "sys_mmap <= addr: " << addr << ", length: " << length << ", prot: "
                                      << prot << ", flags: " << flags << ", fd: " << fd << ", offset: " << offset << "\n";

        uintptr_t alignedLength;
        if (!checkedAlignUp(length, MMAP_PAGE_SIZE, alignedLength) || alignedLength == 0) {
            return LinuxError::INVAL;
        }

        auto& task = sched::currentTask();
        auto& space = task.addressSpace();
        LockGuard guard(space);

        virt_addr start;
        if (mapFlags->contains(MmapFlags::FIXED)) {
            if (!addr.isAligned(MMAP_PAGE_SIZE)) {
                return LinuxError::INVAL;
            }
            start = addr;
        } else {
            const auto limit = mm::virt_memory_range::fromStartSize(space.base(), space.size());
            auto found = space.findFreeArea(addr, alignedLength, limit);
            if (!found) {
                return LinuxError::NOMEM;
            }
            start = *found;
        }

        const auto perms = toMappingPermissions(*protFlags);
        const bool anonymous = mapFlags->contains(MmapFlags::ANONYMOUS);
        if (!anonymous) {
            if (fd < 0 || !task.files().isOpen(fd)) {
                return LinuxError::BADF;
            }
        }

        auto mapped = space.mapAlloc(start, alignedLength, perms, true);
        if (!mapped) {
            log(LoggingImportance::IMPORTANT) << "mmap: mapping " << alignedLength << " bytes at " << start
                                              << " failed: " << mapped.error() << "\n";
            return toLinuxError(mapped.error());
        }

        if (!anonymous) {
            auto populated = populateFromFile(space, task.files(), start, length, fd, offset);
            if (!populated) {
                return populated.error();
            }
        }
        return start;
    }
}
