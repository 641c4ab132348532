//
// kconfig.h
//

#ifndef HERONOS_KCONFIG_H
#define HERONOS_KCONFIG_H

#define KERNEL_DEFAULT_LOG_IMPORTANCE kernel::LoggingImportance::IMPORTANT
#define MMAP_PAGE_SIZE 0x1000
#define EARLY_ALLOC_MIN_REGION_SIZE (64 * 1024) //Smallest boot region worth running the early allocator on

#endif //HERONOS_KCONFIG_H
