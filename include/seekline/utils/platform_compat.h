#ifndef SEEKLINE_UTILS_PLATFORM_COMPAT_H
#define SEEKLINE_UTILS_PLATFORM_COMPAT_H

#ifdef _WIN32
#include <fcntl.h>
#include <io.h>
#include <sys/stat.h>

#define fseeko _fseeki64
#define ftello _ftelli64
#define fileno _fileno
#define fstat _fstat64
typedef struct _stat64 seekline_stat_t;

#else
#include <sys/stat.h>
#include <unistd.h>

// Large file support on 32-bit systems
#ifndef _FILE_OFFSET_BITS
#define _FILE_OFFSET_BITS 64
#endif

#ifndef _LARGEFILE64_SOURCE
#define _LARGEFILE64_SOURCE
#endif

typedef struct stat seekline_stat_t;
#endif

#endif  // SEEKLINE_UTILS_PLATFORM_COMPAT_H
