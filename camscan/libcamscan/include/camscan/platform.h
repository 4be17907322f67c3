/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file platform.h
 * @brief Platform dependent includes and definitions
 **/

#ifndef _CAMSCAN_PLATFORM_H_
#define _CAMSCAN_PLATFORM_H_

#if !defined(__GNUC__)
#error "Unsupported compiler (only POSIX builds are supported)"
#endif

/** Exported symbols define */
#define CAMSCANAPI __attribute__ ((visibility ("default")))

/** Includes */
#include <unistd.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>

/** Typedefs */
typedef int socket_t;

#define INVALID_SOCKET (socket_t)(-1)
#define SOCKET_ERROR (-1)

#endif /* _CAMSCAN_PLATFORM_H_ */
