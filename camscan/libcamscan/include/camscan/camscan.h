/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file camscan.h
 * @brief Status codes and defaults of the camscan library.
 **/

#ifndef _CAMSCAN_H_
#define _CAMSCAN_H_

#include "camscan/platform.h"

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/** Version */
#define CAMSCAN_MAJOR_VERSION (1)
#define CAMSCAN_MINOR_VERSION (0)
#define CAMSCAN_REVISION_VERSION (0)

/** Defaults */
#define CAMSCAN_FALLBACK_SUBNET ("192.168.1")
#define CAMSCAN_SUBNET_RENDEZVOUS_IP ("8.8.8.8")
#define CAMSCAN_SUBNET_RENDEZVOUS_PORT (80)
#define CAMSCAN_SUBNET_FIRST_HOST (1)
#define CAMSCAN_SUBNET_LAST_HOST (254)

#define CAMSCAN_DEFAULT_PROBE_TIMEOUT_MS (1000)
#define CAMSCAN_DEFAULT_MAX_WORKERS (50)
#define CAMSCAN_DEFAULT_MULTICAST_LISTEN_TIMEOUT_MS (3000)
#define CAMSCAN_DEFAULT_MULTICAST_JOIN_TIMEOUT_MS (5000)

#define CAMSCAN_MULTICAST_GROUP_IP ("239.255.255.250")
#define CAMSCAN_ONVIF_DISCOVERY_PORT (3702)
#define CAMSCAN_SSDP_DISCOVERY_PORT (1900)
#define CAMSCAN_MULTICAST_DEVICE_PORT (80)
#define CAMSCAN_MAX_DATAGRAM_SIZE (4096)
#define CAMSCAN_MULTICAST_TTL (1)

#define CAMSCAN_MAX_ENUM (INT32_MAX)

/** camscan return codes */
#define CAMSCAN_STATUS_VARIABLES\
    CAMSCAN_STATUS__X(0,  CAMSCAN_SUCCESS                      /*!< Success - No error */)\
    CAMSCAN_STATUS__X(1,  CAMSCAN_UNINITIALIZED                /*!< No error code was initialized */)\
    CAMSCAN_STATUS__X(2,  CAMSCAN_INVALID_ARGUMENT             /*!< Invalid argument passed to function */)\
    CAMSCAN_STATUS__X(3,  CAMSCAN_OUT_OF_HOST_MEMORY           /*!< Cannot allocate more memory at host */)\
    CAMSCAN_STATUS__X(4,  CAMSCAN_TIMEOUT                      /*!< Received a timeout */)\
    CAMSCAN_STATUS__X(5,  CAMSCAN_INVALID_OPERATION            /*!< Invalid operation */)\
    CAMSCAN_STATUS__X(6,  CAMSCAN_INTERNAL_FAILURE             /*!< Unexpected internal failure */)\
    CAMSCAN_STATUS__X(7,  CAMSCAN_NOT_FOUND                    /*!< Could not find requested object */)\
    CAMSCAN_STATUS__X(8,  CAMSCAN_SOCKET_FAILURE               /*!< Socket operation has failed */)\
    CAMSCAN_STATUS__X(9,  CAMSCAN_SEND_FAILURE                 /*!< Socket failed at send operation */)\
    CAMSCAN_STATUS__X(10, CAMSCAN_RECV_FAILURE                 /*!< Socket failed at recv operation */)\
    CAMSCAN_STATUS__X(11, CAMSCAN_CONNECTION_REFUSED           /*!< Connection was refused by other side */)\
    CAMSCAN_STATUS__X(12, CAMSCAN_HOST_UNREACHABLE             /*!< No route to the remote host */)\
    CAMSCAN_STATUS__X(13, CAMSCAN_INTERRUPTED_BY_SIGNAL        /*!< Blocking syscall was interrupted by a signal */)\
    CAMSCAN_STATUS__X(14, CAMSCAN_OPERATION_ABORTED            /*!< Operation was aborted */)\
    CAMSCAN_STATUS__X(15, CAMSCAN_CLOSE_FAILURE                /*!< Failed to close fd */)\

typedef enum {
#define CAMSCAN_STATUS__X(value, name) name = value,
    CAMSCAN_STATUS_VARIABLES
#undef CAMSCAN_STATUS__X

    /** Must be last! */
    CAMSCAN_STATUS_COUNT,

    /** Max enum value to maintain ABI Integrity */
    CAMSCAN_STATUS_MAX_ENUM                       = CAMSCAN_MAX_ENUM
} camscan_status;

/**
 * Returns a string format of @a status.
 *
 * @param[in] status        A ::camscan_status to be converted to string format.
 * @return Upon success, returns @a status as a string format. Otherwise, returns @a nullptr.
 */
CAMSCANAPI const char* camscan_get_status_message(camscan_status status);

#ifdef __cplusplus
}
#endif

#endif /* _CAMSCAN_H_ */
