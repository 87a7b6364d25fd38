/*
 * busytag_usb_driver.h
 *
 * C interface for bulk transfer communication with BusyTag USB devices
 * (VID 0x303A, PID 0x81DF). Every entry point is safe to call with a stale or
 * unknown handle. Callbacks run on driver-owned threads; a callback may call
 * back into this API, including btusb_send and btusb_destroy.
 */

#ifndef BUSYTAG_USB_DRIVER_H
#define BUSYTAG_USB_DRIVER_H

#include <stdint.h>

#if defined(_WIN32)
#  if defined(BTUSB_BUILDING_LIBRARY)
#    define BTUSB_EXPORT __declspec(dllexport)
#  else
#    define BTUSB_EXPORT __declspec(dllimport)
#  endif
#elif defined(__GNUC__)
#  define BTUSB_EXPORT __attribute__((visibility("default")))
#else
#  define BTUSB_EXPORT
#endif

#ifdef __cplusplus
extern "C" {
#endif

#define BTUSB_VENDOR_ID         0x303A
#define BTUSB_PRODUCT_ID        0x81DF
#define BTUSB_MAX_SEND_LENGTH   (1024 * 1024)

/* Opaque handle type */
typedef void* btusb_handle_t;

enum btusb_error {
    BTUSB_SUCCESS = 0,
    BTUSB_ERROR_INVALID_HANDLE = -1,
    BTUSB_ERROR_INVALID_ARGUMENT = -2,
    BTUSB_ERROR_NO_SESSION = -3,
    BTUSB_ERROR_TRANSFER = -4,
    BTUSB_ERROR_ALLOCATION = -5,
    BTUSB_ERROR_INTERNAL = -6,
};

/* Callback types. The data buffer is only valid for the duration of the call. */
typedef void (*btusb_data_callback_t)(const uint8_t* data, int32_t length, void* context);
typedef void (*btusb_connection_callback_t)(int32_t connected, void* context);
typedef void (*btusb_log_callback_t)(const char* message, void* context);

/* Lifecycle. btusb_create returns NULL on failure. btusb_destroy blocks until
 * callbacks running for the handle have returned. */
BTUSB_EXPORT btusb_handle_t btusb_create(void);
BTUSB_EXPORT void btusb_destroy(btusb_handle_t handle);

/* Monitoring */
BTUSB_EXPORT void btusb_start_monitoring(btusb_handle_t handle);
BTUSB_EXPORT void btusb_stop_monitoring(btusb_handle_t handle);

/* State */
BTUSB_EXPORT int32_t btusb_is_connected(btusb_handle_t handle);
BTUSB_EXPORT int32_t btusb_is_device_present(btusb_handle_t handle);

/* Data transfer. Returns the number of bytes sent (always length) or a
 * negative btusb_error. */
BTUSB_EXPORT int32_t btusb_send(btusb_handle_t handle, const uint8_t* data, int32_t length);
BTUSB_EXPORT int32_t btusb_send_string(btusb_handle_t handle, const char* str);
/* Sends str followed by "\r\n" */
BTUSB_EXPORT int32_t btusb_send_command(btusb_handle_t handle, const char* str);

/* Callbacks. Passing NULL clears the registration. */
BTUSB_EXPORT void btusb_set_data_callback(btusb_handle_t handle, btusb_data_callback_t callback, void* context);
BTUSB_EXPORT void btusb_set_connection_callback(btusb_handle_t handle, btusb_connection_callback_t callback, void* context);
BTUSB_EXPORT void btusb_set_log_callback(btusb_handle_t handle, btusb_log_callback_t callback, void* context);

BTUSB_EXPORT const char* btusb_error_name(int32_t error);

#ifdef __cplusplus
}
#endif

#endif /* BUSYTAG_USB_DRIVER_H */
