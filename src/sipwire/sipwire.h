#pragma once

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// Receives "sip_rx" and "error" events on the listener thread. Both strings are freed when
// the callback returns; copy anything needed later. Do not call sipwire_shutdown(),
// sipwire_init() or the callback setters from inside the callback.
typedef void (*sipwire_event_cb)(const char* event, const char* payload);

// Returns false only when a listener is still active.
bool sipwire_init(void);

// A null callback clears the registration.
void sipwire_set_event_callback(sipwire_event_cb cb);
void sipwire_clear_event_callback(void);

// Listens on 0.0.0.0:port (0 picks an ephemeral port). False if a listener is already
// active or the bind fails.
bool sipwire_start_udp_listener(uint16_t port);

// 0 when no listener is active.
uint16_t sipwire_listener_port(void);

// True iff the sending socket could be bound; delivery is best effort.
bool sipwire_send_udp(const char* dest_ip, uint16_t dest_port, const char* data);
bool sipwire_send_udp_bytes(const char* dest_ip, uint16_t dest_port, const uint8_t* data, size_t size);

// Listener options as a JSON object, e.g. {"poll_interval_ms": 50}. Takes effect on the next
// start; false on invalid JSON or values, or while a listener is active.
bool sipwire_configure(const char* options_json);

// Stops and joins the listener and clears the callback.
void sipwire_shutdown(void);

// Static storage, never freed.
const char* sipwire_version(void);

#ifdef __cplusplus
}
#endif
