#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// libssh2 forward declaration
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

// Names accepted by apply_client_property, in help order.
const std::vector<std::string>& client_property_names();

bool is_client_property(const std::string& name);

// Apply one session property. Must be called before the handshake.
//
//   kex, hostkey, crypt_cs, crypt_sc, mac_cs, mac_sc,
//   comp_cs, comp_sc, lang_cs, lang_sc   method preference lists
//   compression, sigpipe                 booleans
//   banner                               client identification banner
//   keepalive_interval                   seconds between keepalives (0 = off)
Result<void> apply_client_property(LIBSSH2_SESSION* session,
                                   const std::string& name, const std::string& value);
