#include "client_properties.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <algorithm>

struct MethodPref {
    const char* name;
    int method;
};

static const MethodPref METHOD_PREFS[] = {
    {"kex",      LIBSSH2_METHOD_KEX},
    {"hostkey",  LIBSSH2_METHOD_HOSTKEY},
    {"crypt_cs", LIBSSH2_METHOD_CRYPT_CS},
    {"crypt_sc", LIBSSH2_METHOD_CRYPT_SC},
    {"mac_cs",   LIBSSH2_METHOD_MAC_CS},
    {"mac_sc",   LIBSSH2_METHOD_MAC_SC},
    {"comp_cs",  LIBSSH2_METHOD_COMP_CS},
    {"comp_sc",  LIBSSH2_METHOD_COMP_SC},
    {"lang_cs",  LIBSSH2_METHOD_LANG_CS},
    {"lang_sc",  LIBSSH2_METHOD_LANG_SC},
};

const std::vector<std::string>& client_property_names() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> v;
        for (const auto& m : METHOD_PREFS) v.push_back(m.name);
        v.push_back("compression");
        v.push_back("sigpipe");
        v.push_back("banner");
        v.push_back("keepalive_interval");
        return v;
    }();
    return names;
}

bool is_client_property(const std::string& name) {
    const auto& names = client_property_names();
    return std::find(names.begin(), names.end(), name) != names.end();
}

static std::string session_error(LIBSSH2_SESSION* session) {
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, len) : "unknown error";
}

static Result<void> set_flag(LIBSSH2_SESSION* session, int flag,
                             const std::string& name, const std::string& value) {
    auto enabled = parse_bool(value);
    if (!enabled) {
        return Result<void>::Err(fmt::format(
            "SSH property {} expects a boolean, got '{}'", name, value));
    }
    if (libssh2_session_flag(session, flag, *enabled ? 1 : 0) != 0) {
        return Result<void>::Err(fmt::format(
            "Failed to set SSH property {}: {}", name, session_error(session)));
    }
    return Result<void>::Ok();
}

Result<void> apply_client_property(LIBSSH2_SESSION* session,
                                   const std::string& name, const std::string& value) {
    if (!session) {
        return Result<void>::Err("No SSH session to configure");
    }

    log_debug(fmt::format("SSH property {}={}", name, value));

    for (const auto& m : METHOD_PREFS) {
        if (name != m.name) continue;
        if (libssh2_session_method_pref(session, m.method, value.c_str()) != 0) {
            return Result<void>::Err(fmt::format(
                "Unsupported value for SSH property {}: '{}' ({})",
                name, value, session_error(session)));
        }
        return Result<void>::Ok();
    }

    if (name == "compression") {
        return set_flag(session, LIBSSH2_FLAG_COMPRESS, name, value);
    }
    if (name == "sigpipe") {
        return set_flag(session, LIBSSH2_FLAG_SIGPIPE, name, value);
    }
    if (name == "banner") {
        if (value.empty()) {
            return Result<void>::Err("SSH property banner must not be empty");
        }
        if (libssh2_session_banner_set(session, value.c_str()) != 0) {
            return Result<void>::Err(fmt::format(
                "Failed to set SSH banner: {}", session_error(session)));
        }
        return Result<void>::Ok();
    }
    if (name == "keepalive_interval") {
        auto secs = parse_int(value);
        if (!secs || *secs < 0) {
            return Result<void>::Err(fmt::format(
                "SSH property keepalive_interval expects seconds >= 0, got '{}'", value));
        }
        libssh2_keepalive_config(session, 1, static_cast<unsigned>(*secs));
        return Result<void>::Ok();
    }

    return Result<void>::Err(fmt::format("Unknown SSH property '{}'", name));
}
