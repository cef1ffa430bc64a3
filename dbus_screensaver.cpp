/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <dbus_screensaver.h>
#include <util.h>

#include <gio/gio.h>

namespace Pep {

namespace {
const char* SERVICE_NAME = "org.freedesktop.ScreenSaver";
const char* OBJECT_PATH = "/org/freedesktop/ScreenSaver";
const char* INTERFACE_NAME = "org.freedesktop.ScreenSaver";
} // anonymous namespace

constexpr int GDBusScreenSaverBus::CALL_TIMEOUT_MS;

GDBusScreenSaverBus::GDBusScreenSaverBus()
    : m_connection(nullptr)
{}

GDBusScreenSaverBus::~GDBusScreenSaverBus()
{
    DropConnection();
}

std::optional<uint32_t> GDBusScreenSaverBus::Inhibit(const std::string& application, const std::string& reason)
{
    GError* dbus_error = nullptr;
    GVariant* dbus_result = nullptr;
    std::optional<uint32_t> cookie;
    bool connected_here = false;

    if (!m_connection) {
        m_connection = ConnectSessionBus(&dbus_error);

        if (!m_connection) {
            if (dbus_error) {
                debug_log("INFO: %s: Cannot connect to session bus for screensaver inhibit: %s",
                          __func__,
                          dbus_error->message);
                g_error_free(dbus_error);
            } else {
                debug_log("INFO: %s: Cannot connect to session bus for screensaver inhibit (unknown error).",
                          __func__);
            }
            return std::nullopt;
        }

        connected_here = true;
    }

    const char* method_name = "Inhibit";

    dbus_result = CallScreenSaver(m_connection,
                                  method_name,
                                  g_variant_new("(ss)", application.c_str(), reason.c_str()),
                                  G_VARIANT_TYPE("(u)"),
                                  &dbus_error);

    if (dbus_error) {
        // Expected where no screensaver service is running, so debug only.
        debug_log("INFO: %s: Error calling %s on %s: %s",
                  __func__,
                  method_name,
                  INTERFACE_NAME,
                  dbus_error->message);
        g_error_free(dbus_error);
    } else if (dbus_result) {
        guint32 result_cookie = 0;
        g_variant_get(dbus_result, "(u)", &result_cookie);
        cookie = static_cast<uint32_t>(result_cookie);

        debug_log("INFO: %s: %s.%s returned cookie %u",
                  __func__,
                  INTERFACE_NAME,
                  method_name,
                  result_cookie);
    } else {
        error_log("%s: Call to %s on %s returned no result and no error.",
                  __func__,
                  method_name,
                  INTERFACE_NAME);
    }

    if (dbus_result) {
        g_variant_unref(dbus_result);
    }

    // Nothing is owned by a connection opened for a failed call.
    if (!cookie && connected_here) {
        DropConnection();
    }

    return cookie;
}

bool GDBusScreenSaverBus::UnInhibit(uint32_t cookie)
{
    GError* dbus_error = nullptr;
    GVariant* dbus_result = nullptr;
    bool released = false;

    if (!m_connection) {
        error_log("%s: No session bus connection holds screensaver inhibit cookie %u.",
                  __func__,
                  cookie);
        return false;
    }

    const char* method_name = "UnInhibit";

    dbus_result = CallScreenSaver(m_connection,
                                  method_name,
                                  g_variant_new("(u)", static_cast<guint32>(cookie)),
                                  nullptr,
                                  &dbus_error);

    if (dbus_error) {
        error_log("%s: Error calling %s on %s with cookie %u: %s",
                  __func__,
                  method_name,
                  INTERFACE_NAME,
                  cookie,
                  dbus_error->message);
        g_error_free(dbus_error);
    } else {
        released = true;
    }

    if (dbus_result) {
        g_variant_unref(dbus_result);
    }

    // Leaving the bus also ends the inhibit, so the connection goes either way.
    DropConnection();

    return released;
}

bool GDBusScreenSaverBus::HoldsConnection() const
{
    return m_connection != nullptr;
}

GDBusConnection* GDBusScreenSaverBus::ConnectSessionBus(GError** error)
{
    return g_bus_get_sync(G_BUS_TYPE_SESSION, nullptr, error);
}

GVariant* GDBusScreenSaverBus::CallScreenSaver(GDBusConnection* connection,
                                               const char* method_name,
                                               GVariant* parameters,
                                               const GVariantType* reply_type,
                                               GError** error)
{
    return g_dbus_connection_call_sync(connection,
                                       SERVICE_NAME, OBJECT_PATH, INTERFACE_NAME, method_name,
                                       parameters,
                                       reply_type,
                                       G_DBUS_CALL_FLAGS_NONE,
                                       CALL_TIMEOUT_MS,
                                       nullptr,
                                       error);
}

void GDBusScreenSaverBus::ReleaseConnection(GDBusConnection* connection)
{
    g_object_unref(connection);
}

void GDBusScreenSaverBus::DropConnection()
{
    if (m_connection) {
        ReleaseConnection(m_connection);
        m_connection = nullptr;
    }
}

} // namespace Pep
