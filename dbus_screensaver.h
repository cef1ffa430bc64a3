/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef DBUS_SCREENSAVER_H
#define DBUS_SCREENSAVER_H

#include <cstdint>
#include <optional>
#include <string>

#include <gio/gio.h>

namespace Pep {

//!
//! \brief The ScreenSaverBus class is the session bus org.freedesktop.ScreenSaver inhibit interface.
//!
class ScreenSaverBus
{
public:
    virtual ~ScreenSaverBus() {}

    //!
    //! \brief Calls Inhibit(application, reason).
    //! \return the cookie, or std::nullopt if the bus or the service is unavailable or the call failed.
    //!
    virtual std::optional<uint32_t> Inhibit(const std::string& application, const std::string& reason) = 0;

    //!
    //! \brief Calls UnInhibit(cookie).
    //! \return true if the call succeeded.
    //!
    virtual bool UnInhibit(uint32_t cookie) = 0;
};

//!
//! \brief GDBus (gio) implementation of ScreenSaverBus. The services drop an inhibit when its owner leaves the bus, so
//! the session bus connection used for Inhibit is held until the matching UnInhibit. While no connection is held a
//! new one is requested on each Inhibit, so a bus that comes up after pep starts is picked up.
//!
class GDBusScreenSaverBus : public ScreenSaverBus
{
public:
    //!
    //! \brief D-Bus call timeout in milliseconds.
    //!
    static constexpr int CALL_TIMEOUT_MS = 5000;

    GDBusScreenSaverBus();
    ~GDBusScreenSaverBus() override;

    GDBusScreenSaverBus(const GDBusScreenSaverBus&) = delete;
    GDBusScreenSaverBus& operator=(const GDBusScreenSaverBus&) = delete;

    std::optional<uint32_t> Inhibit(const std::string& application, const std::string& reason) override;

    //!
    //! \brief Calls UnInhibit(cookie) on the connection that holds the inhibit, then releases that connection.
    //!
    bool UnInhibit(uint32_t cookie) override;

    //!
    //! \brief True while a session bus connection is held for an outstanding inhibit.
    //!
    bool HoldsConnection() const;

protected:
    //!
    //! \brief Returns a new reference to the session bus, or nullptr with error set.
    //!
    virtual GDBusConnection* ConnectSessionBus(GError** error);

    //!
    //! \brief Synchronous call of method on org.freedesktop.ScreenSaver. Takes ownership of a floating parameters
    //! value. Returns the reply, or nullptr with error set.
    //!
    virtual GVariant* CallScreenSaver(GDBusConnection* connection,
                                      const char* method_name,
                                      GVariant* parameters,
                                      const GVariantType* reply_type,
                                      GError** error);

    //!
    //! \brief Drops a reference obtained from ConnectSessionBus.
    //!
    virtual void ReleaseConnection(GDBusConnection* connection);

    //!
    //! \brief Releases the held connection, if any. Subclasses that override ReleaseConnection call this from their
    //! destructor.
    //!
    void DropConnection();

private:
    GDBusConnection* m_connection;
};

} // namespace Pep

#endif // DBUS_SCREENSAVER_H
