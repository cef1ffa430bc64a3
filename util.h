/*
 * Copyright (C) 2025 James C. Owens
 * Portions Copyright (c) 2019 The Bitcoin Core developers
 * Portions Copyright (c) 2025 The Gridcoin developers
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef UTIL_H
#define UTIL_H

#include <atomic>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <tinyformat.h>
#include <variant>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

extern std::atomic<bool> g_debug;
extern std::atomic<bool> g_log_timestamps;

//!
//! /brief Locale-independent version of std::to_string
//!
template <typename T>
std::string ToString(const T& t)
{
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << t;
    return oss.str();
}

//!
//! \brief Utility function to split string by the provided delimiter. Note that no trimming is done to remove white space.
//! \param s: the string to split
//! \param delim: the delimiter string
//! \return std::vector of string parts
//!
[[nodiscard]] std::vector<std::string> StringSplit(const std::string& s, const std::string& delim);

//!
//! \brief Utility function to trim whitespace from the beginning and end of a string.
//! \param str: the string to trim
//! \param pattern: the pattern to trim, defaulting to " \f\n\r\t\v"
//! \return trimmed string
//!
[[nodiscard]] std::string TrimString(const std::string& str, const std::string& pattern = " \f\n\r\t\v");

//!
//! \brief Utility function to remove enclosing single or double quotes from a string. Used for quoted values
//! in the config file.
//! \param str: the input string with potential quotes to remove
//! \return the string with any enclosing quotes removed
//!
[[nodiscard]] std::string StripQuotes(const std::string& str);

/**
 * Returns the lowercase equivalent of the given string.
 * This function is locale independent. It only converts uppercase
 * characters in the standard 7-bit ASCII range.
 *
 * @param[in] str   the string to convert to lowercase.
 * @returns         lowercased equivalent of str
 */
std::string ToLower(const std::string& str);

/**
 * Returns the uppercase equivalent of the given string, 7-bit ASCII only.
 */
std::string ToUpper(const std::string& str);

//!
//! \brief Returns number of seconds since the beginning of the Unix Epoch.
//! \return int64_t seconds.
//!
int64_t GetUnixEpochTime();

//!
//! \brief Formats input unix epoch time in human readable format.
//! \param int64_t seconds.
//! \return ISO8601 conformant datetime string.
//!
std::string FormatISO8601DateTime(int64_t time);

//!
//! \brief Validate timestamp of a control message. No more than 60 seconds in the future and no more than
//! one day in the past, so stale commands left in the pipe are not replayed.
//! \param timestamp
//! \return boolean flag of whether the timestamp is valid.
//!
bool IsValidTimestamp(const int64_t& timestamp);

template <typename... Args>
//!
//! \brief Creates a string with fmt specifier and variadic args.
//! \param fmt specifier
//! \param args... variadic
//! \return formatted std::string
//!
static inline std::string LogPrintStr(const char* fmt, const Args&... args)
{
    std::string log_msg;

    if (g_log_timestamps.load(std::memory_order_relaxed)) {
        log_msg = FormatISO8601DateTime(GetUnixEpochTime()) + " ";
    }

    try {
        log_msg += tfm::format(fmt, args...);
    } catch (tinyformat::format_error& fmterr) {
        log_msg += "Error \"" + std::string(fmterr.what()) + "\" while formatting log message: " + fmt;
    }

    log_msg += "\n";

    return log_msg;
}

template <typename... Args>
//!
//! \brief LogPrintStr directed to cout.
//! \param fmt
//! \param args
//!
void log(const char* fmt, const Args&... args)
{
    std::cout << LogPrintStr(fmt, args...);
}

template <typename... Args>
//!
//! \brief LogPrintStr directed to cout, conditioned on the debug setting.
//! \param fmt
//! \param args
//!
void debug_log(const char* fmt, const Args&... args)
{
    if (g_debug.load()) {
        log(fmt, args...);
    }
}

template <typename... Args>
//!
//! \brief LogPrintStr directed to cerr
//! \param fmt
//! \param args
//!
void error_log(const char* fmt, const Args&... args)
{
    std::string error_fmt = "ERROR: ";
    error_fmt += fmt;

    std::cerr << LogPrintStr(error_fmt.c_str(), args...);
}

[[nodiscard]] int ParseStringToInt(const std::string& str);

[[nodiscard]] int64_t ParseStringtoInt64(const std::string& str);

//!
//! \brief Safely get an enviroment variable value from the provided name
//! \param std::string of the name of the variable to retrieve
//! \return std::string of the value of the requested variable. std::nullopt if not found.
//!
std::optional<std::string> GetEnvVariable(const std::string& var_name);

//!
//! \brief Returns $XDG_RUNTIME_DIR if set and non-empty.
//!
std::optional<fs::path> GetXdgRuntimeDir();

//!
//! \brief Returns the default config file location, $XDG_CONFIG_HOME/pep/pep.conf, falling back to
//! $HOME/.config/pep/pep.conf. Empty path if neither variable is set.
//!
fs::path GetDefaultConfigFilePath();

//!
//! \brief Writes content to path atomically: the content goes to <path>.tmp which is then renamed over path.
//! The temporary file is removed if anything fails. Parent directories are created as needed.
//! \param path
//! \param content
//! \throws FileSystemException on failure.
//!
void WriteFileAtomic(const fs::path& path, const std::string& content);

//!
//! \brief The PepException class is the base of the exceptions thrown within pep.
//!
class PepException : public std::exception
{
public:
    PepException(const std::string& message) : m_message(message) {}
    PepException(const char* message) : m_message(message) {}

    const char* what() const noexcept override {
        return m_message.c_str();
    }

protected:
    std::string m_message;
};

//! File system related exceptions
class FileSystemException : public PepException
{
public:
    FileSystemException(const std::string& message, const std::filesystem::path& path)
        : PepException(message + " Path: " + path.string()), m_path(path) {}

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

//! Child process related exceptions. Carries the errno of the failing call.
class ProcessException : public PepException
{
public:
    ProcessException(const std::string& message, int error_number)
        : PepException(message), m_error_number(error_number) {}

    int error_number() const { return m_error_number; }

private:
    int m_error_number;
};

typedef std::variant<bool, int, std::string, fs::path> config_variant;

//!
//! \brief The Config class stores program config read from the config file, with applied defaults if the
//! config file cannot be read, or a config parameter is not in the config file. Values changed at runtime
//! with SetArg() can be written back with WriteConfig().
//!
class Config
{
public:
    //!
    //! \brief Constructor.
    //!
    Config();

    virtual ~Config() {}

    //!
    //! \brief Reads and parses the config file provided by the argument and populates m_config_in, then calls private
    //! method ProcessArgs() to populate m_config.
    //! \param config_file
    //!
    void ReadAndUpdateConfig(const fs::path& config_file);

    //!
    //! \brief Provides the config_variant type value of the config parameter (argument).
    //! \param arg (key) to look up value.
    //! \return config_variant type value of the value of the config parameter (argument).
    //!
    config_variant GetArg(const std::string& arg);

    //!
    //! \brief Replaces the value of a processed parameter. Used for state toggled at runtime.
    //! \param arg (key)
    //! \param value
    //!
    void SetArg(const std::string& arg, const config_variant& value);

    //!
    //! \brief Writes the processed parameters to config_file as key=value lines, atomically.
    //! \param config_file
    //! \return true on success. Failures are logged.
    //!
    bool WriteConfig(const fs::path& config_file);

protected:
    //!
    //! \brief Private version of GetArg that operates on m_config_in and also selects the provided default value
    //! if the arg is not found. This is how default values for parameters are established.
    //! \param arg (key) to look up value as string.
    //! \param default_value if arg is not found.
    //! \return string value found in lookup, default value if not found.
    //!
    std::string GetArgString(const std::string& arg, const std::string& default_value) const;

    //!
    //! \brief Parses a boolean parameter ("1"/"true", "0"/"false", case insensitive) into m_config. Invalid values
    //! are logged and the default is used.
    //!
    void ProcessBoolArg(const std::string& arg, const std::string& default_value);

    //!
    //! \brief Holds the processed parameter-values, which are strongly typed and in a config_variant union, and where
    //! default values are populated if not found in the config file (m_config_in).
    //!
    std::map<std::string, config_variant> m_config;

private:
    //!
    //! \brief Populates m_config from m_config_in. Must be implemented by the application specialization.
    //!
    virtual void ProcessArgs() = 0;

    //!
    //! \brief Provides lock control for the config object.
    //!
    mutable std::mutex mtx_config;

    //!
    //! \brief Holds the raw parsed parameter-values from the config file.
    //!
    std::multimap<std::string, std::string> m_config_in;
};

//!
//! \brief The ControlMessage class encapsulates a command sent to the pep daemon over the control pipe by pepctl.
//! The wire format is <timestamp>:<command> in string format, one message per line.
//!
class ControlMessage
{
public:
    //!
    //! \brief Commands understood by the daemon. If this enum is expanded, CommandToString and
    //! CommandStringToEnum must also be updated.
    //!
    enum Command {
        UNKNOWN,
        ENABLE,
        DISABLE,
        TOGGLE,
        AUTOSTART_ON,
        AUTOSTART_OFF,
        QUIT
    };

    //!
    //! \brief Constructs an "empty" ControlMessage with timestamp of 0 and Command of UNKNOWN.
    //!
    ControlMessage();

    ControlMessage(int64_t timestamp, Command command);

    //!
    //! \brief Constructs a ControlMessage from the string fields of a received line.
    //! \throws std::invalid_argument or std::out_of_range if the timestamp does not parse.
    //!
    ControlMessage(const std::string& timestamp_str, const std::string& command_str);

    //!
    //! \brief Parses one received line. Returns std::nullopt for lines that are not of the form a:b or have a
    //! non-numeric timestamp. Validity (IsValid) is not checked here.
    //!
    static std::optional<ControlMessage> Parse(const std::string& line);

    std::string CommandToString() const;

    static std::string CommandToString(const Command& command);

    //!
    //! \brief Converts a command name to the enum value, case insensitive. Accepts '-' in place of '_' so that
    //! pepctl arguments like autostart-on map directly.
    //!
    static Command CommandStringToEnum(const std::string& command_str);

    //!
    //! \brief Validates the ControlMessage object.
    //! \return true if the command is known and the timestamp is recent.
    //!
    bool IsValid() const;

    //!
    //! \brief Returns the pipe format <timestamp>:<command> of the ControlMessage object.
    //!
    std::string ToString() const;

    int64_t m_timestamp;
    Command m_command;
};

#endif // UTIL_H
