/*
 * Copyright (C) 2025 James C. Owens
 * Portions Copyright (c) 2019 The Bitcoin Core developers
 * Portions Copyright (c) 2025 The Gridcoin developers
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <util.h>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <type_traits>

//!
//! \brief This to support early use of the log utility functions before the config is read to get the
//! debug flag.
//!
std::atomic<bool> g_debug = false;

//!
//! \brief The flag controls the logging of timestamps by the log functions. This is used to suppress
//! timestamp output when run under systemd, where the journal appends a high resolution timestamp.
//!
std::atomic<bool> g_log_timestamps = true;

[[nodiscard]] std::vector<std::string> StringSplit(const std::string& s, const std::string& delim)
{
    size_t pos = 0;
    size_t end = 0;
    std::vector<std::string> elems;

    while((end = s.find(delim, pos)) != std::string::npos)
    {
        elems.push_back(s.substr(pos, end - pos));
        pos = end + delim.size();
    }

    // Append final value
    elems.push_back(s.substr(pos, end - pos));
    return elems;
}

[[nodiscard]] std::string TrimString(const std::string& str, const std::string& pattern)
{
    std::string::size_type front = str.find_first_not_of(pattern);
    if (front == std::string::npos) {
        return std::string();
    }
    std::string::size_type end = str.find_last_not_of(pattern);
    return str.substr(front, end - front + 1);
}

[[nodiscard]] std::string StripQuotes(const std::string& str)
{
    if (str.empty()) {
        return str;
    }

    std::string result = str;

    if (result.front() == '"' || result.front() == '\'') {
        result.erase(0, 1);
    }

    if (!result.empty() && (result.back() == '"' || result.back() == '\'')) {
        result.pop_back();
    }

    return result;
}

std::string ToLower(const std::string& str)
{
    std::string r;
    for (auto ch : str) r += (ch >= 'A' && ch <= 'Z' ? (ch - 'A') + 'a' : ch);
    return r;
}

std::string ToUpper(const std::string& str)
{
    std::string r;
    for (auto ch : str) r += (ch >= 'a' && ch <= 'z' ? (ch - 'a') + 'A' : ch);
    return r;
}

int64_t GetUnixEpochTime()
{
    auto duration = std::chrono::system_clock::now().time_since_epoch();

    return std::chrono::duration_cast<std::chrono::seconds>(duration).count();
}

std::string FormatISO8601DateTime(int64_t time)
{
    struct tm ts;
    time_t time_val = time;
    if (gmtime_r(&time_val, &ts) == nullptr) {
        return {};
    }

    return tfm::format("%04i-%02i-%02iT%02i:%02i:%02iZ",
                       ts.tm_year + 1900, ts.tm_mon + 1, ts.tm_mday, ts.tm_hour, ts.tm_min, ts.tm_sec);
}

bool IsValidTimestamp(const int64_t& timestamp)
{
    int64_t now = GetUnixEpochTime();

    int64_t future_limit = now + 60;
    int64_t past_limit = now - 86400;

    return timestamp >= past_limit && timestamp <= future_limit;
}

[[nodiscard]] int ParseStringToInt(const std::string& str)
{
    try {
        return std::stoi(str);
    } catch (const std::invalid_argument& e){
        error_log("%s: Invalid argument: %s",
                  __func__,
                  e.what());
        throw;
    } catch (const std::out_of_range& e){
        error_log("%s: Out of range: %s",
                  __func__,
                  e.what());
        throw;
    }
}

[[nodiscard]] int64_t ParseStringtoInt64(const std::string& str)
{
    try {
        return static_cast<int64_t>(std::stoll(str));
    } catch (const std::invalid_argument& e){
        error_log("%s: Invalid argument: %s",
                  __func__,
                  e.what());
        throw;
    } catch (const std::out_of_range& e){
        error_log("%s: Out of range: %s",
                  __func__,
                  e.what());
        throw;
    }
}

std::optional<std::string> GetEnvVariable(const std::string& var_name)
{
    const char* value = std::getenv(var_name.c_str());

    if (value == nullptr) {
        return std::nullopt;
    }

    return std::string(value);
}

std::optional<fs::path> GetXdgRuntimeDir()
{
    std::optional<std::string> runtime_dir = GetEnvVariable("XDG_RUNTIME_DIR");

    if (!runtime_dir || runtime_dir->empty()) {
        return std::nullopt;
    }

    return fs::path(*runtime_dir);
}

fs::path GetDefaultConfigFilePath()
{
    std::optional<std::string> config_home = GetEnvVariable("XDG_CONFIG_HOME");

    if (config_home && !config_home->empty()) {
        return fs::path(*config_home) / "pep" / "pep.conf";
    }

    std::optional<std::string> home = GetEnvVariable("HOME");

    if (home && !home->empty()) {
        return fs::path(*home) / ".config" / "pep" / "pep.conf";
    }

    return fs::path();
}

void WriteFileAtomic(const fs::path& path, const std::string& content)
{
    fs::path temp_path = path;
    temp_path += ".tmp";

    std::error_code ec;

    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);

        if (ec) {
            throw FileSystemException("Could not create directory: " + ec.message(), path.parent_path());
        }
    }

    {
        std::ofstream file(temp_path, std::ios::out | std::ios::trunc);

        if (!file.is_open()) {
            throw FileSystemException("Could not open temporary file for writing.", temp_path);
        }

        file << content;
        file.flush();

        if (file.fail()) {
            file.close();
            fs::remove(temp_path, ec);
            throw FileSystemException("Could not write temporary file.", temp_path);
        }
    }

    fs::rename(temp_path, path, ec);

    if (ec) {
        std::error_code remove_ec;
        fs::remove(temp_path, remove_ec);
        throw FileSystemException("Could not rename temporary file into place: " + ec.message(), path);
    }
}

// Class Config

Config::Config()
{}

void Config::ReadAndUpdateConfig(const fs::path& config_file) {
    std::unique_lock<std::mutex> lock(mtx_config);

    std::multimap<std::string, std::string> config;

    std::ifstream file(config_file);

    if (!file.is_open()) {
        error_log("%s: Could not open the config file: %s",
                  __func__,
                  config_file);
    } else {
        std::string line;
        while (std::getline(file, line)) {
            // Skip empty lines and lines starting with '#'
            if (line.empty() || line[0] == '#') {
                continue;
            }

            std::vector line_elements = StringSplit(line, "=");

            if (line_elements.size() != 2) {
                continue;
            }

            config.insert(std::make_pair(StripQuotes(TrimString(line_elements[0])),
                                         StripQuotes(TrimString(line_elements[1]))));
        }

        file.close();
    }

    // Do this all at once so the result of the config read is essentially "atomic". If the read failed, the
    // args are processed anyway, which results in defaults being chosen.
    m_config_in.swap(config);
    m_config.clear();

    ProcessArgs();
}

config_variant Config::GetArg(const std::string& arg)
{
    std::unique_lock<std::mutex> lock(mtx_config);

    auto iter = m_config.find(arg);

    if (iter != m_config.end()) {
        return iter->second;
    } else {
        return std::string {};
    }
}

void Config::SetArg(const std::string& arg, const config_variant& value)
{
    std::unique_lock<std::mutex> lock(mtx_config);

    m_config[arg] = value;
}

bool Config::WriteConfig(const fs::path& config_file)
{
    std::unique_lock<std::mutex> lock(mtx_config);

    if (config_file.empty()) {
        error_log("%s: No config file path available, config not saved.",
                  __func__);
        return false;
    }

    std::string content;

    for (const auto& [key, value] : m_config) {
        std::string value_str = std::visit([](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, fs::path>) {
                return v.string();
            } else {
                return ToString(v);
            }
        }, value);

        content += key + "=" + value_str + "\n";
    }

    try {
        WriteFileAtomic(config_file, content);
    } catch (FileSystemException& e) {
        error_log("%s: Writing config file failed: %s",
                  __func__,
                  e.what());
        return false;
    }

    debug_log("INFO: %s: Saved config to %s",
              __func__,
              config_file);

    return true;
}

std::string Config::GetArgString(const std::string& arg, const std::string& default_value) const
{
    auto iter = m_config_in.find(arg);

    if (iter != m_config_in.end()) {
        return iter->second;
    } else {
        return default_value;
    }
}

void Config::ProcessBoolArg(const std::string& arg, const std::string& default_value)
{
    std::string value = GetArgString(arg, default_value);

    if (value == "1" || ToLower(value) == "true") {
        m_config.insert(std::make_pair(arg, true));
    } else if (value == "0" || ToLower(value) == "false") {
        m_config.insert(std::make_pair(arg, false));
    } else {
        error_log("%s: %s parameter in config file has invalid value: %s",
                  __func__,
                  arg,
                  value);

        m_config.insert(std::make_pair(arg, default_value == "1" || ToLower(default_value) == "true"));
    }
}

// Class ControlMessage

ControlMessage::ControlMessage()
    : m_timestamp(0)
    , m_command(UNKNOWN)
{}

ControlMessage::ControlMessage(int64_t timestamp, Command command)
    : m_timestamp(timestamp)
    , m_command(command)
{}

ControlMessage::ControlMessage(const std::string& timestamp_str, const std::string& command_str)
{
    m_timestamp = ParseStringtoInt64(timestamp_str);

    m_command = CommandStringToEnum(command_str);
}

std::optional<ControlMessage> ControlMessage::Parse(const std::string& line)
{
    std::vector<std::string> parts = StringSplit(TrimString(line), ":");

    if (parts.size() != 2) {
        return std::nullopt;
    }

    try {
        return ControlMessage(TrimString(parts[0]), TrimString(parts[1]));
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

ControlMessage::Command ControlMessage::CommandStringToEnum(const std::string& command_str)
{
    std::string normalized = ToUpper(TrimString(command_str));

    for (auto& ch : normalized) {
        if (ch == '-') ch = '_';
    }

    if (normalized == "ENABLE") {
        return ENABLE;
    } else if (normalized == "DISABLE") {
        return DISABLE;
    } else if (normalized == "TOGGLE") {
        return TOGGLE;
    } else if (normalized == "AUTOSTART_ON") {
        return AUTOSTART_ON;
    } else if (normalized == "AUTOSTART_OFF") {
        return AUTOSTART_OFF;
    } else if (normalized == "QUIT") {
        return QUIT;
    }

    return UNKNOWN;
}

std::string ControlMessage::CommandToString() const
{
    return CommandToString(m_command);
}

std::string ControlMessage::CommandToString(const Command& command)
{
    std::string out;

    switch (command) {
    case UNKNOWN:
        out = "UNKNOWN";
        break;
    case ENABLE:
        out = "ENABLE";
        break;
    case DISABLE:
        out = "DISABLE";
        break;
    case TOGGLE:
        out = "TOGGLE";
        break;
    case AUTOSTART_ON:
        out = "AUTOSTART_ON";
        break;
    case AUTOSTART_OFF:
        out = "AUTOSTART_OFF";
        break;
    case QUIT:
        out = "QUIT";
        break;
    }

    return out;
}

bool ControlMessage::IsValid() const
{
    return m_command != UNKNOWN && IsValidTimestamp(m_timestamp);
}

std::string ControlMessage::ToString() const
{
    return ::ToString(m_timestamp) + ":" + CommandToString(m_command);
}
