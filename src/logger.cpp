#include "claparse/logger.hpp"
#include <zlib.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>

namespace claparse {

namespace {

std::ofstream g_log_ofs;
std::string g_log_path; // NOLINT(runtime/string)
std::atomic<LogLevel> g_min_level{LogLevel::INFO};
std::atomic<size_t> g_max_size{0};
std::atomic<size_t> g_max_files{1};
std::atomic<bool> g_json_log{false};
std::atomic<bool> g_compress_logs{false};
std::mutex g_log_mtx;

std::string timestamp() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf);
}

const char* level_label(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARNING:
        return "WARNING";
    case LogLevel::ERR:
        return "ERROR";
    }
    return "INFO";
}

bool gzip_file(const std::string& src, const std::string& dst) {
    std::ifstream in(src, std::ios::binary);
    gzFile out = gzopen(dst.c_str(), "wb");
    if (!in.is_open() || out == nullptr) {
        if (out)
            gzclose(out);
        return false;
    }
    char buf[8192];
    bool ok = true;
    while (in) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n > 0 && gzwrite(out, buf, static_cast<unsigned int>(n)) == 0) {
            ok = false;
            break;
        }
    }
    return gzclose(out) == Z_OK && ok;
}

std::string json_escape(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out += c;
            break;
        }
    }
    return out;
}

std::string format_extra_json(const std::map<std::string, std::string>& fields) {
    std::string out;
    bool first = true;
    for (const auto& [k, v] : fields) {
        if (!first)
            out += ",";
        out += "\"" + json_escape(k) + "\":\"" + json_escape(v) + "\"";
        first = false;
    }
    return out;
}

// Shift <log>.N to <log>.N+1, dropping the oldest, and move the active file
// to <log>.1 (gzipped when compression is on). Caller holds g_log_mtx.
void rotate_files() {
    namespace fs = std::filesystem;
    std::error_code ec;
    const size_t keep = g_max_files.load();
    const std::string ext = g_compress_logs.load() ? ".gz" : "";
    for (size_t i = keep; i > 0; --i) {
        fs::path src = g_log_path + "." + std::to_string(i) + ext;
        if (i == keep) {
            fs::remove(src, ec);
        } else {
            fs::path dst = g_log_path + "." + std::to_string(i + 1) + ext;
            fs::rename(src, dst, ec);
        }
    }
    fs::path first = g_log_path + ".1";
    fs::rename(g_log_path, first, ec);
    if (!ec && g_compress_logs.load()) {
        fs::path gz = first;
        gz += ".gz";
        if (gzip_file(first.string(), gz.string()))
            fs::remove(first, ec);
    }
}

void write_log_entry(LogLevel level, const std::string& msg,
                     const std::map<std::string, std::string>& fields) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (!g_log_ofs.is_open() || level < g_min_level.load())
        return;
    const char* label = level_label(level);
    std::string line;
    std::string ts = timestamp();
    if (g_json_log.load()) {
        line = "{\"timestamp\":\"" + json_escape(ts) + "\",\"level\":\"" + label + "\",\"msg\":\"" +
               json_escape(msg) + "\"";
        std::string extras = format_extra_json(fields);
        if (!extras.empty())
            line += "," + extras;
        line += "}";
    } else {
        line = "[" + ts + "] [" + label + "] " + msg;
        for (const auto& [k, v] : fields)
            line += " " + k + "=" + v;
    }
    g_log_ofs << line << std::endl;
    if (g_max_size.load() == 0)
        return;
    std::error_code ec;
    auto size = std::filesystem::file_size(g_log_path, ec);
    if (ec || size <= g_max_size.load())
        return;
    g_log_ofs.close();
    if (g_max_files.load() > 0)
        rotate_files();
    g_log_ofs.open(g_log_path, std::ios::trunc);
}

} // namespace

bool init_logger(const std::string& path, LogLevel level, size_t max_size, size_t max_files) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    std::string prev_path = g_log_path;
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
    g_log_ofs.clear();
    g_max_size.store(max_size);
    g_max_files.store(max_files);
    g_min_level.store(level);
    g_log_ofs.open(path, std::ios::app);
    if (g_log_ofs.is_open()) {
        g_log_path = path;
        return true;
    }
    std::cerr << "Failed to open log file: " << path << std::endl;
    if (!prev_path.empty())
        g_log_ofs.open(prev_path, std::ios::app);
    return false;
}

void set_log_level(LogLevel level) { g_min_level.store(level); }

LogLevel log_level() { return g_min_level.load(); }

void set_json_logging(bool enable) { g_json_log.store(enable); }

void set_log_compression(bool enable) { g_compress_logs.store(enable); }

void set_log_rotation(size_t max_files) { g_max_files.store(max_files); }

bool logger_initialized() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    return g_log_ofs.is_open();
}

bool parse_log_level(const std::string& name, LogLevel& level) {
    std::string up = name;
    std::transform(up.begin(), up.end(), up.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (up == "DEBUG")
        level = LogLevel::DEBUG;
    else if (up == "INFO")
        level = LogLevel::INFO;
    else if (up == "WARNING" || up == "WARN")
        level = LogLevel::WARNING;
    else if (up == "ERROR" || up == "ERR")
        level = LogLevel::ERR;
    else
        return false;
    return true;
}

void log_event(LogLevel level, const std::string& message) { write_log_entry(level, message, {}); }

void log_event(LogLevel level, const std::string& message,
               const std::map<std::string, std::string>& fields) {
    write_log_entry(level, message, fields);
}

void log_debug(const std::string& msg) { write_log_entry(LogLevel::DEBUG, msg, {}); }
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields) {
    write_log_entry(LogLevel::DEBUG, msg, fields);
}
void log_info(const std::string& msg) { write_log_entry(LogLevel::INFO, msg, {}); }
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields) {
    write_log_entry(LogLevel::INFO, msg, fields);
}

void log_warning(const std::string& msg) { write_log_entry(LogLevel::WARNING, msg, {}); }
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields) {
    write_log_entry(LogLevel::WARNING, msg, fields);
}

void log_error(const std::string& msg) { write_log_entry(LogLevel::ERR, msg, {}); }
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields) {
    write_log_entry(LogLevel::ERR, msg, fields);
}

void shutdown_logger() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
    g_log_path.clear();
}

} // namespace claparse
