#include "misc/logging.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace MsBin::Logger {

// Internal state
static std::ofstream index_log;
static std::ofstream decode_log;
static std::mutex index_log_mutex;
static std::mutex decode_log_mutex;
static std::mutex stderr_mutex;
static bool initialized = false;

// Helper function to get current timestamp
static std::string get_timestamp() {
  auto now = std::chrono::system_clock::now();
  auto time_t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::stringstream ss;
  ss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
  ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

static void open_log(std::ofstream &log, const std::filesystem::path &path, const char *title) {
  log.open(path);
  if (log.is_open()) {
    log << "[" << get_timestamp() << "] " << title << " Started at: " << path << std::endl;
  } else {
    std::cerr << "Failed to create " << title << " at: " << path << std::endl;
  }
}

static void write_line(std::ofstream &log, std::mutex &mutex, const std::string &message) {
  if (!initialized)
    return;

  std::lock_guard<std::mutex> lock(mutex);
  if (log.is_open()) {
    log << "[" << get_timestamp() << "] " << message << std::endl;
  }
}

static void echo_error(const std::string &message) {
  std::lock_guard<std::mutex> lock(stderr_mutex);
  std::cerr << message << std::endl;
}

void init(const std::string &log_dir) {
  if (initialized) {
    return;
  }

  std::filesystem::path dir = std::filesystem::absolute(log_dir);
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    std::cerr << "Failed to create log directory " << dir << ": " << ec.message() << std::endl;
    return;
  }

  open_log(index_log, dir / "index.log", "Index Log");
  open_log(decode_log, dir / "decode.log", "Decode Log");

  initialized = true;
}

void close() {
  if (!initialized) {
    return;
  }

  if (index_log.is_open()) {
    index_log << "[" << get_timestamp() << "] Index Log Ended" << std::endl;
    index_log.close();
  }

  if (decode_log.is_open()) {
    decode_log << "[" << get_timestamp() << "] Decode Log Ended" << std::endl;
    decode_log.close();
  }

  initialized = false;
}

void log_index(const std::string &message) {
  write_line(index_log, index_log_mutex, message);
}

void log_index_error(const std::string &source, const std::string &message) {
  const std::string line = "Error while loading " + source + ": " + message;
  write_line(index_log, index_log_mutex, line);
  echo_error(line);
}

void log_decode(const std::string &message) {
  write_line(decode_log, decode_log_mutex, message);
}

void log_decode_error(const std::string &symbol, const std::string &message) {
  const std::string line = "Error while converting symbol " + symbol + ": " + message;
  write_line(decode_log, decode_log_mutex, line);
  echo_error(line);
}

bool is_initialized() {
  return initialized;
}

} // namespace MsBin::Logger
