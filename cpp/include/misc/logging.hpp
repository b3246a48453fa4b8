/*
 * LOGGING FOR THE METASTOCK DECODER
 *
 * File based logs under one directory, kept out of the decoding code paths.
 *
 * Channels:
 * - index.log:  index loading (MASTER / EMASTER / XMASTER), catalog merge
 * - decode.log: per-symbol data file decoding, failures with symbol + cause
 *
 * Errors are echoed to stderr, so a failure is reported even before init().
 *
 * Usage:
 *   Logger::init(log_dir);
 *   Logger::log_index("EMASTER: 12 records");
 *   Logger::log_decode_error("ABC", "data file not found: F7.DAT");
 *   Logger::close();
 */

#pragma once

#include <string>

namespace MsBin::Logger {

// Initialize logging system with the log directory
void init(const std::string &log_dir);

// Close all log files
void close();

// Index loading
void log_index(const std::string &message);
void log_index_error(const std::string &source, const std::string &message);

// Data file decoding
void log_decode(const std::string &message);
void log_decode_error(const std::string &symbol, const std::string &message);

// Check if logging is initialized
bool is_initialized();

} // namespace MsBin::Logger
