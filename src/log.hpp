#pragma once
/*
 * Log
 *
 * Purpose: install the process-wide spdlog logger for a session.
 * Note: the link may be the process's own tty, so without a log file every
 *       message is dropped instead of going to stdout.
 */
#include <string>
#include "config.hpp"

bool init_logging(const Settings& settings, std::string& msg);
