#pragma once

#include <string>
#include "types.hpp"

// Debug log. Lines go to <tmp>/twin_debug.log unless RuntimeOptions names
// another file; with an echo callback installed they are mirrored there too.
void init_logging(const RuntimeOptions& options, StatusCallback echo = nullptr);

const std::string& twin_log_path();

void twin_log(const std::string& msg);

// Logs the command, exit status and truncated output of a child process.
void twin_log_process(const std::string& label, const std::string& cmd,
                      const ProcessResult& r);
