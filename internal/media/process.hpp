#pragma once

#include <string>
#include <vector>

namespace reel::media {

struct ProcessResult {
  int         exit_code = -1;
  std::string output; // stdout and stderr interleaved
};

/*
  Runs argv[0] (looked up on PATH) and waits for it. The child reads from
  /dev/null. Throws util::MediaToolError if the process cannot be started.
*/
ProcessResult RunProcess(const std::vector<std::string>& argv);

} // namespace reel::media
