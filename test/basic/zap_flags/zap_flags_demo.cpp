/* zflags
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

#include "zflags/cfg/flag_set.hpp"
#include "zflags/cfg/log_flags.hpp"
#include "zflags/cfg/logger_factory.hpp"
#include "zflags/log/encoder.hpp"
#include "zflags/log/legacy_verbosity.hpp"
#include "zflags/log/stream_logger.hpp"
#include <boost/lexical_cast/try_lexical_convert.hpp>
#include <iostream>
#include <memory>

/* This simple program shows the zap flags in action.
 *   <executable> [-zap-devel] [-zap-encoder=json|console] [-zap-level=debug|info|error|N] [-zap-sample[=bool]]
 *                [-zap-timeformat=unix|iso8601] [<count of repeated messages>]
 * It parses the flags (exiting with a usage message if they are bad), builds the logger they describe, and logs a
 * few records at various severities, then the same message the given number of times (default 150), so the effect
 * of sampling can be seen. */
int main(int argc, const char** argv)
{
  using zflags::cfg::Flag_set;
  using zflags::cfg::Log_flags;
  using zflags::cfg::build_logger;
  using zflags::cfg::resolve_logger_config;
  using zflags::log::Console_encoder;
  using zflags::log::Encoder_config;
  using zflags::log::Process_legacy_verbosity;
  using zflags::log::Sev;
  using zflags::log::Stream_logger;
  using zflags::log::make_field;
  using std::exception;

  const int BAD_EXIT = 1;
  const unsigned int DEFAULT_N_REPEATS = 150;

  /* Parsing itself logs, but only warnings are of interest to the user; send those to the console in the
   * development format. */
  Stream_logger bootstrap_logger(Sev::S_WARNING, std::make_unique<Console_encoder>(Encoder_config::development()));

  Flag_set flag_set(&bootstrap_logger, argv[0], Flag_set::On_error::S_EXIT);
  Log_flags log_flags(&bootstrap_logger);

  unsigned int n_repeats = DEFAULT_N_REPEATS;
  try
  {
    log_flags.register_flags(&flag_set);
    flag_set.parse(argc, argv); // Exits on bad flags or -help.

    const auto& args = flag_set.args();
    if (args.size() > 1)
    {
      std::cerr << "Usage: " << argv[0] << " [flags] [<count of repeated messages>]\n";
      flag_set.print_help(std::cerr);
      return BAD_EXIT;
    }
    // else
    if ((!args.empty()) && (!boost::conversion::try_lexical_convert(args.front(), n_repeats)))
    {
      std::cerr << "Count [" << args.front() << "] is not a non-negative integer.\n";
      return BAD_EXIT;
    }
  }
  catch (const exception& exc)
  {
    std::cerr << "Flag setup failed: [" << exc.what() << "].\n";
    return BAD_EXIT;
  }

  const auto options = log_flags.options();
  const auto logger = build_logger(options);
  ZFLAGS_LOG_SET_LOGGER(logger.get());

  ZFLAGS_LOG_WITH_FIELDS(Sev::S_INFO, "Logger ready.",
                         make_field("config", zflags::util::ostream_op_string(resolve_logger_config(options))),
                         make_field("legacy_verbosity", Process_legacy_verbosity::get_singleton().verbosity()));

  ZFLAGS_LOG_V(5, "Verbosity-5 message.");
  ZFLAGS_LOG_V(2, "Verbosity-2 message.");
  ZFLAGS_LOG_DEBUG("Debug message.");
  ZFLAGS_LOG_INFO("Info message.");
  ZFLAGS_LOG_WARNING("Warning message.");
  ZFLAGS_LOG_ERROR("Error message.");
  ZFLAGS_LOG_WITH_FIELDS(Sev::S_INFO, "Message with fields.",
                         make_field("user", "demo"), make_field("attempt", 3), make_field("ratio", 0.25),
                         make_field("ok", true));

  for (unsigned int idx = 0; idx != n_repeats; ++idx)
  {
    ZFLAGS_LOG_INFO("Repeated message.");
  }
  ZFLAGS_LOG_INFO("Logged [" << n_repeats << "] repeated messages; with sampling on, only some appear above.");

  return 0;
} // main()
