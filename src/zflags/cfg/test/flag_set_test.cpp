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
#include "zflags/cfg/error.hpp"
#include "zflags/cfg/log_flags.hpp"
#include "zflags/cfg/option_value.hpp"
#include "zflags/error/error.hpp"
#include "zflags/log/buffer_logger.hpp"
#include <gtest/gtest.h>
#include <sstream>

namespace zflags::cfg::test
{

namespace
{
using log::Sev;
using log::verbose_sev;
using std::string;
using std::vector;

/// The flag cells of a typical program, registered into a Flag_set.
struct Fixture
{
  explicit Fixture(Flag_set::On_error on_error = Flag_set::On_error::S_CONTINUE) :
    m_logger(Sev::S_DEBUG),
    m_flag_set(&m_logger, "zap", on_error),
    m_log_flags(&m_logger, nullptr)
  {
    m_log_flags.register_flags(&m_flag_set);
  }

  Error_code parse(const vector<string>& args)
  {
    Error_code err_code;
    m_flag_set.parse(args, &err_code);
    return err_code;
  }

  log::Buffer_logger m_logger;
  Flag_set m_flag_set;
  Log_flags m_log_flags;
}; // struct Fixture

} // Anonymous namespace

TEST(Flag_set, Spellings)
{
  for (const auto& args : vector<vector<string>>{ { "-zap-level=error" }, { "--zap-level=error" },
                                                   { "-zap-level", "error" }, { "--zap-level", "error" } })
  {
    Fixture fx;
    EXPECT_FALSE(fx.parse(args)) << args.front();
    EXPECT_TRUE(fx.m_flag_set.parsed());
    EXPECT_TRUE(fx.m_log_flags.m_level.is_set()) << args.front();
    EXPECT_EQ(fx.m_log_flags.m_level.value(), Sev::S_ERROR) << args.front();
    EXPECT_TRUE(fx.m_flag_set.args().empty()) << args.front();
  }
} // TEST(Flag_set, Spellings)

TEST(Flag_set, All_flags)
{
  Fixture fx;
  EXPECT_FALSE(fx.parse({ "-zap-devel", "-zap-encoder=console", "-zap-level=7", "-zap-sample=false",
                          "-zap-timeformat", "iso8601" }));
  const auto& flags = fx.m_log_flags;
  EXPECT_TRUE(flags.m_devel.value());
  EXPECT_EQ(flags.m_encoder.value(), Encoder_choice::S_CONSOLE);
  EXPECT_EQ(flags.m_level.value(), verbose_sev(7));
  EXPECT_TRUE(flags.m_sample.is_set());
  EXPECT_FALSE(flags.m_sample.value());
  EXPECT_EQ(flags.m_time_format.value(), Time_format::S_ISO8601);

  const auto options = flags.options();
  EXPECT_TRUE(options.m_development);
  EXPECT_EQ(options.m_encoder, Encoder_choice::S_CONSOLE);
  EXPECT_EQ(options.m_level, verbose_sev(7));
  EXPECT_EQ(options.m_sample, false);
  EXPECT_EQ(options.m_time_format, Time_format::S_ISO8601);

  // Parsing is logged.
  EXPECT_NE(fx.m_logger.buffer_str().find("flag [zap-encoder] set to [console]"), string::npos)
    << fx.m_logger.buffer_str();
} // TEST(Flag_set, All_flags)

TEST(Flag_set, Untouched_flags)
{
  Fixture fx;
  EXPECT_FALSE(fx.parse({}));
  const auto options = fx.m_log_flags.options();
  EXPECT_FALSE(options.m_development);
  EXPECT_FALSE(options.m_encoder);
  EXPECT_FALSE(options.m_level);
  EXPECT_FALSE(options.m_sample);
  EXPECT_EQ(options.m_time_format, Time_format::S_UNIX);
}

TEST(Flag_set, Bool_flags)
{
  Fixture fx;
  EXPECT_FALSE(fx.parse({ "-zap-sample" }));
  EXPECT_TRUE(fx.m_log_flags.m_sample.value());

  EXPECT_FALSE(fx.parse({ "--zap-sample=F", "--zap-devel=1" }));
  EXPECT_FALSE(fx.m_log_flags.m_sample.value());
  EXPECT_TRUE(fx.m_log_flags.m_devel.value());

  // A bool flag takes a value only after "="; otherwise the next token is positional.
  Fixture fx2;
  EXPECT_FALSE(fx2.parse({ "-zap-devel", "false", "-zap-sample", "x" }));
  EXPECT_TRUE(fx2.m_log_flags.m_devel.value());
  EXPECT_TRUE(fx2.m_log_flags.m_sample.value());
  EXPECT_EQ(fx2.m_flag_set.args(), (vector<string>{ "false", "x" }));
} // TEST(Flag_set, Bool_flags)

TEST(Flag_set, Positional)
{
  Fixture fx;
  EXPECT_FALSE(fx.parse({ "first", "-zap-encoder=json", "second", "--", "-zap-level=debug" }));
  EXPECT_EQ(fx.m_flag_set.args(), (vector<string>{ "first", "second", "-zap-level=debug" }));
  EXPECT_EQ(fx.m_log_flags.m_encoder.value(), Encoder_choice::S_JSON);
  EXPECT_FALSE(fx.m_log_flags.m_level.is_set());
}

TEST(Flag_set, Repeat_overwrites)
{
  Fixture fx;
  EXPECT_FALSE(fx.parse({ "-zap-level=debug", "-zap-encoder=console", "-zap-level=error",
                          "-zap-encoder=json" }));
  EXPECT_EQ(fx.m_log_flags.m_level.value(), Sev::S_ERROR);
  EXPECT_EQ(fx.m_log_flags.m_encoder.value(), Encoder_choice::S_JSON);
}

TEST(Flag_set, Empty_values)
{
  {
    // An empty time format means unix, also from the command line, and also after an explicit iso8601.
    Fixture fx;
    EXPECT_FALSE(fx.parse({ "-zap-timeformat=iso8601", "-zap-timeformat=" }));
    EXPECT_TRUE(fx.m_log_flags.m_time_format.is_set());
    EXPECT_EQ(fx.m_log_flags.m_time_format.value(), Time_format::S_UNIX);
    EXPECT_TRUE(fx.m_flag_set.args().empty());

    EXPECT_FALSE(fx.parse({ "-zap-timeformat=iso8601", "--zap-timeformat=", "rest" }));
    EXPECT_EQ(fx.m_log_flags.m_time_format.value(), Time_format::S_UNIX);
    EXPECT_EQ(fx.m_flag_set.args(), (vector<string>{ "rest" }));
  }
  {
    // The other cells reject empty text as an invalid value, not as bad syntax.
    Fixture fx;
    EXPECT_EQ(fx.parse({ "-zap-encoder=" }), error::Code::S_INVALID_VALUE);
    EXPECT_FALSE(fx.m_log_flags.m_encoder.is_set());
    EXPECT_EQ(fx.parse({ "--zap-level=" }), error::Code::S_INVALID_VALUE);
    EXPECT_EQ(fx.parse({ "-zap-sample=" }), error::Code::S_INVALID_VALUE);
    EXPECT_FALSE(fx.m_log_flags.m_sample.is_set());
    EXPECT_EQ(fx.parse({ "-zap-bogus=" }), error::Code::S_UNKNOWN_FLAG);
  }
  {
    // After "--" an empty-valued flag is positional like everything else.
    Fixture fx;
    EXPECT_FALSE(fx.parse({ "--", "-zap-encoder=" }));
    EXPECT_EQ(fx.m_flag_set.args(), (vector<string>{ "-zap-encoder=" }));
  }
} // TEST(Flag_set, Empty_values)

TEST(Flag_set, Errors)
{
  {
    Fixture fx;
    EXPECT_EQ(fx.parse({ "-zap-bogus=1" }), error::Code::S_UNKNOWN_FLAG);
    EXPECT_EQ(fx.parse({ "--zap-bogus" }), error::Code::S_UNKNOWN_FLAG);
    EXPECT_FALSE(fx.m_flag_set.parsed());
  }
  {
    Fixture fx;
    EXPECT_EQ(fx.parse({ "-zap-level" }), error::Code::S_FLAG_SYNTAX);
    EXPECT_EQ(fx.parse({ "--zap-timeformat" }), error::Code::S_FLAG_SYNTAX);
  }
  {
    // Flags before the bad one are applied; the bad one leaves its cell as it was; parsing stops there.
    Fixture fx;
    fx.m_log_flags.m_encoder.set("console");
    EXPECT_EQ(fx.parse({ "-zap-level=error", "-zap-encoder=xml", "-zap-sample" }), error::Code::S_INVALID_VALUE);
    EXPECT_EQ(fx.m_log_flags.m_level.value(), Sev::S_ERROR);
    EXPECT_EQ(fx.m_log_flags.m_encoder.value(), Encoder_choice::S_CONSOLE);
    EXPECT_FALSE(fx.m_log_flags.m_sample.is_set());
    EXPECT_FALSE(fx.m_flag_set.parsed());
    EXPECT_NE(fx.m_logger.buffer_str().find("invalid argument \"xml\" for \"-zap-encoder\" flag"), string::npos)
      << fx.m_logger.buffer_str();
  }
  for (const auto& help : { "-h", "-help", "--help" })
  {
    Fixture fx;
    EXPECT_EQ(fx.parse({ help }), error::Code::S_HELP_REQUESTED) << help;
  }
  {
    Fixture fx;
    EXPECT_THROW(fx.m_flag_set.parse(vector<string>{ "-zap-nope" }), zflags::error::Runtime_error);
  }
} // TEST(Flag_set, Errors)

TEST(Flag_set, Registration)
{
  Flag_set flag_set(nullptr, "app");
  EXPECT_EQ(flag_set.name(), "app");
  Bool_value verbose;
  Encoder_value encoder;

  Error_code err_code;
  flag_set.add_flag("verbose", &verbose, "Be chatty", &err_code);
  EXPECT_FALSE(err_code);
  flag_set.add_flag("verbose", &encoder, "Again", &err_code);
  EXPECT_EQ(err_code, error::Code::S_FLAG_REDEFINED);
  flag_set.add_flag("help", &encoder, "Mine", &err_code);
  EXPECT_EQ(err_code, error::Code::S_FLAG_REDEFINED);
  flag_set.add_flag("", &encoder, "Empty", &err_code);
  EXPECT_EQ(err_code, error::Code::S_FLAG_SYNTAX);
  flag_set.add_flag("a,b", &encoder, "Comma", &err_code);
  EXPECT_EQ(err_code, error::Code::S_FLAG_SYNTAX);
  EXPECT_THROW(flag_set.add_flag("verbose", &encoder, "Throws"), zflags::error::Runtime_error);

  EXPECT_EQ(flag_set.lookup("verbose"), &verbose);
  EXPECT_EQ(flag_set.lookup("encoder"), nullptr);

  flag_set.set("verbose", "true");
  EXPECT_TRUE(verbose.value());
  flag_set.set("verbose", "nah", &err_code);
  EXPECT_EQ(err_code, error::Code::S_INVALID_VALUE);
  EXPECT_TRUE(verbose.value());
  flag_set.set("missing", "1", &err_code);
  EXPECT_EQ(err_code, error::Code::S_UNKNOWN_FLAG);

  const char* const argv[] = { "prog", "-verbose=false", "rest" };
  flag_set.parse(3, argv);
  EXPECT_FALSE(verbose.value());
  EXPECT_EQ(flag_set.args(), vector<string>{ "rest" });
} // TEST(Flag_set, Registration)

TEST(Flag_set, Help)
{
  Fixture fx;
  std::ostringstream os;
  fx.m_flag_set.print_help(os);
  const auto help = os.str();
  EXPECT_NE(help.find("Usage of zap:"), string::npos) << help;
  for (const auto& name : { "zap-devel", "zap-encoder", "zap-level", "zap-sample", "zap-timeformat", "help" })
  {
    EXPECT_NE(help.find(string("--") + name), string::npos) << name << '\n' << help;
  }
  EXPECT_NE(help.find("Zap log encoding ('json' or 'console')"), string::npos) << help;
  // Registration order.
  EXPECT_LT(help.find("zap-devel"), help.find("zap-timeformat"));
} // TEST(Flag_set, Help)

TEST(Flag_set_death_test, Exit_on_error)
{
  EXPECT_EXIT({ Fixture fx(Flag_set::On_error::S_EXIT); fx.parse({ "-zap-encoder=xml" }); },
              ::testing::ExitedWithCode(2), "zap: invalid argument");
  EXPECT_EXIT({ Fixture fx(Flag_set::On_error::S_EXIT); fx.parse({ "-zap-whatever" }); },
              ::testing::ExitedWithCode(2), "Usage of zap");
  EXPECT_EXIT({ Fixture fx(Flag_set::On_error::S_EXIT); fx.parse({ "-help" }); },
              ::testing::ExitedWithCode(0), "Usage of zap");
} // TEST(Flag_set_death_test, Exit_on_error)

} // namespace zflags::cfg::test
